#include "tilebox/writer.h"
#include "tilebox/containers.h"
#include "tilebox/error.h"
#include "tilebox/versatiles.h"

#include "string_util.h"

#include "aixlog.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace tilebox {

void TileWriter::ensure_open(const char *operation) const {
    switch (_state.load()) {
        case State::Open:
            return;
        case State::Finalized:
            throw config_error(std::string("Cannot ") + operation + " '" + _path + "': writer is already finalized");
        case State::Aborted:
            throw config_error(std::string("Cannot ") + operation + " '" + _path + "': writer was aborted");
    }
}

void TileWriter::set_metadata(const ContainerMetadata &metadata) {
    ensure_open("set metadata of");
    if (_written.load()) {
        throw config_error("Metadata of '" + _path + "' must be set before the first tile is written");
    }
    _metadata = metadata;
    adjust_metadata(_metadata);
}

void TileWriter::write_tile(const TileCoord &coord, const Blob &blob) {
    ensure_open("write a tile to");
    _written.store(true);
    if (blob.empty()) {
        return;
    }
    check_compression(blob);
    do_write_tile(coord, recompress(blob, _metadata.tile_compression));

    std::lock_guard<std::mutex> lock(_pyramid_mutex);
    _written_pyramid.include_coord(coord);
}

void TileWriter::finalize() {
    ensure_open("finalize");
    {
        std::lock_guard<std::mutex> lock(_pyramid_mutex);
        _metadata.pyramid = _written_pyramid;
    }
    _metadata.refresh_derived_entries();

    try {
        do_finalize();
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Finalizing '" << _path << "' failed: " << ex.what() << "\n";
        _state.store(State::Aborted);
        try {
            do_abort();
        } catch (const std::exception &cleanup) {
            LOG(ERROR) << "Cleaning up '" << _path << "' failed: " << cleanup.what() << "\n";
        }
        throw;
    }
    _state.store(State::Finalized);
    LOG(INFO) << "Wrote " << _metadata.pyramid.count_tiles() << " tile positions to '" << _path << "'\n";
}

void TileWriter::abort() {
    ensure_open("abort");
    _state.store(State::Aborted);
    do_abort();
    LOG(INFO) << "Aborted writing '" << _path << "'\n";
}

void TileWriter::abort_unfinished() noexcept {
    if (_state.load() != State::Open) {
        return;
    }
    LOG(WARNING) << "Writer for '" << _path << "' destroyed without finalize, discarding output\n";
    try {
        abort();
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Discarding '" << _path << "' failed: " << ex.what() << "\n";
    }
}

std::unique_ptr<TileWriter> open_writer(const std::string &destination) {
    if (destination.empty()) {
        throw config_error("Output path must not be empty");
    }
    const std::string ext = detail::to_lower(fs::path(destination).extension().string());
    if (ext == ".versatiles") {
        return std::make_unique<VersaTilesWriter>(destination);
    }
    if (ext == ".tar") {
        return std::make_unique<TarWriter>(destination);
    }
    if (ext == ".mbtiles") {
        return std::make_unique<MBTilesWriter>(destination);
    }
    if (ext.empty() || detail::ends_with(destination, "/")) {
        return std::make_unique<DirectoryWriter>(destination);
    }
    throw format_error("Unsupported output container '" + destination + "'");
}

}  // namespace tilebox
