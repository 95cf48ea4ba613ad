#include "tilebox/containers.h"
#include "tilebox/error.h"

#include "tile_path.h"

#include "aixlog.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace tilebox {

namespace {

Bytes read_file(const fs::path &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw io_error("Unable to open '" + path.string() + "'");
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw io_error("Failed to read '" + path.string() + "'");
    }
    return Blob::from_string(content).data();
}

void ensure_directory(const fs::path &path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::is_directory(path)) {
        throw io_error("Failed to create directory '" + path.string() + "': " + ec.message());
    }
}

}  // namespace

DirectoryReader::DirectoryReader(const std::string &path) : _root(path) {
    std::error_code ec;
    if (!fs::is_directory(_root, ec)) {
        throw io_error("'" + path + "' is not a directory");
    }

    std::optional<TileFormat> format;
    std::optional<Compression> compression;

    for (auto it = fs::recursive_directory_iterator(_root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        const std::string relative = fs::relative(it->path(), _root).generic_string();

        if (const auto meta_compression = detail::parse_metadata_path(relative)) {
            const Blob meta(read_file(it->path()), *meta_compression);
            _metadata.merge_json(decompress(meta).to_string());
            continue;
        }

        const auto tile = detail::parse_tile_path(relative);
        if (!tile) {
            LOG(DEBUG) << "Ignoring '" << relative << "' in '" << path << "'\n";
            continue;
        }
        detail::check_uniform(format, compression, *tile, path);
        _tiles[tile->coord] = it->path();
        _metadata.pyramid.include_coord(tile->coord);
    }
    if (ec) {
        throw io_error("Failed to scan directory '" + path + "': " + ec.message());
    }

    if (format) {
        _metadata.tile_format = *format;
        _metadata.tile_compression = *compression;
    } else if (const auto declared = _metadata.get("format")) {
        _metadata.tile_format = tile_format_from_string(*declared);
    }

    LOG(DEBUG) << "Found " << _tiles.size() << " tiles in directory '" << path << "'\n";
}

std::optional<Blob> DirectoryReader::get_tile(const TileCoord &coord) {
    const auto it = _tiles.find(coord);
    if (it == _tiles.end()) {
        return std::nullopt;
    }
    return Blob(read_file(it->second), _metadata.tile_compression);
}

DirectoryWriter::DirectoryWriter(const std::string &path) : TileWriter(path), _root(path) {
    std::error_code ec;
    if (fs::exists(_root, ec) && !fs::is_directory(_root, ec)) {
        throw io_error("'" + path + "' exists and is not a directory");
    }
    _created_root = !fs::exists(_root, ec);
    ensure_directory(_root);
}

DirectoryWriter::~DirectoryWriter() {
    abort_unfinished();
}

void DirectoryWriter::write_file(const fs::path &relative, const Blob &blob) {
    const fs::path target = _root / relative;
    ensure_directory(target.parent_path());

    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw io_error("Unable to create '" + target.string() + "'");
    }
    output.write(reinterpret_cast<const char *>(blob.data().data()), static_cast<std::streamsize>(blob.size()));
    if (!output) {
        throw io_error("Failed to write '" + target.string() + "'");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _written.push_back(target);
}

void DirectoryWriter::do_write_tile(const TileCoord &coord, const Blob &blob) {
    write_file(detail::make_tile_path(coord, metadata().tile_format, blob.compression()), blob);
}

void DirectoryWriter::do_finalize() {
    const ContainerMetadata &meta = metadata();
    const Blob json = compress(Blob::from_string(meta.to_json()), meta.tile_compression);
    write_file("meta.json" + compression_suffix(meta.tile_compression), json);
}

void DirectoryWriter::do_abort() {
    std::error_code ec;
    if (_created_root) {
        fs::remove_all(_root, ec);
    } else {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto &file : _written) {
            fs::remove(file, ec);
            if (ec) {
                break;
            }
        }
    }
    if (ec) {
        throw io_error("Failed to discard output in '" + _root.string() + "': " + ec.message());
    }
}

}  // namespace tilebox
