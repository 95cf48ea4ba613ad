#include "tilebox/reader.h"
#include "tilebox/containers.h"
#include "tilebox/error.h"
#include "tilebox/versatiles.h"

#include "string_util.h"

#include "aixlog.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tilebox {

namespace {

constexpr std::size_t kBiggestTiles = 10;

std::string sniff_signature(const std::string &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw io_error("Unable to open '" + path + "'");
    }
    std::string head(512, '\0');
    input.read(&head[0], static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(input.gcount()));
    return head;
}

}  // namespace

std::vector<std::pair<TileCoord, Blob>> TileReader::get_bbox(const TileBBox &bbox) {
    std::vector<std::pair<TileCoord, Blob>> result;
    for (const TileCoord &coord : bbox) {
        if (auto blob = get_tile(coord)) {
            result.emplace_back(coord, std::move(*blob));
        }
    }
    return result;
}

void TileReader::probe_container(std::ostream &out) {
    out << "deep container probing is not implemented for " << container_name() << " containers\n";
}

ProbeDepth probe_depth_from_count(int count) {
    if (count <= 0) {
        return ProbeDepth::Parameters;
    }
    if (count == 1) {
        return ProbeDepth::Container;
    }
    return ProbeDepth::Tiles;
}

void probe(TileReader &reader, ProbeDepth depth, std::ostream &out) {
    const ContainerMetadata &meta = reader.metadata();
    out << "name: " << reader.name() << '\n';
    out << "container: " << reader.container_name() << '\n';
    out << "metadata: " << meta.to_json() << '\n';
    out << "pyramid: " << reader.bbox_pyramid().to_string() << '\n';
    out << "tile format: " << to_string(meta.tile_format) << '\n';
    out << "tile compression: " << to_string(meta.tile_compression) << '\n';

    if (depth == ProbeDepth::Parameters) {
        return;
    }
    reader.probe_container(out);

    if (depth != ProbeDepth::Tiles) {
        return;
    }

    std::uint64_t count = 0;
    std::uint64_t total_size = 0;
    std::vector<std::pair<std::uint64_t, TileCoord>> biggest;
    auto larger_first = [](const std::pair<std::uint64_t, TileCoord> &lhs, const std::pair<std::uint64_t, TileCoord> &rhs) {
        return lhs.first > rhs.first;
    };

    PyramidIterator it = reader.bbox_pyramid().iter();
    while (const auto coord = it.next()) {
        const auto blob = reader.get_tile(*coord);
        if (!blob) {
            continue;
        }
        ++count;
        total_size += blob->size();

        biggest.emplace_back(blob->size(), *coord);
        std::push_heap(biggest.begin(), biggest.end(), larger_first);
        if (biggest.size() > kBiggestTiles) {
            std::pop_heap(biggest.begin(), biggest.end(), larger_first);
            biggest.pop_back();
        }
    }

    out << "tile count: " << count << '\n';
    out << "average tile size: " << (count == 0 ? 0 : total_size / count) << '\n';
    std::sort(biggest.begin(), biggest.end(), larger_first);
    out << "biggest tiles:\n";
    for (const auto &entry : biggest) {
        out << "  " << entry.second.to_string() << ": " << entry.first << " bytes\n";
    }
}

std::unique_ptr<TileReader> open_reader(const std::string &source, const RetryPolicy &policy) {
    if (source.empty()) {
        throw config_error("Input path must not be empty");
    }
    if (is_url(source)) {
        LOG(INFO) << "Opening remote versatiles container '" << source << "'\n";
        return VersaTilesReader::open(source, policy);
    }

    std::error_code ec;
    if (fs::is_directory(source, ec)) {
        return std::make_unique<DirectoryReader>(source);
    }
    if (!fs::exists(source, ec)) {
        throw io_error("'" + source + "' does not exist");
    }

    const std::string ext = detail::to_lower(fs::path(source).extension().string());
    if (ext == ".versatiles") {
        return VersaTilesReader::open(source, policy);
    }
    if (ext == ".tar") {
        return std::make_unique<TarReader>(source);
    }
    if (ext == ".mbtiles") {
        return std::make_unique<MBTilesReader>(source);
    }

    const std::string head = sniff_signature(source);
    if (head.rfind("versatiles_v", 0) == 0) {
        return VersaTilesReader::open(source, policy);
    }
    if (head.rfind(std::string("SQLite format 3\0", 16), 0) == 0) {
        return std::make_unique<MBTilesReader>(source);
    }
    if (head.size() >= 262 && head.compare(257, 5, "ustar") == 0) {
        return std::make_unique<TarReader>(source);
    }
    throw format_error("Unrecognized container '" + source + "'");
}

}  // namespace tilebox
