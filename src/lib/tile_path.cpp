#include "tile_path.h"
#include "string_util.h"

#include "tilebox/error.h"

namespace tilebox {
namespace detail {

namespace {

std::optional<std::uint32_t> parse_index(const std::string &value) {
    if (value.empty() || value.size() > 10 || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    const auto parsed = parse_int(value);
    if (!parsed || *parsed < 0 || *parsed > static_cast<long long>(UINT32_MAX)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*parsed);
}

std::string strip_compression_suffix(const std::string &name, Compression &compression) {
    if (ends_with(name, ".gz")) {
        compression = Compression::Gzip;
        return name.substr(0, name.size() - 3);
    }
    if (ends_with(name, ".br")) {
        compression = Compression::Brotli;
        return name.substr(0, name.size() - 3);
    }
    compression = Compression::Uncompressed;
    return name;
}

std::string strip_leading_dot_slash(std::string path) {
    while (path.rfind("./", 0) == 0) {
        path.erase(0, 2);
    }
    return path;
}

}  // namespace

std::optional<TilePath> parse_tile_path(const std::string &path) {
    const auto parts = split(strip_leading_dot_slash(path), '/');
    if (parts.size() != 3) {
        return std::nullopt;
    }

    const auto zoom = parse_index(parts[0]);
    const auto x = parse_index(parts[1]);

    Compression compression = Compression::Uncompressed;
    const std::string file = strip_compression_suffix(to_lower(parts[2]), compression);
    const auto dot = file.find('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    const auto y = parse_index(file.substr(0, dot));
    if (!zoom || !x || !y || !TileCoord::is_valid(*zoom, *x, *y)) {
        return std::nullopt;
    }

    TileFormat format;
    try {
        format = tile_format_from_string(file.substr(dot + 1));
    } catch (const format_error &) {
        return std::nullopt;
    }
    return TilePath{TileCoord(*zoom, *x, *y), format, compression};
}

std::string make_tile_path(const TileCoord &coord, TileFormat format, Compression compression) {
    return std::to_string(coord.zoom()) + "/" + std::to_string(coord.x()) + "/" + std::to_string(coord.y()) +
           extension(format) + compression_suffix(compression);
}

std::optional<Compression> parse_metadata_path(const std::string &path) {
    Compression compression = Compression::Uncompressed;
    const std::string name = strip_compression_suffix(strip_leading_dot_slash(path), compression);
    if (name == "meta.json" || name == "tiles.json" || name == "metadata.json") {
        return compression;
    }
    return std::nullopt;
}

void check_uniform(std::optional<TileFormat> &format, std::optional<Compression> &compression,
                   const TilePath &tile, const std::string &container) {
    if (!format) {
        format = tile.format;
        compression = tile.compression;
        return;
    }
    if (*format != tile.format) {
        throw format_error("Tile " + tile.coord.to_string() + " in '" + container + "' is " +
                           to_string(tile.format) + " but earlier tiles are " + to_string(*format));
    }
    if (*compression != tile.compression) {
        throw format_error("Tile " + tile.coord.to_string() + " in '" + container + "' is " +
                           to_string(tile.compression) + " compressed but earlier tiles are " +
                           to_string(*compression) + " compressed");
    }
}

}  // namespace detail
}  // namespace tilebox
