#ifndef TILEBOX_FORMAT_H
#define TILEBOX_FORMAT_H
#pragma once

#include "tilebox/blob.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tilebox {

enum class TileFormat : std::uint8_t {
    BIN,
    PNG,
    JPG,
    WEBP,
    AVIF,
    SVG,
    PBF,
    GEOJSON,
    TOPOJSON,
    JSON,
};

struct TileFormatInfo {
    TileFormat format;
    const char *name;
    const char *extension;
    const char *mime_type;
    Compression typical_compression;
    // Content is already compressed (raster codecs); wrapping it gains nothing.
    bool compression_redundant;
};

const TileFormatInfo &format_info(TileFormat format);
const std::vector<TileFormatInfo> &all_formats();

std::string to_string(TileFormat format);
std::string extension(TileFormat format);
std::string mime_type(TileFormat format);

// Accepts names, extensions with or without the dot, and the aliases jpeg and mvt.
TileFormat tile_format_from_string(const std::string &value);

// Magic-byte sniffing of uncompressed tile content.
std::optional<TileFormat> detect_tile_format(const Blob &blob);

}  // namespace tilebox

#endif // TILEBOX_FORMAT_H
