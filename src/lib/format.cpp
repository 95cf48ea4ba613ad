#include "tilebox/format.h"
#include "tilebox/error.h"

#include "string_util.h"

#include <algorithm>

namespace tilebox {

namespace {

const std::vector<TileFormatInfo> kFormats = {
    {TileFormat::BIN, "bin", ".bin", "application/octet-stream", Compression::Uncompressed, false},
    {TileFormat::PNG, "png", ".png", "image/png", Compression::Uncompressed, true},
    {TileFormat::JPG, "jpg", ".jpg", "image/jpeg", Compression::Uncompressed, true},
    {TileFormat::WEBP, "webp", ".webp", "image/webp", Compression::Uncompressed, true},
    {TileFormat::AVIF, "avif", ".avif", "image/avif", Compression::Uncompressed, true},
    {TileFormat::SVG, "svg", ".svg", "image/svg+xml", Compression::Gzip, false},
    {TileFormat::PBF, "pbf", ".pbf", "application/x-protobuf", Compression::Gzip, false},
    {TileFormat::GEOJSON, "geojson", ".geojson", "application/geo+json", Compression::Gzip, false},
    {TileFormat::TOPOJSON, "topojson", ".topojson", "application/topo+json", Compression::Gzip, false},
    {TileFormat::JSON, "json", ".json", "application/json", Compression::Gzip, false},
};

}  // namespace

const TileFormatInfo &format_info(TileFormat format) {
    const auto it = std::find_if(kFormats.begin(), kFormats.end(),
                                 [format](const TileFormatInfo &info) { return info.format == format; });
    if (it == kFormats.end()) {
        throw format_error("Unknown tile format id " + std::to_string(static_cast<int>(format)));
    }
    return *it;
}

const std::vector<TileFormatInfo> &all_formats() {
    return kFormats;
}

std::string to_string(TileFormat format) {
    return format_info(format).name;
}

std::string extension(TileFormat format) {
    return format_info(format).extension;
}

std::string mime_type(TileFormat format) {
    return format_info(format).mime_type;
}

TileFormat tile_format_from_string(const std::string &value) {
    std::string token = detail::to_lower(detail::trim(value));
    if (!token.empty() && token.front() == '.') {
        token.erase(token.begin());
    }

    if (token == "jpeg") {
        return TileFormat::JPG;
    }
    if (token == "mvt") {
        return TileFormat::PBF;
    }
    for (const auto &info : kFormats) {
        if (token == info.name) {
            return info.format;
        }
    }
    throw format_error("Unknown tile format '" + value + "'");
}

std::optional<TileFormat> detect_tile_format(const Blob &blob) {
    if (blob.compression() != Compression::Uncompressed) {
        return std::nullopt;
    }

    const std::uint8_t *bytes = blob.bytes();
    const std::size_t size = blob.size();
    if (size >= 8 && bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47) {
        return TileFormat::PNG;
    }
    if (size >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return TileFormat::JPG;
    }
    if (size >= 12 && bytes[0] == 0x52 && bytes[1] == 0x49 && bytes[2] == 0x46 && bytes[3] == 0x46 &&
        bytes[8] == 0x57 && bytes[9] == 0x45 && bytes[10] == 0x42 && bytes[11] == 0x50) {
        return TileFormat::WEBP;
    }
    // ISO BMFF: size box then "ftypavif" / "ftypavis"
    if (size >= 12 && bytes[4] == 'f' && bytes[5] == 't' && bytes[6] == 'y' && bytes[7] == 'p' && bytes[8] == 'a' &&
        bytes[9] == 'v' && bytes[10] == 'i' && (bytes[11] == 'f' || bytes[11] == 's')) {
        return TileFormat::AVIF;
    }
    return std::nullopt;
}

}  // namespace tilebox
