#ifndef TILEBOX_TILE_PATH_H
#define TILEBOX_TILE_PATH_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/format.h"

#include <optional>
#include <string>

namespace tilebox {
namespace detail {

struct TilePath {
    TileCoord coord;
    TileFormat format;
    Compression compression;
};

// "z/x/y.ext[.gz|.br]", optionally prefixed by "./"
std::optional<TilePath> parse_tile_path(const std::string &path);

std::string make_tile_path(const TileCoord &coord, TileFormat format, Compression compression);

// meta.json, tiles.json or metadata.json with an optional compression suffix.
std::optional<Compression> parse_metadata_path(const std::string &path);

// Checks a new tile against the format and compression seen so far.
void check_uniform(std::optional<TileFormat> &format, std::optional<Compression> &compression,
                   const TilePath &tile, const std::string &container);

}  // namespace detail
}  // namespace tilebox

#endif // TILEBOX_TILE_PATH_H
