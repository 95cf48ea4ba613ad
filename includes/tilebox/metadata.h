#ifndef TILEBOX_METADATA_H
#define TILEBOX_METADATA_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/format.h"

#include <map>
#include <optional>
#include <string>

namespace tilebox {

struct ContainerMetadata {
    TileFormat tile_format = TileFormat::BIN;
    Compression tile_compression = Compression::Uncompressed;
    BBoxPyramid pyramid;

    // Free-form entries (name, attribution, minzoom, bounds, vector_layers, ...).
    // Values holding a JSON array or object are kept as raw JSON text.
    std::map<std::string, std::string> entries;

    std::optional<std::string> get(const std::string &key) const;
    void set(const std::string &key, const std::string &value) { entries[key] = value; }

    // Rewrites minzoom, maxzoom, bounds and format from the pyramid and tile format.
    void refresh_derived_entries();

    // Compact JSON object of the entries.
    std::string to_json() const;

    // Adds the members of a JSON object to the entries; throws format_error on
    // malformed JSON or a non-object document.
    void merge_json(const std::string &json);
};

std::map<std::string, std::string> parse_metadata_json(const std::string &json);

}  // namespace tilebox

#endif // TILEBOX_METADATA_H
