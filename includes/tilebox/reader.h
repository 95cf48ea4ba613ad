#ifndef TILEBOX_READER_H
#define TILEBOX_READER_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/data_reader.h"
#include "tilebox/metadata.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace tilebox {

enum class ProbeDepth {
    Parameters,
    Container,
    Tiles,
};

// Read access to a tile container. get_tile may be called concurrently.
class TileReader {
public:
    virtual ~TileReader() = default;

    // Path or URL the reader was opened from.
    virtual std::string name() const = 0;
    virtual std::string container_name() const = 0;

    const ContainerMetadata &metadata() const noexcept { return _metadata; }
    const BBoxPyramid &bbox_pyramid() const noexcept { return _metadata.pyramid; }

    // std::nullopt when the container holds no tile at coord. The returned
    // blob carries the container's tile compression.
    virtual std::optional<Blob> get_tile(const TileCoord &coord) = 0;

    // Tiles of a bbox in row-major order, absent tiles skipped.
    virtual std::vector<std::pair<TileCoord, Blob>> get_bbox(const TileBBox &bbox);

    // Container specific statistics for probe at ProbeDepth::Container.
    virtual void probe_container(std::ostream &out);

protected:
    ContainerMetadata _metadata;
};

void probe(TileReader &reader, ProbeDepth depth, std::ostream &out);

ProbeDepth probe_depth_from_count(int count);

// Chooses the implementation from the extension, a directory, or an http(s) URL.
std::unique_ptr<TileReader> open_reader(const std::string &source, const RetryPolicy &policy = {});

}  // namespace tilebox

#endif // TILEBOX_READER_H
