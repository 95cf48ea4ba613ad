#ifndef TILEBOX_CONVERTER_H
#define TILEBOX_CONVERTER_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/format.h"
#include "tilebox/reader.h"
#include "tilebox/writer.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace tilebox {

// Receives the uncompressed source tile and returns it in the target format.
using TileTransform = std::function<Blob(const TileCoord &coord, const Blob &tile)>;

// Called after each fetched batch, from the worker threads and without any
// converter lock held, so it may run concurrently with itself.
using ProgressCallback = std::function<void(std::uint64_t done, std::uint64_t total)>;

struct ConvertOptions {
    std::optional<unsigned> min_zoom;
    std::optional<unsigned> max_zoom;
    std::optional<GeoBBox> geo_bbox;
    std::optional<BBoxPyramid> pyramid;

    // Defaults to the source format / compression.
    std::optional<TileFormat> tile_format;
    std::optional<Compression> compression;
    // Decode and encode tiles even when the compression does not change.
    bool force_recompress = false;

    // 0 uses the hardware concurrency.
    unsigned threads = 0;
    // Tiles fetched but not yet written by an ordered writer, beyond which no
    // further batch is fetched; 0 picks 64 per thread. Tiles are fetched per
    // block piece, in bands of whole rows, so one batch may overshoot the bound.
    std::size_t max_in_flight = 0;

    TileTransform transform;
    const std::atomic<bool> *cancel = nullptr;
    ProgressCallback progress;
};

struct ConvertStats {
    std::uint64_t positions = 0;
    std::uint64_t tiles_written = 0;
    std::uint64_t bytes_written = 0;
};

// Copies the selected tiles from reader to writer and finalizes the writer.
// On any error or cancellation the writer is aborted and the error rethrown,
// its message naming the failing tile.
ConvertStats convert(TileReader &reader, TileWriter &writer, const ConvertOptions &options = {});

// The pyramid a conversion with these options would visit.
BBoxPyramid conversion_pyramid(const TileReader &reader, const ConvertOptions &options);

}  // namespace tilebox

#endif // TILEBOX_CONVERTER_H
