#include <gtest/gtest.h>

#include "tilebox/containers.h"
#include "tilebox/converter.h"
#include "tilebox/error.h"
#include "tilebox/reader.h"
#include "tilebox/versatiles.h"
#include "tilebox/writer.h"

#include "test_helpers.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <vector>

using namespace tilebox;
using tilebox_test::MemoryReader;
using tilebox_test::TempDir;
using tilebox_test::sample_tile;

namespace fs = std::filesystem;

namespace {

// Every tile of the pyramid stored with the given compression.
std::unique_ptr<MemoryReader> filled_reader(const BBoxPyramid &pyramid, Compression compression,
                                            TileFormat format = TileFormat::PBF) {
    auto reader = std::make_unique<MemoryReader>(format, compression);
    reader->mutable_metadata().set("name", "memory tiles");
    for (const TileCoord &coord : tilebox_test::all_coords(pyramid)) {
        reader->add(coord, sample_tile(coord));
    }
    return reader;
}

// Records every write and checks nothing; for observing the writer side.
class RecordingWriter : public TileWriter {
public:
    explicit RecordingWriter(bool ordered) : TileWriter("recording"), _ordered(ordered) {}

    std::string container_name() const override { return "recording"; }
    bool requires_ordered_input() const override { return _ordered; }

    std::vector<TileCoord> written() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _written;
    }
    bool finalized() const { return _finalized; }
    bool aborted() const { return _aborted; }

protected:
    void do_write_tile(const TileCoord &coord, const Blob &) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _written.push_back(coord);
    }
    void do_finalize() override { _finalized = true; }
    void do_abort() override { _aborted = true; }

private:
    bool _ordered;
    mutable std::mutex _mutex;
    std::vector<TileCoord> _written;
    bool _finalized = false;
    bool _aborted = false;
};

// Counts batch reads; tiles come from the in-memory map.
class BatchCountingReader : public MemoryReader {
public:
    using MemoryReader::MemoryReader;

    std::vector<std::pair<TileCoord, Blob>> get_bbox(const TileBBox &bbox) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _batches.push_back(bbox);
        return MemoryReader::get_bbox(bbox);
    }

    std::vector<TileBBox> batches() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _batches;
    }

private:
    mutable std::mutex _mutex;
    std::vector<TileBBox> _batches;
};

}  // namespace

// ============================================================================
// Pipeline
// ============================================================================

TEST(ConverterTest, OrderedWriterReceivesCanonicalOrder) {
    const BBoxPyramid pyramid = BBoxPyramid::full(5);
    auto reader = filled_reader(pyramid, Compression::Gzip);

    RecordingWriter writer(true);
    ConvertOptions options;
    options.threads = 8;
    options.max_in_flight = 3;
    const ConvertStats stats = convert(*reader, writer, options);

    EXPECT_TRUE(writer.finalized());
    EXPECT_EQ(writer.written(), tilebox_test::all_coords(pyramid));
    EXPECT_EQ(stats.positions, pyramid.count_tiles());
    EXPECT_EQ(stats.tiles_written, pyramid.count_tiles());
}

TEST(ConverterTest, TilesAreFetchedOneBlockAtATime) {
    BBoxPyramid pyramid;
    pyramid.include_bbox(TileBBox(9, 250, 0, 260, 1));
    BatchCountingReader reader(TileFormat::PBF, Compression::Gzip);
    for (const TileCoord &coord : tilebox_test::all_coords(pyramid)) {
        reader.add(coord, sample_tile(coord));
    }

    RecordingWriter writer(true);
    ConvertOptions options;
    options.threads = 2;
    const ConvertStats stats = convert(reader, writer, options);

    std::vector<TileBBox> batches = reader.batches();
    std::sort(batches.begin(), batches.end(),
              [](const TileBBox &lhs, const TileBBox &rhs) { return lhs.x_min() < rhs.x_min(); });
    const std::vector<TileBBox> expected = {TileBBox(9, 250, 0, 255, 1), TileBBox(9, 256, 0, 260, 1)};
    EXPECT_EQ(batches, expected);
    EXPECT_EQ(reader.reads(), pyramid.count_tiles());
    EXPECT_EQ(stats.tiles_written, pyramid.count_tiles());
    EXPECT_EQ(writer.written(), tilebox_test::all_coords(pyramid));
}

TEST(ConverterTest, WideBlocksAreFetchedInRowBands) {
    BBoxPyramid pyramid;
    pyramid.include_bbox(TileBBox(8, 0, 0, 255, 20));
    BatchCountingReader reader(TileFormat::PBF, Compression::Gzip);
    reader.add(TileCoord(8, 3, 17), sample_tile(TileCoord(8, 3, 17)));

    RecordingWriter writer(true);
    ConvertOptions options;
    options.threads = 1;
    const ConvertStats stats = convert(reader, writer, options);

    // 4096 tiles per band are 16 rows of a full block width
    const std::vector<TileBBox> expected = {TileBBox(8, 0, 0, 255, 15), TileBBox(8, 0, 16, 255, 20)};
    EXPECT_EQ(reader.batches(), expected);
    EXPECT_EQ(stats.positions, pyramid.count_tiles());
    EXPECT_EQ(writer.written(), std::vector<TileCoord>{TileCoord(8, 3, 17)});
}

TEST(ConverterTest, UnorderedWriterReceivesEveryTileOnce) {
    const BBoxPyramid pyramid = BBoxPyramid::full(4);
    auto reader = filled_reader(pyramid, Compression::Gzip);

    RecordingWriter writer(false);
    ConvertOptions options;
    options.threads = 4;
    convert(*reader, writer, options);

    std::vector<TileCoord> written = writer.written();
    std::sort(written.begin(), written.end());
    EXPECT_EQ(written, tilebox_test::all_coords(pyramid));
}

TEST(ConverterTest, ConvertsIntoVersaTiles) {
    TempDir dir;
    const std::string path = dir.file("out.versatiles");
    const BBoxPyramid pyramid = BBoxPyramid::full(4);
    auto reader = filled_reader(pyramid, Compression::Gzip);

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.threads = 4;
        convert(*reader, writer, options);
    }

    auto result = open_reader(path);
    EXPECT_EQ(result->bbox_pyramid(), pyramid);
    EXPECT_EQ(result->metadata().get("name"), std::optional<std::string>("memory tiles"));
    EXPECT_EQ(result->metadata().tile_compression, Compression::Gzip);
    for (const TileCoord &coord : tilebox_test::all_coords(pyramid)) {
        const auto blob = result->get_tile(coord);
        ASSERT_TRUE(blob.has_value()) << coord.to_string();
        EXPECT_EQ(decompress(*blob), sample_tile(coord));
    }
}

TEST(ConverterTest, AbsentTilesAreSkipped) {
    MemoryReader reader(TileFormat::PNG, Compression::Uncompressed);
    reader.add(TileCoord(2, 0, 0), sample_tile(TileCoord(2, 0, 0)));
    reader.add(TileCoord(2, 3, 3), sample_tile(TileCoord(2, 3, 3)));

    RecordingWriter writer(true);
    const ConvertStats stats = convert(reader, writer);
    EXPECT_EQ(stats.positions, 16u);
    EXPECT_EQ(stats.tiles_written, 2u);
    EXPECT_EQ(writer.written(), (std::vector<TileCoord>{TileCoord(2, 0, 0), TileCoord(2, 3, 3)}));
}

// ============================================================================
// Selection
// ============================================================================

TEST(ConverterTest, ZoomAndGeoFiltersRestrictThePyramid) {
    auto reader = filled_reader(BBoxPyramid::full(3), Compression::Gzip);

    ConvertOptions zooms;
    zooms.min_zoom = 1;
    zooms.max_zoom = 2;
    const BBoxPyramid limited = conversion_pyramid(*reader, zooms);
    EXPECT_EQ(limited.min_zoom(), std::optional<unsigned>(1));
    EXPECT_EQ(limited.max_zoom(), std::optional<unsigned>(2));
    EXPECT_EQ(limited.count_tiles(), 4u + 16u);

    ConvertOptions geo;
    geo.max_zoom = 2;
    geo.geo_bbox = GeoBBox{10.0, 10.0, 170.0, 80.0};
    const BBoxPyramid north_east = conversion_pyramid(*reader, geo);
    EXPECT_EQ(north_east.level(0), TileBBox(0, 0, 0, 0, 0));
    EXPECT_EQ(north_east.level(1), TileBBox(1, 1, 0, 1, 0));
    EXPECT_EQ(north_east.level(2), TileBBox(2, 2, 0, 3, 1));

    RecordingWriter writer(true);
    const ConvertStats stats = convert(*reader, writer, geo);
    EXPECT_EQ(stats.tiles_written, 1u + 1u + 4u);
}

TEST(ConverterTest, ZoomOutOfRangeIsAConfigError) {
    auto reader = filled_reader(BBoxPyramid::full(1), Compression::Gzip);
    RecordingWriter writer(false);
    ConvertOptions options;
    options.max_zoom = kMaxZoomLevel + 1;
    EXPECT_THROW(convert(*reader, writer, options), config_error);
    EXPECT_TRUE(writer.aborted());
}

// ============================================================================
// Compression and format
// ============================================================================

TEST(ConverterTest, BrotliArchiveConvertedToGzip) {
    TempDir dir;
    const std::string path = dir.file("gzip.versatiles");
    const BBoxPyramid pyramid = BBoxPyramid::full(3);
    auto source = filled_reader(pyramid, Compression::Brotli);

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.compression = Compression::Gzip;
        convert(*source, writer, options);
    }

    auto result = open_reader(path);
    EXPECT_EQ(result->metadata().tile_compression, Compression::Gzip);
    for (const TileCoord &coord : tilebox_test::all_coords(pyramid)) {
        const auto output = result->get_tile(coord);
        const auto input = source->get_tile(coord);
        ASSERT_TRUE(output.has_value());
        ASSERT_TRUE(input.has_value());
        EXPECT_EQ(output->compression(), Compression::Gzip);
        EXPECT_EQ(decompress(*output), decompress(*input));
    }
}

TEST(ConverterTest, ForceRecompressKeepsContent) {
    TempDir dir;
    const std::string path = dir.file("forced.tar");
    auto source = filled_reader(BBoxPyramid::full(1), Compression::Gzip);

    {
        TarWriter writer(path);
        ConvertOptions options;
        options.force_recompress = true;
        convert(*source, writer, options);
    }

    auto result = open_reader(path);
    EXPECT_EQ(result->metadata().tile_compression, Compression::Gzip);
    const auto blob = result->get_tile(TileCoord(1, 1, 0));
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(decompress(*blob), sample_tile(TileCoord(1, 1, 0)));
}

TEST(ConverterTest, FormatChangeNeedsATransform) {
    TempDir dir;
    const std::string path = dir.file("geojson.versatiles");
    auto source = filled_reader(BBoxPyramid::full(1), Compression::Gzip);

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.tile_format = TileFormat::GEOJSON;
        EXPECT_THROW(convert(*source, writer, options), config_error);
        EXPECT_FALSE(writer.is_open());
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(ConverterTest, TransformReceivesUncompressedTiles) {
    TempDir dir;
    const std::string path = dir.file("geojson.versatiles");
    auto source = filled_reader(BBoxPyramid::full(1), Compression::Brotli);

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.tile_format = TileFormat::GEOJSON;
        options.compression = Compression::Gzip;
        options.transform = [](const TileCoord &coord, const Blob &tile) {
            EXPECT_EQ(tile.compression(), Compression::Uncompressed);
            return Blob::from_string("{\"tile\":\"" + coord.to_string() + "\",\"size\":" +
                                     std::to_string(tile.size()) + "}");
        };
        convert(*source, writer, options);
    }

    auto result = open_reader(path);
    EXPECT_EQ(result->metadata().tile_format, TileFormat::GEOJSON);
    const auto blob = result->get_tile(TileCoord(1, 0, 1));
    ASSERT_TRUE(blob.has_value());
    const std::string expected_size = std::to_string(sample_tile(TileCoord(1, 0, 1)).size());
    EXPECT_EQ(decompress(*blob).to_string(), "{\"tile\":\"1/0/1\",\"size\":" + expected_size + "}");
}

// ============================================================================
// Failure and cancellation
// ============================================================================

TEST(ConverterTest, ReadFailureNamesTheTileAndRemovesOutput) {
    TempDir dir;
    const std::string path = dir.file("failed.versatiles");
    auto source = filled_reader(BBoxPyramid::full(3), Compression::Gzip);
    source->fail_at(TileCoord(2, 1, 3));

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.threads = 4;
        try {
            convert(*source, writer, options);
            FAIL() << "expected io_error";
        } catch (const io_error &ex) {
            EXPECT_NE(std::string(ex.what()).find("reading tile 2/1/3"), std::string::npos) << ex.what();
            EXPECT_NE(std::string(ex.what()).find("simulated read failure"), std::string::npos);
        }
        EXPECT_FALSE(writer.is_open());
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(ConverterTest, CancelledBeforeStartDiscardsOutput) {
    TempDir dir;
    const std::string path = dir.file("cancelled.versatiles");
    auto source = filled_reader(BBoxPyramid::full(3), Compression::Gzip);
    const std::atomic<bool> cancel{true};

    {
        VersaTilesWriter writer(path);
        ConvertOptions options;
        options.cancel = &cancel;
        EXPECT_THROW(convert(*source, writer, options), cancelled_error);
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(source->reads(), 0u);
}

TEST(ConverterTest, CancelledFromProgressCallback) {
    auto source = filled_reader(BBoxPyramid::full(4), Compression::Gzip);
    std::atomic<bool> cancel{false};

    RecordingWriter writer(true);
    ConvertOptions options;
    options.threads = 2;
    options.cancel = &cancel;
    options.progress = [&cancel](std::uint64_t done, std::uint64_t) {
        if (done >= 10) {
            cancel.store(true);
        }
    };
    EXPECT_THROW(convert(*source, writer, options), cancelled_error);
    EXPECT_TRUE(writer.aborted());
    EXPECT_FALSE(writer.finalized());
    EXPECT_LT(source->reads(), BBoxPyramid::full(4).count_tiles());
}

TEST(ConverterTest, ProgressCountsEveryPosition) {
    const BBoxPyramid pyramid = BBoxPyramid::full(3);
    auto source = filled_reader(pyramid, Compression::Gzip);

    std::mutex mutex;
    std::uint64_t calls = 0;
    std::uint64_t max_done = 0;
    std::uint64_t last_total = 0;
    RecordingWriter writer(false);
    ConvertOptions options;
    options.threads = 3;
    options.progress = [&](std::uint64_t done, std::uint64_t total) {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        max_done = std::max(max_done, done);
        last_total = total;
    };
    convert(*source, writer, options);

    // one call per zoom level, each level being a single block
    EXPECT_EQ(calls, 4u);
    EXPECT_EQ(max_done, pyramid.count_tiles());
    EXPECT_EQ(last_total, pyramid.count_tiles());
}

TEST(ConverterTest, ProgressCallbacksRunConcurrently) {
    const BBoxPyramid pyramid = BBoxPyramid::full(2);
    auto source = filled_reader(pyramid, Compression::Gzip);

    std::mutex mutex;
    std::condition_variable second_caller;
    int inside = 0;
    bool overlapped = false;
    RecordingWriter writer(false);
    ConvertOptions options;
    options.threads = 2;
    options.progress = [&](std::uint64_t, std::uint64_t) {
        std::unique_lock<std::mutex> lock(mutex);
        ++inside;
        if (inside >= 2) {
            overlapped = true;
            second_caller.notify_all();
        } else {
            // the other worker must be able to report while this callback is busy
            second_caller.wait_for(lock, std::chrono::seconds(5), [&overlapped]() { return overlapped; });
        }
        --inside;
    };
    const ConvertStats stats = convert(*source, writer, options);

    EXPECT_TRUE(overlapped);
    EXPECT_EQ(stats.positions, pyramid.count_tiles());
}
