#ifndef TILEBOX_VERSATILES_H
#define TILEBOX_VERSATILES_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/data_reader.h"
#include "tilebox/lru_cache.h"
#include "tilebox/reader.h"
#include "tilebox/writer.h"

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tilebox {
namespace versatiles {

constexpr char kMagic[] = "versatiles_v02";
constexpr std::size_t kMagicSize = 14;
constexpr std::size_t kHeaderSize = 66;
constexpr std::size_t kBlockRecordSize = 33;
constexpr std::size_t kTileRecordSize = 12;

// Tiles below this size are stored once per block when repeated.
constexpr std::size_t kDedupLimit = 1024;

constexpr std::size_t kTileIndexCacheSize = 64;
constexpr std::uint64_t kMaxChunkSize = 64ull * 1024 * 1024;
constexpr std::uint64_t kMaxChunkGap = 32ull * 1024;

std::uint8_t format_to_id(TileFormat format);
TileFormat format_from_id(std::uint8_t id);

struct FileHeader {
    TileFormat tile_format = TileFormat::BIN;
    Compression compression = Compression::Uncompressed;
    std::uint8_t zoom_min = 0;
    std::uint8_t zoom_max = 0;
    GeoBBox bbox;
    ByteRange meta_range;
    ByteRange blocks_range;

    Bytes to_bytes() const;

    // Throws format_error for a foreign signature or another format version.
    static FileHeader from_bytes(const Bytes &bytes);
};

// One entry of the block index: a block of kBlockSize x kBlockSize tiles.
struct BlockDefinition {
    std::uint8_t level = 0;
    std::uint32_t block_x = 0;
    std::uint32_t block_y = 0;
    // Covered tiles relative to the block origin.
    std::uint8_t x_min = 0;
    std::uint8_t y_min = 0;
    std::uint8_t x_max = 0;
    std::uint8_t y_max = 0;
    ByteRange tiles_range;
    std::uint32_t index_length = 0;

    TileCoord key() const { return TileCoord(level, block_x, block_y); }

    // Tile index follows the tile data of the block.
    ByteRange index_range() const { return ByteRange{tiles_range.end(), index_length}; }

    // Covered tiles in absolute coordinates of the zoom level.
    TileBBox global_bbox() const;

    static BlockDefinition from_bbox(const TileBBox &bbox);
};

class BlockIndex {
public:
    void add(const BlockDefinition &block);
    const BlockDefinition *find(const TileCoord &key) const;

    std::size_t size() const noexcept { return _blocks.size(); }
    const std::map<TileCoord, BlockDefinition> &blocks() const noexcept { return _blocks; }

    BBoxPyramid pyramid() const;

    // Brotli compressed records.
    Bytes to_bytes() const;
    static BlockIndex from_bytes(const Bytes &compressed);

private:
    std::map<TileCoord, BlockDefinition> _blocks;
};

// Row-major tile ranges of one block, offsets relative to the block's tiles range.
class TileIndex {
public:
    explicit TileIndex(std::size_t count = 0) : _entries(count) {}

    std::size_t size() const noexcept { return _entries.size(); }
    const ByteRange &at(std::size_t index) const { return _entries.at(index); }
    void set(std::size_t index, const ByteRange &range) { _entries.at(index) = range; }

    Bytes to_bytes() const;
    static TileIndex from_bytes(const Bytes &compressed);

private:
    std::vector<ByteRange> _entries;
};

}  // namespace versatiles

class VersaTilesReader : public TileReader {
public:
    explicit VersaTilesReader(std::unique_ptr<DataReader> data);

    static std::unique_ptr<VersaTilesReader> open(const std::string &source, const RetryPolicy &policy = {});

    std::string name() const override { return _data->name(); }
    std::string container_name() const override { return "versatiles"; }

    std::optional<Blob> get_tile(const TileCoord &coord) override;
    std::vector<std::pair<TileCoord, Blob>> get_bbox(const TileBBox &bbox) override;
    void probe_container(std::ostream &out) override;

    const versatiles::FileHeader &header() const noexcept { return _header; }
    const versatiles::BlockIndex &block_index() const noexcept { return _blocks; }

private:
    std::shared_ptr<const versatiles::TileIndex> tile_index(const versatiles::BlockDefinition &block);
    Bytes read_checked(const ByteRange &range, const std::string &what);

    std::unique_ptr<DataReader> _data;
    versatiles::FileHeader _header;
    versatiles::BlockIndex _blocks;
    LimitedCache<TileCoord, versatiles::TileIndex> _tile_indexes{versatiles::kTileIndexCacheSize};
};

// Writes tiles block by block in canonical pyramid order. Tiles of one block
// may come in any order; returning to a closed block is an order_error.
class VersaTilesWriter : public TileWriter {
public:
    explicit VersaTilesWriter(const std::string &path);
    ~VersaTilesWriter() override;

    std::string container_name() const override { return "versatiles"; }
    bool requires_ordered_input() const override { return true; }

protected:
    void do_write_tile(const TileCoord &coord, const Blob &blob) override;
    void do_finalize() override;
    void do_abort() override;

private:
    void close_block();
    void write_bytes(const void *data, std::size_t size);

    std::mutex _mutex;
    std::fstream _file;
    std::uint64_t _position = 0;
    versatiles::BlockIndex _blocks;
    std::set<TileCoord> _closed_blocks;

    std::optional<TileCoord> _current_block;
    std::uint64_t _block_offset = 0;
    std::map<TileCoord, ByteRange> _block_entries;
    std::unordered_map<std::string, ByteRange> _block_dedup;
};

}  // namespace tilebox

#endif // TILEBOX_VERSATILES_H
