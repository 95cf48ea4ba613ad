#include "tilebox/versatiles.h"
#include "tilebox/error.h"

#include "byte_io.h"

#include "aixlog.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tilebox {
namespace versatiles {

namespace {

struct FormatId {
    TileFormat format;
    std::uint8_t id;
};

constexpr FormatId kFormatIds[] = {
    {TileFormat::BIN, 0x00},     {TileFormat::PNG, 0x10},     {TileFormat::JPG, 0x11},
    {TileFormat::WEBP, 0x12},    {TileFormat::AVIF, 0x13},    {TileFormat::SVG, 0x14},
    {TileFormat::PBF, 0x20},     {TileFormat::GEOJSON, 0x21}, {TileFormat::TOPOJSON, 0x22},
    {TileFormat::JSON, 0x23},
};

std::int32_t degrees_to_fixed(double value) {
    return static_cast<std::int32_t>(std::lround(value * 1e7));
}

double fixed_to_degrees(std::int32_t value) {
    return static_cast<double>(value) / 1e7;
}

Compression compression_from_id(std::uint8_t id) {
    switch (id) {
        case 0:
            return Compression::Uncompressed;
        case 1:
            return Compression::Gzip;
        case 2:
            return Compression::Brotli;
        default:
            throw format_error("Unknown tile compression id " + std::to_string(id) + " in versatiles header");
    }
}

}  // namespace

std::uint8_t format_to_id(TileFormat format) {
    for (const auto &entry : kFormatIds) {
        if (entry.format == format) {
            return entry.id;
        }
    }
    throw format_error("Tile format " + to_string(format) + " cannot be stored in a versatiles container");
}

TileFormat format_from_id(std::uint8_t id) {
    for (const auto &entry : kFormatIds) {
        if (entry.id == id) {
            return entry.format;
        }
    }
    throw format_error("Unknown tile format id " + std::to_string(id) + " in versatiles header");
}

Bytes FileHeader::to_bytes() const {
    detail::ByteWriter writer;
    writer.put_bytes(kMagic, kMagicSize);
    writer.put_u8(format_to_id(tile_format));
    writer.put_u8(static_cast<std::uint8_t>(compression));
    writer.put_u8(zoom_min);
    writer.put_u8(zoom_max);
    writer.put_i32(degrees_to_fixed(bbox.lon_min));
    writer.put_i32(degrees_to_fixed(bbox.lat_min));
    writer.put_i32(degrees_to_fixed(bbox.lon_max));
    writer.put_i32(degrees_to_fixed(bbox.lat_max));
    writer.put_u64(meta_range.offset);
    writer.put_u64(meta_range.length);
    writer.put_u64(blocks_range.offset);
    writer.put_u64(blocks_range.length);
    return writer.release();
}

FileHeader FileHeader::from_bytes(const Bytes &bytes) {
    const std::string prefix = "versatiles_v";
    if (bytes.size() < prefix.size() ||
        std::string(reinterpret_cast<const char *>(bytes.data()), prefix.size()) != prefix) {
        throw format_error("Not a versatiles container: signature mismatch");
    }
    if (bytes.size() < kHeaderSize) {
        throw format_error("Not a versatiles container: header is truncated");
    }

    detail::ByteReader reader(bytes);
    const std::string magic = reader.get_string(kMagicSize);
    if (magic != kMagic) {
        throw format_error("Unsupported versatiles version '" + magic.substr(prefix.size()) + "'");
    }

    FileHeader header;
    header.tile_format = format_from_id(reader.get_u8());
    header.compression = compression_from_id(reader.get_u8());
    header.zoom_min = reader.get_u8();
    header.zoom_max = reader.get_u8();
    header.bbox.lon_min = fixed_to_degrees(reader.get_i32());
    header.bbox.lat_min = fixed_to_degrees(reader.get_i32());
    header.bbox.lon_max = fixed_to_degrees(reader.get_i32());
    header.bbox.lat_max = fixed_to_degrees(reader.get_i32());
    header.meta_range.offset = reader.get_u64();
    header.meta_range.length = reader.get_u64();
    header.blocks_range.offset = reader.get_u64();
    header.blocks_range.length = reader.get_u64();
    return header;
}

TileBBox BlockDefinition::global_bbox() const {
    const std::uint64_t x0 = static_cast<std::uint64_t>(block_x) * kBlockSize;
    const std::uint64_t y0 = static_cast<std::uint64_t>(block_y) * kBlockSize;
    const std::uint64_t size = std::uint64_t{1} << level;
    if (x_min > x_max || y_min > y_max || x0 + x_max >= size || y0 + y_max >= size) {
        throw corruption_error("Block " + key().to_string() + " has an invalid tile range [" + std::to_string(x_min) +
                               "," + std::to_string(y_min) + "," + std::to_string(x_max) + "," +
                               std::to_string(y_max) + "]");
    }
    return TileBBox(level, static_cast<std::uint32_t>(x0 + x_min), static_cast<std::uint32_t>(y0 + y_min),
                    static_cast<std::uint32_t>(x0 + x_max), static_cast<std::uint32_t>(y0 + y_max));
}

BlockDefinition BlockDefinition::from_bbox(const TileBBox &bbox) {
    if (bbox.is_empty()) {
        throw config_error("A block must cover at least one tile");
    }
    BlockDefinition block;
    block.level = static_cast<std::uint8_t>(bbox.zoom());
    block.block_x = bbox.x_min() / kBlockSize;
    block.block_y = bbox.y_min() / kBlockSize;
    if (bbox.x_max() / kBlockSize != block.block_x || bbox.y_max() / kBlockSize != block.block_y) {
        throw config_error("Bounding box " + bbox.to_string() + " spans more than one block");
    }
    block.x_min = static_cast<std::uint8_t>(bbox.x_min() % kBlockSize);
    block.y_min = static_cast<std::uint8_t>(bbox.y_min() % kBlockSize);
    block.x_max = static_cast<std::uint8_t>(bbox.x_max() % kBlockSize);
    block.y_max = static_cast<std::uint8_t>(bbox.y_max() % kBlockSize);
    return block;
}

void BlockIndex::add(const BlockDefinition &block) {
    _blocks[block.key()] = block;
}

const BlockDefinition *BlockIndex::find(const TileCoord &key) const {
    const auto it = _blocks.find(key);
    return it == _blocks.end() ? nullptr : &it->second;
}

BBoxPyramid BlockIndex::pyramid() const {
    BBoxPyramid pyramid;
    for (const auto &entry : _blocks) {
        pyramid.include_bbox(entry.second.global_bbox());
    }
    return pyramid;
}

Bytes BlockIndex::to_bytes() const {
    detail::ByteWriter writer;
    for (const auto &entry : _blocks) {
        const BlockDefinition &block = entry.second;
        writer.put_u8(block.level);
        writer.put_u32(block.block_x);
        writer.put_u32(block.block_y);
        writer.put_u8(block.x_min);
        writer.put_u8(block.y_min);
        writer.put_u8(block.x_max);
        writer.put_u8(block.y_max);
        writer.put_u64(block.tiles_range.offset);
        writer.put_u64(block.tiles_range.length);
        writer.put_u32(block.index_length);
    }
    return compress(Blob(writer.release()), Compression::Brotli).data();
}

BlockIndex BlockIndex::from_bytes(const Bytes &compressed) {
    const Blob raw = decompress(Blob(compressed, Compression::Brotli));
    if (raw.size() % kBlockRecordSize != 0) {
        throw corruption_error("Block index size " + std::to_string(raw.size()) + " is not a multiple of " +
                               std::to_string(kBlockRecordSize));
    }

    BlockIndex index;
    detail::ByteReader reader(raw.data());
    while (reader.remaining() > 0) {
        BlockDefinition block;
        block.level = reader.get_u8();
        block.block_x = reader.get_u32();
        block.block_y = reader.get_u32();
        block.x_min = reader.get_u8();
        block.y_min = reader.get_u8();
        block.x_max = reader.get_u8();
        block.y_max = reader.get_u8();
        block.tiles_range.offset = reader.get_u64();
        block.tiles_range.length = reader.get_u64();
        block.index_length = reader.get_u32();

        if (block.level > kMaxZoomLevel || !TileCoord::is_valid(block.level, block.block_x, block.block_y)) {
            throw corruption_error("Block index holds an invalid block " + std::to_string(block.level) + "/" +
                                   std::to_string(block.block_x) + "/" + std::to_string(block.block_y));
        }
        // validates the tile range of the block
        block.global_bbox();
        index.add(block);
    }
    return index;
}

Bytes TileIndex::to_bytes() const {
    detail::ByteWriter writer;
    for (const auto &entry : _entries) {
        if (entry.length > UINT32_MAX) {
            throw config_error("Tile of " + std::to_string(entry.length) + " bytes is too large for the index");
        }
        writer.put_u64(entry.offset);
        writer.put_u32(static_cast<std::uint32_t>(entry.length));
    }
    return compress(Blob(writer.release()), Compression::Brotli).data();
}

TileIndex TileIndex::from_bytes(const Bytes &compressed) {
    const Blob raw = decompress(Blob(compressed, Compression::Brotli));
    if (raw.size() % kTileRecordSize != 0) {
        throw corruption_error("Tile index size " + std::to_string(raw.size()) + " is not a multiple of " +
                               std::to_string(kTileRecordSize));
    }

    TileIndex index(raw.size() / kTileRecordSize);
    detail::ByteReader reader(raw.data());
    for (std::size_t i = 0; i < index.size(); ++i) {
        ByteRange range;
        range.offset = reader.get_u64();
        range.length = reader.get_u32();
        index.set(i, range);
    }
    return index;
}

}  // namespace versatiles

VersaTilesReader::VersaTilesReader(std::unique_ptr<DataReader> data) : _data(std::move(data)) {
    if (_data->size() < versatiles::kHeaderSize) {
        const Bytes head = _data->read_range(ByteRange{0, std::min<std::uint64_t>(_data->size(), 12)});
        // reports a signature mismatch before complaining about the size
        versatiles::FileHeader::from_bytes(head);
    }
    _header = versatiles::FileHeader::from_bytes(read_checked(ByteRange{0, versatiles::kHeaderSize}, "header"));

    _metadata.tile_format = _header.tile_format;
    _metadata.tile_compression = _header.compression;

    if (_header.meta_range.length > 0) {
        const Blob meta(read_checked(_header.meta_range, "metadata"), _header.compression);
        try {
            _metadata.merge_json(decompress(meta).to_string());
        } catch (const format_error &ex) {
            throw corruption_error("Metadata of '" + _data->name() + "' is unreadable: " + ex.what());
        }
    }

    if (_header.blocks_range.length > 0) {
        _blocks = versatiles::BlockIndex::from_bytes(read_checked(_header.blocks_range, "block index"));
    }
    _metadata.pyramid = _blocks.pyramid();

    LOG(DEBUG) << "Opened versatiles container '" << _data->name() << "' with " << _blocks.size()
               << " blocks\n";
}

std::unique_ptr<VersaTilesReader> VersaTilesReader::open(const std::string &source, const RetryPolicy &policy) {
    return std::make_unique<VersaTilesReader>(open_data_reader(source, policy));
}

Bytes VersaTilesReader::read_checked(const ByteRange &range, const std::string &what) {
    if (range.end() < range.offset || range.end() > _data->size()) {
        throw corruption_error("The " + what + " range " + range.to_string() + " of '" + _data->name() +
                               "' exceeds the file size of " + std::to_string(_data->size()) + " bytes");
    }
    return _data->read_range(range);
}

std::shared_ptr<const versatiles::TileIndex> VersaTilesReader::tile_index(const versatiles::BlockDefinition &block) {
    return _tile_indexes.get_or_load(block.key(), [&]() {
        const ByteRange range = block.index_range();
        if (range.end() > _data->size() || range.end() < range.offset) {
            throw corruption_error("Tile index of block " + block.key().to_string() + " at offset " +
                                   std::to_string(range.offset) + " exceeds the file size of " +
                                   std::to_string(_data->size()) + " bytes");
        }
        versatiles::TileIndex index = versatiles::TileIndex::from_bytes(_data->read_range(range));
        const std::uint64_t expected = block.global_bbox().count_tiles();
        if (index.size() != expected) {
            throw corruption_error("Tile index of block " + block.key().to_string() + " at offset " +
                                   std::to_string(range.offset) + " has " + std::to_string(index.size()) +
                                   " entries, expected " + std::to_string(expected));
        }
        return index;
    });
}

namespace {

// Absolute file range of an index entry. The entry must lie inside the
// block's tile data, which itself must lie inside the file.
ByteRange tile_range(const versatiles::BlockDefinition &block, const ByteRange &entry,
                            const TileCoord &coord, std::uint64_t file_size) {
    const ByteRange &tiles = block.tiles_range;
    if (entry.offset > tiles.length || entry.length > tiles.length - entry.offset) {
        throw corruption_error("Tile " + coord.to_string() + " at relative offset " + std::to_string(entry.offset) +
                               " with length " + std::to_string(entry.length) + " exceeds the " +
                               std::to_string(tiles.length) + " bytes of tile data in block " +
                               block.key().to_string());
    }
    const ByteRange range{tiles.offset + entry.offset, entry.length};
    if (range.end() < range.offset || range.end() > file_size) {
        throw corruption_error("Tile " + coord.to_string() + " at offset " + std::to_string(range.offset) +
                               " exceeds the file size of " + std::to_string(file_size) + " bytes");
    }
    return range;
}

}  // namespace

std::optional<Blob> VersaTilesReader::get_tile(const TileCoord &coord) {
    const versatiles::BlockDefinition *block = _blocks.find(coord.block());
    if (block == nullptr) {
        return std::nullopt;
    }
    const TileBBox bbox = block->global_bbox();
    if (!bbox.contains(coord)) {
        return std::nullopt;
    }

    const auto index = tile_index(*block);
    const ByteRange &entry = index->at(bbox.index_of(coord));
    if (entry.length == 0) {
        return std::nullopt;
    }

    return Blob(_data->read_range(tile_range(*block, entry, coord, _data->size())), _header.compression);
}

std::vector<std::pair<TileCoord, Blob>> VersaTilesReader::get_bbox(const TileBBox &bbox) {
    struct Wanted {
        TileCoord coord;
        ByteRange range;
    };

    std::vector<Wanted> wanted;
    for (TileBBox piece : bbox.block_grid(kBlockSize)) {
        const TileCoord key(piece.zoom(), piece.x_min() / kBlockSize, piece.y_min() / kBlockSize);
        const versatiles::BlockDefinition *block = _blocks.find(key);
        if (block == nullptr) {
            continue;
        }
        const TileBBox block_bbox = block->global_bbox();
        piece.intersect_bbox(block_bbox);
        if (piece.is_empty()) {
            continue;
        }

        const auto index = tile_index(*block);
        for (const TileCoord &coord : piece) {
            const ByteRange &entry = index->at(block_bbox.index_of(coord));
            if (entry.length == 0) {
                continue;
            }
            wanted.push_back({coord, tile_range(*block, entry, coord, _data->size())});
        }
    }

    std::sort(wanted.begin(), wanted.end(),
              [](const Wanted &lhs, const Wanted &rhs) { return lhs.range.offset < rhs.range.offset; });

    std::vector<std::pair<TileCoord, Blob>> result;
    result.reserve(wanted.size());

    std::size_t first = 0;
    while (first < wanted.size()) {
        ByteRange chunk = wanted[first].range;
        std::size_t last = first + 1;
        while (last < wanted.size()) {
            const ByteRange &next = wanted[last].range;
            const std::uint64_t end = std::max(chunk.end(), next.end());
            if (next.offset > chunk.end() + versatiles::kMaxChunkGap || end - chunk.offset > versatiles::kMaxChunkSize) {
                break;
            }
            chunk.length = end - chunk.offset;
            ++last;
        }

        const Bytes data = _data->read_range(chunk);
        for (std::size_t i = first; i < last; ++i) {
            const ByteRange &range = wanted[i].range;
            const auto begin = data.begin() + static_cast<std::ptrdiff_t>(range.offset - chunk.offset);
            result.emplace_back(wanted[i].coord,
                                Blob(Bytes(begin, begin + static_cast<std::ptrdiff_t>(range.length)),
                                     _header.compression));
        }
        first = last;
    }

    std::sort(result.begin(), result.end(),
              [](const std::pair<TileCoord, Blob> &lhs, const std::pair<TileCoord, Blob> &rhs) {
                  return lhs.first < rhs.first;
              });
    return result;
}

void VersaTilesReader::probe_container(std::ostream &out) {
    std::uint64_t index_bytes = 0;
    std::uint64_t tile_bytes = 0;
    for (const auto &entry : _blocks.blocks()) {
        index_bytes += entry.second.index_length;
        tile_bytes += entry.second.tiles_range.length;
    }
    out << "block count: " << _blocks.size() << '\n';
    out << "sum of block index sizes: " << index_bytes << '\n';
    out << "sum of block tiles sizes: " << tile_bytes << '\n';
}

VersaTilesWriter::VersaTilesWriter(const std::string &path) : TileWriter(path) {
    _file.open(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!_file) {
        throw io_error("Unable to create '" + path + "'");
    }
    const Bytes placeholder(versatiles::kHeaderSize);
    write_bytes(placeholder.data(), placeholder.size());
}

VersaTilesWriter::~VersaTilesWriter() {
    abort_unfinished();
}

void VersaTilesWriter::write_bytes(const void *data, std::size_t size) {
    _file.write(static_cast<const char *>(data), static_cast<std::streamsize>(size));
    if (!_file) {
        throw io_error("Failed to write " + std::to_string(size) + " bytes to '" + path() + "'");
    }
    _position += size;
}

void VersaTilesWriter::do_write_tile(const TileCoord &coord, const Blob &blob) {
    std::lock_guard<std::mutex> lock(_mutex);
    const TileCoord key = coord.block();

    if (_current_block && *_current_block != key) {
        close_block();
    }
    if (!_current_block) {
        if (_closed_blocks.count(key) > 0) {
            throw order_error("Tile " + coord.to_string() + " belongs to block " + key.to_string() +
                              " which is already written");
        }
        _current_block = key;
        _block_offset = _position;
    }

    if (blob.size() < versatiles::kDedupLimit) {
        const std::string content = blob.to_string();
        const auto it = _block_dedup.find(content);
        if (it != _block_dedup.end()) {
            _block_entries[coord] = it->second;
            return;
        }
        const ByteRange range{_position - _block_offset, blob.size()};
        write_bytes(blob.data().data(), blob.size());
        _block_entries[coord] = range;
        _block_dedup.emplace(content, range);
        return;
    }

    const ByteRange range{_position - _block_offset, blob.size()};
    write_bytes(blob.data().data(), blob.size());
    _block_entries[coord] = range;
}

void VersaTilesWriter::close_block() {
    if (!_current_block) {
        return;
    }

    TileBBox bbox = TileBBox::empty(_current_block->zoom());
    for (const auto &entry : _block_entries) {
        bbox.include_coord(entry.first);
    }

    versatiles::TileIndex index(bbox.count_tiles());
    for (const auto &entry : _block_entries) {
        index.set(bbox.index_of(entry.first), entry.second);
    }

    versatiles::BlockDefinition block = versatiles::BlockDefinition::from_bbox(bbox);
    block.tiles_range = ByteRange{_block_offset, _position - _block_offset};

    const Bytes index_bytes = index.to_bytes();
    write_bytes(index_bytes.data(), index_bytes.size());
    block.index_length = static_cast<std::uint32_t>(index_bytes.size());

    _blocks.add(block);
    _closed_blocks.insert(*_current_block);
    LOG(DEBUG) << "Closed block " << _current_block->to_string() << " with " << _block_entries.size() << " tiles\n";

    _current_block.reset();
    _block_entries.clear();
    _block_dedup.clear();
}

void VersaTilesWriter::do_finalize() {
    std::lock_guard<std::mutex> lock(_mutex);
    close_block();

    const ContainerMetadata &meta = metadata();

    versatiles::FileHeader header;
    header.tile_format = meta.tile_format;
    header.compression = meta.tile_compression;
    if (const auto min_zoom = meta.pyramid.min_zoom()) {
        header.zoom_min = static_cast<std::uint8_t>(*min_zoom);
        header.zoom_max = static_cast<std::uint8_t>(*meta.pyramid.max_zoom());
    }
    if (const auto geo = meta.pyramid.geo_bbox()) {
        header.bbox = *geo;
    }

    const Blob meta_blob = compress(Blob::from_string(meta.to_json()), meta.tile_compression);
    header.meta_range = ByteRange{_position, meta_blob.size()};
    write_bytes(meta_blob.data().data(), meta_blob.size());

    const Bytes block_bytes = _blocks.to_bytes();
    header.blocks_range = ByteRange{_position, block_bytes.size()};
    write_bytes(block_bytes.data(), block_bytes.size());

    const Bytes header_bytes = header.to_bytes();
    _file.seekp(0);
    _file.write(reinterpret_cast<const char *>(header_bytes.data()), static_cast<std::streamsize>(header_bytes.size()));
    _file.flush();
    if (!_file) {
        throw io_error("Failed to write the header of '" + path() + "'");
    }
    _file.close();
}

void VersaTilesWriter::do_abort() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_file.is_open()) {
        _file.close();
    }
    std::error_code ec;
    fs::remove(path(), ec);
    if (ec) {
        throw io_error("Failed to remove '" + path() + "': " + ec.message());
    }
}

}  // namespace tilebox
