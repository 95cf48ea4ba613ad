#ifndef TILEBOX_COORD_H
#define TILEBOX_COORD_H
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tilebox {

// Highest zoom level any container may address.
constexpr unsigned kMaxZoomLevel = 30;

// Side length, in tiles, of one block of the binary container index.
constexpr std::uint32_t kBlockSize = 256;

struct GeoBBox {
    double lon_min = -180.0;
    double lat_min = -85.05112878;
    double lon_max = 180.0;
    double lat_max = 85.05112878;

    std::string to_string() const;
};

// Parses "lon_min,lat_min,lon_max,lat_max".
GeoBBox parse_geo_bbox(const std::string &value);

double tile_x_to_lon(double x, unsigned zoom);
double tile_y_to_lat(double y, unsigned zoom);
double lon_to_tile_x(double lon, unsigned zoom);
double lat_to_tile_y(double lat, unsigned zoom);

class TileCoord {
public:
    TileCoord() = default;
    TileCoord(unsigned zoom, std::uint32_t x, std::uint32_t y);

    static bool is_valid(unsigned zoom, std::uint64_t x, std::uint64_t y) noexcept;

    unsigned zoom() const noexcept { return _zoom; }
    std::uint32_t x() const noexcept { return _x; }
    std::uint32_t y() const noexcept { return _y; }

    // Key of the index block holding this tile.
    TileCoord block() const;

    std::string to_string() const;

    bool operator==(const TileCoord &other) const noexcept {
        return _zoom == other._zoom && _x == other._x && _y == other._y;
    }
    bool operator!=(const TileCoord &other) const noexcept { return !(*this == other); }
    bool operator<(const TileCoord &other) const noexcept {
        if (_zoom != other._zoom) {
            return _zoom < other._zoom;
        }
        if (_y != other._y) {
            return _y < other._y;
        }
        return _x < other._x;
    }

private:
    std::uint8_t _zoom = 0;
    std::uint32_t _x = 0;
    std::uint32_t _y = 0;
};

class TileBBox;

// Row-major walk over a TileBBox: y outer, x inner.
class TileCoordIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = TileCoord;
    using difference_type = std::ptrdiff_t;
    using pointer = const TileCoord *;
    using reference = TileCoord;

    TileCoordIterator() = default;

    TileCoord operator*() const { return TileCoord(_zoom, _x, _y); }
    TileCoordIterator &operator++();
    TileCoordIterator operator++(int) {
        TileCoordIterator copy = *this;
        ++*this;
        return copy;
    }

    bool operator==(const TileCoordIterator &other) const noexcept;
    bool operator!=(const TileCoordIterator &other) const noexcept { return !(*this == other); }

private:
    unsigned _zoom = 0;
    std::uint32_t _x_min = 0;
    std::uint32_t _x_max = 0;
    std::uint32_t _y_max = 0;
    std::uint32_t _x = 0;
    std::uint32_t _y = 0;
    bool _done = true;

    friend class TileBBox;
};

class TileBBox {
public:
    // Empty bbox at zoom 0.
    TileBBox() = default;
    TileBBox(unsigned zoom, std::uint32_t x_min, std::uint32_t y_min, std::uint32_t x_max,
             std::uint32_t y_max);

    static TileBBox empty(unsigned zoom);
    static TileBBox full(unsigned zoom);
    static TileBBox from_geo(unsigned zoom, const GeoBBox &geo);

    unsigned zoom() const noexcept { return _zoom; }
    std::uint32_t x_min() const noexcept { return _x_min; }
    std::uint32_t y_min() const noexcept { return _y_min; }
    std::uint32_t x_max() const noexcept { return _x_max; }
    std::uint32_t y_max() const noexcept { return _y_max; }

    bool is_empty() const noexcept { return _x_max < _x_min || _y_max < _y_min; }
    std::uint32_t width() const noexcept { return is_empty() ? 0 : _x_max - _x_min + 1; }
    std::uint32_t height() const noexcept { return is_empty() ? 0 : _y_max - _y_min + 1; }
    std::uint64_t count_tiles() const noexcept {
        return static_cast<std::uint64_t>(width()) * static_cast<std::uint64_t>(height());
    }

    bool contains(const TileCoord &coord) const noexcept;

    void include_coord(const TileCoord &coord);
    void include_bbox(const TileBBox &other);
    void intersect_bbox(const TileBBox &other);

    // Row-major position of a contained coordinate, and its inverse.
    std::uint64_t index_of(const TileCoord &coord) const;
    TileCoord coord_at(std::uint64_t index) const;

    // Bounds divided by factor, same zoom (used to address index blocks).
    TileBBox scaled_down(std::uint32_t factor) const;

    // Splits the bbox at multiples of block_size; pieces come row-major over blocks.
    std::vector<TileBBox> block_grid(std::uint32_t block_size) const;
    // The part of this bbox inside block (block_x, block_y); empty when they do not overlap.
    TileBBox block_piece(std::uint32_t block_size, std::uint32_t block_x, std::uint32_t block_y) const;

    GeoBBox to_geo() const;
    std::string to_string() const;

    TileCoordIterator begin() const;
    TileCoordIterator end() const;

    bool operator==(const TileBBox &other) const noexcept;
    bool operator!=(const TileBBox &other) const noexcept { return !(*this == other); }

private:
    void set_empty() noexcept;

    unsigned _zoom = 0;
    std::uint32_t _x_min = 1;
    std::uint32_t _y_min = 1;
    std::uint32_t _x_max = 0;
    std::uint32_t _y_max = 0;
};

class BBoxPyramid;

// Lazy, restartable walk over a pyramid in canonical order: zoom ascending,
// block-aligned pieces row-major, tiles row-major inside each piece.
// Pieces are computed one at a time, so full high-zoom levels cost nothing up front.
// Use either next() or next_piece() on one iterator, not both.
class PyramidIterator {
public:
    explicit PyramidIterator(std::vector<TileBBox> levels);

    std::optional<TileCoord> next();
    std::optional<TileBBox> next_piece();
    void reset();

private:
    bool advance_piece();

    std::vector<TileBBox> _levels;
    std::size_t _level_index = 0;
    TileBBox _blocks;
    std::uint32_t _block_x = 0;
    std::uint32_t _block_y = 0;
    bool _in_level = false;
    TileCoordIterator _current;
    TileCoordIterator _current_end;
    bool _started = false;
};

class BBoxPyramid {
public:
    BBoxPyramid() = default;

    static BBoxPyramid full(unsigned max_zoom, unsigned min_zoom = 0);
    static BBoxPyramid from_coords(const std::vector<TileCoord> &coords);

    void include_coord(const TileCoord &coord);
    void include_bbox(const TileBBox &bbox);
    void set_level(const TileBBox &bbox);

    // Empty bbox when the zoom level is not covered.
    TileBBox level(unsigned zoom) const;
    std::vector<TileBBox> levels() const;

    bool contains(const TileCoord &coord) const noexcept;
    bool is_empty() const noexcept { return _levels.empty(); }
    std::uint64_t count_tiles() const noexcept;

    std::optional<unsigned> min_zoom() const noexcept;
    std::optional<unsigned> max_zoom() const noexcept;

    void intersect(const BBoxPyramid &other);
    void unite(const BBoxPyramid &other);
    void limit_zoom(unsigned min_zoom, unsigned max_zoom);
    void intersect_geo(const GeoBBox &geo);

    // Geographic extent of the highest zoom level.
    std::optional<GeoBBox> geo_bbox() const;

    PyramidIterator iter() const;
    std::string to_string() const;

    bool operator==(const BBoxPyramid &other) const { return _levels == other._levels; }
    bool operator!=(const BBoxPyramid &other) const { return !(*this == other); }

private:
    std::map<unsigned, TileBBox> _levels;
};

}  // namespace tilebox

namespace std {
template <>
struct hash<tilebox::TileCoord> {
    std::size_t operator()(const tilebox::TileCoord &coord) const noexcept {
        std::uint64_t key = (static_cast<std::uint64_t>(coord.zoom()) << 58) ^
                            (static_cast<std::uint64_t>(coord.x()) << 29) ^ coord.y();
        return std::hash<std::uint64_t>()(key);
    }
};
}  // namespace std

#endif // TILEBOX_COORD_H
