#include "tilebox/coord.h"
#include "tilebox/error.h"

#include "string_util.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace tilebox {

namespace {

constexpr double kPi = 3.141592653589793238462643383279502884;
constexpr double kMaxLatitude = 85.05112878;

std::uint64_t tiles_per_side(unsigned zoom) {
    return std::uint64_t{1} << zoom;
}

void check_zoom(unsigned zoom) {
    if (zoom > kMaxZoomLevel) {
        throw config_error("Zoom level " + std::to_string(zoom) + " is outside the supported range 0-" +
                           std::to_string(kMaxZoomLevel));
    }
}

std::uint32_t clamp_tile(double value, unsigned zoom) {
    const double max_index = static_cast<double>(tiles_per_side(zoom) - 1);
    return static_cast<std::uint32_t>(std::clamp(value, 0.0, max_index));
}

std::string format_degrees(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << value;
    return oss.str();
}

}  // namespace

double tile_x_to_lon(double x, unsigned zoom) {
    const double n = x / static_cast<double>(tiles_per_side(zoom));
    return n * 360.0 - 180.0;
}

double tile_y_to_lat(double y, unsigned zoom) {
    const double n = kPi - 2.0 * kPi * y / static_cast<double>(tiles_per_side(zoom));
    return 180.0 / kPi * std::atan(0.5 * (std::exp(n) - std::exp(-n)));
}

double lon_to_tile_x(double lon, unsigned zoom) {
    return (lon + 180.0) / 360.0 * static_cast<double>(tiles_per_side(zoom));
}

double lat_to_tile_y(double lat, unsigned zoom) {
    const double clamped = std::clamp(lat, -kMaxLatitude, kMaxLatitude);
    const double rad = clamped * kPi / 180.0;
    return (1.0 - std::log(std::tan(rad) + 1.0 / std::cos(rad)) / kPi) / 2.0 *
           static_cast<double>(tiles_per_side(zoom));
}

std::string GeoBBox::to_string() const {
    return format_degrees(lon_min) + "," + format_degrees(lat_min) + "," + format_degrees(lon_max) + "," +
           format_degrees(lat_max);
}

GeoBBox parse_geo_bbox(const std::string &value) {
    const auto parts = detail::split(value, ',');
    if (parts.size() != 4) {
        throw config_error("Bounding box must have four comma separated values: '" + value + "'");
    }

    double numbers[4];
    for (std::size_t i = 0; i < 4; ++i) {
        const auto parsed = detail::parse_double(parts[i]);
        if (!parsed || !std::isfinite(*parsed)) {
            throw config_error("Invalid number '" + parts[i] + "' in bounding box '" + value + "'");
        }
        numbers[i] = *parsed;
    }

    GeoBBox bbox;
    bbox.lon_min = numbers[0];
    bbox.lat_min = numbers[1];
    bbox.lon_max = numbers[2];
    bbox.lat_max = numbers[3];

    if (bbox.lon_min < -180.0 || bbox.lon_max > 180.0 || bbox.lat_min < -90.0 || bbox.lat_max > 90.0) {
        throw config_error("Bounding box '" + value + "' exceeds the valid longitude/latitude range");
    }
    if (bbox.lon_min > bbox.lon_max || bbox.lat_min > bbox.lat_max) {
        throw config_error("Bounding box '" + value + "' has minimum values above maximum values");
    }
    return bbox;
}

TileCoord::TileCoord(unsigned zoom, std::uint32_t x, std::uint32_t y) {
    check_zoom(zoom);
    if (!is_valid(zoom, x, y)) {
        throw config_error("Tile coordinate " + std::to_string(zoom) + "/" + std::to_string(x) + "/" +
                           std::to_string(y) + " is outside the range of zoom level " + std::to_string(zoom));
    }
    _zoom = static_cast<std::uint8_t>(zoom);
    _x = x;
    _y = y;
}

bool TileCoord::is_valid(unsigned zoom, std::uint64_t x, std::uint64_t y) noexcept {
    if (zoom > kMaxZoomLevel) {
        return false;
    }
    const std::uint64_t size = tiles_per_side(zoom);
    return x < size && y < size;
}

TileCoord TileCoord::block() const {
    return TileCoord(_zoom, _x / kBlockSize, _y / kBlockSize);
}

std::string TileCoord::to_string() const {
    return std::to_string(_zoom) + "/" + std::to_string(_x) + "/" + std::to_string(_y);
}

TileCoordIterator &TileCoordIterator::operator++() {
    if (_done) {
        return *this;
    }
    if (_x < _x_max) {
        ++_x;
    } else if (_y < _y_max) {
        _x = _x_min;
        ++_y;
    } else {
        _done = true;
    }
    return *this;
}

bool TileCoordIterator::operator==(const TileCoordIterator &other) const noexcept {
    if (_done || other._done) {
        return _done == other._done;
    }
    return _zoom == other._zoom && _x == other._x && _y == other._y;
}

TileBBox::TileBBox(unsigned zoom, std::uint32_t x_min, std::uint32_t y_min, std::uint32_t x_max,
                   std::uint32_t y_max)
    : _zoom(zoom), _x_min(x_min), _y_min(y_min), _x_max(x_max), _y_max(y_max) {
    check_zoom(zoom);
    if (is_empty()) {
        set_empty();
        return;
    }
    const std::uint64_t size = tiles_per_side(zoom);
    if (x_max >= size || y_max >= size) {
        throw config_error("Bounding box " + to_string() + " exceeds the range of zoom level " +
                           std::to_string(zoom));
    }
}

TileBBox TileBBox::empty(unsigned zoom) {
    check_zoom(zoom);
    TileBBox bbox;
    bbox._zoom = zoom;
    return bbox;
}

TileBBox TileBBox::full(unsigned zoom) {
    check_zoom(zoom);
    const auto max_index = static_cast<std::uint32_t>(tiles_per_side(zoom) - 1);
    return TileBBox(zoom, 0, 0, max_index, max_index);
}

TileBBox TileBBox::from_geo(unsigned zoom, const GeoBBox &geo) {
    check_zoom(zoom);
    const std::uint32_t x_min = clamp_tile(std::floor(lon_to_tile_x(geo.lon_min, zoom)), zoom);
    const std::uint32_t y_min = clamp_tile(std::floor(lat_to_tile_y(geo.lat_max, zoom)), zoom);
    std::uint32_t x_max = clamp_tile(std::ceil(lon_to_tile_x(geo.lon_max, zoom)) - 1.0, zoom);
    std::uint32_t y_max = clamp_tile(std::ceil(lat_to_tile_y(geo.lat_min, zoom)) - 1.0, zoom);
    // a degenerate (point or line) geo bbox still covers the tile it lies in
    x_max = std::max(x_max, x_min);
    y_max = std::max(y_max, y_min);
    return TileBBox(zoom, x_min, y_min, x_max, y_max);
}

void TileBBox::set_empty() noexcept {
    _x_min = 1;
    _y_min = 1;
    _x_max = 0;
    _y_max = 0;
}

bool TileBBox::contains(const TileCoord &coord) const noexcept {
    return !is_empty() && coord.zoom() == _zoom && coord.x() >= _x_min && coord.x() <= _x_max &&
           coord.y() >= _y_min && coord.y() <= _y_max;
}

void TileBBox::include_coord(const TileCoord &coord) {
    if (coord.zoom() != _zoom) {
        throw config_error("Cannot include tile " + coord.to_string() + " in a bounding box of zoom level " +
                           std::to_string(_zoom));
    }
    if (is_empty()) {
        _x_min = _x_max = coord.x();
        _y_min = _y_max = coord.y();
        return;
    }
    _x_min = std::min(_x_min, coord.x());
    _y_min = std::min(_y_min, coord.y());
    _x_max = std::max(_x_max, coord.x());
    _y_max = std::max(_y_max, coord.y());
}

void TileBBox::include_bbox(const TileBBox &other) {
    if (other.is_empty()) {
        return;
    }
    if (other._zoom != _zoom) {
        throw config_error("Cannot unite bounding boxes of zoom levels " + std::to_string(_zoom) + " and " +
                           std::to_string(other._zoom));
    }
    if (is_empty()) {
        *this = other;
        return;
    }
    _x_min = std::min(_x_min, other._x_min);
    _y_min = std::min(_y_min, other._y_min);
    _x_max = std::max(_x_max, other._x_max);
    _y_max = std::max(_y_max, other._y_max);
}

void TileBBox::intersect_bbox(const TileBBox &other) {
    if (other._zoom != _zoom) {
        throw config_error("Cannot intersect bounding boxes of zoom levels " + std::to_string(_zoom) + " and " +
                           std::to_string(other._zoom));
    }
    if (is_empty()) {
        return;
    }
    if (other.is_empty()) {
        set_empty();
        return;
    }
    _x_min = std::max(_x_min, other._x_min);
    _y_min = std::max(_y_min, other._y_min);
    _x_max = std::min(_x_max, other._x_max);
    _y_max = std::min(_y_max, other._y_max);
    if (is_empty()) {
        set_empty();
    }
}

std::uint64_t TileBBox::index_of(const TileCoord &coord) const {
    if (!contains(coord)) {
        throw config_error("Tile " + coord.to_string() + " is outside bounding box " + to_string());
    }
    return static_cast<std::uint64_t>(coord.y() - _y_min) * width() + (coord.x() - _x_min);
}

TileCoord TileBBox::coord_at(std::uint64_t index) const {
    if (index >= count_tiles()) {
        throw config_error("Index " + std::to_string(index) + " is outside bounding box " + to_string());
    }
    const auto x = static_cast<std::uint32_t>(index % width()) + _x_min;
    const auto y = static_cast<std::uint32_t>(index / width()) + _y_min;
    return TileCoord(_zoom, x, y);
}

TileBBox TileBBox::scaled_down(std::uint32_t factor) const {
    if (factor == 0) {
        throw config_error("Scale factor must be positive");
    }
    if (is_empty()) {
        return *this;
    }
    TileBBox result = *this;
    result._x_min /= factor;
    result._y_min /= factor;
    result._x_max /= factor;
    result._y_max /= factor;
    return result;
}

TileBBox TileBBox::block_piece(std::uint32_t block_size, std::uint32_t block_x, std::uint32_t block_y) const {
    if (block_size == 0) {
        throw config_error("Block size must be positive");
    }
    TileBBox piece = *this;
    if (is_empty()) {
        return piece;
    }
    const std::uint64_t x0 = static_cast<std::uint64_t>(block_x) * block_size;
    const std::uint64_t y0 = static_cast<std::uint64_t>(block_y) * block_size;
    piece._x_min = static_cast<std::uint32_t>(std::max<std::uint64_t>(x0, _x_min));
    piece._y_min = static_cast<std::uint32_t>(std::max<std::uint64_t>(y0, _y_min));
    piece._x_max = static_cast<std::uint32_t>(std::min<std::uint64_t>(x0 + block_size - 1, _x_max));
    piece._y_max = static_cast<std::uint32_t>(std::min<std::uint64_t>(y0 + block_size - 1, _y_max));
    if (piece.is_empty()) {
        piece.set_empty();
    }
    return piece;
}

std::vector<TileBBox> TileBBox::block_grid(std::uint32_t block_size) const {
    std::vector<TileBBox> pieces;
    if (is_empty()) {
        return pieces;
    }
    const TileBBox blocks = scaled_down(block_size);
    for (std::uint32_t by = blocks._y_min; by <= blocks._y_max; ++by) {
        for (std::uint32_t bx = blocks._x_min; bx <= blocks._x_max; ++bx) {
            pieces.push_back(block_piece(block_size, bx, by));
        }
    }
    return pieces;
}

GeoBBox TileBBox::to_geo() const {
    if (is_empty()) {
        throw config_error("An empty bounding box has no geographic extent");
    }
    GeoBBox geo;
    geo.lon_min = tile_x_to_lon(_x_min, _zoom);
    geo.lon_max = tile_x_to_lon(static_cast<double>(_x_max) + 1.0, _zoom);
    geo.lat_max = tile_y_to_lat(_y_min, _zoom);
    geo.lat_min = tile_y_to_lat(static_cast<double>(_y_max) + 1.0, _zoom);
    return geo;
}

std::string TileBBox::to_string() const {
    if (is_empty()) {
        return "[]";
    }
    return "[" + std::to_string(_x_min) + "," + std::to_string(_y_min) + "," + std::to_string(_x_max) + "," +
           std::to_string(_y_max) + "]";
}

TileCoordIterator TileBBox::begin() const {
    TileCoordIterator it;
    if (is_empty()) {
        return it;
    }
    it._zoom = _zoom;
    it._x_min = _x_min;
    it._x_max = _x_max;
    it._y_max = _y_max;
    it._x = _x_min;
    it._y = _y_min;
    it._done = false;
    return it;
}

TileCoordIterator TileBBox::end() const {
    return TileCoordIterator();
}

bool TileBBox::operator==(const TileBBox &other) const noexcept {
    if (_zoom != other._zoom) {
        return false;
    }
    if (is_empty() || other.is_empty()) {
        return is_empty() == other.is_empty();
    }
    return _x_min == other._x_min && _y_min == other._y_min && _x_max == other._x_max && _y_max == other._y_max;
}

PyramidIterator::PyramidIterator(std::vector<TileBBox> levels) : _levels(std::move(levels)) {}

void PyramidIterator::reset() {
    _level_index = 0;
    _blocks = TileBBox();
    _block_x = 0;
    _block_y = 0;
    _in_level = false;
    _current = TileCoordIterator();
    _current_end = TileCoordIterator();
    _started = false;
}

std::optional<TileBBox> PyramidIterator::next_piece() {
    while (true) {
        if (_in_level) {
            const TileBBox piece = _levels[_level_index - 1].block_piece(kBlockSize, _block_x, _block_y);
            if (_block_x < _blocks.x_max()) {
                ++_block_x;
            } else if (_block_y < _blocks.y_max()) {
                _block_x = _blocks.x_min();
                ++_block_y;
            } else {
                _in_level = false;
            }
            if (!piece.is_empty()) {
                return piece;
            }
            continue;
        }
        if (_level_index >= _levels.size()) {
            return std::nullopt;
        }
        const TileBBox &level = _levels[_level_index++];
        if (level.is_empty()) {
            continue;
        }
        _blocks = level.scaled_down(kBlockSize);
        _block_x = _blocks.x_min();
        _block_y = _blocks.y_min();
        _in_level = true;
    }
}

bool PyramidIterator::advance_piece() {
    const std::optional<TileBBox> piece = next_piece();
    if (!piece) {
        return false;
    }
    _current = piece->begin();
    _current_end = piece->end();
    return true;
}

std::optional<TileCoord> PyramidIterator::next() {
    if (!_started) {
        _started = true;
        if (!advance_piece()) {
            return std::nullopt;
        }
    } else if (_current == _current_end && !advance_piece()) {
        return std::nullopt;
    }

    const TileCoord coord = *_current;
    ++_current;
    return coord;
}

BBoxPyramid BBoxPyramid::full(unsigned max_zoom, unsigned min_zoom) {
    check_zoom(max_zoom);
    if (min_zoom > max_zoom) {
        throw config_error("Minimum zoom " + std::to_string(min_zoom) + " is above maximum zoom " +
                           std::to_string(max_zoom));
    }
    BBoxPyramid pyramid;
    for (unsigned zoom = min_zoom; zoom <= max_zoom; ++zoom) {
        pyramid._levels[zoom] = TileBBox::full(zoom);
    }
    return pyramid;
}

BBoxPyramid BBoxPyramid::from_coords(const std::vector<TileCoord> &coords) {
    BBoxPyramid pyramid;
    for (const auto &coord : coords) {
        pyramid.include_coord(coord);
    }
    return pyramid;
}

void BBoxPyramid::include_coord(const TileCoord &coord) {
    auto it = _levels.find(coord.zoom());
    if (it == _levels.end()) {
        _levels.emplace(coord.zoom(), TileBBox(coord.zoom(), coord.x(), coord.y(), coord.x(), coord.y()));
        return;
    }
    it->second.include_coord(coord);
}

void BBoxPyramid::include_bbox(const TileBBox &bbox) {
    if (bbox.is_empty()) {
        return;
    }
    auto it = _levels.find(bbox.zoom());
    if (it == _levels.end()) {
        _levels.emplace(bbox.zoom(), bbox);
        return;
    }
    it->second.include_bbox(bbox);
}

void BBoxPyramid::set_level(const TileBBox &bbox) {
    if (bbox.is_empty()) {
        _levels.erase(bbox.zoom());
        return;
    }
    _levels[bbox.zoom()] = bbox;
}

TileBBox BBoxPyramid::level(unsigned zoom) const {
    auto it = _levels.find(zoom);
    if (it == _levels.end()) {
        return TileBBox::empty(zoom);
    }
    return it->second;
}

std::vector<TileBBox> BBoxPyramid::levels() const {
    std::vector<TileBBox> result;
    result.reserve(_levels.size());
    for (const auto &entry : _levels) {
        result.push_back(entry.second);
    }
    return result;
}

bool BBoxPyramid::contains(const TileCoord &coord) const noexcept {
    auto it = _levels.find(coord.zoom());
    return it != _levels.end() && it->second.contains(coord);
}

std::uint64_t BBoxPyramid::count_tiles() const noexcept {
    std::uint64_t total = 0;
    for (const auto &entry : _levels) {
        total += entry.second.count_tiles();
    }
    return total;
}

std::optional<unsigned> BBoxPyramid::min_zoom() const noexcept {
    if (_levels.empty()) {
        return std::nullopt;
    }
    return _levels.begin()->first;
}

std::optional<unsigned> BBoxPyramid::max_zoom() const noexcept {
    if (_levels.empty()) {
        return std::nullopt;
    }
    return _levels.rbegin()->first;
}

void BBoxPyramid::intersect(const BBoxPyramid &other) {
    for (auto it = _levels.begin(); it != _levels.end();) {
        auto match = other._levels.find(it->first);
        if (match == other._levels.end()) {
            it = _levels.erase(it);
            continue;
        }
        it->second.intersect_bbox(match->second);
        if (it->second.is_empty()) {
            it = _levels.erase(it);
        } else {
            ++it;
        }
    }
}

void BBoxPyramid::unite(const BBoxPyramid &other) {
    for (const auto &entry : other._levels) {
        include_bbox(entry.second);
    }
}

void BBoxPyramid::limit_zoom(unsigned min_zoom, unsigned max_zoom) {
    if (min_zoom > max_zoom) {
        throw config_error("Minimum zoom " + std::to_string(min_zoom) + " is above maximum zoom " +
                           std::to_string(max_zoom));
    }
    for (auto it = _levels.begin(); it != _levels.end();) {
        if (it->first < min_zoom || it->first > max_zoom) {
            it = _levels.erase(it);
        } else {
            ++it;
        }
    }
}

void BBoxPyramid::intersect_geo(const GeoBBox &geo) {
    for (auto it = _levels.begin(); it != _levels.end();) {
        it->second.intersect_bbox(TileBBox::from_geo(it->first, geo));
        if (it->second.is_empty()) {
            it = _levels.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<GeoBBox> BBoxPyramid::geo_bbox() const {
    if (_levels.empty()) {
        return std::nullopt;
    }
    return _levels.rbegin()->second.to_geo();
}

PyramidIterator BBoxPyramid::iter() const {
    return PyramidIterator(levels());
}

std::string BBoxPyramid::to_string() const {
    std::string result;
    for (const auto &entry : _levels) {
        if (!result.empty()) {
            result += ' ';
        }
        result += std::to_string(entry.first) + ":" + entry.second.to_string();
    }
    return result;
}

}  // namespace tilebox
