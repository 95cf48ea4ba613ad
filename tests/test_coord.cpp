#include <gtest/gtest.h>

#include "tilebox/coord.h"
#include "tilebox/error.h"

#include "test_helpers.h"

#include <optional>
#include <set>
#include <vector>

using namespace tilebox;

// ============================================================================
// TileCoord
// ============================================================================

TEST(TileCoordTest, ValidatesRangePerZoom) {
    EXPECT_TRUE(TileCoord::is_valid(0, 0, 0));
    EXPECT_FALSE(TileCoord::is_valid(0, 1, 0));
    EXPECT_TRUE(TileCoord::is_valid(3, 7, 7));
    EXPECT_FALSE(TileCoord::is_valid(3, 8, 0));
    EXPECT_TRUE(TileCoord::is_valid(30, (1u << 30) - 1, (1u << 30) - 1));
    EXPECT_FALSE(TileCoord::is_valid(31, 0, 0));

    EXPECT_THROW(TileCoord(3, 8, 0), config_error);
    EXPECT_THROW(TileCoord(31, 0, 0), config_error);
}

TEST(TileCoordTest, BlockKeyAndOrdering) {
    const TileCoord coord(10, 700, 300);
    EXPECT_EQ(coord.block(), TileCoord(10, 2, 1));
    EXPECT_EQ(coord.to_string(), "10/700/300");

    EXPECT_LT(TileCoord(1, 1, 1), TileCoord(2, 0, 0));
    EXPECT_LT(TileCoord(2, 3, 0), TileCoord(2, 0, 1));
    EXPECT_LT(TileCoord(2, 0, 1), TileCoord(2, 1, 1));
}

// ============================================================================
// TileBBox
// ============================================================================

TEST(TileBBoxTest, CountsAndContainment) {
    const TileBBox bbox(4, 2, 3, 5, 4);
    EXPECT_EQ(bbox.width(), 4u);
    EXPECT_EQ(bbox.height(), 2u);
    EXPECT_EQ(bbox.count_tiles(), 8u);
    EXPECT_TRUE(bbox.contains(TileCoord(4, 2, 3)));
    EXPECT_TRUE(bbox.contains(TileCoord(4, 5, 4)));
    EXPECT_FALSE(bbox.contains(TileCoord(4, 6, 4)));
    EXPECT_FALSE(bbox.contains(TileCoord(5, 2, 3)));
    EXPECT_THROW(TileBBox(2, 0, 0, 4, 0), config_error);
}

TEST(TileBBoxTest, EmptyBoxYieldsNothing) {
    const TileBBox empty = TileBBox::empty(5);
    EXPECT_TRUE(empty.is_empty());
    EXPECT_EQ(empty.count_tiles(), 0u);
    EXPECT_EQ(empty.begin(), empty.end());
    EXPECT_TRUE(empty.block_grid(kBlockSize).empty());
    EXPECT_THROW(empty.to_geo(), config_error);
}

TEST(TileBBoxTest, IteratesRowMajorAndRestarts) {
    const TileBBox bbox(2, 1, 1, 2, 2);
    std::vector<TileCoord> first(bbox.begin(), bbox.end());
    const std::vector<TileCoord> expected = {TileCoord(2, 1, 1), TileCoord(2, 2, 1), TileCoord(2, 1, 2),
                                             TileCoord(2, 2, 2)};
    EXPECT_EQ(first, expected);

    std::vector<TileCoord> second;
    for (const TileCoord &coord : bbox) {
        second.push_back(coord);
    }
    EXPECT_EQ(second, expected);
}

TEST(TileBBoxTest, IndexOfAndCoordAtAreInverse) {
    const TileBBox bbox(6, 10, 20, 14, 23);
    for (std::uint64_t i = 0; i < bbox.count_tiles(); ++i) {
        EXPECT_EQ(bbox.index_of(bbox.coord_at(i)), i);
    }
    EXPECT_EQ(bbox.index_of(TileCoord(6, 11, 21)), 6u);
    EXPECT_THROW(bbox.index_of(TileCoord(6, 9, 20)), config_error);
    EXPECT_THROW(bbox.coord_at(bbox.count_tiles()), config_error);
}

TEST(TileBBoxTest, UnionAndIntersection) {
    TileBBox bbox = TileBBox::empty(3);
    bbox.include_coord(TileCoord(3, 4, 5));
    bbox.include_coord(TileCoord(3, 1, 2));
    EXPECT_EQ(bbox, TileBBox(3, 1, 2, 4, 5));

    bbox.include_bbox(TileBBox(3, 6, 0, 7, 1));
    EXPECT_EQ(bbox, TileBBox(3, 1, 0, 7, 5));

    bbox.intersect_bbox(TileBBox(3, 0, 4, 2, 7));
    EXPECT_EQ(bbox, TileBBox(3, 1, 4, 2, 5));

    bbox.intersect_bbox(TileBBox(3, 5, 5, 6, 6));
    EXPECT_TRUE(bbox.is_empty());

    EXPECT_THROW(bbox.include_coord(TileCoord(2, 0, 0)), config_error);
}

TEST(TileBBoxTest, BlockGridSplitsAtBlockBoundaries) {
    const TileBBox bbox(10, 250, 10, 520, 12);
    const auto pieces = bbox.block_grid(kBlockSize);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[0], TileBBox(10, 250, 10, 255, 12));
    EXPECT_EQ(pieces[1], TileBBox(10, 256, 10, 511, 12));
    EXPECT_EQ(pieces[2], TileBBox(10, 512, 10, 520, 12));

    EXPECT_EQ(bbox.scaled_down(kBlockSize), TileBBox(10, 0, 0, 2, 0));
}

TEST(TileBBoxTest, GeoConversionCoversWorldAtZeroAndBerlinAtEleven) {
    EXPECT_EQ(TileBBox::from_geo(0, GeoBBox{}), TileBBox::full(0));
    EXPECT_EQ(TileBBox::from_geo(2, GeoBBox{}), TileBBox::full(2));

    const TileBBox berlin = TileBBox::from_geo(11, parse_geo_bbox("13.38,52.51,13.39,52.52"));
    EXPECT_FALSE(berlin.is_empty());
    EXPECT_TRUE(berlin.contains(TileCoord(11, 1100, 671)));

    const GeoBBox world = TileBBox::full(0).to_geo();
    EXPECT_DOUBLE_EQ(world.lon_min, -180.0);
    EXPECT_DOUBLE_EQ(world.lon_max, 180.0);
    EXPECT_NEAR(world.lat_max, 85.0511, 1e-3);
}

TEST(GeoBBoxTest, ParsesAndRejects) {
    const GeoBBox bbox = parse_geo_bbox(" -10.5, 20 ,30,40.25");
    EXPECT_DOUBLE_EQ(bbox.lon_min, -10.5);
    EXPECT_DOUBLE_EQ(bbox.lat_min, 20.0);
    EXPECT_DOUBLE_EQ(bbox.lon_max, 30.0);
    EXPECT_DOUBLE_EQ(bbox.lat_max, 40.25);

    EXPECT_THROW(parse_geo_bbox("1,2,3"), config_error);
    EXPECT_THROW(parse_geo_bbox("1,2,3,x"), config_error);
    EXPECT_THROW(parse_geo_bbox("10,0,5,1"), config_error);
    EXPECT_THROW(parse_geo_bbox("-190,0,5,1"), config_error);
}

// ============================================================================
// BBoxPyramid
// ============================================================================

TEST(BBoxPyramidTest, FullPyramidCountsAndPrints) {
    const BBoxPyramid pyramid = BBoxPyramid::full(2);
    EXPECT_EQ(pyramid.count_tiles(), 1u + 4u + 16u);
    EXPECT_EQ(*pyramid.min_zoom(), 0u);
    EXPECT_EQ(*pyramid.max_zoom(), 2u);
    EXPECT_EQ(pyramid.to_string(), "0:[0,0,0,0] 1:[0,0,1,1] 2:[0,0,3,3]");
    EXPECT_THROW(BBoxPyramid::full(31), config_error);
}

TEST(BBoxPyramidTest, FromCoordsAndContains) {
    const BBoxPyramid pyramid =
        BBoxPyramid::from_coords({TileCoord(3, 1, 1), TileCoord(3, 2, 4), TileCoord(5, 0, 0)});
    EXPECT_EQ(pyramid.level(3), TileBBox(3, 1, 1, 2, 4));
    EXPECT_EQ(pyramid.level(5), TileBBox(5, 0, 0, 0, 0));
    EXPECT_TRUE(pyramid.level(4).is_empty());
    EXPECT_TRUE(pyramid.contains(TileCoord(3, 2, 2)));
    EXPECT_FALSE(pyramid.contains(TileCoord(4, 0, 0)));
    EXPECT_EQ(pyramid.levels().size(), 2u);
}

TEST(BBoxPyramidTest, LimitIntersectAndUnite) {
    BBoxPyramid pyramid = BBoxPyramid::full(5);
    pyramid.limit_zoom(2, 4);
    EXPECT_EQ(*pyramid.min_zoom(), 2u);
    EXPECT_EQ(*pyramid.max_zoom(), 4u);
    EXPECT_THROW(pyramid.limit_zoom(4, 2), config_error);

    BBoxPyramid other;
    other.include_bbox(TileBBox(3, 0, 0, 1, 1));
    other.include_bbox(TileBBox(6, 0, 0, 1, 1));
    pyramid.intersect(other);
    EXPECT_EQ(pyramid.to_string(), "3:[0,0,1,1]");

    BBoxPyramid extra;
    extra.include_coord(TileCoord(3, 5, 5));
    extra.include_coord(TileCoord(1, 1, 0));
    pyramid.unite(extra);
    EXPECT_EQ(pyramid.to_string(), "1:[1,0,1,0] 3:[0,0,5,5]");
}

TEST(BBoxPyramidTest, IntersectGeoKeepsEasternHemisphere) {
    BBoxPyramid pyramid = BBoxPyramid::full(3);
    pyramid.intersect_geo(parse_geo_bbox("0.5,-80,179,80"));
    EXPECT_EQ(pyramid.level(0), TileBBox::full(0));
    EXPECT_EQ(pyramid.level(1), TileBBox(1, 1, 0, 1, 1));
    EXPECT_EQ(pyramid.level(3).x_min(), 4u);
}

TEST(BBoxPyramidTest, EmptyPyramid) {
    const BBoxPyramid pyramid;
    EXPECT_TRUE(pyramid.is_empty());
    EXPECT_EQ(pyramid.count_tiles(), 0u);
    EXPECT_FALSE(pyramid.min_zoom().has_value());
    EXPECT_FALSE(pyramid.geo_bbox().has_value());
    PyramidIterator it = pyramid.iter();
    EXPECT_FALSE(it.next().has_value());
}

// ============================================================================
// Canonical order
// ============================================================================

TEST(PyramidIteratorTest, LowZoomsArePlainRowMajor) {
    const auto coords = tilebox_test::all_coords(BBoxPyramid::full(2));
    ASSERT_EQ(coords.size(), 21u);
    EXPECT_EQ(coords[0], TileCoord(0, 0, 0));
    EXPECT_EQ(coords[1], TileCoord(1, 0, 0));
    EXPECT_EQ(coords[2], TileCoord(1, 1, 0));
    EXPECT_EQ(coords[3], TileCoord(1, 0, 1));
    EXPECT_EQ(coords[5], TileCoord(2, 0, 0));
    EXPECT_EQ(coords[20], TileCoord(2, 3, 3));
}

TEST(PyramidIteratorTest, HighZoomsWalkBlockByBlock) {
    BBoxPyramid pyramid;
    pyramid.include_bbox(TileBBox(9, 254, 0, 257, 1));
    const auto coords = tilebox_test::all_coords(pyramid);
    const std::vector<TileCoord> expected = {
        TileCoord(9, 254, 0), TileCoord(9, 255, 0), TileCoord(9, 254, 1), TileCoord(9, 255, 1),
        TileCoord(9, 256, 0), TileCoord(9, 257, 0), TileCoord(9, 256, 1), TileCoord(9, 257, 1),
    };
    EXPECT_EQ(coords, expected);

    // every block is visited in one contiguous run
    std::set<TileCoord> finished;
    std::optional<TileCoord> current;
    for (const TileCoord &coord : coords) {
        if (current && *current != coord.block()) {
            finished.insert(*current);
        }
        EXPECT_EQ(finished.count(coord.block()), 0u);
        current = coord.block();
    }
}

TEST(PyramidIteratorTest, DeepFullLevelsStartImmediately) {
    BBoxPyramid pyramid;
    pyramid.set_level(TileBBox::full(30));
    PyramidIterator it = pyramid.iter();
    EXPECT_EQ(it.next(), std::optional<TileCoord>(TileCoord(30, 0, 0)));
    EXPECT_EQ(it.next(), std::optional<TileCoord>(TileCoord(30, 1, 0)));

    // the first block is finished before the walk moves right
    for (std::uint32_t i = 2; i < kBlockSize * kBlockSize; ++i) {
        ASSERT_TRUE(it.next().has_value());
    }
    EXPECT_EQ(it.next(), std::optional<TileCoord>(TileCoord(30, 256, 0)));
}

TEST(PyramidIteratorTest, PiecesFollowTheBlockGrid) {
    BBoxPyramid pyramid = BBoxPyramid::full(1);
    pyramid.set_level(TileBBox(24, 250, 3, 520, 4));
    PyramidIterator it = pyramid.iter();
    EXPECT_EQ(it.next_piece(), std::optional<TileBBox>(TileBBox::full(0)));
    EXPECT_EQ(it.next_piece(), std::optional<TileBBox>(TileBBox::full(1)));
    EXPECT_EQ(it.next_piece(), std::optional<TileBBox>(TileBBox(24, 250, 3, 255, 4)));
    EXPECT_EQ(it.next_piece(), std::optional<TileBBox>(TileBBox(24, 256, 3, 511, 4)));
    EXPECT_EQ(it.next_piece(), std::optional<TileBBox>(TileBBox(24, 512, 3, 520, 4)));
    EXPECT_FALSE(it.next_piece().has_value());

    BBoxPyramid deep;
    deep.set_level(TileBBox::full(24));
    PyramidIterator full_it = deep.iter();
    EXPECT_EQ(full_it.next_piece(), std::optional<TileBBox>(TileBBox(24, 0, 0, 255, 255)));
    EXPECT_EQ(full_it.next_piece(), std::optional<TileBBox>(TileBBox(24, 256, 0, 511, 255)));
}

TEST(PyramidIteratorTest, ResetRestartsTheWalk) {
    PyramidIterator it = BBoxPyramid::full(1).iter();
    ASSERT_TRUE(it.next().has_value());
    ASSERT_TRUE(it.next().has_value());
    it.reset();
    const auto first = it.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, TileCoord(0, 0, 0));

    std::size_t remaining = 0;
    while (it.next()) {
        ++remaining;
    }
    EXPECT_EQ(remaining, 4u);
    EXPECT_FALSE(it.next().has_value());
}
