#include <gtest/gtest.h>

#include "tilebox/error.h"
#include "tilebox/server.h"

#include "test_helpers.h"

#include "httplib.h"
#include <json/json.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace tilebox;
using tilebox_test::MemoryReader;
using tilebox_test::sample_tile;

namespace {

std::shared_ptr<MemoryReader> vector_source(Compression compression) {
    auto reader = std::make_shared<MemoryReader>(TileFormat::PBF, compression);
    reader->mutable_metadata().set("name", "osm");
    for (const TileCoord &coord : tilebox_test::all_coords(BBoxPyramid::full(2))) {
        reader->add(coord, sample_tile(coord));
    }
    return reader;
}

Json::Value parse_json(const std::string &text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
    return root;
}

}  // namespace

// ============================================================================
// Compression negotiation
// ============================================================================

TEST(ServeTileTest, KeepsStoredCompressionWhenAccepted) {
    auto reader = vector_source(Compression::Brotli);
    const auto served = serve_tile(*reader, TileCoord(1, 0, 1), TargetCompression::all());
    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served->blob.compression(), Compression::Brotli);
    EXPECT_EQ(served->content_type, "application/x-protobuf");
    EXPECT_EQ(decompress(served->blob), sample_tile(TileCoord(1, 0, 1)));
}

TEST(ServeTileTest, UncompressedTileIsGzippedForGzipOnlyClients) {
    auto reader = std::make_shared<MemoryReader>(TileFormat::PNG, Compression::Uncompressed);
    reader->add(TileCoord(0, 0, 0), Blob::from_string("original bytes"));

    const auto served = serve_tile(*reader, TileCoord(0, 0, 0), TargetCompression::from(Compression::Gzip));
    ASSERT_TRUE(served.has_value());
    EXPECT_EQ(served->blob.compression(), Compression::Gzip);
    EXPECT_EQ(decompress(served->blob), Blob::from_string("original bytes"));
}

TEST(ServeTileTest, FallsBackToUncompressedThenBrotli) {
    auto reader = vector_source(Compression::Gzip);

    const auto plain = serve_tile(*reader, TileCoord(0, 0, 0), TargetCompression::from_none());
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->blob.compression(), Compression::Uncompressed);
    EXPECT_EQ(plain->blob, sample_tile(TileCoord(0, 0, 0)));

    const auto brotli = serve_tile(*reader, TileCoord(0, 0, 0), TargetCompression({Compression::Brotli}));
    ASSERT_TRUE(brotli.has_value());
    EXPECT_EQ(brotli->blob.compression(), Compression::Brotli);
    EXPECT_EQ(decompress(brotli->blob), sample_tile(TileCoord(0, 0, 0)));
}

TEST(ServeTileTest, AbsentAndOutsideTilesAreNotFound) {
    auto reader = vector_source(Compression::Gzip);
    EXPECT_FALSE(serve_tile(*reader, TileCoord(5, 0, 0), TargetCompression::all()).has_value());
    EXPECT_THROW(serve_tile(*reader, TileCoord(0, 0, 0), TargetCompression(std::set<Compression>{})), config_error);
}

// ============================================================================
// Routing
// ============================================================================

TEST(TileServerTest, NormalizesPrefixes) {
    EXPECT_EQ(normalize_prefix("osm"), "/osm/");
    EXPECT_EQ(normalize_prefix("/tiles/osm/"), "/tiles/osm/");
    EXPECT_EQ(normalize_prefix(" //x// "), "/x/");
    EXPECT_EQ(normalize_prefix(""), "/");
}

TEST(TileServerTest, RejectsClashingAndReservedPrefixes) {
    TileServer server;
    server.add_source("osm", vector_source(Compression::Gzip));
    EXPECT_THROW(server.add_source("/osm/", vector_source(Compression::Gzip)), config_error);
    EXPECT_THROW(server.add_source("status", vector_source(Compression::Gzip)), config_error);
    EXPECT_THROW(server.add_source("empty", nullptr), config_error);
    EXPECT_EQ(server.prefixes(), (std::vector<std::string>{"/osm/"}));
}

TEST(TileServerTest, ServesTilesAndMetadata) {
    TileServer server;
    server.add_source("osm", vector_source(Compression::Gzip));

    const auto tile = server.handle("/osm/2/3/1.pbf", "gzip, br");
    EXPECT_EQ(tile.status, 200);
    EXPECT_EQ(tile.content_type, "application/x-protobuf");
    EXPECT_EQ(tile.content_encoding, "gzip");
    EXPECT_EQ(decompress(Blob::from_string(tile.body, Compression::Gzip)), sample_tile(TileCoord(2, 3, 1)));

    const auto plain = server.handle("/osm/2/3/1", "");
    EXPECT_EQ(plain.status, 200);
    EXPECT_TRUE(plain.content_encoding.empty());
    EXPECT_EQ(plain.body, sample_tile(TileCoord(2, 3, 1)).to_string());

    const auto meta = server.handle("/osm/meta.json", "");
    EXPECT_EQ(meta.status, 200);
    EXPECT_EQ(meta.content_type, "application/json");
    EXPECT_EQ(parse_json(meta.body)["name"].asString(), "osm");
    EXPECT_EQ(server.handle("/osm/tiles.json", "").status, 200);
}

TEST(TileServerTest, ReportsClientErrors) {
    TileServer server;
    server.add_source("osm", vector_source(Compression::Gzip));

    EXPECT_EQ(server.handle("/unknown/0/0/0", "").status, 404);
    EXPECT_EQ(server.handle("/osm/0/0", "").status, 404);
    EXPECT_EQ(server.handle("/osm/a/0/0", "").status, 400);
    EXPECT_EQ(server.handle("/osm/0/-1/0", "").status, 400);
    // valid numbers outside the zoom level's range
    EXPECT_EQ(server.handle("/osm/1/2/0", "").status, 400);
    EXPECT_EQ(server.handle("/osm/0/0/1", "").status, 400);
    EXPECT_EQ(server.handle("/osm/31/0/0", "").status, 400);
    // zoom 5 is outside the stored pyramid
    EXPECT_EQ(server.handle("/osm/5/0/0", "").status, 404);
}

TEST(TileServerTest, ReadFailuresBecomeServerErrors) {
    auto reader = vector_source(Compression::Gzip);
    reader->fail_at(TileCoord(1, 1, 1));
    TileServer server;
    server.add_source("osm", reader);

    const auto response = server.handle("/osm/1/1/1", "gzip");
    EXPECT_EQ(response.status, 500);
    EXPECT_NE(response.body.find("simulated read failure"), std::string::npos);
}

TEST(TileServerTest, NestedPrefixesAreRejected) {
    auto outer = vector_source(Compression::Gzip);
    auto inner = std::make_shared<MemoryReader>(TileFormat::PNG, Compression::Uncompressed);
    inner->add(TileCoord(0, 0, 0), Blob::from_string("inner"));

    TileServer server;
    server.add_source("tiles", outer);
    EXPECT_THROW(server.add_source("tiles/raster", inner), config_error);
    EXPECT_THROW(server.add_source("status/raster", inner), config_error);
    server.add_source("raster", inner);

    TileServer reversed;
    reversed.add_source("tiles/raster", inner);
    EXPECT_THROW(reversed.add_source("tiles", outer), config_error);
    EXPECT_THROW(reversed.add_source("", outer), config_error);
    // sharing leading characters is not nesting
    reversed.add_source("tiles/rasterized", outer);
    EXPECT_EQ(reversed.prefixes(), (std::vector<std::string>{"/tiles/raster/", "/tiles/rasterized/"}));

    const auto response = reversed.handle("/tiles/raster/0/0/0.png", "");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "image/png");
    EXPECT_EQ(response.body, "inner");
}

TEST(TileServerTest, StatusListsSources) {
    TileServer server;
    server.add_source("osm", vector_source(Compression::Brotli));

    const auto response = server.handle("/status", "");
    EXPECT_EQ(response.status, 200);
    const Json::Value root = parse_json(response.body);
    ASSERT_EQ(root["sources"].size(), 1u);
    const Json::Value &source = root["sources"][0];
    EXPECT_EQ(source["prefix"].asString(), "/osm/");
    EXPECT_EQ(source["container"].asString(), "memory");
    EXPECT_EQ(source["tile_format"].asString(), "pbf");
    EXPECT_EQ(source["tile_compression"].asString(), to_string(Compression::Brotli));
    EXPECT_EQ(source["pyramid"].asString(), "0:[0,0,0,0] 1:[0,0,1,1] 2:[0,0,3,3]");
}

// ============================================================================
// HTTP
// ============================================================================

TEST(TileServerTest, AnswersOverHttp) {
    TileServer server;
    server.add_source("osm", vector_source(Compression::Brotli));
    const int port = server.bind("127.0.0.1", 0);
    ASSERT_GT(port, 0);

    std::thread thread([&server]() { server.listen_after_bind(); });
    while (!server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    httplib::Client client("127.0.0.1", port);
    client.set_decompress(false);

    const httplib::Headers modern{{"Accept-Encoding", "gzip, br"}};
    const auto brotli = client.Get("/osm/1/0/0", modern);
    ASSERT_TRUE(brotli);
    EXPECT_EQ(brotli->status, 200);
    EXPECT_EQ(brotli->get_header_value("Content-Type"), "application/x-protobuf");
    EXPECT_EQ(brotli->get_header_value("Content-Encoding"), "br");
    EXPECT_EQ(brotli->get_header_value("Vary"), "Accept-Encoding");
    EXPECT_EQ(decompress(Blob::from_string(brotli->body, Compression::Brotli)), sample_tile(TileCoord(1, 0, 0)));

    // brotli tiles are decoded for clients that only speak gzip
    const httplib::Headers legacy{{"Accept-Encoding", "gzip"}};
    const auto plain = client.Get("/osm/1/0/0", legacy);
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain->status, 200);
    EXPECT_FALSE(plain->has_header("Content-Encoding"));
    EXPECT_EQ(plain->body, sample_tile(TileCoord(1, 0, 0)).to_string());

    const auto missing = client.Get("/osm/9/0/0");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    server.stop();
    thread.join();
    EXPECT_FALSE(server.is_running());
}
