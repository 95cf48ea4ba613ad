#ifndef TILEBOX_SERVER_H
#define TILEBOX_SERVER_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/reader.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tilebox {

struct ServedTile {
    Blob blob;
    std::string content_type;
};

// Returns the tile in a compression the client accepts: the stored one when
// possible, else uncompressed, else the best accepted (brotli before gzip).
std::optional<ServedTile> serve_tile(TileReader &reader, const TileCoord &coord, const TargetCompression &accepted);

struct ServerOptions {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8080;
};

class TileServer {
public:
    struct Response {
        int status = 200;
        std::string body;
        std::string content_type = "text/plain; charset=utf-8";
        std::string content_encoding;
    };

    TileServer();
    ~TileServer();

    TileServer(const TileServer &) = delete;
    TileServer &operator=(const TileServer &) = delete;

    // The prefix is normalized to "/name/"; an already used prefix is a config_error.
    void add_source(const std::string &prefix, std::shared_ptr<TileReader> reader);
    std::vector<std::string> prefixes() const;

    // Routing without the network layer.
    Response handle(const std::string &path, const std::string &accept_encoding) const;

    // Blocks until stop() is called.
    void listen(const ServerOptions &options);

    // Binds (port 0 picks a free port) and returns the port; serve with listen_after_bind().
    int bind(const std::string &host, std::uint16_t port);
    void listen_after_bind();
    bool is_running() const;

    void stop();

private:
    struct Impl;

    void install_routes();
    std::string status_json() const;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<TileReader>> _sources;
    std::unique_ptr<Impl> _impl;
};

std::string normalize_prefix(const std::string &prefix);

}  // namespace tilebox

#endif // TILEBOX_SERVER_H
