#include "tilebox/server.h"
#include "tilebox/error.h"
#include "tilebox/format.h"

#include "string_util.h"

#include "aixlog.hpp"
#include "httplib.h"
#include <json/json.h>

namespace tilebox {

namespace {

std::optional<std::uint32_t> parse_coordinate_part(const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    const auto parsed = detail::parse_int(value);
    if (!parsed || *parsed > static_cast<long long>(UINT32_MAX)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(*parsed);
}

TileServer::Response text_response(int status, const std::string &message) {
    TileServer::Response response;
    response.status = status;
    response.body = message;
    return response;
}

}  // namespace

std::optional<ServedTile> serve_tile(TileReader &reader, const TileCoord &coord, const TargetCompression &accepted) {
    if (accepted.empty()) {
        throw config_error("No compression is accepted");
    }

    std::optional<Blob> blob = reader.get_tile(coord);
    if (!blob) {
        return std::nullopt;
    }

    ServedTile served;
    served.content_type = mime_type(reader.metadata().tile_format);

    const Compression stored = blob->compression();
    if (accepted.contains(stored)) {
        served.blob = std::move(*blob);
    } else if (accepted.contains(Compression::Uncompressed)) {
        served.blob = decompress(*blob);
    } else if (accepted.contains(Compression::Brotli)) {
        served.blob = recompress(*blob, Compression::Brotli);
    } else {
        served.blob = recompress(*blob, Compression::Gzip);
    }
    return served;
}

std::string normalize_prefix(const std::string &prefix) {
    std::string result = detail::trim(prefix);
    while (!result.empty() && result.front() == '/') {
        result.erase(result.begin());
    }
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (result.empty()) {
        return "/";
    }
    return "/" + result + "/";
}

struct TileServer::Impl {
    httplib::Server server;
};

TileServer::TileServer() : _impl(std::make_unique<Impl>()) {
    install_routes();
}

TileServer::~TileServer() {
    stop();
}

void TileServer::add_source(const std::string &prefix, std::shared_ptr<TileReader> reader) {
    if (!reader) {
        throw config_error("Cannot serve an empty reader at '" + prefix + "'");
    }
    const std::string normalized = normalize_prefix(prefix);
    if (normalized.compare(0, 8, "/status/") == 0) {
        throw config_error("The prefix '" + prefix + "' is reserved");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &entry : _sources) {
        const std::string &used = entry.first;
        // equal prefixes and prefixes nested in either direction would shadow each other
        if (normalized.compare(0, used.size(), used) == 0 || used.compare(0, normalized.size(), normalized) == 0) {
            throw config_error("The prefix '" + normalized + "' overlaps '" + used + "' used by '" +
                               entry.second->name() + "'");
        }
    }
    LOG(INFO) << "Serving '" << reader->name() << "' at " << normalized << "\n";
    _sources.emplace(normalized, std::move(reader));
}

std::vector<std::string> TileServer::prefixes() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> result;
    for (const auto &entry : _sources) {
        result.push_back(entry.first);
    }
    return result;
}

std::string TileServer::status_json() const {
    Json::Value root(Json::objectValue);
    Json::Value &sources = root["sources"] = Json::Value(Json::arrayValue);

    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &entry : _sources) {
        const ContainerMetadata &meta = entry.second->metadata();
        Json::Value source(Json::objectValue);
        source["prefix"] = entry.first;
        source["name"] = entry.second->name();
        source["container"] = entry.second->container_name();
        source["tile_format"] = to_string(meta.tile_format);
        source["tile_compression"] = to_string(meta.tile_compression);
        source["pyramid"] = meta.pyramid.to_string();
        sources.append(source);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

TileServer::Response TileServer::handle(const std::string &path, const std::string &accept_encoding) const {
    if (path == "/status" || path == "/status/") {
        Response response;
        response.body = status_json();
        response.content_type = "application/json";
        return response;
    }

    std::string prefix;
    std::shared_ptr<TileReader> reader;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto &entry : _sources) {
            if (path.compare(0, entry.first.size(), entry.first) == 0 && entry.first.size() > prefix.size()) {
                prefix = entry.first;
                reader = entry.second;
            }
        }
    }
    if (!reader) {
        return text_response(404, "Unknown tile source");
    }

    const std::string rest = path.substr(prefix.size());
    try {
        if (rest == "meta.json" || rest == "tiles.json") {
            Response response;
            response.body = reader->metadata().to_json();
            response.content_type = "application/json";
            return response;
        }

        const auto parts = detail::split(rest, '/');
        if (parts.size() != 3) {
            return text_response(404, "Not found");
        }
        const std::string y_part = parts[2].substr(0, parts[2].find('.'));
        const auto zoom = parse_coordinate_part(parts[0]);
        const auto x = parse_coordinate_part(parts[1]);
        const auto y = parse_coordinate_part(y_part);
        if (!zoom || !x || !y) {
            return text_response(400, "Invalid tile coordinates");
        }
        if (!TileCoord::is_valid(*zoom, *x, *y)) {
            return text_response(400, "Tile coordinates exceed range for zoom level");
        }

        const auto served = serve_tile(*reader, TileCoord(*zoom, *x, *y), parse_accept_encoding(accept_encoding));
        if (!served) {
            return text_response(404, "Tile not found");
        }

        Response response;
        response.body = served->blob.to_string();
        response.content_type = served->content_type;
        response.content_encoding = content_encoding(served->blob.compression());
        return response;
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Failed to serve '" << path << "': " << ex.what() << "\n";
        return text_response(500, ex.what());
    }
}

void TileServer::install_routes() {
    _impl->server.Get(R"(/.*)", [this](const httplib::Request &req, httplib::Response &res) {
        const Response response = handle(req.path, req.get_header_value("Accept-Encoding"));
        res.status = response.status;
        res.set_header("Vary", "Accept-Encoding");
        if (!response.content_encoding.empty()) {
            res.set_header("Content-Encoding", response.content_encoding);
        }
        res.set_content(response.body, response.content_type.c_str());
    });
}

void TileServer::listen(const ServerOptions &options) {
    LOG(INFO) << "Listening on http://" << options.host << ":" << options.port << "\n";
    if (!_impl->server.listen(options.host.c_str(), options.port)) {
        throw io_error("Failed to start server on " + options.host + ":" + std::to_string(options.port));
    }
}

int TileServer::bind(const std::string &host, std::uint16_t port) {
    if (port == 0) {
        const int bound = _impl->server.bind_to_any_port(host.c_str());
        if (bound < 0) {
            throw io_error("Failed to bind server to " + host);
        }
        return bound;
    }
    if (!_impl->server.bind_to_port(host.c_str(), port)) {
        throw io_error("Failed to bind server to " + host + ":" + std::to_string(port));
    }
    return port;
}

void TileServer::listen_after_bind() {
    if (!_impl->server.listen_after_bind()) {
        throw io_error("Server stopped with an error");
    }
}

bool TileServer::is_running() const {
    return _impl->server.is_running();
}

void TileServer::stop() {
    if (_impl && _impl->server.is_running()) {
        _impl->server.stop();
    }
}

}  // namespace tilebox
