#include "CLI11.hpp"
#include "tilebox.h"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

// "name=path" or a plain path whose stem becomes the name.
std::pair<std::string, std::string> split_source(const std::string &value) {
    const auto separator = value.find('=');
    if (separator != std::string::npos && separator > 0 && value.find("://") > separator) {
        return {value.substr(0, separator), value.substr(separator + 1)};
    }
    std::filesystem::path path(value);
    std::string stem = path.stem().string();
    if (stem.empty()) {
        stem = path.parent_path().filename().string();
    }
    return {stem, value};
}

}  // namespace

int main(int argc, char **argv) {
    CLI::App app{"tilebox: convert, probe and serve tile containers"};
    app.require_subcommand(1);

    int verbosity = 0;
    std::string log_level;
    auto add_logging_flags = [&](CLI::App *cmd) {
        cmd->add_flag("-v,--verbose", verbosity, "Increase logging verbosity");
        cmd->add_option("--log-level", log_level, "Log level: debug, info, warning or error (overrides -v)")
            ->check([](const std::string &value) {
                return tilebox::log_level_from_string(value) ? std::string() : "unknown log level '" + value + "'";
            });
    };

    auto convert_cmd = app.add_subcommand("convert", "Copy tiles from one container into another");
    add_logging_flags(convert_cmd);
    std::string convert_input;
    std::string convert_output;
    std::optional<unsigned> convert_min_zoom;
    std::optional<unsigned> convert_max_zoom;
    std::string convert_bbox;
    std::string convert_format;
    std::string convert_compression;
    bool convert_force_recompress = false;
    unsigned convert_threads = 0;

    convert_cmd->add_option("input", convert_input, "Source container: file, directory or http(s) URL")->required();
    convert_cmd->add_option("output", convert_output,
                            "Destination: .versatiles, .tar, .mbtiles, or a directory")
        ->required();
    convert_cmd->add_option("--min-zoom", convert_min_zoom, "Lowest zoom level to copy")
        ->check(CLI::Range(0u, tilebox::kMaxZoomLevel));
    convert_cmd->add_option("--max-zoom", convert_max_zoom, "Highest zoom level to copy")
        ->check(CLI::Range(0u, tilebox::kMaxZoomLevel));
    convert_cmd->add_option("--bbox", convert_bbox, "Geographic filter: lon_min,lat_min,lon_max,lat_max");
    convert_cmd->add_option("--tile-format", convert_format, "Output tile format");
    convert_cmd->add_option("-c,--compress", convert_compression, "Output tile compression: none, gzip or brotli")
        ->check(CLI::IsMember({"none", "raw", "uncompressed", "gzip", "gz", "brotli", "br"}, CLI::ignore_case));
    convert_cmd->add_flag("--force-recompress", convert_force_recompress,
                          "Decode and encode tiles even when the compression does not change");
    convert_cmd->add_option("-t,--threads", convert_threads, "Worker threads, 0 uses all cores")->default_val(0);

    auto probe_cmd = app.add_subcommand("probe", "Print information about a tile container");
    add_logging_flags(probe_cmd);
    std::string probe_input;
    int probe_depth = 0;
    probe_cmd->add_option("input", probe_input, "Container to inspect")->required();
    probe_cmd->add_flag("-d,--deep", probe_depth,
                        "Probe deeper: -d adds container statistics, -dd scans all tiles");

    auto serve_cmd = app.add_subcommand("serve", "Serve tile containers over HTTP");
    add_logging_flags(serve_cmd);
    std::vector<std::string> serve_sources;
    tilebox::ServerOptions serve_options;
    serve_cmd->add_option("sources", serve_sources, "Containers as 'name=path' or 'path'")->required();
    serve_cmd->add_option("--host", serve_options.host, "Host/IP address to bind the server")
        ->default_val("0.0.0.0");
    serve_cmd->add_option("-p,--port", serve_options.port, "Port to bind the server")->default_val(8080);

    CLI11_PARSE(app, argc, argv);

    tilebox::Logger::set_level(log_level.empty() ? tilebox::log_level_for_verbosity(verbosity)
                                                  : *tilebox::log_level_from_string(log_level));

    try {
        if (*convert_cmd) {
            tilebox::ConvertOptions options;
            options.min_zoom = convert_min_zoom;
            options.max_zoom = convert_max_zoom;
            if (!convert_bbox.empty()) {
                options.geo_bbox = tilebox::parse_geo_bbox(convert_bbox);
            }
            if (!convert_format.empty()) {
                options.tile_format = tilebox::tile_format_from_string(convert_format);
            }
            if (!convert_compression.empty()) {
                options.compression = tilebox::compression_from_string(convert_compression);
            }
            options.force_recompress = convert_force_recompress;
            options.threads = convert_threads;

            auto reader = tilebox::open_reader(convert_input);
            auto writer = tilebox::open_writer(convert_output);
            const auto stats = tilebox::convert(*reader, *writer, options);
            std::cout << "Converted " << stats.tiles_written << " tiles to '" << convert_output << "'" << std::endl;
            return EXIT_SUCCESS;
        }

        if (*probe_cmd) {
            auto reader = tilebox::open_reader(probe_input);
            tilebox::probe(*reader, tilebox::probe_depth_from_count(probe_depth), std::cout);
            return EXIT_SUCCESS;
        }

        if (*serve_cmd) {
            tilebox::TileServer server;
            for (const auto &source : serve_sources) {
                const auto entry = split_source(source);
                std::shared_ptr<tilebox::TileReader> reader = tilebox::open_reader(entry.second);
                server.add_source(entry.first, std::move(reader));
            }
            std::cout << "Serving " << serve_sources.size() << " container(s) at http://" << serve_options.host
                      << ":" << serve_options.port << std::endl;
            std::cout << "Press Ctrl+C to stop the server." << std::endl;
            server.listen(serve_options);
            return EXIT_SUCCESS;
        }
    } catch (const std::exception &ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
