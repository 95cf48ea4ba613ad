#include "tilebox/metadata.h"
#include "tilebox/error.h"

#include "aixlog.hpp"
#include <json/json.h>

#include <iomanip>
#include <locale>
#include <memory>
#include <sstream>

namespace tilebox {

namespace {

std::string format_decimal(double value) {
    std::ostringstream stream;
    stream.imbue(std::locale::classic());
    stream << std::fixed << std::setprecision(6) << value;
    return stream.str();
}

bool looks_like_json_container(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    return first != std::string::npos && (value[first] == '[' || value[first] == '{');
}

Json::Value parse_document(const std::string &json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw format_error("Invalid metadata JSON: " + errors);
    }
    return root;
}

std::string write_compact(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

}  // namespace

std::optional<std::string> ContainerMetadata::get(const std::string &key) const {
    const auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ContainerMetadata::refresh_derived_entries() {
    entries["format"] = to_string(tile_format);

    const auto min_zoom = pyramid.min_zoom();
    const auto max_zoom = pyramid.max_zoom();
    if (!min_zoom || !max_zoom) {
        entries.erase("minzoom");
        entries.erase("maxzoom");
        entries.erase("bounds");
        return;
    }
    entries["minzoom"] = std::to_string(*min_zoom);
    entries["maxzoom"] = std::to_string(*max_zoom);

    const auto geo = pyramid.geo_bbox();
    if (geo) {
        entries["bounds"] = format_decimal(geo->lon_min) + "," + format_decimal(geo->lat_min) + "," +
                            format_decimal(geo->lon_max) + "," + format_decimal(geo->lat_max);
    }
}

std::string ContainerMetadata::to_json() const {
    Json::Value root(Json::objectValue);
    for (const auto &entry : entries) {
        root[entry.first] = entry.second;
        if (looks_like_json_container(entry.second)) {
            try {
                root[entry.first] = parse_document(entry.second);
            } catch (const format_error &) {
                LOG(DEBUG) << "Metadata entry '" << entry.first << "' is not valid JSON, keeping it as text\n";
            }
        }
    }
    return write_compact(root);
}

void ContainerMetadata::merge_json(const std::string &json) {
    for (auto &entry : parse_metadata_json(json)) {
        entries[entry.first] = std::move(entry.second);
    }
}

std::map<std::string, std::string> parse_metadata_json(const std::string &json) {
    const Json::Value root = parse_document(json);
    if (!root.isObject()) {
        throw format_error("Metadata JSON must be an object");
    }

    std::map<std::string, std::string> result;
    for (const auto &name : root.getMemberNames()) {
        const Json::Value &value = root[name];
        if (value.isString()) {
            result[name] = value.asString();
        } else if (value.isArray() || value.isObject()) {
            result[name] = write_compact(value);
        } else if (value.isNull()) {
            continue;
        } else {
            // numbers and booleans keep their JSON spelling
            result[name] = write_compact(value);
        }
    }
    return result;
}

}  // namespace tilebox
