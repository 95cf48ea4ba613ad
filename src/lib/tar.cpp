#include "tilebox/containers.h"
#include "tilebox/error.h"

#include "tile_path.h"

#include "aixlog.hpp"

#include <array>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <limits>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace tilebox {

namespace {

constexpr std::size_t kTarBlock = 512;

using TarHeader = std::array<char, kTarBlock>;

std::string field_string(const Bytes &block, std::size_t offset, std::size_t size) {
    const char *begin = reinterpret_cast<const char *>(block.data()) + offset;
    std::size_t length = 0;
    while (length < size && begin[length] != '\0') {
        ++length;
    }
    return std::string(begin, length);
}

std::optional<std::uint64_t> parse_number(const Bytes &block, std::size_t offset, std::size_t size) {
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(block.data()) + offset;
    // GNU base-256 encoding for large values
    if ((bytes[0] & 0x80) != 0) {
        std::uint64_t value = bytes[0] & 0x7f;
        for (std::size_t i = 1; i < size; ++i) {
            if (value > (std::numeric_limits<std::uint64_t>::max() >> 8)) {
                return std::nullopt;
            }
            value = (value << 8) | bytes[i];
        }
        return value;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        const char ch = static_cast<char>(bytes[i]);
        if (ch == '\0' || ch == ' ') {
            if (value > 0) {
                break;
            }
            continue;
        }
        if (ch < '0' || ch > '7') {
            return std::nullopt;
        }
        value = value * 8 + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

std::uint64_t field_number(const Bytes &block, std::size_t offset, std::size_t size) {
    const auto value = parse_number(block, offset, size);
    if (!value) {
        throw corruption_error("Invalid octal field in tar header");
    }
    return *value;
}

bool is_zero_block(const Bytes &block) {
    for (const auto byte : block) {
        if (byte != std::byte{0}) {
            return false;
        }
    }
    return true;
}

std::uint64_t header_checksum(const std::uint8_t *bytes) {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < kTarBlock; ++i) {
        sum += (i >= 148 && i < 156) ? static_cast<std::uint8_t>(' ') : bytes[i];
    }
    return sum;
}

std::uint64_t padded(std::uint64_t size) {
    return (size + kTarBlock - 1) / kTarBlock * kTarBlock;
}

void put_octal(TarHeader &header, std::size_t offset, std::size_t size, std::uint64_t value) {
    // size - 1 digits followed by a NUL
    std::snprintf(header.data() + offset, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

TarHeader make_header(const std::string &name, std::uint64_t size) {
    TarHeader header{};
    if (name.size() > 100) {
        throw config_error("Tar entry name '" + name + "' is longer than 100 characters");
    }
    std::memcpy(header.data(), name.data(), name.size());
    put_octal(header, 100, 8, 0644);
    put_octal(header, 108, 8, 0);
    put_octal(header, 116, 8, 0);
    put_octal(header, 124, 12, size);
    put_octal(header, 136, 12, static_cast<std::uint64_t>(std::time(nullptr)));
    header[156] = '0';
    std::memcpy(header.data() + 257, "ustar", 6);
    std::memcpy(header.data() + 263, "00", 2);

    const std::uint64_t checksum = header_checksum(reinterpret_cast<const std::uint8_t *>(header.data()));
    std::snprintf(header.data() + 148, 8, "%06llo", static_cast<unsigned long long>(checksum));
    header[155] = ' ';
    return header;
}

}  // namespace

TarReader::TarReader(const std::string &path) : _data(std::make_unique<FileDataReader>(path)) {
    std::optional<TileFormat> format;
    std::optional<Compression> compression;
    std::string long_name;

    std::uint64_t offset = 0;
    const std::uint64_t file_size = _data->size();
    while (offset + kTarBlock <= file_size) {
        const Bytes block = _data->read_range(ByteRange{offset, kTarBlock});
        if (is_zero_block(block)) {
            break;
        }

        const auto *bytes = reinterpret_cast<const std::uint8_t *>(block.data());
        if (parse_number(block, 148, 8) != header_checksum(bytes)) {
            if (offset == 0 && field_string(block, 257, 5) != "ustar") {
                throw format_error("'" + path + "' is not a tar archive");
            }
            throw corruption_error("Tar header checksum mismatch at offset " + std::to_string(offset) + " in '" +
                                   path + "'");
        }

        std::string name = field_string(block, 0, 100);
        if (field_string(block, 257, 5) == "ustar") {
            const std::string prefix = field_string(block, 345, 155);
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }
        if (!long_name.empty()) {
            name = long_name;
            long_name.clear();
        }

        const std::uint64_t size = field_number(block, 124, 12);
        const char type = static_cast<char>(bytes[156]);
        if (size > file_size - offset - kTarBlock) {
            throw corruption_error("Tar entry '" + name + "' at offset " + std::to_string(offset) + " declares " +
                                   std::to_string(size) + " bytes, more than the archive holds");
        }
        const ByteRange data{offset + kTarBlock, size};
        offset = data.offset + padded(size);
        ++_entry_count;

        if (type == 'L') {
            long_name = field_string(_data->read_range(data), 0, size);
            continue;
        }
        if (type != '0' && type != '\0') {
            continue;
        }

        if (const auto meta_compression = detail::parse_metadata_path(name)) {
            const Blob meta(_data->read_range(data), *meta_compression);
            _metadata.merge_json(decompress(meta).to_string());
            continue;
        }

        const auto tile = detail::parse_tile_path(name);
        if (!tile) {
            LOG(DEBUG) << "Ignoring tar entry '" << name << "'\n";
            continue;
        }
        detail::check_uniform(format, compression, *tile, path);
        _tiles[tile->coord] = data;
        _metadata.pyramid.include_coord(tile->coord);
    }

    if (format) {
        _metadata.tile_format = *format;
        _metadata.tile_compression = *compression;
    } else if (const auto declared = _metadata.get("format")) {
        _metadata.tile_format = tile_format_from_string(*declared);
    }

    LOG(DEBUG) << "Indexed " << _tiles.size() << " tiles in tar archive '" << path << "'\n";
}

std::optional<Blob> TarReader::get_tile(const TileCoord &coord) {
    const auto it = _tiles.find(coord);
    if (it == _tiles.end() || it->second.length == 0) {
        return std::nullopt;
    }
    return Blob(_data->read_range(it->second), _metadata.tile_compression);
}

void TarReader::probe_container(std::ostream &out) {
    out << "tar entries: " << _entry_count << '\n';
    out << "tile entries: " << _tiles.size() << '\n';
}

TarWriter::TarWriter(const std::string &path) : TileWriter(path) {
    _file.open(path, std::ios::binary | std::ios::trunc);
    if (!_file) {
        throw io_error("Unable to create '" + path + "'");
    }
}

TarWriter::~TarWriter() {
    abort_unfinished();
}

void TarWriter::write_entry(const std::string &name, const Blob &blob) {
    const TarHeader header = make_header(name, blob.size());
    static const std::array<char, kTarBlock> padding{};

    std::lock_guard<std::mutex> lock(_mutex);
    _file.write(header.data(), static_cast<std::streamsize>(header.size()));
    _file.write(reinterpret_cast<const char *>(blob.data().data()), static_cast<std::streamsize>(blob.size()));
    _file.write(padding.data(), static_cast<std::streamsize>(padded(blob.size()) - blob.size()));
    if (!_file) {
        throw io_error("Failed to write tar entry '" + name + "' to '" + path() + "'");
    }
}

void TarWriter::do_write_tile(const TileCoord &coord, const Blob &blob) {
    write_entry(detail::make_tile_path(coord, metadata().tile_format, blob.compression()), blob);
}

void TarWriter::do_finalize() {
    const ContainerMetadata &meta = metadata();
    write_entry("meta.json" + compression_suffix(meta.tile_compression),
                compress(Blob::from_string(meta.to_json()), meta.tile_compression));

    std::lock_guard<std::mutex> lock(_mutex);
    static const std::array<char, 2 * kTarBlock> trailer{};
    _file.write(trailer.data(), static_cast<std::streamsize>(trailer.size()));
    _file.flush();
    if (!_file) {
        throw io_error("Failed to finish tar archive '" + path() + "'");
    }
    _file.close();
}

void TarWriter::do_abort() {
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
