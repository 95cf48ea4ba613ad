#ifndef TILEBOX_BLOB_H
#define TILEBOX_BLOB_H
#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tilebox {

enum class Compression : std::uint8_t {
    Uncompressed = 0,
    Gzip = 1,
    Brotli = 2,
};

using Bytes = std::vector<std::byte>;

// Owned byte buffer tagged with the compression of its content.
class Blob {
public:
    Blob() = default;
    explicit Blob(Bytes data, Compression compression = Compression::Uncompressed)
        : _data(std::move(data)), _compression(compression) {}

    static Blob from_string(const std::string &data, Compression compression = Compression::Uncompressed);
    static Blob from_bytes(const void *data, std::size_t size,
                           Compression compression = Compression::Uncompressed);

    const Bytes &data() const noexcept { return _data; }
    const std::uint8_t *bytes() const noexcept { return reinterpret_cast<const std::uint8_t *>(_data.data()); }
    std::size_t size() const noexcept { return _data.size(); }
    bool empty() const noexcept { return _data.empty(); }
    Compression compression() const noexcept { return _compression; }

    std::string to_string() const;

    bool operator==(const Blob &other) const noexcept {
        return _compression == other._compression && _data == other._data;
    }
    bool operator!=(const Blob &other) const noexcept { return !(*this == other); }

private:
    Bytes _data;
    Compression _compression = Compression::Uncompressed;
};

// "none", "gzip", "brotli"
std::string to_string(Compression compression);

// Accepts none/raw/uncompressed, gzip/gz, brotli/br (case-insensitive).
Compression compression_from_string(const std::string &value);

// File suffix: "", ".gz", ".br"
std::string compression_suffix(Compression compression);

// Content-Encoding token: "", "gzip", "br"
std::string content_encoding(Compression compression);

// Encodes an uncompressed blob.
Blob compress(const Blob &blob, Compression target);

// Always returns an uncompressed blob.
Blob decompress(const Blob &blob);

// Returns the blob unchanged when it already has the target compression,
// unless force is set, in which case it is decoded and encoded again.
Blob recompress(const Blob &blob, Compression target, bool force = false);

// Throws corruption_error when the stream signature does not match the tag.
void check_compression(const Blob &blob);

// Set of compressions a consumer accepts.
class TargetCompression {
public:
    TargetCompression() = default;
    explicit TargetCompression(std::set<Compression> compressions, bool best_compression = true)
        : _compressions(std::move(compressions)), _best_compression(best_compression) {}

    static TargetCompression from(Compression compression);
    static TargetCompression from_none();
    static TargetCompression all();

    bool contains(Compression compression) const { return _compressions.count(compression) > 0; }
    void insert(Compression compression) { _compressions.insert(compression); }
    bool empty() const noexcept { return _compressions.empty(); }

    // When set, a blob is re-encoded with the strongest accepted compression
    // even if its current compression is already accepted.
    bool best_compression() const noexcept { return _best_compression; }
    void set_best_compression(bool value) noexcept { _best_compression = value; }

    const std::set<Compression> &compressions() const noexcept { return _compressions; }

private:
    std::set<Compression> _compressions;
    bool _best_compression = true;
};

Blob optimize_compression(const Blob &blob, const TargetCompression &target);

// Parses an Accept-Encoding header. Uncompressed is always part of the result.
TargetCompression parse_accept_encoding(const std::string &header);

}  // namespace tilebox

#endif // TILEBOX_BLOB_H
