#ifndef TILEBOX_BYTE_IO_H
#define TILEBOX_BYTE_IO_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/error.h"

#include <cstdint>
#include <cstring>
#include <string>

namespace tilebox {
namespace detail {

// Big-endian encoder for the binary container structures.
class ByteWriter {
public:
    void put_u8(std::uint8_t value) { _buffer.push_back(static_cast<std::byte>(value)); }

    void put_u32(std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            put_u8(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void put_i32(std::int32_t value) { put_u32(static_cast<std::uint32_t>(value)); }

    void put_u64(std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            put_u8(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void put_bytes(const void *data, std::size_t size) {
        const auto *begin = static_cast<const std::byte *>(data);
        _buffer.insert(_buffer.end(), begin, begin + size);
    }

    const Bytes &bytes() const noexcept { return _buffer; }
    Bytes release() { return std::move(_buffer); }

private:
    Bytes _buffer;
};

class ByteReader {
public:
    explicit ByteReader(const Bytes &buffer) : _buffer(buffer) {}

    std::uint8_t get_u8() {
        require(1);
        return static_cast<std::uint8_t>(_buffer[_position++]);
    }

    std::uint32_t get_u32() {
        require(4);
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | static_cast<std::uint8_t>(_buffer[_position++]);
        }
        return value;
    }

    std::int32_t get_i32() { return static_cast<std::int32_t>(get_u32()); }

    std::uint64_t get_u64() {
        require(8);
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | static_cast<std::uint8_t>(_buffer[_position++]);
        }
        return value;
    }

    std::string get_string(std::size_t size) {
        require(size);
        std::string value(reinterpret_cast<const char *>(_buffer.data() + _position), size);
        _position += size;
        return value;
    }

    std::size_t remaining() const noexcept { return _buffer.size() - _position; }

private:
    void require(std::size_t count) const {
        if (_buffer.size() - _position < count) {
            throw corruption_error("Unexpected end of data at byte " + std::to_string(_position));
        }
    }

    const Bytes &_buffer;
    std::size_t _position = 0;
};

}  // namespace detail
}  // namespace tilebox

#endif // TILEBOX_BYTE_IO_H
