#include "tilebox/blob.h"
#include "tilebox/error.h"

#include "string_util.h"

#include <brotli/decode.h>
#include <brotli/encode.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <memory>

namespace tilebox {

namespace {

constexpr int kBrotliQuality = 10;
constexpr int kBrotliWindowBits = 19;
constexpr std::size_t kChunkSize = 64 * 1024;

bool has_gzip_signature(const Blob &blob) {
    return blob.size() >= 2 && blob.bytes()[0] == 0x1f && blob.bytes()[1] == 0x8b;
}

Bytes compress_gzip(const Bytes &input) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw tilebox_error("Failed to initialize gzip encoder");
    }
    std::unique_ptr<z_stream, decltype(&deflateEnd)> guard(&zs, deflateEnd);

    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    Bytes output;
    std::vector<Bytef> buffer(std::max<std::size_t>(input.size() / 2 + 64, 4096));
    int ret = Z_OK;
    do {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            throw tilebox_error("gzip encoder failed");
        }
        const std::size_t have = buffer.size() - zs.avail_out;
        const auto *begin = reinterpret_cast<const std::byte *>(buffer.data());
        output.insert(output.end(), begin, begin + have);
    } while (ret != Z_STREAM_END);

    return output;
}

Bytes decompress_gzip(const Bytes &input) {
    z_stream zs{};
    if (inflateInit2(&zs, 15 + 16) != Z_OK) {
        throw tilebox_error("Failed to initialize gzip decoder");
    }
    std::unique_ptr<z_stream, decltype(&inflateEnd)> guard(&zs, inflateEnd);

    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    Bytes output;
    std::vector<Bytef> buffer(kChunkSize);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string message = "Failed to decompress gzip data";
            if (zs.msg != nullptr) {
                message += ": ";
                message += zs.msg;
            }
            throw corruption_error(message);
        }
        const std::size_t have = buffer.size() - zs.avail_out;
        const auto *begin = reinterpret_cast<const std::byte *>(buffer.data());
        output.insert(output.end(), begin, begin + have);
        if (ret == Z_OK && zs.avail_in == 0 && have == 0) {
            throw corruption_error("Failed to decompress gzip data: truncated stream");
        }
    }
    return output;
}

Bytes compress_brotli(const Bytes &input) {
    std::size_t encoded_size = BrotliEncoderMaxCompressedSize(input.size());
    if (encoded_size == 0) {
        encoded_size = input.size() + 1024;
    }
    Bytes output(encoded_size);
    const BROTLI_BOOL ok = BrotliEncoderCompress(
        kBrotliQuality, kBrotliWindowBits, BROTLI_MODE_GENERIC, input.size(),
        reinterpret_cast<const std::uint8_t *>(input.data()), &encoded_size,
        reinterpret_cast<std::uint8_t *>(output.data()));
    if (ok != BROTLI_TRUE) {
        throw tilebox_error("brotli encoder failed");
    }
    output.resize(encoded_size);
    return output;
}

struct brotli_decoder_deleter {
    void operator()(BrotliDecoderState *state) const noexcept {
        if (state != nullptr) {
            BrotliDecoderDestroyInstance(state);
        }
    }
};

Bytes decompress_brotli(const Bytes &input) {
    std::unique_ptr<BrotliDecoderState, brotli_decoder_deleter> state(
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr));
    if (!state) {
        throw tilebox_error("Failed to initialize brotli decoder");
    }

    std::size_t available_in = input.size();
    const auto *next_in = reinterpret_cast<const std::uint8_t *>(input.data());

    Bytes output;
    std::vector<std::uint8_t> buffer(kChunkSize);
    while (true) {
        std::size_t available_out = buffer.size();
        std::uint8_t *next_out = buffer.data();
        const BrotliDecoderResult result =
            BrotliDecoderDecompressStream(state.get(), &available_in, &next_in, &available_out, &next_out, nullptr);
        const std::size_t have = buffer.size() - available_out;
        const auto *begin = reinterpret_cast<const std::byte *>(buffer.data());
        output.insert(output.end(), begin, begin + have);

        if (result == BROTLI_DECODER_RESULT_SUCCESS) {
            return output;
        }
        if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
            continue;
        }
        if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
            throw corruption_error("Failed to decompress brotli data: truncated stream");
        }
        throw corruption_error(std::string("Failed to decompress brotli data: ") +
                               BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
    }
}

}  // namespace

Blob Blob::from_string(const std::string &data, Compression compression) {
    return from_bytes(data.data(), data.size(), compression);
}

Blob Blob::from_bytes(const void *data, std::size_t size, Compression compression) {
    Bytes bytes(size);
    if (size > 0) {
        std::memcpy(bytes.data(), data, size);
    }
    return Blob(std::move(bytes), compression);
}

std::string Blob::to_string() const {
    return std::string(reinterpret_cast<const char *>(_data.data()), _data.size());
}

std::string to_string(Compression compression) {
    switch (compression) {
        case Compression::Uncompressed:
            return "none";
        case Compression::Gzip:
            return "gzip";
        case Compression::Brotli:
            return "brotli";
    }
    return "none";
}

Compression compression_from_string(const std::string &value) {
    const std::string token = detail::to_lower(detail::trim(value));
    if (token == "none" || token == "raw" || token == "uncompressed") {
        return Compression::Uncompressed;
    }
    if (token == "gzip" || token == "gz") {
        return Compression::Gzip;
    }
    if (token == "brotli" || token == "br") {
        return Compression::Brotli;
    }
    throw config_error("Unknown compression '" + value + "'");
}

std::string compression_suffix(Compression compression) {
    switch (compression) {
        case Compression::Uncompressed:
            return "";
        case Compression::Gzip:
            return ".gz";
        case Compression::Brotli:
            return ".br";
    }
    return "";
}

std::string content_encoding(Compression compression) {
    switch (compression) {
        case Compression::Uncompressed:
            return "";
        case Compression::Gzip:
            return "gzip";
        case Compression::Brotli:
            return "br";
    }
    return "";
}

Blob compress(const Blob &blob, Compression target) {
    if (blob.compression() != Compression::Uncompressed) {
        throw config_error("Cannot compress a blob that is already " + to_string(blob.compression()) +
                           " compressed");
    }
    switch (target) {
        case Compression::Uncompressed:
            return blob;
        case Compression::Gzip:
            return Blob(compress_gzip(blob.data()), Compression::Gzip);
        case Compression::Brotli:
            return Blob(compress_brotli(blob.data()), Compression::Brotli);
    }
    throw config_error("Unsupported compression target");
}

Blob decompress(const Blob &blob) {
    switch (blob.compression()) {
        case Compression::Uncompressed:
            return blob;
        case Compression::Gzip:
            return Blob(decompress_gzip(blob.data()), Compression::Uncompressed);
        case Compression::Brotli:
            return Blob(decompress_brotli(blob.data()), Compression::Uncompressed);
    }
    throw config_error("Unsupported compression");
}

Blob recompress(const Blob &blob, Compression target, bool force) {
    if (blob.compression() == target && !force) {
        return blob;
    }
    return compress(decompress(blob), target);
}

void check_compression(const Blob &blob) {
    if (blob.empty()) {
        return;
    }
    const bool gzip_stream = has_gzip_signature(blob);
    if (blob.compression() == Compression::Gzip && !gzip_stream) {
        throw corruption_error("Blob is tagged as gzip but has no gzip signature");
    }
    if (blob.compression() == Compression::Uncompressed && gzip_stream) {
        throw corruption_error("Blob is tagged as uncompressed but contains a gzip stream");
    }
}

TargetCompression TargetCompression::from(Compression compression) {
    return TargetCompression({compression});
}

TargetCompression TargetCompression::from_none() {
    return from(Compression::Uncompressed);
}

TargetCompression TargetCompression::all() {
    return TargetCompression({Compression::Uncompressed, Compression::Gzip, Compression::Brotli});
}

Blob optimize_compression(const Blob &blob, const TargetCompression &target) {
    if (target.empty()) {
        throw config_error("No compression is accepted");
    }

    if (!target.best_compression() && target.contains(blob.compression())) {
        return blob;
    }

    switch (blob.compression()) {
        case Compression::Uncompressed:
            if (target.contains(Compression::Brotli)) {
                return compress(blob, Compression::Brotli);
            }
            if (target.contains(Compression::Gzip)) {
                return compress(blob, Compression::Gzip);
            }
            return blob;
        case Compression::Gzip:
            if (target.contains(Compression::Brotli)) {
                return recompress(blob, Compression::Brotli);
            }
            if (target.contains(Compression::Gzip)) {
                return blob;
            }
            return decompress(blob);
        case Compression::Brotli: {
            if (target.contains(Compression::Brotli)) {
                return blob;
            }
            const Blob raw = decompress(blob);
            if (target.contains(Compression::Gzip)) {
                return compress(raw, Compression::Gzip);
            }
            return raw;
        }
    }
    throw config_error("Unsupported compression");
}

TargetCompression parse_accept_encoding(const std::string &header) {
    TargetCompression target = TargetCompression::from_none();
    target.set_best_compression(false);

    for (const auto &part : detail::split(header, ',')) {
        const auto params = detail::split(part, ';');
        if (params.empty()) {
            continue;
        }
        const std::string token = detail::to_lower(params[0]);

        bool refused = false;
        for (std::size_t i = 1; i < params.size(); ++i) {
            const std::string param = detail::to_lower(params[i]);
            if (param.rfind("q=", 0) == 0) {
                const auto quality = detail::parse_double(detail::trim(param.substr(2)));
                refused = quality && *quality <= 0.0;
            }
        }
        if (refused) {
            continue;
        }

        if (token == "gzip" || token == "x-gzip") {
            target.insert(Compression::Gzip);
        } else if (token == "br") {
            target.insert(Compression::Brotli);
        } else if (token == "*") {
            target.insert(Compression::Gzip);
            target.insert(Compression::Brotli);
        }
    }
    return target;
}

}  // namespace tilebox
