#ifndef TILEBOX_DATA_READER_H
#define TILEBOX_DATA_READER_H
#pragma once

#include "tilebox/blob.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tilebox {

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    std::uint64_t end() const noexcept { return offset + length; }
    std::string to_string() const;
};

// Random access to the bytes of an archive. Implementations are safe for
// concurrent read_range calls.
class DataReader {
public:
    virtual ~DataReader() = default;

    virtual Bytes read_range(const ByteRange &range) = 0;
    virtual std::uint64_t size() const = 0;
    virtual std::string name() const = 0;
};

class FileDataReader : public DataReader {
public:
    explicit FileDataReader(const std::string &path);
    ~FileDataReader() override;

    FileDataReader(const FileDataReader &) = delete;
    FileDataReader &operator=(const FileDataReader &) = delete;

    Bytes read_range(const ByteRange &range) override;
    std::uint64_t size() const override { return _size; }
    std::string name() const override { return _path; }

private:
    std::string _path;
    int _fd = -1;
    std::uint64_t _size = 0;
};

struct RetryPolicy {
    unsigned attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    long timeout_seconds = 40;
    long connect_timeout_seconds = 20;
};

// Range requests against an HTTP(S) URL. Only 206 answers are accepted.
class HttpDataReader : public DataReader {
public:
    explicit HttpDataReader(const std::string &url, RetryPolicy policy = {});

    Bytes read_range(const ByteRange &range) override;
    std::uint64_t size() const override { return _size; }
    std::string name() const override { return _url; }

private:
    struct Response {
        long status = 0;
        Bytes body;
        std::string content_range;
    };

    Response fetch(const ByteRange &range) const;
    Response fetch_with_retry(const ByteRange &range) const;

    std::string _url;
    RetryPolicy _policy;
    std::uint64_t _size = 0;
};

bool is_url(const std::string &source);

std::unique_ptr<DataReader> open_data_reader(const std::string &source, const RetryPolicy &policy = {});

}  // namespace tilebox

#endif // TILEBOX_DATA_READER_H
