#include "tilebox/data_reader.h"
#include "tilebox/error.h"

#include "string_util.h"

#include "aixlog.hpp"
#include <curl/curl.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tilebox {

namespace {

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw io_error("Failed to initialize libcurl");
        }
    });
}

struct curl_deleter {
    void operator()(CURL *curl) const noexcept {
        if (curl != nullptr) {
            curl_easy_cleanup(curl);
        }
    }
};

struct slist_deleter {
    void operator()(curl_slist *list) const noexcept {
        if (list != nullptr) {
            curl_slist_free_all(list);
        }
    }
};

// State shared by the CURL callbacks of one range request.
struct Transfer {
    Bytes *body = nullptr;
    std::string *content_range = nullptr;
    std::uint64_t expected = 0;
    long status = 0;
    // set when the body callback refused data
    bool stopped = false;
};

// Accepts body bytes only for a 206 answer and never more than requested.
size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *transfer = static_cast<Transfer *>(userdata);
    const size_t total = size * nmemb;
    if (transfer->status != 206 || transfer->body->size() + total > transfer->expected) {
        transfer->stopped = true;
        return 0;
    }
    const auto *begin = reinterpret_cast<const std::byte *>(ptr);
    transfer->body->insert(transfer->body->end(), begin, begin + total);
    return total;
}

// Tracks the status line of the current response and its Content-Range.
size_t write_header(char *buffer, size_t size, size_t nitems, void *userdata) {
    auto *transfer = static_cast<Transfer *>(userdata);
    const size_t total = size * nitems;
    const std::string line(buffer, total);
    if (line.compare(0, 5, "HTTP/") == 0) {
        const auto space = line.find(' ');
        transfer->status = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
        transfer->content_range->clear();
        return total;
    }
    const auto colon = line.find(':');
    if (colon != std::string::npos &&
        detail::equals_ignore_case(detail::trim(line.substr(0, colon)), "Content-Range")) {
        *transfer->content_range = detail::trim(line.substr(colon + 1));
    }
    return total;
}

bool is_retryable(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

// "bytes 0-0/12345" -> 12345
std::uint64_t parse_total_length(const std::string &content_range, const std::string &url) {
    const auto slash = content_range.rfind('/');
    if (slash == std::string::npos) {
        throw io_error("Missing Content-Range in response from '" + url + "'");
    }
    const auto total = detail::parse_int(detail::trim(content_range.substr(slash + 1)));
    if (!total || *total < 0) {
        throw io_error("Server did not report the size of '" + url + "' (Content-Range: " + content_range + ")");
    }
    return static_cast<std::uint64_t>(*total);
}

}  // namespace

std::string ByteRange::to_string() const {
    return "[" + std::to_string(offset) + "+" + std::to_string(length) + "]";
}

FileDataReader::FileDataReader(const std::string &path) : _path(path) {
    _fd = ::open(path.c_str(), O_RDONLY);
    if (_fd < 0) {
        throw io_error("Unable to open file '" + path + "': " + std::strerror(errno));
    }
    struct stat info {};
    if (::fstat(_fd, &info) != 0) {
        const std::string message = std::strerror(errno);
        ::close(_fd);
        _fd = -1;
        throw io_error("Unable to stat file '" + path + "': " + message);
    }
    _size = static_cast<std::uint64_t>(info.st_size);
}

FileDataReader::~FileDataReader() {
    if (_fd >= 0) {
        ::close(_fd);
    }
}

Bytes FileDataReader::read_range(const ByteRange &range) {
    if (range.end() > _size || range.end() < range.offset) {
        throw corruption_error("Range " + range.to_string() + " exceeds the size of '" + _path + "' (" +
                               std::to_string(_size) + " bytes)");
    }

    Bytes buffer(range.length);
    std::uint64_t done = 0;
    while (done < range.length) {
        const ssize_t count = ::pread(_fd, buffer.data() + done, range.length - done,
                                      static_cast<off_t>(range.offset + done));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw io_error("Failed to read " + range.to_string() + " from '" + _path + "': " + std::strerror(errno));
        }
        if (count == 0) {
            throw io_error("Unexpected end of file while reading " + range.to_string() + " from '" + _path + "'");
        }
        done += static_cast<std::uint64_t>(count);
    }
    return buffer;
}

HttpDataReader::HttpDataReader(const std::string &url, RetryPolicy policy) : _url(url), _policy(policy) {
    ensure_curl_initialized();
    const Response response = fetch_with_retry(ByteRange{0, 1});
    _size = parse_total_length(response.content_range, _url);
    LOG(DEBUG) << "Remote archive '" << _url << "' has " << _size << " bytes\n";
}

HttpDataReader::Response HttpDataReader::fetch(const ByteRange &range) const {
    std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) {
        throw io_error("Failed to initialize CURL", true);
    }

    Response response;
    const std::string range_header =
        "Range: bytes=" + std::to_string(range.offset) + "-" + std::to_string(range.end() - 1);
    std::unique_ptr<curl_slist, slist_deleter> headers(curl_slist_append(nullptr, range_header.c_str()));

    curl_easy_setopt(curl.get(), CURLOPT_URL, _url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "tilebox");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, _policy.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, _policy.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "identity");
    Transfer transfer;
    transfer.body = &response.body;
    transfer.content_range = &response.content_range;
    transfer.expected = range.length;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &transfer);

    // a refused body ends the transfer early; the status decides what went wrong
    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && transfer.stopped)) {
        throw io_error("Request for " + range.to_string() + " of '" + _url + "' failed: " + curl_easy_strerror(res),
                       is_retryable(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (response.status == 429 || response.status >= 500) {
        throw io_error("Server answered " + std::to_string(response.status) + " for " + range.to_string() + " of '" +
                           _url + "'",
                       true);
    }
    if (response.status != 206) {
        throw io_error("Server answered " + std::to_string(response.status) + " instead of 206 for " +
                       range.to_string() + " of '" + _url + "'");
    }
    if (transfer.stopped) {
        throw io_error("Received more than " + std::to_string(range.length) + " bytes for " + range.to_string() +
                       " of '" + _url + "'");
    }
    if (response.body.size() != range.length) {
        throw io_error("Received " + std::to_string(response.body.size()) + " bytes instead of " +
                           std::to_string(range.length) + " for " + range.to_string() + " of '" + _url + "'",
                       true);
    }
    return response;
}

HttpDataReader::Response HttpDataReader::fetch_with_retry(const ByteRange &range) const {
    const unsigned attempts = _policy.attempts == 0 ? 1 : _policy.attempts;
    auto backoff = _policy.initial_backoff;
    for (unsigned attempt = 1;; ++attempt) {
        try {
            return fetch(range);
        } catch (const io_error &ex) {
            if (!ex.retryable() || attempt >= attempts) {
                throw;
            }
            LOG(WARNING) << ex.what() << ", retrying in " << backoff.count() << " ms\n";
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
}

Bytes HttpDataReader::read_range(const ByteRange &range) {
    if (range.length == 0) {
        return {};
    }
    if (range.end() > _size || range.end() < range.offset) {
        throw corruption_error("Range " + range.to_string() + " exceeds the size of '" + _url + "' (" +
                               std::to_string(_size) + " bytes)");
    }
    return fetch_with_retry(range).body;
}

bool is_url(const std::string &source) {
    const std::string lowered = detail::to_lower(source);
    return lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0;
}

std::unique_ptr<DataReader> open_data_reader(const std::string &source, const RetryPolicy &policy) {
    if (is_url(source)) {
        return std::make_unique<HttpDataReader>(source, policy);
    }
    return std::make_unique<FileDataReader>(source);
}

}  // namespace tilebox
