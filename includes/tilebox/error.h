#ifndef TILEBOX_ERROR_H
#define TILEBOX_ERROR_H
#pragma once

#include <stdexcept>
#include <string>

namespace tilebox {

class tilebox_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unrecognized container signature or tile format.
class format_error : public tilebox_error {
public:
    using tilebox_error::tilebox_error;
};

// Index/offset inconsistency or undecodable stored bytes.
class corruption_error : public tilebox_error {
public:
    using tilebox_error::tilebox_error;
};

// Filesystem or network failure.
class io_error : public tilebox_error {
public:
    explicit io_error(const std::string &message, bool retryable = false)
        : tilebox_error(message), _retryable(retryable) {}

    bool retryable() const noexcept { return _retryable; }

private:
    bool _retryable;
};

// Invalid zoom range, bbox, coordinate or option combination.
class config_error : public tilebox_error {
public:
    using tilebox_error::tilebox_error;
};

class order_error : public config_error {
public:
    using config_error::config_error;
};

class cancelled_error : public tilebox_error {
public:
    using tilebox_error::tilebox_error;
};

}  // namespace tilebox

#endif // TILEBOX_ERROR_H
