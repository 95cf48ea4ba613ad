#ifndef TILEBOX_WRITER_H
#define TILEBOX_WRITER_H
#pragma once

#include "tilebox/blob.h"
#include "tilebox/coord.h"
#include "tilebox/metadata.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace tilebox {

// Accepts tiles plus metadata and produces a finished container. The public
// calls enforce the life cycle: set_metadata before the first write_tile,
// nothing after finalize or abort. An unfinished writer aborts on destruction.
class TileWriter {
public:
    explicit TileWriter(std::string path) : _path(std::move(path)) {}
    virtual ~TileWriter() = default;

    TileWriter(const TileWriter &) = delete;
    TileWriter &operator=(const TileWriter &) = delete;

    const std::string &path() const noexcept { return _path; }
    virtual std::string container_name() const = 0;

    // Ordered writers need tiles in canonical pyramid order (see PyramidIterator).
    virtual bool requires_ordered_input() const { return false; }

    void set_metadata(const ContainerMetadata &metadata);

    // Empty blobs are skipped. The blob is recompressed to the container's
    // tile compression when needed.
    void write_tile(const TileCoord &coord, const Blob &blob);

    void finalize();

    // Discards partial output.
    void abort();

    bool is_open() const noexcept { return _state.load() == State::Open; }

    const ContainerMetadata &metadata() const noexcept { return _metadata; }

protected:
    // Lets a container force its own conventions (e.g. tile compression).
    virtual void adjust_metadata(ContainerMetadata &metadata) { (void)metadata; }

    virtual void do_write_tile(const TileCoord &coord, const Blob &blob) = 0;
    virtual void do_finalize() = 0;
    virtual void do_abort() = 0;

    // For derived destructors.
    void abort_unfinished() noexcept;

private:
    enum class State { Open, Finalized, Aborted };

    void ensure_open(const char *operation) const;

    std::string _path;
    ContainerMetadata _metadata;
    std::atomic<State> _state{State::Open};
    std::atomic<bool> _written{false};
    std::mutex _pyramid_mutex;
    BBoxPyramid _written_pyramid;
};

// .versatiles, .tar, .mbtiles, anything else is a directory.
std::unique_ptr<TileWriter> open_writer(const std::string &destination);

}  // namespace tilebox

#endif // TILEBOX_WRITER_H
