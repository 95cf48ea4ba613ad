#include "tilebox/converter.h"
#include "tilebox/error.h"

#include "aixlog.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tilebox {

namespace {

constexpr std::uint64_t kProgressInterval = 10000;
constexpr std::size_t kInFlightPerThread = 64;
// Block pieces wider than this many tiles are fetched in bands of whole rows.
constexpr std::uint64_t kBatchTiles = 4096;

// Returns the current exception with the failing tile(s) prepended, keeping its type.
std::exception_ptr with_context(const std::string &context) {
    try {
        throw;
    } catch (const cancelled_error &ex) {
        return std::make_exception_ptr(ex);
    } catch (const order_error &ex) {
        return std::make_exception_ptr(order_error(context + ex.what()));
    } catch (const config_error &ex) {
        return std::make_exception_ptr(config_error(context + ex.what()));
    } catch (const format_error &ex) {
        return std::make_exception_ptr(format_error(context + ex.what()));
    } catch (const corruption_error &ex) {
        return std::make_exception_ptr(corruption_error(context + ex.what()));
    } catch (const io_error &ex) {
        return std::make_exception_ptr(io_error(context + ex.what(), ex.retryable()));
    } catch (const std::exception &ex) {
        return std::make_exception_ptr(tilebox_error(context + ex.what()));
    }
}

std::exception_ptr with_coordinate(const TileCoord &coord, const char *step) {
    return with_context(std::string(step) + " tile " + coord.to_string() + ": ");
}

// A row band of one block piece, fetched with a single get_bbox call.
struct Batch {
    std::uint64_t sequence = 0;
    TileBBox bbox;
};

using TileList = std::vector<std::pair<TileCoord, Blob>>;

class Conversion {
public:
    Conversion(TileReader &reader, TileWriter &writer, const ConvertOptions &options, const BBoxPyramid &work)
        : _reader(reader),
          _writer(writer),
          _options(options),
          _iterator(work.iter()),
          _total(work.count_tiles()),
          _ordered(writer.requires_ordered_input()) {
        _target_format = options.tile_format.value_or(reader.metadata().tile_format);
        _target_compression = options.compression.value_or(reader.metadata().tile_compression);
        _max_in_flight = options.max_in_flight;
        if (_max_in_flight == 0) {
            _max_in_flight = kInFlightPerThread * thread_count();
        }
    }

    unsigned thread_count() const {
        if (_options.threads > 0) {
            return _options.threads;
        }
        const unsigned hardware = std::thread::hardware_concurrency();
        return hardware == 0 ? 1 : hardware;
    }

    ConvertStats run() {
        ContainerMetadata meta = _reader.metadata();
        meta.tile_format = _target_format;
        meta.tile_compression = _target_compression;

        try {
            _writer.set_metadata(meta);
        } catch (const std::exception &) {
            _writer.abort();
            throw;
        }

        LOG(INFO) << "Converting " << _total << " tile positions from '" << _reader.name() << "' to '"
                  << _writer.path() << "' with " << thread_count() << " threads\n";

        std::vector<std::thread> workers;
        const unsigned count = thread_count();
        workers.reserve(count);
        for (unsigned i = 0; i < count; ++i) {
            workers.emplace_back(&Conversion::work, this);
        }
        for (auto &worker : workers) {
            worker.join();
        }

        if (!_error && cancelled()) {
            _error = std::make_exception_ptr(cancelled_error("Conversion to '" + _writer.path() + "' was cancelled"));
        }
        if (_error) {
            try {
                _writer.abort();
            } catch (const std::exception &ex) {
                LOG(ERROR) << "Failed to discard '" << _writer.path() << "': " << ex.what() << "\n";
            }
            std::rethrow_exception(_error);
        }

        _writer.finalize();
        LOG(INFO) << "Converted " << _stats.tiles_written << " tiles (" << _stats.bytes_written << " bytes)\n";
        return _stats;
    }

private:
    bool cancelled() const { return _options.cancel != nullptr && _options.cancel->load(); }

    // Next band of the current block piece, moving to the next piece when it is used up.
    std::optional<TileBBox> next_band() {
        if (!_piece || _band_row > _piece->y_max()) {
            _piece = _iterator.next_piece();
            if (!_piece) {
                return std::nullopt;
            }
            _band_row = _piece->y_min();
        }
        const std::uint64_t rows = std::max<std::uint64_t>(1, kBatchTiles / _piece->width());
        const std::uint64_t last = std::min<std::uint64_t>(_band_row + rows - 1, _piece->y_max());
        const TileBBox band(_piece->zoom(), _piece->x_min(), _band_row, _piece->x_max(),
                            static_cast<std::uint32_t>(last));
        _band_row = static_cast<std::uint32_t>(last) + 1;
        if (last == _piece->y_max()) {
            _piece.reset();
        }
        return band;
    }

    // Next batch, or nullopt when done or stopping. Ordered writers may run
    // ahead by up to max_in_flight tiles plus one batch.
    std::optional<Batch> next_job() {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_ordered) {
            _slot_available.wait(lock, [this]() { return _stop || _tiles_in_flight < _max_in_flight; });
        }
        if (_stop) {
            return std::nullopt;
        }
        if (cancelled()) {
            _stop = true;
            _slot_available.notify_all();
            return std::nullopt;
        }
        const auto band = next_band();
        if (!band) {
            return std::nullopt;
        }
        _tiles_in_flight += band->count_tiles();
        return Batch{_assigned++, *band};
    }

    // Tells the failing coordinate apart after a batch read failed.
    std::exception_ptr locate_read_failure(const TileBBox &bbox) {
        const std::exception_ptr batch_error = with_context("reading tiles " + bbox.to_string() + ": ");
        for (const TileCoord &coord : bbox) {
            try {
                _reader.get_tile(coord);
            } catch (const std::exception &) {
                return with_coordinate(coord, "reading");
            }
        }
        return batch_error;
    }

    TileList process(const Batch &batch) {
        TileList tiles;
        try {
            tiles = _reader.get_bbox(batch.bbox);
        } catch (const std::exception &) {
            std::rethrow_exception(locate_read_failure(batch.bbox));
        }

        TileList result;
        result.reserve(tiles.size());
        for (auto &tile : tiles) {
            try {
                if (_options.transform) {
                    const Blob transformed = _options.transform(tile.first, decompress(tile.second));
                    result.emplace_back(tile.first, recompress(transformed, _target_compression));
                } else {
                    result.emplace_back(tile.first,
                                        recompress(tile.second, _target_compression, _options.force_recompress));
                }
            } catch (const std::exception &) {
                std::rethrow_exception(with_coordinate(tile.first, "reading"));
            }
        }
        return result;
    }

    void write(const TileList &tiles) {
        for (const auto &tile : tiles) {
            if (tile.second.empty()) {
                continue;
            }
            try {
                _writer.write_tile(tile.first, tile.second);
            } catch (const std::exception &) {
                std::rethrow_exception(with_coordinate(tile.first, "writing"));
            }
            std::lock_guard<std::mutex> lock(_stats_mutex);
            ++_stats.tiles_written;
            _stats.bytes_written += tile.second.size();
        }
    }

    // Ordered writers only see the next expected sequence number.
    void deliver(const Batch &batch, TileList tiles) {
        if (!_ordered) {
            try {
                write(tiles);
            } catch (const std::exception &) {
                fail(std::current_exception());
            }
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        _buffer.emplace(batch.sequence, std::make_pair(batch.bbox.count_tiles(), std::move(tiles)));
        while (!_stop && !_buffer.empty() && _buffer.begin()->first == _released) {
            auto entry = std::move(_buffer.begin()->second);
            _buffer.erase(_buffer.begin());
            try {
                write(entry.second);
            } catch (const std::exception &) {
                fail_locked(std::current_exception());
                return;
            }
            ++_released;
            _tiles_in_flight -= entry.first;
        }
        _slot_available.notify_all();
    }

    void report_progress(std::uint64_t positions) {
        std::uint64_t done = 0;
        {
            std::lock_guard<std::mutex> lock(_stats_mutex);
            const std::uint64_t before = _stats.positions;
            _stats.positions += positions;
            done = _stats.positions;
            if (done / kProgressInterval != before / kProgressInterval) {
                LOG(INFO) << "Processed " << done << " of " << _total << " tile positions\n";
            }
        }
        if (_options.progress) {
            _options.progress(done, _total);
        }
    }

    void fail_locked(std::exception_ptr error) {
        if (!_error) {
            _error = std::move(error);
        }
        _stop = true;
        _slot_available.notify_all();
    }

    void fail(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(_mutex);
        fail_locked(std::move(error));
    }

    void work() {
        while (true) {
            std::optional<Batch> job;
            try {
                job = next_job();
            } catch (const std::exception &) {
                fail(std::current_exception());
                return;
            }
            if (!job) {
                return;
            }

            TileList tiles;
            try {
                tiles = process(*job);
            } catch (const std::exception &) {
                fail(std::current_exception());
                return;
            }
            deliver(*job, std::move(tiles));
            try {
                report_progress(job->bbox.count_tiles());
            } catch (const std::exception &) {
                fail(with_context("reporting progress: "));
                return;
            }
        }
    }

    TileReader &_reader;
    TileWriter &_writer;
    const ConvertOptions &_options;
    TileFormat _target_format = TileFormat::BIN;
    Compression _target_compression = Compression::Uncompressed;

    std::mutex _mutex;
    std::condition_variable _slot_available;
    PyramidIterator _iterator;
    std::optional<TileBBox> _piece;
    std::uint32_t _band_row = 0;
    std::uint64_t _total = 0;
    bool _ordered = false;
    std::size_t _max_in_flight = 0;
    std::uint64_t _tiles_in_flight = 0;
    std::uint64_t _assigned = 0;
    std::uint64_t _released = 0;
    // sequence -> (positions covered, tiles to write)
    std::map<std::uint64_t, std::pair<std::uint64_t, TileList>> _buffer;
    bool _stop = false;
    std::exception_ptr _error;

    std::mutex _stats_mutex;
    ConvertStats _stats;
};

}  // namespace

BBoxPyramid conversion_pyramid(const TileReader &reader, const ConvertOptions &options) {
    BBoxPyramid work = reader.bbox_pyramid();
    const unsigned min_zoom = options.min_zoom.value_or(0);
    const unsigned max_zoom = options.max_zoom.value_or(kMaxZoomLevel);
    if (min_zoom > kMaxZoomLevel || max_zoom > kMaxZoomLevel) {
        throw config_error("Zoom levels must lie within 0-" + std::to_string(kMaxZoomLevel));
    }
    work.limit_zoom(min_zoom, max_zoom);
    if (options.geo_bbox) {
        work.intersect_geo(*options.geo_bbox);
    }
    if (options.pyramid) {
        work.intersect(*options.pyramid);
    }
    return work;
}

ConvertStats convert(TileReader &reader, TileWriter &writer, const ConvertOptions &options) {
    const TileFormat source_format = reader.metadata().tile_format;
    const TileFormat target_format = options.tile_format.value_or(source_format);
    BBoxPyramid work;
    try {
        if (target_format != source_format && !options.transform) {
            throw config_error("Converting " + to_string(source_format) + " tiles to " + to_string(target_format) +
                               " needs a tile transform");
        }
        work = conversion_pyramid(reader, options);
    } catch (const tilebox_error &) {
        writer.abort();
        throw;
    }

    Conversion conversion(reader, writer, options, work);
    return conversion.run();
}

}  // namespace tilebox
