#include "tilebox/containers.h"
#include "tilebox/error.h"

#include "string_util.h"

#include "aixlog.hpp"
#include "sqlite3.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tilebox {

namespace {

struct stmt_deleter {
    void operator()(sqlite3_stmt *stmt) const noexcept {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

std::unique_ptr<sqlite3_stmt, stmt_deleter> prepare(sqlite3 *db, const char *sql, const std::string &what) {
    sqlite3_stmt *raw_stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw_stmt, nullptr) != SQLITE_OK) {
        if (raw_stmt != nullptr) {
            sqlite3_finalize(raw_stmt);
        }
        throw io_error("Failed to " + what + ": " + std::string(sqlite3_errmsg(db)));
    }
    return std::unique_ptr<sqlite3_stmt, stmt_deleter>(raw_stmt);
}

void exec(sqlite3 *db, const char *sql, const std::string &what) {
    if (sqlite3_exec(db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw io_error("Failed to " + what + ": " + std::string(sqlite3_errmsg(db)));
    }
}

sqlite3 *open_database(const std::string &path, int flags) {
    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string message = "Unable to open MBTiles file: " + path;
        if (db != nullptr) {
            message += ": ";
            message += sqlite3_errmsg(db);
            sqlite3_close(db);
        }
        throw io_error(message);
    }
    return db;
}

// MBTiles keeps every tile in the usual compression of its format.
Compression mbtiles_compression(TileFormat format) {
    return format_info(format).typical_compression;
}

}  // namespace

std::uint32_t flip_y(std::uint32_t y, unsigned zoom) {
    if (!TileCoord::is_valid(zoom, 0, y)) {
        throw corruption_error("Tile row " + std::to_string(y) + " is outside the range of zoom level " +
                               std::to_string(zoom));
    }
    return static_cast<std::uint32_t>((std::uint64_t{1} << zoom) - 1 - y);
}

MBTilesReader::MBTilesReader(const std::string &path) : _path(path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw io_error("MBTiles file '" + path + "' does not exist");
    }
    _db = open_database(path, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX);

    try {
        load_metadata();
        load_pyramid();

        const char *query = "SELECT tile_data FROM tiles WHERE zoom_level=?1 AND tile_column=?2 AND tile_row=?3";
        _tile_stmt = prepare(_db, query, "prepare tile query").release();
    } catch (const tilebox_error &) {
        sqlite3_close(_db);
        _db = nullptr;
        throw;
    }

    LOG(DEBUG) << "Opened MBTiles '" << path << "' with " << _metadata.pyramid.count_tiles()
               << " tile positions\n";
}

MBTilesReader::~MBTilesReader() {
    if (_tile_stmt != nullptr) {
        sqlite3_finalize(_tile_stmt);
    }
    if (_db != nullptr) {
        sqlite3_close(_db);
    }
}

void MBTilesReader::load_metadata() {
    auto stmt = prepare(_db, "SELECT name, value FROM metadata", "read metadata");
    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            throw io_error("SQLite error while reading metadata: " + std::string(sqlite3_errmsg(_db)));
        }
        const unsigned char *name = sqlite3_column_text(stmt.get(), 0);
        const unsigned char *value = sqlite3_column_text(stmt.get(), 1);
        if (name == nullptr) {
            continue;
        }
        _metadata.set(reinterpret_cast<const char *>(name),
                      value == nullptr ? std::string() : reinterpret_cast<const char *>(value));
    }

    const auto declared = _metadata.get("format");
    if (declared && !detail::trim(*declared).empty()) {
        _metadata.tile_format = tile_format_from_string(*declared);
    } else {
        // some writers omit the format; sniff the first tile
        auto first = prepare(_db, "SELECT tile_data FROM tiles LIMIT 1", "read first tile");
        if (sqlite3_step(first.get()) == SQLITE_ROW) {
            const Blob blob = Blob::from_bytes(sqlite3_column_blob(first.get(), 0),
                                               static_cast<std::size_t>(sqlite3_column_bytes(first.get(), 0)));
            if (blob.size() >= 2 && blob.bytes()[0] == 0x1f && blob.bytes()[1] == 0x8b) {
                _metadata.tile_format = TileFormat::PBF;
            } else {
                _metadata.tile_format = detect_tile_format(blob).value_or(TileFormat::BIN);
            }
        }
        LOG(WARNING) << "MBTiles '" << _path << "' declares no format, assuming "
                     << to_string(_metadata.tile_format) << "\n";
    }
    _metadata.tile_compression = mbtiles_compression(_metadata.tile_format);
}

void MBTilesReader::load_pyramid() {
    const char *query =
        "SELECT zoom_level, MIN(tile_column), MAX(tile_column), MIN(tile_row), MAX(tile_row) "
        "FROM tiles GROUP BY zoom_level";
    auto stmt = prepare(_db, query, "enumerate zoom levels");
    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            throw io_error("SQLite error while reading zoom levels: " + std::string(sqlite3_errmsg(_db)));
        }
        const sqlite3_int64 zoom = sqlite3_column_int64(stmt.get(), 0);
        const sqlite3_int64 x_min = sqlite3_column_int64(stmt.get(), 1);
        const sqlite3_int64 x_max = sqlite3_column_int64(stmt.get(), 2);
        const sqlite3_int64 row_min = sqlite3_column_int64(stmt.get(), 3);
        const sqlite3_int64 row_max = sqlite3_column_int64(stmt.get(), 4);
        if (zoom < 0 || zoom > kMaxZoomLevel || x_min < 0 || row_min < 0 ||
            !TileCoord::is_valid(static_cast<unsigned>(zoom), static_cast<std::uint64_t>(x_max),
                                 static_cast<std::uint64_t>(row_max))) {
            throw corruption_error("MBTiles '" + _path + "' holds tiles outside the range of zoom level " +
                                   std::to_string(zoom));
        }
        const auto z = static_cast<unsigned>(zoom);
        _metadata.pyramid.include_bbox(TileBBox(z, static_cast<std::uint32_t>(x_min),
                                                flip_y(static_cast<std::uint32_t>(row_max), z),
                                                static_cast<std::uint32_t>(x_max),
                                                flip_y(static_cast<std::uint32_t>(row_min), z)));
    }
}

std::optional<Blob> MBTilesReader::get_tile(const TileCoord &coord) {
    std::lock_guard<std::mutex> lock(_mutex);
    sqlite3_reset(_tile_stmt);
    sqlite3_clear_bindings(_tile_stmt);
    sqlite3_bind_int(_tile_stmt, 1, static_cast<int>(coord.zoom()));
    sqlite3_bind_int64(_tile_stmt, 2, coord.x());
    sqlite3_bind_int64(_tile_stmt, 3, flip_y(coord.y(), coord.zoom()));

    const int rc = sqlite3_step(_tile_stmt);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw io_error("SQLite error while reading tile " + coord.to_string() + ": " +
                       std::string(sqlite3_errmsg(_db)));
    }
    const int size = sqlite3_column_bytes(_tile_stmt, 0);
    if (size <= 0) {
        return std::nullopt;
    }
    Blob blob = Blob::from_bytes(sqlite3_column_blob(_tile_stmt, 0), static_cast<std::size_t>(size),
                                 _metadata.tile_compression);
    sqlite3_reset(_tile_stmt);
    return blob;
}

void MBTilesReader::probe_container(std::ostream &out) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, "SELECT COUNT(*), COALESCE(SUM(LENGTH(tile_data)), 0) FROM tiles", "count tiles");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw io_error("SQLite error while counting tiles: " + std::string(sqlite3_errmsg(_db)));
    }
    out << "tile rows: " << sqlite3_column_int64(stmt.get(), 0) << '\n';
    out << "sum of tile sizes: " << sqlite3_column_int64(stmt.get(), 1) << '\n';
}

MBTilesWriter::MBTilesWriter(const std::string &path) : TileWriter(path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw io_error("Failed to replace '" + path + "': " + ec.message());
    }
    _db = open_database(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX);

    try {
        exec(_db, "CREATE TABLE metadata (name TEXT, value TEXT)", "create metadata table");
        exec(_db, "CREATE UNIQUE INDEX metadata_index ON metadata (name)", "create metadata index");
        exec(_db, "CREATE TABLE tiles (zoom_level INTEGER, tile_column INTEGER, tile_row INTEGER, tile_data BLOB)",
             "create tiles table");
        exec(_db, "CREATE UNIQUE INDEX tile_index ON tiles (zoom_level, tile_column, tile_row)",
             "create tiles index");
        exec(_db, "BEGIN IMMEDIATE TRANSACTION", "begin transaction");

        const char *insert_sql =
            "INSERT OR REPLACE INTO tiles(zoom_level, tile_column, tile_row, tile_data) VALUES(?1, ?2, ?3, ?4)";
        _insert_stmt = prepare(_db, insert_sql, "prepare insert statement").release();
    } catch (const tilebox_error &) {
        close();
        fs::remove(path, ec);
        throw;
    }
}

MBTilesWriter::~MBTilesWriter() {
    abort_unfinished();
    close();
}

void MBTilesWriter::close() {
    if (_insert_stmt != nullptr) {
        sqlite3_finalize(_insert_stmt);
        _insert_stmt = nullptr;
    }
    if (_db != nullptr) {
        sqlite3_close(_db);
        _db = nullptr;
    }
}

void MBTilesWriter::adjust_metadata(ContainerMetadata &metadata) {
    metadata.tile_compression = mbtiles_compression(metadata.tile_format);
}

void MBTilesWriter::do_write_tile(const TileCoord &coord, const Blob &blob) {
    std::lock_guard<std::mutex> lock(_mutex);
    sqlite3_reset(_insert_stmt);
    sqlite3_clear_bindings(_insert_stmt);
    sqlite3_bind_int(_insert_stmt, 1, static_cast<int>(coord.zoom()));
    sqlite3_bind_int64(_insert_stmt, 2, coord.x());
    sqlite3_bind_int64(_insert_stmt, 3, flip_y(coord.y(), coord.zoom()));
    sqlite3_bind_blob(_insert_stmt, 4, blob.data().data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(_insert_stmt) != SQLITE_DONE) {
        throw io_error("Failed to write tile " + coord.to_string() + " to '" + path() +
                       "': " + std::string(sqlite3_errmsg(_db)));
    }
}

void MBTilesWriter::do_finalize() {
    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, "INSERT OR REPLACE INTO metadata(name, value) VALUES(?1, ?2)",
                        "prepare metadata statement");
    for (const auto &entry : metadata().entries) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        sqlite3_bind_text(stmt.get(), 1, entry.first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, entry.second.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw io_error("Failed to write metadata '" + entry.first + "': " + std::string(sqlite3_errmsg(_db)));
        }
    }
    stmt.reset();
    exec(_db, "COMMIT", "commit tile data");
    close();
}

void MBTilesWriter::do_abort() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_db != nullptr) {
        // the transaction may already be gone after a failed COMMIT
        sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    close();
    std::error_code ec;
    fs::remove(path(), ec);
    if (ec) {
        throw io_error("Failed to remove '" + path() + "': " + ec.message());
    }
}

}  // namespace tilebox
