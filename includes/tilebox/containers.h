#ifndef TILEBOX_CONTAINERS_H
#define TILEBOX_CONTAINERS_H
#pragma once

#include "tilebox/data_reader.h"
#include "tilebox/reader.h"
#include "tilebox/writer.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace tilebox {

// z/x/y.<ext>[.gz|.br] files below a root directory.
class DirectoryReader : public TileReader {
public:
    explicit DirectoryReader(const std::string &path);

    std::string name() const override { return _root.string(); }
    std::string container_name() const override { return "directory"; }

    std::optional<Blob> get_tile(const TileCoord &coord) override;

private:
    std::filesystem::path _root;
    std::map<TileCoord, std::filesystem::path> _tiles;
};

class DirectoryWriter : public TileWriter {
public:
    explicit DirectoryWriter(const std::string &path);
    ~DirectoryWriter() override;

    std::string container_name() const override { return "directory"; }

protected:
    void do_write_tile(const TileCoord &coord, const Blob &blob) override;
    void do_finalize() override;
    void do_abort() override;

private:
    void write_file(const std::filesystem::path &relative, const Blob &blob);

    std::filesystem::path _root;
    bool _created_root = false;
    std::mutex _mutex;
    std::vector<std::filesystem::path> _written;
};

// The same layout inside a ustar archive. The index is built by scanning the
// headers when the archive is opened.
class TarReader : public TileReader {
public:
    explicit TarReader(const std::string &path);

    std::string name() const override { return _data->name(); }
    std::string container_name() const override { return "tar"; }

    std::optional<Blob> get_tile(const TileCoord &coord) override;
    void probe_container(std::ostream &out) override;

private:
    std::unique_ptr<DataReader> _data;
    std::map<TileCoord, ByteRange> _tiles;
    std::size_t _entry_count = 0;
};

class TarWriter : public TileWriter {
public:
    explicit TarWriter(const std::string &path);
    ~TarWriter() override;

    std::string container_name() const override { return "tar"; }

protected:
    void do_write_tile(const TileCoord &coord, const Blob &blob) override;
    void do_finalize() override;
    void do_abort() override;

private:
    void write_entry(const std::string &name, const Blob &blob);

    std::mutex _mutex;
    std::ofstream _file;
};

// SQLite archive with tiles/metadata tables; rows are stored TMS flipped.
class MBTilesReader : public TileReader {
public:
    explicit MBTilesReader(const std::string &path);
    ~MBTilesReader() override;

    MBTilesReader(const MBTilesReader &) = delete;
    MBTilesReader &operator=(const MBTilesReader &) = delete;

    std::string name() const override { return _path; }
    std::string container_name() const override { return "mbtiles"; }

    std::optional<Blob> get_tile(const TileCoord &coord) override;
    void probe_container(std::ostream &out) override;

private:
    void load_metadata();
    void load_pyramid();

    std::string _path;
    sqlite3 *_db = nullptr;
    sqlite3_stmt *_tile_stmt = nullptr;
    std::mutex _mutex;
};

class MBTilesWriter : public TileWriter {
public:
    explicit MBTilesWriter(const std::string &path);
    ~MBTilesWriter() override;

    std::string container_name() const override { return "mbtiles"; }

protected:
    void adjust_metadata(ContainerMetadata &metadata) override;
    void do_write_tile(const TileCoord &coord, const Blob &blob) override;
    void do_finalize() override;
    void do_abort() override;

private:
    void close();

    sqlite3 *_db = nullptr;
    sqlite3_stmt *_insert_stmt = nullptr;
    std::mutex _mutex;
};

// TMS row <-> XYZ row.
std::uint32_t flip_y(std::uint32_t y, unsigned zoom);

}  // namespace tilebox

#endif // TILEBOX_CONTAINERS_H
