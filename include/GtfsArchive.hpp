#pragma once
#include <string>
#include "miniz.h"
#include "CsvTable.hpp"

// Read-only view of a zipped GTFS static dataset. Members are located by
// file name, ignoring any directory prefix inside the archive.
class GtfsArchive
{
private:
    std::string path;
    mz_zip_archive archive;

    int locate(std::string const& member);

public:
    explicit GtfsArchive(std::string zipPath);
    ~GtfsArchive();

    GtfsArchive(GtfsArchive const&) = delete;
    GtfsArchive& operator=(GtfsArchive const&) = delete;

    [[nodiscard]] std::string const& getPath() const noexcept { return path; }

    bool contains(std::string const& member);
    std::string read(std::string const& member);
    CsvTable readTable(std::string const& member);
};
