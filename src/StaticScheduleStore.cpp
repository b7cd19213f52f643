#include <utility>
#include <iostream>
#include <cstdlib>
#include <cerrno>
#include "StaticScheduleStore.hpp"
#include "GtfsArchive.hpp"
#include "CsvTable.hpp"
#include "Errors.hpp"

namespace
{
    std::string const& required(CsvTable const& table, CsvTable::Row const& row,
                                std::size_t column, std::size_t rowNumber)
    {
        if (column >= row.size())
        {
            throw DataFormatError(table.getName() + " row " + std::to_string(rowNumber)
                                  + " has " + std::to_string(row.size()) + " fields, expected at least "
                                  + std::to_string(column + 1));
        }
        return row[column];
    }

    double toDouble(CsvTable const& table, std::string const& column, std::string const& value)
    {
        char const* begin = value.c_str();
        char* end = nullptr;
        errno = 0;
        double const result = std::strtod(begin, &end);

        while (end && (*end == ' ' || *end == '\t'))
            ++end;

        if (end == begin || *end != '\0' || errno == ERANGE)
            throw DataFormatError(table.getName() + ": " + column + " '" + value + "' is not a number");
        return result;
    }

    long toInteger(CsvTable const& table, std::string const& column, std::string const& value)
    {
        char const* begin = value.c_str();
        char* end = nullptr;
        errno = 0;
        long const result = std::strtol(begin, &end, 10);

        while (end && (*end == ' ' || *end == '\t'))
            ++end;

        if (end == begin || *end != '\0' || errno == ERANGE)
            throw DataFormatError(table.getName() + ": " + column + " '" + value + "' is not an integer");
        return result;
    }

    std::string columnText(sqlite3_stmt* stmt, int column)
    {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }
}

StaticScheduleStore::StaticScheduleStore(std::string zipPath, std::ostream& log)
    : archivePath(std::move(zipPath))
{
    GtfsArchive archive(archivePath);

    CsvTable stops     = archive.readTable("stops.txt");
    CsvTable trips     = archive.readTable("trips.txt");
    CsvTable stopTimes = archive.readTable("stop_times.txt");

    sqlite3* handle = nullptr;
    int rc = sqlite3_open(":memory:", &handle);
    db.reset(handle);
    if (rc != SQLITE_OK)
    {
        throw DataFormatError(std::string("Failed to open schedule index: ")
                              + (handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc)));
    }

    createSchema();

    exec("BEGIN TRANSACTION;");
    importStops(stops);
    importTrips(trips);
    importStopTimes(stopTimes);
    exec("COMMIT;");

    log << "[System] Static schedule loaded from " << archivePath << ": "
              << count("stops") << " stops, "
              << count("trips") << " trips, "
              << count("stop_times") << " stop times." << std::endl;
}

void StaticScheduleStore::exec(char const* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db.get(), sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : sqlite3_errmsg(db.get());
        if (errMsg) sqlite3_free(errMsg);
        throw DataFormatError("Schedule index statement failed: " + message);
    }
}

StaticScheduleStore::Statement StaticScheduleStore::prepare(char const* sql)
{
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db.get(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        throw DataFormatError(std::string("Failed to prepare schedule query: ")
                              + sqlite3_errmsg(db.get()));
    }
    return Statement(stmt);
}

void StaticScheduleStore::bindText(Statement const& stmt, int index, std::string const& value)
{
    if (sqlite3_bind_text(stmt.get(), index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw DataFormatError(std::string("Failed to bind schedule query parameter: ")
                              + sqlite3_errmsg(db.get()));
    }
}

void StaticScheduleStore::finish(Statement const& stmt, int rc, char const* what)
{
    if (rc != SQLITE_DONE)
    {
        throw DataFormatError(std::string(what) + " failed: " + sqlite3_errmsg(db.get()));
    }
    sqlite3_reset(stmt.get());
}

Stop StaticScheduleStore::readStop(Statement const& stmt)
{
    Stop s;
    s.stopId   = columnText(stmt.get(), 0);
    s.stopName = columnText(stmt.get(), 1);
    s.lat      = sqlite3_column_double(stmt.get(), 2);
    s.lon      = sqlite3_column_double(stmt.get(), 3);
    return s;
}

void StaticScheduleStore::createSchema()
{
    const char* createSql =
        "CREATE TABLE stops ("
        "  seq INTEGER PRIMARY KEY, "
        "  stop_id TEXT, "
        "  stop_name TEXT, "
        "  lat REAL, "
        "  lon REAL"
        ");"
        "CREATE INDEX stops_by_id ON stops (stop_id);"
        "CREATE TABLE trips ("
        "  trip_id TEXT PRIMARY KEY, "
        "  route_id TEXT"
        ");"
        "CREATE INDEX trips_by_route ON trips (route_id COLLATE NOCASE);"
        "CREATE TABLE stop_times ("
        "  trip_id TEXT, "
        "  stop_id TEXT, "
        "  stop_sequence INTEGER"
        ");"
        "CREATE INDEX stop_times_by_stop ON stop_times (stop_id COLLATE NOCASE);"
        "CREATE INDEX stop_times_by_trip ON stop_times (trip_id);";

    exec(createSql);
}

void StaticScheduleStore::importStops(CsvTable const& table)
{
    std::size_t const idCol   = table.requireColumn("stop_id");
    std::size_t const nameCol = table.requireColumn("stop_name");
    std::size_t const latCol  = table.requireColumn("stop_lat");
    std::size_t const lonCol  = table.requireColumn("stop_lon");

    Statement insertStmt = prepare(
        "INSERT INTO stops (stop_id, stop_name, lat, lon) VALUES (?, ?, ?, ?);");

    std::size_t rowNumber = 1;
    for (auto const& row : table.getRows())
    {
        ++rowNumber;
        double const lat = toDouble(table, "stop_lat", required(table, row, latCol, rowNumber));
        double const lon = toDouble(table, "stop_lon", required(table, row, lonCol, rowNumber));

        bindText(insertStmt, 1, required(table, row, idCol, rowNumber));
        bindText(insertStmt, 2, required(table, row, nameCol, rowNumber));
        sqlite3_bind_double(insertStmt.get(), 3, lat);
        sqlite3_bind_double(insertStmt.get(), 4, lon);

        finish(insertStmt, sqlite3_step(insertStmt.get()), "Stop import");
    }
}

void StaticScheduleStore::importTrips(CsvTable const& table)
{
    std::size_t const tripCol  = table.requireColumn("trip_id");
    std::size_t const routeCol = table.requireColumn("route_id");

    // A repeated trip_id maps to the route of its last row.
    Statement insertStmt = prepare(
        "INSERT OR REPLACE INTO trips (trip_id, route_id) VALUES (?, ?);");

    std::size_t rowNumber = 1;
    for (auto const& row : table.getRows())
    {
        ++rowNumber;
        bindText(insertStmt, 1, required(table, row, tripCol, rowNumber));
        bindText(insertStmt, 2, required(table, row, routeCol, rowNumber));

        finish(insertStmt, sqlite3_step(insertStmt.get()), "Trip import");
    }
}

void StaticScheduleStore::importStopTimes(CsvTable const& table)
{
    std::size_t const tripCol = table.requireColumn("trip_id");
    std::size_t const stopCol = table.requireColumn("stop_id");
    std::size_t const seqCol  = table.requireColumn("stop_sequence");

    Statement insertStmt = prepare(
        "INSERT INTO stop_times (trip_id, stop_id, stop_sequence) VALUES (?, ?, ?);");

    std::size_t rowNumber = 1;
    for (auto const& row : table.getRows())
    {
        ++rowNumber;
        long const sequence = toInteger(table, "stop_sequence", required(table, row, seqCol, rowNumber));

        bindText(insertStmt, 1, required(table, row, tripCol, rowNumber));
        bindText(insertStmt, 2, required(table, row, stopCol, rowNumber));
        sqlite3_bind_int64(insertStmt.get(), 3, static_cast<sqlite3_int64>(sequence));

        finish(insertStmt, sqlite3_step(insertStmt.get()), "Stop time import");
    }
}

int StaticScheduleStore::count(char const* table)
{
    std::string sql = std::string("SELECT count(*) FROM ") + table + ";";
    Statement stmt = prepare(sql.c_str());
    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        return 0;
    return sqlite3_column_int(stmt.get(), 0);
}

std::vector<Stop> StaticScheduleStore::loadStops()
{
    Statement stmt = prepare("SELECT stop_id, stop_name, lat, lon FROM stops ORDER BY seq;");

    std::vector<Stop> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        results.push_back(readStop(stmt));

    finish(stmt, rc, "loadStops");
    return results;
}

std::optional<Stop> StaticScheduleStore::findStop(std::string const& stopId)
{
    Statement stmt = prepare(
        "SELECT stop_id, stop_name, lat, lon FROM stops "
        "WHERE stop_id = ?1 COLLATE NOCASE ORDER BY seq LIMIT 1;");
    bindText(stmt, 1, stopId);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW)
        return readStop(stmt);

    finish(stmt, rc, "findStop");
    return std::nullopt;
}

std::vector<Stop> StaticScheduleStore::findStopsByName(std::string const& keyword)
{
    Statement stmt = prepare(
        "SELECT stop_id, stop_name, lat, lon FROM stops "
        "WHERE instr(lower(stop_name), lower(?1)) > 0 ORDER BY seq;");
    bindText(stmt, 1, keyword);

    std::vector<Stop> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        results.push_back(readStop(stmt));

    finish(stmt, rc, "findStopsByName");
    return results;
}

std::vector<std::string> StaticScheduleStore::routesForStop(std::string const& stopId)
{
    Statement stmt = prepare(
        "SELECT DISTINCT T.route_id "
        "FROM stop_times ST "
        "JOIN trips T ON T.trip_id = ST.trip_id "
        "WHERE ST.stop_id = ?1 COLLATE NOCASE "
        "  AND T.route_id <> '' "
        "ORDER BY T.route_id;");
    bindText(stmt, 1, stopId);

    std::vector<std::string> routes;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        routes.push_back(columnText(stmt.get(), 0));

    finish(stmt, rc, "routesForStop");
    return routes;
}

std::vector<Stop> StaticScheduleStore::stopsForRoute(std::string const& routeId)
{
    Statement stmt = prepare(
        "SELECT stop_id, stop_name, lat, lon FROM stops "
        "WHERE stop_id IN ("
        "  SELECT ST.stop_id FROM stop_times ST "
        "  JOIN trips T ON T.trip_id = ST.trip_id "
        "  WHERE T.route_id = ?1 COLLATE NOCASE"
        ") "
        "ORDER BY seq;");
    bindText(stmt, 1, routeId);

    std::vector<Stop> results;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        results.push_back(readStop(stmt));

    finish(stmt, rc, "stopsForRoute");
    return results;
}

std::vector<Agency> StaticScheduleStore::agencyInfo()
{
    GtfsArchive archive(archivePath);
    CsvTable table = archive.readTable("agency.txt");

    auto const nameCol     = table.findColumn("agency_name");
    auto const urlCol      = table.findColumn("agency_url");
    auto const timezoneCol = table.findColumn("agency_timezone");
    auto const langCol     = table.findColumn("agency_lang");
    auto const phoneCol    = table.findColumn("agency_phone");

    std::vector<Agency> agencies;
    agencies.reserve(table.size());

    for (auto const& row : table.getRows())
    {
        Agency a;
        a.name     = CsvTable::field(row, nameCol);
        a.url      = CsvTable::field(row, urlCol);
        a.timezone = CsvTable::field(row, timezoneCol);
        a.language = CsvTable::field(row, langCol);
        a.phone    = CsvTable::field(row, phoneCol);
        agencies.push_back(std::move(a));
    }

    return agencies;
}
