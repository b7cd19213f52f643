#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

// One boarding location from stops.txt.
struct Stop
{
    std::string stopId;
    std::string stopName;
    double lat = 0.0;
    double lon = 0.0;
};

// One row of agency.txt. Columns absent from the file stay empty.
struct Agency
{
    std::optional<std::string> name;
    std::optional<std::string> url;
    std::optional<std::string> timezone;
    std::optional<std::string> language;
    std::optional<std::string> phone;
};

struct ActivePeriod
{
    std::int64_t start = 0;
    std::int64_t end = 0;
    std::string startText;    // "2024-05-27 08:15:30 PM", local time
    std::string endText;
};

struct Alert
{
    std::string header;
    std::string description;
    std::vector<ActivePeriod> activePeriods;
    std::set<std::string> routes;     // uppercased
    std::vector<std::string> stops;   // first-seen order, no duplicates
};

// One stop_time_update of a trip_update entity, flattened.
struct TripUpdateRecord
{
    std::string tripId;
    std::string routeId;
    std::string stopId;
    std::uint32_t stopSequence = 0;
    std::int64_t arrivalTime = 0;
    std::int64_t departureTime = 0;
};

struct VehiclePosition
{
    std::string routeId;
    std::string tripId;
    std::string vehicleId;
    double lat = 0.0;
    double lon = 0.0;
    std::uint64_t timestamp = 0;
};

struct StopDistance
{
    Stop stop;
    double distanceKm = 0.0;
};

using TrackedRouteSet = std::set<std::string>;
