#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <numbers>
#include "Correlation.hpp"
#include "Errors.hpp"

std::string Correlation::normalizeId(std::string id)
{
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return id;
}

std::vector<TripUpdateRecord> Correlation::arrivalsFor(std::vector<TripUpdateRecord> const& tripUpdates,
                                                       std::string const& stopId,
                                                       std::string const& routeFilter)
{
    std::string const stop  = normalizeId(stopId);
    std::string const route = normalizeId(routeFilter);
    bool const anyRoute = (route == ALL_ROUTES);

    std::vector<TripUpdateRecord> out;
    for (auto const& r : tripUpdates)
    {
        if (normalizeId(r.stopId) != stop)
            continue;
        if (!anyRoute && normalizeId(r.routeId) != route)
            continue;
        out.push_back(r);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](TripUpdateRecord const& a, TripUpdateRecord const& b)
                     {
                         return a.arrivalTime < b.arrivalTime;
                     });
    return out;
}

std::vector<Alert> Correlation::alertsMatching(std::vector<Alert> const& alerts,
                                               std::optional<TrackedRouteSet> const& tracked)
{
    if (!tracked)
        return alerts;

    TrackedRouteSet wanted;
    for (auto const& route : *tracked)
        wanted.insert(normalizeId(route));

    std::vector<Alert> out;
    for (auto const& alert : alerts)
    {
        bool const affected = std::any_of(alert.routes.begin(), alert.routes.end(),
                                          [&wanted](std::string const& route)
                                          {
                                              return wanted.count(normalizeId(route)) > 0;
                                          });
        if (affected)
            out.push_back(alert);
    }
    return out;
}

std::vector<VehiclePosition> Correlation::vehiclesOnRoutes(std::vector<VehiclePosition> const& vehicles,
                                                           TrackedRouteSet const& tracked)
{
    std::vector<VehiclePosition> out;
    for (auto const& v : vehicles)
    {
        if (tracked.count(normalizeId(v.routeId)))
            out.push_back(v);
    }
    return out;
}

double Correlation::haversineKm(double lat1, double lon1, double lat2, double lon2)
{
    constexpr double degToRad = std::numbers::pi / 180.0;

    double const dLat = (lat2 - lat1) * degToRad;
    double const dLon = (lon2 - lon1) * degToRad;

    double const a = std::sin(dLat / 2) * std::sin(dLat / 2)
                   + std::cos(lat1 * degToRad) * std::cos(lat2 * degToRad)
                   * std::sin(dLon / 2) * std::sin(dLon / 2);
    double const c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS_KM * c;
}

std::vector<StopDistance> Correlation::nearestStops(std::vector<Stop> const& stops,
                                                    double lat, double lon, std::size_t k)
{
    std::vector<StopDistance> ranked;
    ranked.reserve(stops.size());

    for (auto const& s : stops)
        ranked.push_back({s, haversineKm(lat, lon, s.lat, s.lon)});

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](StopDistance const& a, StopDistance const& b)
                     {
                         return a.distanceKm < b.distanceKm;
                     });

    if (ranked.size() > k)
        ranked.resize(k);
    return ranked;
}

std::vector<StopDistance> Correlation::nearestStops(std::vector<Stop> const& stops,
                                                    std::string const& lat, std::string const& lon,
                                                    std::size_t k)
{
    double const latitude  = parseCoordinate(lat, 90.0, "latitude");
    double const longitude = parseCoordinate(lon, 180.0, "longitude");
    return nearestStops(stops, latitude, longitude, k);
}

double Correlation::parseCoordinate(std::string const& text, double limit, char const* name)
{
    char const* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double const value = std::strtod(begin, &end);

    while (end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;

    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value))
        throw InvalidInputError("Invalid " + std::string(name) + ": '" + text + "'");

    if (std::fabs(value) > limit)
        throw InvalidInputError(std::string(name) + " " + text + " is out of range");

    return value;
}
