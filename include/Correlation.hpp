#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

// Joins fetched realtime records with static schedule data and the rider's
// selection, producing the ordered result sets the console shows.
class Correlation
{
public:
    static constexpr double EARTH_RADIUS_KM = 6371.0;
    static inline const std::string ALL_ROUTES = "ALL";

    // Route and stop ids compare case-insensitively; this is the canonical form.
    static std::string normalizeId(std::string id);

    // Updates calling at stopId, restricted to routeFilter unless it is "all".
    // Stable-sorted by arrival time.
    static std::vector<TripUpdateRecord> arrivalsFor(std::vector<TripUpdateRecord> const& tripUpdates,
                                                     std::string const& stopId,
                                                     std::string const& routeFilter);

    // std::nullopt matches every alert.
    static std::vector<Alert> alertsMatching(std::vector<Alert> const& alerts,
                                             std::optional<TrackedRouteSet> const& tracked);

    static std::vector<VehiclePosition> vehiclesOnRoutes(std::vector<VehiclePosition> const& vehicles,
                                                         TrackedRouteSet const& tracked);

    static double haversineKm(double lat1, double lon1, double lat2, double lon2);

    static std::vector<StopDistance> nearestStops(std::vector<Stop> const& stops,
                                                  double lat, double lon, std::size_t k = 3);

    // Throws InvalidInputError if either coordinate is not a number in range.
    static std::vector<StopDistance> nearestStops(std::vector<Stop> const& stops,
                                                  std::string const& lat, std::string const& lon,
                                                  std::size_t k = 3);

    static double parseCoordinate(std::string const& text, double limit, char const* name);
};
