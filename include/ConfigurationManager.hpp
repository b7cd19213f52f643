#pragma once
#include <string>

// Feed endpoints of the agency being served. Retargeting the assistant to
// another transit authority means supplying that authority's three URLs.
struct FeedConfig
{
    std::string alertsUrl;
    std::string tripUpdatesUrl;
    std::string vehiclePositionsUrl;
};


class ConfigurationManager
{
private:
    FeedConfig feeds;
    std::string staticDataPath;

    static std::string fromEnvironment(char const* name, std::string const& fallback);

public:
    explicit ConfigurationManager(std::string dataPath = DEFAULT_STATIC_DATA);

    static inline const std::string DEFAULT_ALERTS_URL            = "http://gtfs.halifax.ca/realtime/Alert/Alerts.pb";
    static inline const std::string DEFAULT_TRIP_UPDATES_URL      = "http://gtfs.halifax.ca/realtime/TripUpdate/TripUpdates.pb";
    static inline const std::string DEFAULT_VEHICLE_POSITIONS_URL = "http://gtfs.halifax.ca/realtime/Vehicle/VehiclePositions.pb";
    static inline const std::string DEFAULT_STATIC_DATA           = "data/Static_data.zip";

    static inline const char* ALERTS_URL_ENV            = "TRANSIT_ALERTS_URL";
    static inline const char* TRIP_UPDATES_URL_ENV      = "TRANSIT_TRIP_UPDATES_URL";
    static inline const char* VEHICLE_POSITIONS_URL_ENV = "TRANSIT_VEHICLE_POSITIONS_URL";

    [[nodiscard]] FeedConfig const& getFeeds() const noexcept;
    [[nodiscard]] std::string const& getStaticDataPath() const noexcept;
};
