#include <cstdlib>
#include <utility>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager(std::string dataPath)
    : staticDataPath(std::move(dataPath))
{
    feeds.alertsUrl           = fromEnvironment(ALERTS_URL_ENV, DEFAULT_ALERTS_URL);
    feeds.tripUpdatesUrl      = fromEnvironment(TRIP_UPDATES_URL_ENV, DEFAULT_TRIP_UPDATES_URL);
    feeds.vehiclePositionsUrl = fromEnvironment(VEHICLE_POSITIONS_URL_ENV, DEFAULT_VEHICLE_POSITIONS_URL);
}

std::string ConfigurationManager::fromEnvironment(char const* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return fallback;
    return value;
}

FeedConfig const& ConfigurationManager::getFeeds() const noexcept { return feeds; }
std::string const& ConfigurationManager::getStaticDataPath() const noexcept { return staticDataPath; }
