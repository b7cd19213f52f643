#include <cstdlib>
#include <gtest/gtest.h>
#include "ConfigurationManager.hpp"

namespace
{
    void clearFeedEnvironment()
    {
        unsetenv(ConfigurationManager::ALERTS_URL_ENV);
        unsetenv(ConfigurationManager::TRIP_UPDATES_URL_ENV);
        unsetenv(ConfigurationManager::VEHICLE_POSITIONS_URL_ENV);
    }
}

TEST(ConfigurationManager, halifax_defaults)
{
    clearFeedEnvironment();
    ConfigurationManager config;

    EXPECT_EQ(ConfigurationManager::DEFAULT_STATIC_DATA, config.getStaticDataPath());
    EXPECT_EQ(ConfigurationManager::DEFAULT_ALERTS_URL, config.getFeeds().alertsUrl);
    EXPECT_EQ(ConfigurationManager::DEFAULT_TRIP_UPDATES_URL, config.getFeeds().tripUpdatesUrl);
    EXPECT_EQ(ConfigurationManager::DEFAULT_VEHICLE_POSITIONS_URL, config.getFeeds().vehiclePositionsUrl);
}

TEST(ConfigurationManager, environment_overrides)
{
    clearFeedEnvironment();
    setenv(ConfigurationManager::ALERTS_URL_ENV, "https://mirror.test/Alerts.pb", 1);
    setenv(ConfigurationManager::TRIP_UPDATES_URL_ENV, "", 1);

    ConfigurationManager config("/srv/gtfs/halifax.zip");

    EXPECT_EQ("/srv/gtfs/halifax.zip", config.getStaticDataPath());
    EXPECT_EQ("https://mirror.test/Alerts.pb", config.getFeeds().alertsUrl);
    EXPECT_EQ(ConfigurationManager::DEFAULT_TRIP_UPDATES_URL, config.getFeeds().tripUpdatesUrl);

    clearFeedEnvironment();
}
