#pragma once
#include <string>
#include "ConfigurationManager.hpp"
#include "FeedTransport.hpp"
#include "FeedResult.hpp"
#include "Types.hpp"

// Fetches and decodes the three realtime endpoints. Any failure while
// fetching or decoding is logged and returned as a failed FeedResult.
class RealtimeFeedClient
{
private:
    FeedConfig config;
    FeedTransport& transport;

    template <typename T, typename Extract>
    FeedResult<T> fetchFeed(char const* name, std::string const& url, Extract extract);

public:
    RealtimeFeedClient(FeedConfig feeds, FeedTransport& transport);

    FeedResult<Alert> fetchAlerts();
    FeedResult<TripUpdateRecord> fetchTripUpdates();
    FeedResult<VehiclePosition> fetchVehiclePositions();
};
