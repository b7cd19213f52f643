#include <iostream>
#include <exception>
#include <utility>
#include "RealtimeFeedClient.hpp"
#include "FeedParser.hpp"
#include "Errors.hpp"

RealtimeFeedClient::RealtimeFeedClient(FeedConfig feeds, FeedTransport& transport)
    : config(std::move(feeds))
    , transport(transport)
{
}

template <typename T, typename Extract>
FeedResult<T> RealtimeFeedClient::fetchFeed(char const* name, std::string const& url, Extract extract)
{
    try
    {
        std::string data = transport.get(url);
        return FeedResult<T>::success(extract(data));
    }
    catch (TransportError const& e)
    {
        std::cerr << "Error fetching " << name << ": " << e.what() << std::endl;
        return FeedResult<T>::failure(std::string("Could not reach the ") + name + " feed: " + e.what());
    }
    catch (DecodeError const& e)
    {
        std::cerr << "Error decoding " << name << ": " << e.what() << std::endl;
        return FeedResult<T>::failure(std::string("Could not read the ") + name + " feed: " + e.what());
    }
    catch (std::exception const& e)
    {
        std::cerr << "Unexpected error processing " << name << ": " << e.what() << std::endl;
        return FeedResult<T>::failure(std::string("Could not process the ") + name + " feed: " + e.what());
    }
}

FeedResult<Alert> RealtimeFeedClient::fetchAlerts()
{
    return fetchFeed<Alert>("alerts", config.alertsUrl, &FeedParser::extractAlerts);
}

FeedResult<TripUpdateRecord> RealtimeFeedClient::fetchTripUpdates()
{
    return fetchFeed<TripUpdateRecord>("trip updates", config.tripUpdatesUrl, &FeedParser::extractTripUpdates);
}

FeedResult<VehiclePosition> RealtimeFeedClient::fetchVehiclePositions()
{
    return fetchFeed<VehiclePosition>("vehicle positions", config.vehiclePositionsUrl, &FeedParser::extractVehiclePositions);
}
