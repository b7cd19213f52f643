#pragma once
#include <string>
#include <vector>
#include "gtfs-realtime.pb.h"
#include "Types.hpp"

// Decodes GTFS-realtime FeedMessage payloads. Every extract* call throws
// DecodeError when the payload is not a FeedMessage.
class FeedParser
{
public:
    static transit_realtime::FeedMessage decode(std::string const& data);

    static std::vector<Alert> extractAlerts(std::string const& data);
    static std::vector<TripUpdateRecord> extractTripUpdates(std::string const& data);
    static std::vector<VehiclePosition> extractVehiclePositions(std::string const& data);

private:
    static std::string joinTranslations(transit_realtime::TranslatedString const& text);
    static Alert toAlert(transit_realtime::Alert const& alert);
};
