#include <algorithm>
#include "FeedParser.hpp"
#include "TimeFormat.hpp"
#include "Errors.hpp"
#include "Correlation.hpp"

transit_realtime::FeedMessage FeedParser::decode(std::string const& data)
{
    if (data.empty())
        throw DecodeError("Feed payload is empty");

    // Misconfigured endpoints answer 200 with an HTML page.
    if (data[0] == '<')
        throw DecodeError("Feed payload is HTML, not a GTFS-realtime message");

    transit_realtime::FeedMessage feed;
    if (!feed.ParseFromString(data))
    {
        throw DecodeError("Feed payload is not a valid GTFS-realtime FeedMessage ("
                          + std::to_string(data.size()) + " bytes)");
    }

    return feed;
}

std::string FeedParser::joinTranslations(transit_realtime::TranslatedString const& text)
{
    std::string joined;
    for (int i = 0; i < text.translation_size(); ++i)
    {
        if (i > 0)
            joined += '\n';
        joined += text.translation(i).text();
    }
    return joined;
}

Alert FeedParser::toAlert(transit_realtime::Alert const& alert)
{
    Alert a;

    for (const auto& informed : alert.informed_entity())
    {
        if (!informed.route_id().empty())
            a.routes.insert(Correlation::normalizeId(informed.route_id()));

        if (!informed.stop_id().empty()
            && std::find(a.stops.begin(), a.stops.end(), informed.stop_id()) == a.stops.end())
        {
            a.stops.push_back(informed.stop_id());
        }
    }

    a.header      = joinTranslations(alert.header_text());
    a.description = joinTranslations(alert.description_text());

    for (const auto& period : alert.active_period())
    {
        ActivePeriod p;
        p.start     = static_cast<std::int64_t>(period.start());
        p.end       = static_cast<std::int64_t>(period.end());
        p.startText = TimeFormat::format(p.start);
        p.endText   = TimeFormat::format(p.end);
        a.activePeriods.push_back(std::move(p));
    }

    return a;
}

std::vector<Alert> FeedParser::extractAlerts(std::string const& data)
{
    transit_realtime::FeedMessage feed = decode(data);

    std::vector<Alert> out;
    for (const auto& entity : feed.entity())
    {
        if (!entity.has_alert())
            continue;
        out.push_back(toAlert(entity.alert()));
    }
    return out;
}

std::vector<TripUpdateRecord> FeedParser::extractTripUpdates(std::string const& data)
{
    transit_realtime::FeedMessage feed = decode(data);

    std::vector<TripUpdateRecord> out;
    for (const auto& entity : feed.entity())
    {
        if (!entity.has_trip_update())
            continue;

        const auto& tu = entity.trip_update();

        for (int i = 0; i < tu.stop_time_update_size(); ++i)
        {
            const auto& st = tu.stop_time_update(i);

            TripUpdateRecord r;
            r.tripId        = tu.trip().trip_id();
            r.routeId       = tu.trip().route_id();
            r.stopId        = st.stop_id();
            r.stopSequence  = st.stop_sequence();
            r.arrivalTime   = st.arrival().time();
            r.departureTime = st.departure().time();
            out.push_back(std::move(r));
        }
    }
    return out;
}

std::vector<VehiclePosition> FeedParser::extractVehiclePositions(std::string const& data)
{
    transit_realtime::FeedMessage feed = decode(data);

    std::vector<VehiclePosition> out;
    for (const auto& entity : feed.entity())
    {
        if (!entity.has_vehicle())
            continue;

        const auto& v = entity.vehicle();

        VehiclePosition p;
        p.routeId   = v.trip().route_id();
        p.tripId    = v.trip().trip_id();
        p.vehicleId = v.vehicle().id();
        p.timestamp = v.timestamp();

        if (v.has_position())
        {
            p.lat = v.position().latitude();
            p.lon = v.position().longitude();
        }

        out.push_back(std::move(p));
    }
    return out;
}
