#include <sstream>
#include <iomanip>
#include "Renderer.hpp"
#include "TimeFormat.hpp"

std::string Renderer::alert(Alert const& a)
{
    std::stringstream ss;
    ss << "----- ALERT -----\n"
       << "Header: " << a.header << "\n"
       << "Description: " << a.description << "\n";

    for (const auto& p : a.activePeriods)
    {
        ss << "Start: " << p.startText << "\n"
           << "End:   " << p.endText << "\n";
    }

    if (!a.routes.empty())
    {
        ss << "Routes affected: ";
        bool first = true;
        for (const auto& r : a.routes)
        {
            ss << (first ? "" : ", ") << r;
            first = false;
        }
        ss << "\n";
    }

    if (!a.stops.empty())
    {
        ss << "Stops affected:\n";
        for (const auto& s : a.stops)
            ss << "  - Stop ID: " << s << "\n";
    }

    ss << "\n";
    return ss.str();
}

std::string Renderer::arrival(TripUpdateRecord const& r, std::string const& stopId)
{
    std::stringstream ss;
    ss << "-> Route " << r.routeId << " @ Stop " << stopId << "\n"
       << "   Stop Seq: " << r.stopSequence << "\n"
       << "   Arrival: " << TimeFormat::format(r.arrivalTime) << "\n"
       << "   Departure: " << TimeFormat::format(r.departureTime) << "\n"
       << std::string(30, '-') << "\n";
    return ss.str();
}

std::string Renderer::vehicle(VehiclePosition const& v)
{
    std::stringstream ss;
    ss << "\n--- Vehicle Update ---\n"
       << "Route: " << v.routeId << "\n";

    if (!v.vehicleId.empty())
        ss << "Vehicle: " << v.vehicleId << "\n";

    ss << std::fixed << std::setprecision(4)
       << "Location: Lat: " << v.lat << ", Lon: " << v.lon << "\n"
       << "Timestamp: " << TimeFormat::format(static_cast<std::int64_t>(v.timestamp)) << "\n";
    return ss.str();
}

std::string Renderer::stop(Stop const& s)
{
    return s.stopId + " -> " + s.stopName + "\n";
}

std::string Renderer::stopDistance(StopDistance const& s)
{
    std::stringstream ss;
    ss << s.stop.stopId << " -> " << s.stop.stopName
       << " (" << std::fixed << std::setprecision(2) << s.distanceKm << " km)\n";
    return ss.str();
}

std::string Renderer::valueOrNone(std::optional<std::string> const& value)
{
    return value ? *value : "None";
}

std::string Renderer::agency(Agency const& a)
{
    std::stringstream ss;
    ss << "\n=== Agency Information ===\n"
       << "Agency Name: " << valueOrNone(a.name) << "\n"
       << "Agency URL: " << valueOrNone(a.url) << "\n"
       << "Timezone: " << valueOrNone(a.timezone) << "\n"
       << "Agency Language: " << valueOrNone(a.language) << "\n"
       << "Agency Phone Number: " << valueOrNone(a.phone) << "\n";
    return ss.str();
}

std::string Renderer::routeList(std::vector<std::string> const& routes)
{
    std::string joined;
    for (const auto& r : routes)
    {
        if (!joined.empty())
            joined += ", ";
        joined += r;
    }
    return joined;
}
