#include <sstream>
#include <istream>
#include <chrono>
#include "TimeFormat.hpp"
#include "Errors.hpp"

using namespace date;
using namespace std::chrono;

std::string TimeFormat::format(std::int64_t unixSeconds)
{
    return format(unixSeconds, current_zone());
}

std::string TimeFormat::format(std::int64_t unixSeconds, time_zone const* zone)
{
    sys_seconds instant{seconds{unixSeconds}};
    zoned_seconds local{zone, instant};
    return date::format(DISPLAY_FORMAT.c_str(), local);
}

std::int64_t TimeFormat::parse(std::string const& text)
{
    return parse(text, current_zone());
}

std::int64_t TimeFormat::parse(std::string const& text, time_zone const* zone)
{
    std::istringstream in(text);
    local_seconds local;
    in >> date::parse(DISPLAY_FORMAT, local);
    if (in.fail())
        throw InvalidInputError("Unrecognised timestamp: " + text);

    in >> std::ws;
    if (!in.eof())
        throw InvalidInputError("Trailing text after timestamp: " + text);

    // Repeated wall-clock hour at a DST fall-back resolves to the first one.
    sys_seconds instant = zone->to_sys(local, choose::earliest);
    return instant.time_since_epoch().count();
}
