#pragma once
#include <string>
#include <cstdint>
#include <date/tz.h>

// Display form of feed timestamps: "%Y-%m-%d %I:%M:%S %p" in local time,
// e.g. "2024-05-27 08:15:30 PM".
class TimeFormat
{
public:
    static inline const std::string DISPLAY_FORMAT = "%Y-%m-%d %I:%M:%S %p";

    static std::string format(std::int64_t unixSeconds);
    static std::string format(std::int64_t unixSeconds, date::time_zone const* zone);

    // Inverse of format(). Throws InvalidInputError on malformed text.
    static std::int64_t parse(std::string const& text);
    static std::int64_t parse(std::string const& text, date::time_zone const* zone);
};
