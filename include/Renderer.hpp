#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

// Plain-text blocks printed by the console menus.
class Renderer
{
public:
    static std::string alert(Alert const& a);
    static std::string arrival(TripUpdateRecord const& r, std::string const& stopId);
    static std::string vehicle(VehiclePosition const& v);
    static std::string stop(Stop const& s);
    static std::string stopDistance(StopDistance const& s);
    static std::string agency(Agency const& a);
    static std::string routeList(std::vector<std::string> const& routes);

private:
    static std::string valueOrNone(std::optional<std::string> const& value);
};
