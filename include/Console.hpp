#pragma once
#include <string>
#include <optional>
#include <iosfwd>
#include "Session.hpp"
#include "StaticScheduleStore.hpp"
#include "RealtimeFeedClient.hpp"

// Interactive menus. Owns the session state and the lazily opened static
// schedule; every failure is reported on the output stream and control
// returns to the current prompt.
class Console
{
private:
    std::istream& in;
    std::ostream& out;
    RealtimeFeedClient& feeds;
    std::string staticDataPath;
    std::optional<StaticScheduleStore> store;
    SessionState state;

    StaticScheduleStore& schedule();
    std::optional<std::string> ask(std::string const& question);

    template <typename Action>
    CommandOutcome withSchedule(Action action);

    template <typename Action>
    void displaying(char const* what, Action action);

    CommandOutcome alertsMenu(SessionState& session);
    CommandOutcome vehicleMenu(SessionState& session);
    CommandOutcome arrivalsMenu(SessionState& session);
    CommandOutcome stopFinderMenu(SessionState& session);
    CommandOutcome routeManagerMenu(SessionState& session);
    CommandOutcome agencyInfo();

    void showAlerts(SessionState const& session);
    void showVehicles(SessionState const& session);
    void showArrivals(std::string const& stopId, std::string const& routeFilter);

    void addRoute(SessionState& session, std::string const& route);
    void removeRoute(SessionState& session, std::string const& route);

public:
    Console(std::istream& input, std::ostream& output, RealtimeFeedClient& feeds, std::string staticDataPath);

    // Runs the main menu until the user quits or input ends.
    int run();

    [[nodiscard]] SessionState const& session() const noexcept { return state; }
};
