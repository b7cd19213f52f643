#pragma once
#include <string>
#include <map>
#include <functional>
#include <iosfwd>
#include "Types.hpp"

// Everything a console session remembers between commands.
struct SessionState
{
    TrackedRouteSet trackedRoutes;
    bool alertsMatchAll = false;
    std::string stopId;
};

enum class CommandOutcome
{
    Continue,   // stay in the current menu
    Leave,      // return to the enclosing menu
    Quit        // end the process
};

// The only functions that change SessionState::trackedRoutes.
class RouteManager
{
public:
    // Both return false when the call changed nothing.
    static bool add(SessionState& state, std::string const& route);
    static bool remove(SessionState& state, std::string const& route);

    static std::string describe(TrackedRouteSet const& routes, std::string const& empty);
};

// Strips surrounding whitespace from a line of user input.
std::string trimInput(std::string const& text);

// Throws InvalidInputError unless text is exactly four ASCII digits.
std::string validateStopId(std::string const& text);

// Finite command table for one menu. A line is split into a lowercased
// command word and the remaining argument; "q" and "quit" end the process
// from every menu.
class CommandDispatcher
{
public:
    using Handler = std::function<CommandOutcome(SessionState&, std::string const&)>;

private:
    std::string prompt;
    std::string invalidMessage;
    std::map<std::string, Handler> handlers;

public:
    CommandDispatcher(std::string prompt, std::string invalidMessage);

    void on(std::string const& name, Handler handler);
    [[nodiscard]] bool handles(std::string const& name) const;

    CommandOutcome dispatch(SessionState& state, std::string const& line, std::ostream& out) const;

    // Prompts and dispatches until a handler leaves or quits. End of input quits.
    CommandOutcome run(SessionState& state, std::istream& in, std::ostream& out) const;
};
