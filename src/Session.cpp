#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <utility>
#include "Session.hpp"
#include "Correlation.hpp"
#include "Errors.hpp"

namespace
{
    std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

std::string trimInput(std::string const& text)
{
    auto const first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    auto const last = std::find_if_not(text.rbegin(), text.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    return (first < last) ? std::string(first, last) : std::string();
}

bool RouteManager::add(SessionState& state, std::string const& route)
{
    std::string id = Correlation::normalizeId(trimInput(route));
    if (id.empty())
        return false;
    return state.trackedRoutes.insert(std::move(id)).second;
}

bool RouteManager::remove(SessionState& state, std::string const& route)
{
    return state.trackedRoutes.erase(Correlation::normalizeId(trimInput(route))) > 0;
}

std::string RouteManager::describe(TrackedRouteSet const& routes, std::string const& empty)
{
    if (routes.empty())
        return empty;

    std::string joined;
    for (auto const& r : routes)
    {
        if (!joined.empty())
            joined += ", ";
        joined += r;
    }
    return joined;
}

std::string validateStopId(std::string const& text)
{
    std::string candidate = trimInput(text);
    bool const digits = std::all_of(candidate.begin(), candidate.end(),
                                    [](unsigned char c) { return c >= '0' && c <= '9'; });

    if (candidate.size() != 4 || !digits)
        throw InvalidInputError("Invalid stop ID '" + candidate + "'. Must be a 4-digit number.");
    return candidate;
}

CommandDispatcher::CommandDispatcher(std::string prompt, std::string invalidMessage)
    : prompt(std::move(prompt))
    , invalidMessage(std::move(invalidMessage))
{
}

void CommandDispatcher::on(std::string const& name, Handler handler)
{
    handlers[name] = std::move(handler);
}

bool CommandDispatcher::handles(std::string const& name) const
{
    return handlers.count(name) > 0;
}

CommandOutcome CommandDispatcher::dispatch(SessionState& state, std::string const& line, std::ostream& out) const
{
    std::string const command = lower(trimInput(line));

    auto const space = command.find_first_of(" \t");
    std::string const name = command.substr(0, space);
    std::string const argument = (space == std::string::npos) ? "" : trimInput(command.substr(space));

    if (name == "q" || name == "quit")
    {
        out << "Exiting..." << std::endl;
        return CommandOutcome::Quit;
    }

    auto it = handlers.find(name);
    if (it == handlers.end())
    {
        out << invalidMessage << std::endl;
        return CommandOutcome::Continue;
    }

    return it->second(state, argument);
}

CommandOutcome CommandDispatcher::run(SessionState& state, std::istream& in, std::ostream& out) const
{
    std::string line;
    for (;;)
    {
        out << prompt << std::flush;
        if (!std::getline(in, line))
        {
            out << std::endl;
            return CommandOutcome::Quit;
        }

        CommandOutcome outcome = dispatch(state, line, out);
        if (outcome != CommandOutcome::Continue)
            return outcome;
    }
}
