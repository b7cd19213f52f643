#include <istream>
#include <ostream>
#include <utility>
#include <exception>
#include "Console.hpp"
#include "Correlation.hpp"
#include "Renderer.hpp"
#include "Errors.hpp"

namespace
{
    const char* WELCOME =
        "\nWelcome to the Transit Assistant!\n"
        "This tool allows you to:\n"
        "- View current service alerts\n"
        "- Track buses on selected routes\n"
        "- Get upcoming arrival times for stops\n"
        "- Manage your list of routes of interest\n";

    const char* MAIN_MENU =
        "\n=== Transit Assistant ===\n"
        "1. View Service Alerts\n"
        "2. Track a Bus\n"
        "3. Get Route Updates (Arrivals)\n"
        "4. Manage Tracked Routes\n"
        "5. Agency Info\n"
        "H. Help\n"
        "Q. Quit\n\n";

    const char* MAIN_HELP =
        "\nMAIN MENU OPTIONS:\n"
        "1 - View Service Alerts\n"
        "2 - Track a Bus: Add/remove/view routes to track real-time vehicles\n"
        "3 - Get Route Updates: Interactive tool for tracking by stop & route\n"
        "4 - Manage Tracked Routes: Add/remove routes from your tracked list\n"
        "5 - Agency Info\n"
        "H - Help\n"
        "Q - Quit the application\n";

    const char* ALERT_HELP =
        "\n[Alert Fetcher]\n"
        "Commands:\n"
        "  add <ROUTE_ID>      -> Track a route (e.g., add 10)\n"
        "  remove <ROUTE_ID>   -> Stop tracking a route\n"
        "  list                -> Show tracked routes\n"
        "  show                -> Display alerts for tracked routes\n"
        "  all                 -> Show all alerts (ignore route filter)\n"
        "  back                -> Return to main menu\n";

    const char* VEHICLE_HELP =
        "\n[Vehicle Tracker]\n"
        "Commands:\n"
        "  add <ROUTE>      -> Add a route to track (e.g., add 10)\n"
        "  remove <ROUTE>   -> Stop tracking a route\n"
        "  routes           -> Show all currently tracked routes\n"
        "  show             -> Display real-time info for tracked buses\n"
        "  help             -> Show this help message again\n"
        "  back             -> Return to the main menu\n";

    const char* ARRIVALS_HELP =
        "\n[Trip Updater]\n"
        "Commands:\n"
        "  find               -> Find stops\n"
        "  stop <STOP_ID>     -> Set the stop ID for updates (must be 4-digit)\n"
        "  route <ROUTE_ID>   -> Show arrivals for a specific route\n"
        "  routes             -> Show all routes serving the stop\n"
        "  all                -> Show all arrivals at a stop\n"
        "  clear              -> Clear the currently set stop ID\n"
        "  help               -> Show this help message again\n"
        "  back               -> Return to the main menu\n";

    const char* STOP_FINDER_MENU =
        "\n[Stop Finder]\n"
        "1 - Search for a stop by name\n"
        "2 - Find 3 closest stops by coordinates\n"
        "3 - Get all stops served by a route\n"
        "B - Back to previous menu\n";

    const char* ROUTE_MANAGER_HELP =
        "\nROUTE MANAGER COMMANDS:\n"
        "  add <ROUTE>    -> Add a bus route to your tracking list (e.g., add 10)\n"
        "  remove <ROUTE> -> Remove a bus route from your tracking list\n"
        "  list           -> View all tracked routes\n"
        "  help           -> Show this help menu\n"
        "  back           -> Return to main menu\n";

    const char* NO_STOP_SELECTED = "Please enter a stop ID first (use: stop <STOP_ID>)\n";

    // A submenu that was left returns control to the main menu.
    CommandOutcome fromSubmenu(CommandOutcome outcome)
    {
        return outcome == CommandOutcome::Quit ? CommandOutcome::Quit : CommandOutcome::Continue;
    }
}

Console::Console(std::istream& input, std::ostream& output, RealtimeFeedClient& feeds, std::string staticDataPath)
    : in(input)
    , out(output)
    , feeds(feeds)
    , staticDataPath(std::move(staticDataPath))
{
}

StaticScheduleStore& Console::schedule()
{
    if (!store)
        store.emplace(staticDataPath, out);
    return *store;
}

std::optional<std::string> Console::ask(std::string const& question)
{
    out << question << std::flush;

    std::string line;
    if (!std::getline(in, line))
        return std::nullopt;
    return line;
}

template <typename Action>
CommandOutcome Console::withSchedule(Action action)
{
    try
    {
        action(schedule());
    }
    catch (NotFoundError const& e)
    {
        out << "Static schedule unavailable: " << e.what() << std::endl;
    }
    catch (DataFormatError const& e)
    {
        out << "Static schedule is malformed: " << e.what() << std::endl;
    }
    return CommandOutcome::Continue;
}

template <typename Action>
void Console::displaying(char const* what, Action action)
{
    try
    {
        action();
    }
    catch (std::exception const& e)
    {
        out << "Error displaying " << what << ": " << e.what() << std::endl;
    }
}

void Console::addRoute(SessionState& session, std::string const& route)
{
    if (route.empty())
    {
        out << "Usage: add <ROUTE>" << std::endl;
        return;
    }

    std::string id = Correlation::normalizeId(route);
    if (RouteManager::add(session, id))
        out << "Tracking " << id << "." << std::endl;
    else
        out << id << " is already tracked." << std::endl;
}

void Console::removeRoute(SessionState& session, std::string const& route)
{
    if (route.empty())
    {
        out << "Usage: remove <ROUTE>" << std::endl;
        return;
    }

    std::string id = Correlation::normalizeId(route);
    if (RouteManager::remove(session, id))
        out << "Stopped tracking " << id << "." << std::endl;
    else
        out << id << " is not being tracked." << std::endl;
}

void Console::showAlerts(SessionState const& session)
{
    FeedResult<Alert> result = feeds.fetchAlerts();
    if (!result.ok())
    {
        out << "Error fetching or parsing alerts: " << result.error() << std::endl;
        return;
    }

    if (result.value().empty())
    {
        out << "No current alerts." << std::endl;
        return;
    }

    std::optional<TrackedRouteSet> filter;
    if (!session.alertsMatchAll)
        filter = session.trackedRoutes;

    std::vector<Alert> matching = Correlation::alertsMatching(result.value(), filter);
    if (matching.empty())
    {
        out << "No alerts affecting your selected routes." << std::endl;
        return;
    }

    displaying("alerts", [this, &matching]()
    {
        for (const auto& a : matching)
            out << Renderer::alert(a);
    });
}

void Console::showVehicles(SessionState const& session)
{
    FeedResult<VehiclePosition> result = feeds.fetchVehiclePositions();
    if (!result.ok())
    {
        out << "Error fetching vehicle data: " << result.error() << std::endl;
        return;
    }

    std::vector<VehiclePosition> tracked = Correlation::vehiclesOnRoutes(result.value(), session.trackedRoutes);
    if (tracked.empty())
    {
        out << "No vehicles found on the tracked routes." << std::endl;
        return;
    }

    displaying("vehicles", [this, &tracked]()
    {
        for (const auto& v : tracked)
            out << Renderer::vehicle(v);
    });
}

void Console::showArrivals(std::string const& stopId, std::string const& routeFilter)
{
    FeedResult<TripUpdateRecord> result = feeds.fetchTripUpdates();
    if (!result.ok())
    {
        out << "Error fetching trip updates: " << result.error() << std::endl;
        return;
    }

    std::vector<TripUpdateRecord> arrivals = Correlation::arrivalsFor(result.value(), stopId, routeFilter);
    if (arrivals.empty())
    {
        out << "No upcoming arrivals for that stop and route.\n" << std::endl;
        return;
    }

    displaying("arrivals", [this, &arrivals, &stopId]()
    {
        for (const auto& r : arrivals)
            out << Renderer::arrival(r, stopId);
    });
}

CommandOutcome Console::alertsMenu(SessionState& session)
{
    session.alertsMatchAll = false;
    out << ALERT_HELP;

    CommandDispatcher menu("AlertFetcher >> ", "Invalid command. Type 'help' for available options.");

    menu.on("add", [this](SessionState& s, std::string const& arg)
    {
        s.alertsMatchAll = false;
        addRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("remove", [this](SessionState& s, std::string const& arg)
    {
        removeRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("all", [this](SessionState& s, std::string const&)
    {
        s.alertsMatchAll = true;
        out << "Type 'show' to display all alerts, or 'back' to cancel." << std::endl;
        return CommandOutcome::Continue;
    });
    menu.on("list", [this](SessionState& s, std::string const&)
    {
        out << "Tracked Routes: " << RouteManager::describe(s.trackedRoutes, "(none)") << std::endl;
        return CommandOutcome::Continue;
    });
    menu.on("show", [this](SessionState& s, std::string const&)
    {
        showAlerts(s);
        return CommandOutcome::Leave;
    });
    menu.on("help", [this](SessionState&, std::string const&)
    {
        out << ALERT_HELP;
        return CommandOutcome::Continue;
    });
    menu.on("back", [this](SessionState&, std::string const&)
    {
        out << "Returning to main menu." << std::endl;
        return CommandOutcome::Leave;
    });

    return menu.run(session, in, out);
}

CommandOutcome Console::vehicleMenu(SessionState& session)
{
    out << VEHICLE_HELP;

    CommandDispatcher menu("Enter command >> ", "Invalid command. Type 'help' to see available options.");

    menu.on("add", [this](SessionState& s, std::string const& arg)
    {
        addRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("remove", [this](SessionState& s, std::string const& arg)
    {
        removeRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("routes", [this](SessionState& s, std::string const&)
    {
        out << "Tracking: " << RouteManager::describe(s.trackedRoutes, "None") << std::endl;
        return CommandOutcome::Continue;
    });
    menu.on("show", [this](SessionState& s, std::string const&)
    {
        showVehicles(s);
        return CommandOutcome::Continue;
    });
    menu.on("help", [this](SessionState&, std::string const&)
    {
        out << VEHICLE_HELP;
        return CommandOutcome::Continue;
    });
    menu.on("back", [](SessionState&, std::string const&)
    {
        return CommandOutcome::Leave;
    });

    return menu.run(session, in, out);
}

CommandOutcome Console::arrivalsMenu(SessionState& session)
{
    out << ARRIVALS_HELP;

    CommandDispatcher menu("TripUpdater >> ", "Invalid command. Type 'help' for options.\n");

    menu.on("stop", [this](SessionState& s, std::string const& arg)
    {
        try
        {
            s.stopId = validateStopId(arg);
            out << "Stop set to " << s.stopId << "." << std::endl;
        }
        catch (InvalidInputError const& e)
        {
            out << e.what() << "\n" << std::endl;
        }
        return CommandOutcome::Continue;
    });
    menu.on("route", [this](SessionState& s, std::string const& arg)
    {
        if (s.stopId.empty())
            out << NO_STOP_SELECTED << std::endl;
        else if (arg.empty())
            out << "Usage: route <ROUTE_ID>" << std::endl;
        else
            showArrivals(s.stopId, arg);
        return CommandOutcome::Continue;
    });
    menu.on("routes", [this](SessionState& s, std::string const&)
    {
        if (s.stopId.empty())
        {
            out << NO_STOP_SELECTED << std::endl;
            return CommandOutcome::Continue;
        }

        return withSchedule([this, &s](StaticScheduleStore& schedule)
        {
            std::vector<std::string> routes = schedule.routesForStop(s.stopId);
            if (routes.empty())
                out << "No routes found for that stop.\n" << std::endl;
            else
                out << "Routes at stop: " << Renderer::routeList(routes) << std::endl;
        });
    });
    menu.on("all", [this](SessionState& s, std::string const&)
    {
        if (s.stopId.empty())
            out << NO_STOP_SELECTED << std::endl;
        else
            showArrivals(s.stopId, Correlation::ALL_ROUTES);
        return CommandOutcome::Continue;
    });
    menu.on("clear", [this](SessionState& s, std::string const&)
    {
        s.stopId.clear();
        out << "Cleared stop ID. Use 'stop <STOP_ID>' to set a new one.\n" << std::endl;
        return CommandOutcome::Continue;
    });
    menu.on("find", [this](SessionState& s, std::string const&)
    {
        return fromSubmenu(stopFinderMenu(s));
    });
    menu.on("help", [this](SessionState&, std::string const&)
    {
        out << ARRIVALS_HELP;
        return CommandOutcome::Continue;
    });
    menu.on("back", [this](SessionState&, std::string const&)
    {
        out << "Returning to main menu.\n" << std::endl;
        return CommandOutcome::Leave;
    });

    return menu.run(session, in, out);
}

CommandOutcome Console::stopFinderMenu(SessionState& session)
{
    CommandDispatcher menu("StopFinder >> ", "Invalid option. Choose 1, 2, 3, or B.");

    menu.on("1", [this](SessionState&, std::string const&)
    {
        std::optional<std::string> keyword = ask("Enter part of the stop name: ");
        if (!keyword)
            return CommandOutcome::Quit;

        return withSchedule([this, &keyword](StaticScheduleStore& schedule)
        {
            std::vector<Stop> matches = schedule.findStopsByName(trimInput(*keyword));
            if (matches.empty())
                out << "No stops found." << std::endl;
            for (const auto& s : matches)
                out << Renderer::stop(s);
        });
    });
    menu.on("2", [this](SessionState&, std::string const&)
    {
        std::optional<std::string> lat = ask("Enter latitude: ");
        std::optional<std::string> lon = lat ? ask("Enter longitude: ") : std::nullopt;
        if (!lat || !lon)
            return CommandOutcome::Quit;

        return withSchedule([this, &lat, &lon](StaticScheduleStore& schedule)
        {
            try
            {
                for (const auto& s : Correlation::nearestStops(schedule.loadStops(), *lat, *lon))
                    out << Renderer::stopDistance(s);
            }
            catch (InvalidInputError const& e)
            {
                out << "Invalid coordinates. " << e.what() << std::endl;
            }
        });
    });
    menu.on("3", [this](SessionState&, std::string const&)
    {
        std::optional<std::string> route = ask("Enter Route ID: ");
        if (!route)
            return CommandOutcome::Quit;

        return withSchedule([this, &route](StaticScheduleStore& schedule)
        {
            std::vector<Stop> stops = schedule.stopsForRoute(Correlation::normalizeId(trimInput(*route)));
            if (stops.empty())
                out << "No stops found for that route." << std::endl;
            for (const auto& s : stops)
                out << Renderer::stop(s);
        });
    });
    menu.on("b", [](SessionState&, std::string const&)
    {
        return CommandOutcome::Leave;
    });

    for (;;)
    {
        out << STOP_FINDER_MENU;
        std::optional<std::string> choice = ask("StopFinder >> ");
        if (!choice)
            return CommandOutcome::Quit;

        CommandOutcome outcome = menu.dispatch(session, *choice, out);
        if (outcome != CommandOutcome::Continue)
            return outcome;
    }
}

CommandOutcome Console::routeManagerMenu(SessionState& session)
{
    out << ROUTE_MANAGER_HELP;

    CommandDispatcher menu("\nRoute Manager - Type: add <ROUTE>, remove <ROUTE>, list, back\nCommand: ",
                           "Invalid command. Type 'help' to see available commands.");

    menu.on("add", [this](SessionState& s, std::string const& arg)
    {
        addRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("remove", [this](SessionState& s, std::string const& arg)
    {
        removeRoute(s, arg);
        return CommandOutcome::Continue;
    });
    menu.on("list", [this](SessionState& s, std::string const&)
    {
        out << "Currently tracking: " << RouteManager::describe(s.trackedRoutes, "None") << std::endl;
        return CommandOutcome::Continue;
    });
    menu.on("help", [this](SessionState&, std::string const&)
    {
        out << ROUTE_MANAGER_HELP;
        return CommandOutcome::Continue;
    });
    menu.on("back", [](SessionState&, std::string const&)
    {
        return CommandOutcome::Leave;
    });

    return menu.run(session, in, out);
}

CommandOutcome Console::agencyInfo()
{
    return withSchedule([this](StaticScheduleStore& schedule)
    {
        std::vector<Agency> agencies = schedule.agencyInfo();
        if (agencies.empty())
            out << "No agency info found." << std::endl;
        else
            out << Renderer::agency(agencies.front());
    });
}

int Console::run()
{
    out << WELCOME;

    CommandDispatcher mainMenu("Select an option: ", "Invalid choice. Try again.");

    mainMenu.on("1", [this](SessionState& s, std::string const&)
    {
        out << "You can choose which routes to see alerts for, or type 'all' to see everything.\n" << std::endl;
        return fromSubmenu(alertsMenu(s));
    });
    mainMenu.on("2", [this](SessionState& s, std::string const&)
    {
        out << "You can track buses by route and view live vehicle positions." << std::endl;
        return fromSubmenu(vehicleMenu(s));
    });
    mainMenu.on("3", [this](SessionState& s, std::string const&)
    {
        out << "You can interactively check bus arrivals by stop ID and route.\n" << std::endl;
        return fromSubmenu(arrivalsMenu(s));
    });
    mainMenu.on("4", [this](SessionState& s, std::string const&)
    {
        return fromSubmenu(routeManagerMenu(s));
    });
    mainMenu.on("5", [this](SessionState&, std::string const&)
    {
        return agencyInfo();
    });

    auto help = [this](SessionState&, std::string const&)
    {
        out << MAIN_HELP;
        return CommandOutcome::Continue;
    };
    mainMenu.on("h", help);
    mainMenu.on("help", help);

    for (;;)
    {
        out << MAIN_MENU;
        std::optional<std::string> choice = ask("Select an option: ");
        if (!choice)
            return 0;

        if (mainMenu.dispatch(state, *choice, out) == CommandOutcome::Quit)
            return 0;
    }
}
