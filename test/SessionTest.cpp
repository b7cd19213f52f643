#include <sstream>
#include <gtest/gtest.h>
#include "Session.hpp"
#include "Errors.hpp"

TEST(RouteManager, add_and_remove)
{
    SessionState state;

    EXPECT_TRUE(RouteManager::add(state, "10"));
    EXPECT_FALSE(RouteManager::add(state, "10"));
    EXPECT_TRUE(RouteManager::add(state, " 1a "));
    EXPECT_EQ((TrackedRouteSet{"10", "1A"}), state.trackedRoutes);

    EXPECT_TRUE(RouteManager::remove(state, "1A"));
    EXPECT_FALSE(RouteManager::remove(state, "1A"));
    EXPECT_FALSE(RouteManager::remove(state, "99"));
    EXPECT_EQ((TrackedRouteSet{"10"}), state.trackedRoutes);
}

TEST(RouteManager, blank_route_is_ignored)
{
    SessionState state;
    EXPECT_FALSE(RouteManager::add(state, "   "));
    EXPECT_TRUE(state.trackedRoutes.empty());
}

TEST(RouteManager, describe)
{
    EXPECT_EQ("None", RouteManager::describe({}, "None"));
    EXPECT_EQ("10, 20, 9", RouteManager::describe({"9", "10", "20"}, "None"));
}

TEST(StopId, four_digits_only)
{
    EXPECT_EQ("1001", validateStopId("1001"));
    EXPECT_EQ("0042", validateStopId(" 0042 "));

    EXPECT_THROW(validateStopId("123"), InvalidInputError);
    EXPECT_THROW(validateStopId("12345"), InvalidInputError);
    EXPECT_THROW(validateStopId("12a4"), InvalidInputError);
    EXPECT_THROW(validateStopId(""), InvalidInputError);

    try
    {
        validateStopId("abcd");
        FAIL() << "expected InvalidInputError";
    }
    catch (InvalidInputError const& e)
    {
        EXPECT_STREQ("Invalid stop ID 'abcd'. Must be a 4-digit number.", e.what());
    }
}

namespace
{
    struct Recorded
    {
        std::string name;
        std::string argument;
    };

    CommandDispatcher recordingMenu(std::vector<Recorded>& calls)
    {
        CommandDispatcher menu("> ", "Invalid command.");
        menu.on("add", [&calls](SessionState&, std::string const& arg)
        {
            calls.push_back({"add", arg});
            return CommandOutcome::Continue;
        });
        menu.on("back", [&calls](SessionState&, std::string const&)
        {
            calls.push_back({"back", ""});
            return CommandOutcome::Leave;
        });
        return menu;
    }
}

TEST(CommandDispatcher, splits_and_lowercases)
{
    std::vector<Recorded> calls;
    CommandDispatcher menu = recordingMenu(calls);
    SessionState state;
    std::ostringstream out;

    EXPECT_EQ(CommandOutcome::Continue, menu.dispatch(state, "  ADD   1A  ", out));
    ASSERT_EQ(1U, calls.size());
    EXPECT_EQ("add", calls[0].name);
    EXPECT_EQ("1a", calls[0].argument);

    EXPECT_EQ(CommandOutcome::Continue, menu.dispatch(state, "add", out));
    EXPECT_EQ("", calls[1].argument);
    EXPECT_TRUE(out.str().empty());
}

TEST(CommandDispatcher, unknown_command)
{
    std::vector<Recorded> calls;
    CommandDispatcher menu = recordingMenu(calls);
    SessionState state;
    std::ostringstream out;

    EXPECT_EQ(CommandOutcome::Continue, menu.dispatch(state, "launch", out));
    EXPECT_EQ(CommandOutcome::Continue, menu.dispatch(state, "", out));
    EXPECT_TRUE(calls.empty());
    EXPECT_EQ("Invalid command.\nInvalid command.\n", out.str());
    EXPECT_FALSE(menu.handles("launch"));
    EXPECT_TRUE(menu.handles("add"));
}

TEST(CommandDispatcher, quit_from_any_menu)
{
    std::vector<Recorded> calls;
    CommandDispatcher menu = recordingMenu(calls);
    SessionState state;
    std::ostringstream out;

    EXPECT_EQ(CommandOutcome::Quit, menu.dispatch(state, "q", out));
    EXPECT_EQ(CommandOutcome::Quit, menu.dispatch(state, "QUIT", out));
    EXPECT_NE(std::string::npos, out.str().find("Exiting..."));
    EXPECT_TRUE(calls.empty());
}

TEST(CommandDispatcher, run_until_leave)
{
    std::vector<Recorded> calls;
    CommandDispatcher menu = recordingMenu(calls);
    SessionState state;
    std::istringstream in("add 10\nbogus\nback\nadd 20\n");
    std::ostringstream out;

    EXPECT_EQ(CommandOutcome::Leave, menu.run(state, in, out));
    ASSERT_EQ(2U, calls.size());
    EXPECT_EQ("back", calls[1].name);

    std::string rest;
    std::getline(in, rest);
    EXPECT_EQ("add 20", rest);
}

TEST(CommandDispatcher, end_of_input_quits)
{
    std::vector<Recorded> calls;
    CommandDispatcher menu = recordingMenu(calls);
    SessionState state;
    std::istringstream in("add 10\n");
    std::ostringstream out;

    EXPECT_EQ(CommandOutcome::Quit, menu.run(state, in, out));
    EXPECT_EQ(1U, calls.size());
}

TEST(Session, trim_input)
{
    EXPECT_EQ("10", trimInput(" 10 \t"));
    EXPECT_EQ("Oak Ave", trimInput("  Oak Ave\r"));
    EXPECT_EQ("", trimInput("   "));
}
