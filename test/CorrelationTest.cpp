#include <gtest/gtest.h>
#include "Correlation.hpp"
#include "Errors.hpp"

namespace
{
    TripUpdateRecord update(std::string trip, std::string route, std::string stop, std::int64_t arrival)
    {
        TripUpdateRecord r;
        r.tripId = std::move(trip);
        r.routeId = std::move(route);
        r.stopId = std::move(stop);
        r.arrivalTime = arrival;
        r.departureTime = arrival + 30;
        return r;
    }

    Alert alertFor(std::string header, std::set<std::string> routes)
    {
        Alert a;
        a.header = std::move(header);
        a.routes = std::move(routes);
        return a;
    }

    std::vector<Stop> halifaxStops()
    {
        return {
            {"1001", "Main St", 44.64, -63.57},
            {"1002", "Oak Ave", 44.65, -63.58},
            {"1003", "Pine Rd", 44.70, -63.60},
            {"1004", "Elm St", 44.80, -63.70},
        };
    }
}

TEST(Correlation, arrivals_sorted_by_arrival_time)
{
    std::vector<TripUpdateRecord> updates = {
        update("t1", "10", "1001", 500),
        update("t2", "10", "1002", 100),
        update("t3", "20", "1001", 300),
        update("t4", "10", "1001", 200),
    };

    auto const all = Correlation::arrivalsFor(updates, "1001", "all");
    ASSERT_EQ(3U, all.size());
    EXPECT_EQ("t4", all[0].tripId);
    EXPECT_EQ("t3", all[1].tripId);
    EXPECT_EQ("t1", all[2].tripId);

    auto const route10 = Correlation::arrivalsFor(updates, "1001", "10");
    ASSERT_EQ(2U, route10.size());
    EXPECT_EQ("t4", route10[0].tripId);
    EXPECT_EQ("t1", route10[1].tripId);
}

TEST(Correlation, equal_arrival_times_keep_feed_order)
{
    std::vector<TripUpdateRecord> updates = {
        update("first", "10", "1001", 100),
        update("second", "20", "1001", 100),
        update("third", "10", "1001", 100),
    };

    auto const out = Correlation::arrivalsFor(updates, "1001", "ALL");
    ASSERT_EQ(3U, out.size());
    EXPECT_EQ("first", out[0].tripId);
    EXPECT_EQ("second", out[1].tripId);
    EXPECT_EQ("third", out[2].tripId);
}

TEST(Correlation, route_filter_ignores_case)
{
    std::vector<TripUpdateRecord> updates = {
        update("t1", "1A", "1001", 100),
        update("t2", "1b", "1001", 200),
    };

    auto const out = Correlation::arrivalsFor(updates, "1001", "1a");
    ASSERT_EQ(1U, out.size());
    EXPECT_EQ("t1", out[0].tripId);

    EXPECT_EQ(1U, Correlation::arrivalsFor(updates, "1001", "1B").size());
}

TEST(Correlation, unknown_stop_has_no_arrivals)
{
    std::vector<TripUpdateRecord> updates = {update("t1", "10", "1001", 100)};
    EXPECT_TRUE(Correlation::arrivalsFor(updates, "9999", "all").empty());
    EXPECT_TRUE(Correlation::arrivalsFor({}, "1001", "all").empty());
}

TEST(Correlation, alerts_for_tracked_routes)
{
    std::vector<Alert> alerts = {
        alertFor("A", {"1", "2"}),
        alertFor("B", {"3"}),
    };

    auto const matched = Correlation::alertsMatching(alerts, TrackedRouteSet{"2"});
    ASSERT_EQ(1U, matched.size());
    EXPECT_EQ("A", matched[0].header);

    EXPECT_TRUE(Correlation::alertsMatching(alerts, TrackedRouteSet{}).empty());
    EXPECT_TRUE(Correlation::alertsMatching(alerts, TrackedRouteSet{"9"}).empty());
}

TEST(Correlation, alerts_without_filter_pass_through)
{
    std::vector<Alert> alerts = {
        alertFor("A", {"1"}),
        alertFor("B", {}),
        alertFor("C", {"3"}),
    };

    auto const all = Correlation::alertsMatching(alerts, std::nullopt);
    ASSERT_EQ(3U, all.size());
    EXPECT_EQ("B", all[1].header);
}

TEST(Correlation, alert_route_match_ignores_case)
{
    std::vector<Alert> alerts = {alertFor("A", {"1A"})};
    EXPECT_EQ(1U, Correlation::alertsMatching(alerts, TrackedRouteSet{"1a"}).size());
}

TEST(Correlation, vehicles_on_tracked_routes)
{
    std::vector<VehiclePosition> vehicles(3);
    vehicles[0].routeId = "10";
    vehicles[0].vehicleId = "a";
    vehicles[1].routeId = "20";
    vehicles[1].vehicleId = "b";
    vehicles[2].routeId = "10";
    vehicles[2].vehicleId = "c";

    auto const on10 = Correlation::vehiclesOnRoutes(vehicles, {"10"});
    ASSERT_EQ(2U, on10.size());
    EXPECT_EQ("a", on10[0].vehicleId);
    EXPECT_EQ("c", on10[1].vehicleId);

    EXPECT_TRUE(Correlation::vehiclesOnRoutes(vehicles, {}).empty());
}

TEST(Correlation, haversine_distance)
{
    EXPECT_DOUBLE_EQ(0.0, Correlation::haversineKm(44.64, -63.57, 44.64, -63.57));
    EXPECT_NEAR(111.195, Correlation::haversineKm(0.0, 0.0, 0.0, 1.0), 1e-3);
    EXPECT_NEAR(Correlation::haversineKm(44.64, -63.57, 44.65, -63.58),
                Correlation::haversineKm(44.65, -63.58, 44.64, -63.57), 1e-12);
}

TEST(Correlation, nearest_stops_ascending)
{
    auto const nearest = Correlation::nearestStops(halifaxStops(), 44.64, -63.57);
    ASSERT_EQ(3U, nearest.size());

    EXPECT_EQ("1001", nearest[0].stop.stopId);
    EXPECT_DOUBLE_EQ(0.0, nearest[0].distanceKm);
    EXPECT_EQ("1002", nearest[1].stop.stopId);
    EXPECT_EQ("1003", nearest[2].stop.stopId);

    EXPECT_LE(nearest[0].distanceKm, nearest[1].distanceKm);
    EXPECT_LE(nearest[1].distanceKm, nearest[2].distanceKm);
}

TEST(Correlation, nearest_stops_fewer_than_three)
{
    std::vector<Stop> stops = {{"1001", "Main St", 44.64, -63.57}};
    EXPECT_EQ(1U, Correlation::nearestStops(stops, 0.0, 0.0).size());
    EXPECT_TRUE(Correlation::nearestStops({}, 0.0, 0.0).empty());
}

TEST(Correlation, nearest_stops_ties_keep_file_order)
{
    std::vector<Stop> stops = {
        {"2001", "North", 1.0, 0.0},
        {"2002", "South", -1.0, 0.0},
        {"2003", "East", 0.0, 1.0},
        {"2004", "Far", 5.0, 5.0},
    };

    auto const nearest = Correlation::nearestStops(stops, 0.0, 0.0);
    ASSERT_EQ(3U, nearest.size());
    EXPECT_EQ("2001", nearest[0].stop.stopId);
    EXPECT_EQ("2002", nearest[1].stop.stopId);
    EXPECT_EQ("2003", nearest[2].stop.stopId);
}

TEST(Correlation, nearest_stops_from_text)
{
    auto const nearest = Correlation::nearestStops(halifaxStops(), " 44.65 ", "-63.58");
    ASSERT_FALSE(nearest.empty());
    EXPECT_EQ("1002", nearest[0].stop.stopId);
}

TEST(Correlation, invalid_coordinates)
{
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "abc", "-63.57"), InvalidInputError);
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "44.64", ""), InvalidInputError);
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "44.64x", "-63.57"), InvalidInputError);
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "91", "0"), InvalidInputError);
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "0", "-180.5"), InvalidInputError);
    EXPECT_THROW(Correlation::nearestStops(halifaxStops(), "nan", "0"), InvalidInputError);
}
