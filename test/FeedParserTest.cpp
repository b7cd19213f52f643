#include <gtest/gtest.h>
#include "FeedParser.hpp"
#include "TimeFormat.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

TEST(FeedParser, alert_fields)
{
    auto feed = makeFeed();
    auto* alert = addEntity(feed, "a1")->mutable_alert();

    alert->mutable_header_text()->add_translation()->set_text("Detour on Barrington");
    alert->mutable_header_text()->add_translation()->set_text("Detour sur Barrington");
    alert->mutable_description_text()->add_translation()->set_text("Use Hollis St.");

    alert->add_informed_entity()->set_route_id("10");
    alert->add_informed_entity()->set_route_id("1a");
    alert->add_informed_entity()->set_stop_id("1001");
    alert->add_informed_entity()->set_stop_id("1002");
    alert->add_informed_entity()->set_stop_id("1001");

    auto* period = alert->add_active_period();
    period->set_start(1716840930);
    period->set_end(1716844530);

    auto const alerts = FeedParser::extractAlerts(feed.SerializeAsString());
    ASSERT_EQ(1U, alerts.size());

    auto const& a = alerts[0];
    EXPECT_EQ("Detour on Barrington\nDetour sur Barrington", a.header);
    EXPECT_EQ("Use Hollis St.", a.description);
    EXPECT_EQ((std::set<std::string>{"10", "1A"}), a.routes);
    EXPECT_EQ((std::vector<std::string>{"1001", "1002"}), a.stops);

    ASSERT_EQ(1U, a.activePeriods.size());
    EXPECT_EQ(1716840930, a.activePeriods[0].start);
    EXPECT_EQ(1716844530, a.activePeriods[0].end);
    EXPECT_EQ(TimeFormat::format(1716840930), a.activePeriods[0].startText);
    EXPECT_EQ(TimeFormat::format(1716844530), a.activePeriods[0].endText);
}

TEST(FeedParser, alerts_skip_other_entities)
{
    auto feed = makeFeed();
    addAlert(feed, "a1", "First", {"10"});
    addVehicle(feed, "v1", "10", 44.64f, -63.57f, 1716840930);
    addAlert(feed, "a2", "Second", {"20"});

    auto const alerts = FeedParser::extractAlerts(feed.SerializeAsString());
    ASSERT_EQ(2U, alerts.size());
    EXPECT_EQ("First", alerts[0].header);
    EXPECT_EQ("Second", alerts[1].header);
}

TEST(FeedParser, trip_updates_flatten_in_feed_order)
{
    auto feed = makeFeed();
    auto* t1 = addTripUpdate(feed, "t1", "10");
    addStopTime(t1, "1001", 3, 1716841000, 1716841030);
    addStopTime(t1, "1002", 4, 1716841200, 1716841230);
    auto* t2 = addTripUpdate(feed, "t2", "20");
    addStopTime(t2, "1001", 7, 1716840900, 1716840960);

    auto const records = FeedParser::extractTripUpdates(feed.SerializeAsString());
    ASSERT_EQ(3U, records.size());

    EXPECT_EQ("t1", records[0].tripId);
    EXPECT_EQ("10", records[0].routeId);
    EXPECT_EQ("1001", records[0].stopId);
    EXPECT_EQ(3U, records[0].stopSequence);
    EXPECT_EQ(1716841000, records[0].arrivalTime);
    EXPECT_EQ(1716841030, records[0].departureTime);

    EXPECT_EQ("1002", records[1].stopId);
    EXPECT_EQ("20", records[2].routeId);
    EXPECT_EQ(7U, records[2].stopSequence);
}

TEST(FeedParser, stop_time_without_events_reads_zero)
{
    auto feed = makeFeed();
    auto* tu = addTripUpdate(feed, "t1", "10");
    tu->add_stop_time_update()->set_stop_id("1001");

    auto const records = FeedParser::extractTripUpdates(feed.SerializeAsString());
    ASSERT_EQ(1U, records.size());
    EXPECT_EQ(0, records[0].arrivalTime);
    EXPECT_EQ(0, records[0].departureTime);
}

TEST(FeedParser, vehicle_positions)
{
    auto feed = makeFeed();
    addVehicle(feed, "1234", "10", 44.64f, -63.57f, 1716840930);
    addEntity(feed, "v-no-position")->mutable_vehicle()->mutable_trip()->set_route_id("20");

    auto const vehicles = FeedParser::extractVehiclePositions(feed.SerializeAsString());
    ASSERT_EQ(2U, vehicles.size());

    EXPECT_EQ("10", vehicles[0].routeId);
    EXPECT_EQ("1234", vehicles[0].vehicleId);
    EXPECT_NEAR(44.64, vehicles[0].lat, 1e-4);
    EXPECT_NEAR(-63.57, vehicles[0].lon, 1e-4);
    EXPECT_EQ(1716840930U, vehicles[0].timestamp);

    EXPECT_EQ("20", vehicles[1].routeId);
    EXPECT_EQ(0.0, vehicles[1].lat);
}

TEST(FeedParser, empty_feed_has_no_records)
{
    auto const data = makeFeed().SerializeAsString();
    EXPECT_TRUE(FeedParser::extractAlerts(data).empty());
    EXPECT_TRUE(FeedParser::extractTripUpdates(data).empty());
    EXPECT_TRUE(FeedParser::extractVehiclePositions(data).empty());
}

TEST(FeedParser, malformed_payloads)
{
    EXPECT_THROW(FeedParser::extractAlerts(""), DecodeError);
    EXPECT_THROW(FeedParser::extractAlerts("<html><body>Service Unavailable</body></html>"), DecodeError);
    EXPECT_THROW(FeedParser::extractTripUpdates("not a protobuf"), DecodeError);

    // Header is a required field.
    transit_realtime::FeedMessage headless;
    addEntity(headless, "e1");
    EXPECT_THROW(FeedParser::extractVehiclePositions(headless.SerializePartialAsString()), DecodeError);
}
