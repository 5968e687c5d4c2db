#include "gtest/gtest.h"

#include "DepartureResolver.hpp"
#include "RealtimeReconciler.hpp"
#include "SQLiteStore.hpp"
#include "store_helpers.hpp"

namespace {

constexpr EpochSeconds T = 1705325400;

struct departure_resolver_fixture : public ::testing::Test
{
    SQLiteStore db{":memory:"};
    RealtimeReconciler reconciler{db};
    DepartureResolver resolver{db};

    void SetUp() override
    {
        insertStop(db, "127", "Times Sq-42 St", "Broadway & 42 St", "1,2,3");
        insertStop(db, "127N", "Times Sq-42 St");
        insertStop(db, "127S", "Times Sq-42 St");
    }
};

}  // namespace

TEST_F(departure_resolver_fixture, next_train_for_single_trip)
{
    reconciler.reconcile({{"A1", std::nullopt, "1"}}, {{"A1", "127N", T + 120, T + 125}});

    auto departures = resolver.stationDepartures("127N", T);

    ASSERT_EQ(1U, departures.size());
    EXPECT_EQ("1", departures[0].routeId);
    EXPECT_EQ(T + 125, departures[0].departureTime);
    EXPECT_EQ(2, departures[0].etaMinutes);
}

TEST_F(departure_resolver_fixture, earliest_departure_per_route_ordered_by_route)
{
    reconciler.reconcile(
        {{"A1", std::nullopt, "2"}, {"A2", std::nullopt, "2"}, {"A3", std::nullopt, "1"}, {"A4", std::nullopt, "3"}},
        {{"A1", "127N", std::nullopt, T + 600},
         {"A2", "127N", std::nullopt, T + 300},
         {"A3", "127N", std::nullopt, T + 900},
         {"A4", "127S", std::nullopt, T + 60}});

    auto departures = resolver.stationDepartures("127N", T);

    ASSERT_EQ(2U, departures.size());
    EXPECT_EQ("1", departures[0].routeId);
    EXPECT_EQ(T + 900, departures[0].departureTime);
    EXPECT_EQ("2", departures[1].routeId);
    EXPECT_EQ(T + 300, departures[1].departureTime);
    EXPECT_EQ(5, departures[1].etaMinutes);
}

TEST_F(departure_resolver_fixture, never_reports_departed_trains)
{
    reconciler.reconcile(
        {{"A1", std::nullopt, "1"}, {"A2", std::nullopt, "1"}, {"A3", std::nullopt, "2"}},
        {{"A1", "127N", std::nullopt, T - 30},
         {"A2", "127N", std::nullopt, T},
         {"A3", "127N", T + 10, std::nullopt}});

    EXPECT_TRUE(resolver.stationDepartures("127N", T).empty());
    EXPECT_TRUE(resolver.routeDepartures("127N", "1", T).empty());
}

TEST_F(departure_resolver_fixture, unknown_stop_has_no_departures)
{
    reconciler.reconcile({{"A1", std::nullopt, "1"}}, {{"A1", "999N", std::nullopt, T + 60}});

    EXPECT_TRUE(resolver.stationDepartures("999N", T).empty());
    EXPECT_TRUE(resolver.stationDepartures("127N", T).empty());
}

TEST_F(departure_resolver_fixture, route_departures_are_limited_and_sorted)
{
    reconciler.reconcile(
        {{"A1", std::nullopt, "1"}, {"A2", std::nullopt, "1"}, {"A3", std::nullopt, "1"},
         {"A4", std::nullopt, "1"}, {"A5", std::nullopt, "2"}},
        {{"A1", "127N", std::nullopt, T + 400},
         {"A2", "127N", std::nullopt, T + 100},
         {"A3", "127N", std::nullopt, T + 700},
         {"A4", "127N", std::nullopt, T + 250},
         {"A5", "127N", std::nullopt, T + 50}});

    auto departures = resolver.routeDepartures("127N", "1", T);

    ASSERT_EQ(DepartureResolver::ROUTE_DEPARTURE_LIMIT, departures.size());
    EXPECT_EQ(T + 100, departures[0].departureTime);
    EXPECT_EQ(T + 250, departures[1].departureTime);
    EXPECT_EQ(T + 400, departures[2].departureTime);
    for (auto const& d : departures)
        EXPECT_EQ("1", d.routeId);
}

TEST(departure_resolver, eta_rounds_to_nearest_minute)
{
    EXPECT_EQ(0, DepartureResolver::etaMinutes(T + 29, T));
    EXPECT_EQ(1, DepartureResolver::etaMinutes(T + 30, T));
    EXPECT_EQ(2, DepartureResolver::etaMinutes(T + 125, T));
    EXPECT_EQ(10, DepartureResolver::etaMinutes(T + 600, T));
}
