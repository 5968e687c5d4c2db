// Included first so the header has to bring its own dependencies.
#include "SubscriptionStore.hpp"

#include "gtest/gtest.h"

#include <stdexcept>
#include <variant>

#include "SQLiteStore.hpp"
#include "store_helpers.hpp"

TEST(subscription_store, user_ids_are_stable)
{
    SQLiteStore db(":memory:");
    SubscriptionStore store(db);

    auto alice = store.getOrCreateUser("alice");
    auto bob   = store.getOrCreateUser("bob");

    EXPECT_NE(alice, bob);
    EXPECT_EQ(alice, store.getOrCreateUser("alice"));
    EXPECT_EQ(2, countRows(db, "SELECT COUNT(*) FROM users;"));
    EXPECT_THROW(store.getOrCreateUser(""), std::invalid_argument);
}

TEST(subscription_store, duplicate_subscription_rejected)
{
    SQLiteStore db(":memory:");
    SubscriptionStore store(db);
    auto user = store.getOrCreateUser("alice");

    EXPECT_TRUE(store.subscribe(user, StopTarget{"127"}));
    EXPECT_FALSE(store.subscribe(user, StopTarget{"127"}));
    EXPECT_TRUE(store.subscribe(user, RouteTarget{"127"}));
    EXPECT_FALSE(store.subscribe(user, RouteTarget{"127"}));

    auto other = store.getOrCreateUser("bob");
    EXPECT_TRUE(store.subscribe(other, StopTarget{"127"}));

    EXPECT_EQ(3, countRows(db, "SELECT COUNT(*) FROM subscriptions;"));
}

TEST(subscription_store, listing_puts_stops_first)
{
    SQLiteStore db(":memory:");
    SubscriptionStore store(db);
    auto user = store.getOrCreateUser("alice");

    store.subscribe(user, RouteTarget{"Q"});
    store.subscribe(user, StopTarget{"R16"});
    store.subscribe(user, RouteTarget{"A"});
    store.subscribe(user, StopTarget{"127"});

    auto subs = store.subscriptions(user);

    ASSERT_EQ(4U, subs.size());
    ASSERT_TRUE(std::holds_alternative<StopTarget>(subs[0].target));
    EXPECT_EQ("127", std::get<StopTarget>(subs[0].target).stopId);
    ASSERT_TRUE(std::holds_alternative<StopTarget>(subs[1].target));
    EXPECT_EQ("R16", std::get<StopTarget>(subs[1].target).stopId);
    ASSERT_TRUE(std::holds_alternative<RouteTarget>(subs[2].target));
    EXPECT_EQ("A", std::get<RouteTarget>(subs[2].target).routeId);
    ASSERT_TRUE(std::holds_alternative<RouteTarget>(subs[3].target));
    EXPECT_EQ("Q", std::get<RouteTarget>(subs[3].target).routeId);
    for (auto const& s : subs)
        EXPECT_EQ(user, s.userId);
}

TEST(subscription_store, unsubscribe_only_own_rows)
{
    SQLiteStore db(":memory:");
    SubscriptionStore store(db);
    auto alice = store.getOrCreateUser("alice");
    auto bob   = store.getOrCreateUser("bob");

    store.subscribe(alice, RouteTarget{"A"});
    auto subs = store.subscriptions(alice);
    ASSERT_EQ(1U, subs.size());
    auto id = subs[0].subscriptionId;

    EXPECT_FALSE(store.unsubscribe(bob, id));
    EXPECT_EQ(1U, store.subscriptions(alice).size());

    EXPECT_TRUE(store.unsubscribe(alice, id));
    EXPECT_TRUE(store.subscriptions(alice).empty());
    EXPECT_FALSE(store.unsubscribe(alice, id));
}

TEST(subscription_store, schema_rejects_targetless_rows)
{
    SQLiteStore db(":memory:");
    SubscriptionStore store(db);
    auto user = store.getOrCreateUser("alice");

    EXPECT_THROW(db.execute("INSERT INTO subscriptions (user_id, stop_id, route_id) VALUES (" + std::to_string(user) + ", NULL, NULL);"),
                 std::runtime_error);
    EXPECT_THROW(db.execute("INSERT INTO subscriptions (user_id, stop_id, route_id) VALUES (" + std::to_string(user) + ", '127', 'A');"),
                 std::runtime_error);
}
