#include <stdexcept>
#include <variant>
#include "SQLiteStore.hpp"
#include "SubscriptionStore.hpp"

SubscriptionStore::SubscriptionStore(SQLiteStore& store)
    : db(store)
{
}

std::optional<std::int64_t> SubscriptionStore::findUser(std::string const& username)
{
    SQLiteStore::Statement stmt(db, "SELECT user_id FROM users WHERE username = ?;");
    stmt.bind(1, username);
    if (stmt.step())
        return stmt.int64(0);
    return std::nullopt;
}

std::int64_t SubscriptionStore::getOrCreateUser(std::string const& username)
{
    if (username.empty())
        throw std::invalid_argument("username must not be empty");

    SQLiteStore::Transaction tx(db);

    if (auto existing = findUser(username))
    {
        tx.commit();
        return *existing;
    }

    {
        SQLiteStore::Statement insert(db, "INSERT INTO users (username) VALUES (?);");
        insert.bind(1, username);
        insert.run();
    }
    std::int64_t userId = db.lastInsertId();

    tx.commit();
    return userId;
}

bool SubscriptionStore::subscribe(std::int64_t userId, SubscriptionTarget const& target)
{
    std::optional<std::string> stopId;
    std::optional<std::string> routeId;
    if (auto const* stop = std::get_if<StopTarget>(&target))
        stopId = stop->stopId;
    else
        routeId = std::get<RouteTarget>(target).routeId;

    SQLiteStore::Transaction tx(db);

    {
        SQLiteStore::Statement exists(db,
            "SELECT 1 FROM subscriptions "
            "WHERE user_id = ? AND stop_id IS ? AND route_id IS ?;");
        exists.bind(1, userId);
        exists.bind(2, stopId);
        exists.bind(3, routeId);
        if (exists.step())
            return false;
    }

    {
        SQLiteStore::Statement insert(db,
            "INSERT INTO subscriptions (user_id, stop_id, route_id) VALUES (?, ?, ?);");
        insert.bind(1, userId);
        insert.bind(2, stopId);
        insert.bind(3, routeId);
        insert.run();
    }

    tx.commit();
    return true;
}

bool SubscriptionStore::unsubscribe(std::int64_t userId, std::int64_t subscriptionId)
{
    SQLiteStore::Transaction tx(db);

    {
        SQLiteStore::Statement remove(db,
            "DELETE FROM subscriptions WHERE subscription_id = ? AND user_id = ?;");
        remove.bind(1, subscriptionId);
        remove.bind(2, userId);
        remove.run();
    }
    bool removed = db.changes() > 0;

    tx.commit();
    return removed;
}

std::vector<Subscription> SubscriptionStore::subscriptions(std::int64_t userId)
{
    std::vector<Subscription> results;

    SQLiteStore::Statement stmt(db,
        "SELECT subscription_id, stop_id, route_id "
        "FROM subscriptions "
        "WHERE user_id = ? "
        "ORDER BY stop_id IS NULL, stop_id, route_id IS NULL, route_id;");
    stmt.bind(1, userId);

    while (stmt.step())
    {
        Subscription s;
        s.subscriptionId = stmt.int64(0);
        s.userId         = userId;

        std::optional<std::string> stopId  = stmt.optionalText(1);
        std::optional<std::string> routeId = stmt.optionalText(2);
        if (stopId)
            s.target = StopTarget{*stopId};
        else if (routeId)
            s.target = RouteTarget{*routeId};
        else
            throw std::runtime_error("subscription " + std::to_string(s.subscriptionId) + " has no target");

        results.push_back(std::move(s));
    }

    return results;
}
