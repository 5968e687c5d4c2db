#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "Types.hpp"

class SQLiteStore;

class SubscriptionStore
{
private:
    SQLiteStore& db;

    std::optional<std::int64_t> findUser(std::string const& username);

public:
    explicit SubscriptionStore(SQLiteStore& store);

    // Surrogate id for an external user name, created on first contact.
    std::int64_t getOrCreateUser(std::string const& username);

    // Returns false when the user already watches the same stop or route.
    bool subscribe(std::int64_t userId, SubscriptionTarget const& target);

    // Only removes the row when it belongs to userId.
    bool unsubscribe(std::int64_t userId, std::int64_t subscriptionId);

    // Stop subscriptions first (by stop id), then route subscriptions.
    std::vector<Subscription> subscriptions(std::int64_t userId);
};
