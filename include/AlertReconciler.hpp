#pragma once
#include <vector>
#include "Types.hpp"

class SQLiteStore;

class AlertReconciler
{
private:
    SQLiteStore& db;

    void reconcileOne(AlertRecord const& alert, EpochSeconds now);

public:
    explicit AlertReconciler(SQLiteStore& store);

    // Upserts each alert by id and swaps in its active periods and informed
    // entities, one transaction per alert. Alerts not in the batch are left
    // alone. A storage error rolls back the failing alert and is rethrown;
    // alerts before it stay committed.
    void reconcile(std::vector<AlertRecord> const& alerts, EpochSeconds now);
};
