#include <iostream>
#include "SQLiteStore.hpp"
#include "AlertReconciler.hpp"

AlertReconciler::AlertReconciler(SQLiteStore& store)
    : db(store)
{
}

void AlertReconciler::reconcileOne(AlertRecord const& alert, EpochSeconds now)
{
    SQLiteStore::Transaction tx(db);

    {
        SQLiteStore::Statement upsert(db,
            "INSERT INTO alerts (alert_id, header_text, description_text, last_updated) "
            "VALUES (?, ?, ?, ?) "
            "ON CONFLICT (alert_id) DO UPDATE SET "
            "  header_text = excluded.header_text, "
            "  description_text = excluded.description_text, "
            "  last_updated = excluded.last_updated;");
        upsert.bind(1, alert.alertId);
        upsert.bind(2, alert.headerText);
        upsert.bind(3, alert.descriptionText);
        upsert.bind(4, now);
        upsert.run();
    }

    {
        SQLiteStore::Statement deletePeriods(db, "DELETE FROM active_periods WHERE alert_id = ?;");
        deletePeriods.bind(1, alert.alertId);
        deletePeriods.run();

        SQLiteStore::Statement deleteEntities(db, "DELETE FROM informed_entities WHERE alert_id = ?;");
        deleteEntities.bind(1, alert.alertId);
        deleteEntities.run();
    }

    {
        SQLiteStore::Statement insertPeriod(db,
            "INSERT INTO active_periods (alert_id, start_time, end_time) VALUES (?, ?, ?);");
        for (const ActivePeriod& p : alert.activePeriods)
        {
            insertPeriod.reset();
            insertPeriod.bind(1, alert.alertId);
            insertPeriod.bind(2, p.start);
            insertPeriod.bind(3, p.end);
            insertPeriod.run();
        }
    }

    {
        SQLiteStore::Statement insertEntity(db,
            "INSERT INTO informed_entities (alert_id, agency_id, route_id, stop_id) VALUES (?, ?, ?, ?);");
        for (const InformedEntity& e : alert.informedEntities)
        {
            insertEntity.reset();
            insertEntity.bind(1, alert.alertId);
            insertEntity.bind(2, e.agencyId);
            insertEntity.bind(3, e.routeId);
            insertEntity.bind(4, e.stopId);
            insertEntity.run();
        }
    }

    tx.commit();
}

void AlertReconciler::reconcile(std::vector<AlertRecord> const& alerts, EpochSeconds now)
{
    for (const AlertRecord& alert : alerts)
    {
        try
        {
            reconcileOne(alert, now);
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Alerts] Failed to update alert " << alert.alertId << ": " << e.what() << std::endl;
            throw;
        }
    }

    std::cout << "[Alerts] " << alerts.size() << " alerts updated." << std::endl;
}
