#include <iostream>
#include "SQLiteStore.hpp"
#include "RealtimeReconciler.hpp"

RealtimeReconciler::RealtimeReconciler(SQLiteStore& store)
    : db(store)
{
}

void RealtimeReconciler::reconcile(std::vector<TripUpdate> const& trips, std::vector<StopTimeUpdate> const& stopTimes)
{
    if (trips.empty())
        std::cerr << "[Reconciler] No trip updates available; live state will be empty." << std::endl;
    if (stopTimes.empty())
        std::cerr << "[Reconciler] No stop time updates available." << std::endl;

    SQLiteStore::Transaction tx(db);

    db.execute("DELETE FROM stop_time_update;");
    db.execute("DELETE FROM trips_real_time;");

    {
        SQLiteStore::Statement insertTrip(db,
            "INSERT OR IGNORE INTO trips_real_time (trip_id, start_datetime, route_id) "
            "VALUES (?, ?, ?);");

        for (const TripUpdate& t : trips)
        {
            insertTrip.reset();
            insertTrip.bind(1, t.tripId);
            insertTrip.bind(2, t.startTime);
            insertTrip.bind(3, t.routeId);
            insertTrip.run();
        }
    }

    {
        SQLiteStore::Statement insertStopTime(db,
            "INSERT OR IGNORE INTO stop_time_update (trip_id, stop_id, arrival_time, departure_time) "
            "VALUES (?, ?, ?, ?);");

        for (const StopTimeUpdate& st : stopTimes)
        {
            insertStopTime.reset();
            insertStopTime.bind(1, st.tripId);
            insertStopTime.bind(2, st.stopId);
            insertStopTime.bind(3, st.arrivalTime);
            insertStopTime.bind(4, st.departureTime);
            insertStopTime.run();
        }
    }

    tx.commit();

    std::cout << "[Reconciler] Live state replaced: " << trips.size() << " trips, "
              << stopTimes.size() << " stop time updates." << std::endl;
}
