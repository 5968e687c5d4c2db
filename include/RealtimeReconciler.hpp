#pragma once
#include <vector>
#include "Types.hpp"

class SQLiteStore;

// Replaces the whole live trip/stop-time state with one decoded snapshot.
class RealtimeReconciler
{
private:
    SQLiteStore& db;

public:
    explicit RealtimeReconciler(SQLiteStore& store);

    // Clears trips_real_time and stop_time_update and inserts the batch in a
    // single transaction. Duplicate trip ids and duplicate (trip, stop) pairs
    // keep their first occurrence. An empty batch empties the live state.
    void reconcile(std::vector<TripUpdate> const& trips, std::vector<StopTimeUpdate> const& stopTimes);
};
