#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"

class FeedFetcher;
class FeedDecoder;
class RealtimeReconciler;
class AlertReconciler;

struct RealtimeCycleReport
{
    std::size_t feedsFetched = 0;
    std::vector<std::string> failedGroups;
    std::size_t trips = 0;
    std::size_t stopTimes = 0;
};

struct AlertCycleReport
{
    bool fetched = false;
    std::size_t alerts = 0;
};

// Which cycles one ingestion pass runs.
struct CycleSelection
{
    bool realtime = true;
    bool alerts = true;

    // --realtime / --alerts narrow the pass to that cycle; naming both, like
    // naming neither, runs both.
    static CycleSelection fromFlags(bool realtimeFlag, bool alertsFlag)
    {
        CycleSelection selection;
        if (realtimeFlag != alertsFlag)
        {
            selection.realtime = realtimeFlag;
            selection.alerts   = alertsFlag;
        }
        return selection;
    }
};

// One pass of fetch -> decode -> reconcile. Scheduling the passes is up to
// the caller.
class IngestionPipeline
{
private:
    FeedFetcher& fetcher;
    FeedDecoder const& decoder;
    RealtimeReconciler& realtime;
    AlertReconciler& alertReconciler;
    std::vector<FeedEndpoint> subwayFeeds;
    FeedEndpoint alertFeed;

public:
    IngestionPipeline(FeedFetcher& feedFetcher,
                      FeedDecoder const& feedDecoder,
                      RealtimeReconciler& realtimeReconciler,
                      AlertReconciler& alerts,
                      std::vector<FeedEndpoint> feeds,
                      FeedEndpoint alertEndpoint);

    // Live state is replaced even when every group failed, so stale trips
    // never outlive the cycle that could not confirm them.
    boost::asio::awaitable<RealtimeCycleReport> runRealtimeCycle();

    // Leaves stored alerts untouched when the alert feed is unavailable.
    boost::asio::awaitable<AlertCycleReport> runAlertCycle();

    // Realtime first, then alerts, skipping whatever the selection leaves out.
    boost::asio::awaitable<void> runCycles(CycleSelection selection);
};
