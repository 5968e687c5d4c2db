#include <iostream>
#include "FeedFetcher.hpp"
#include "FeedDecoder.hpp"
#include "RealtimeReconciler.hpp"
#include "AlertReconciler.hpp"
#include "VirtualClock.hpp"
#include "IngestionPipeline.hpp"

IngestionPipeline::IngestionPipeline(FeedFetcher& feedFetcher,
                                     FeedDecoder const& feedDecoder,
                                     RealtimeReconciler& realtimeReconciler,
                                     AlertReconciler& alerts,
                                     std::vector<FeedEndpoint> feeds,
                                     FeedEndpoint alertEndpoint)
    : fetcher(feedFetcher)
    , decoder(feedDecoder)
    , realtime(realtimeReconciler)
    , alertReconciler(alerts)
    , subwayFeeds(std::move(feeds))
    , alertFeed(std::move(alertEndpoint))
{
}

boost::asio::awaitable<RealtimeCycleReport> IngestionPipeline::runRealtimeCycle()
{
    std::cout << "\n[T=" << VirtualClock::now() << "] --- Realtime Fetch ---" << std::endl;

    FetchResult fetched = co_await fetcher.fetchAll(subwayFeeds);
    DecodedBatch batch = decoder.decode(fetched.feeds);

    realtime.reconcile(batch.tripUpdates, batch.stopTimeUpdates);

    RealtimeCycleReport report;
    report.feedsFetched = fetched.feeds.size();
    report.failedGroups = std::move(fetched.failedGroups);
    report.trips        = batch.tripUpdates.size();
    report.stopTimes    = batch.stopTimeUpdates.size();

    std::cout << "   -> TOTAL: " << report.trips << " trips from " << report.feedsFetched
              << " feeds, " << report.failedGroups.size() << " failed." << std::endl;
    co_return report;
}

boost::asio::awaitable<AlertCycleReport> IngestionPipeline::runAlertCycle()
{
    std::cout << "\n[T=" << VirtualClock::now() << "] --- Alerts Fetch ---" << std::endl;

    AlertCycleReport report;
    std::vector<FeedEndpoint> endpoints{alertFeed};
    FetchResult fetched = co_await fetcher.fetchAll(endpoints);
    if (fetched.feeds.empty())
    {
        std::cerr << "[Alerts] " << alertFeed.name << " unavailable; keeping stored alerts." << std::endl;
        co_return report;
    }

    DecodedBatch batch = decoder.decode(fetched.feeds);
    alertReconciler.reconcile(batch.alerts, VirtualClock::now());

    report.fetched = true;
    report.alerts  = batch.alerts.size();
    co_return report;
}

boost::asio::awaitable<void> IngestionPipeline::runCycles(CycleSelection selection)
{
    if (selection.realtime)
        co_await runRealtimeCycle();
    if (selection.alerts)
        co_await runAlertCycle();
}
