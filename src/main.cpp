#include <string>
#include <vector>
#include <iostream>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <date/tz.h>
#include "ConfigurationManager.hpp"
#include "MtaClient.hpp"
#include "SQLiteStore.hpp"
#include "FeedFetcher.hpp"
#include "FeedDecoder.hpp"
#include "RealtimeReconciler.hpp"
#include "AlertReconciler.hpp"
#include "IngestionPipeline.hpp"
#include "DepartureResolver.hpp"
#include "AlertMatcher.hpp"
#include "SubscriptionStore.hpp"
#include "StopManager.hpp"
#include "VirtualClock.hpp"

struct CommandLine
{
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> direction;
    std::optional<std::string> stopId;
    std::optional<std::string> routeId;
    std::optional<int> everySeconds;
    bool realtimeOnly = false;
    bool alertsOnly = false;
};

void printUsage()
{
    std::cerr <<
        "usage: nextride [--at EPOCH] <command> [args]\n"
        "  ingest [--realtime] [--alerts] [--every SECONDS]\n"
        "  departures <station_id> [route_id] [--direction N|S]\n"
        "  alerts <username>\n"
        "  subscribe <username> (--stop <stop_id> | --route <route_id>)\n"
        "  subscriptions <username>\n"
        "  unsubscribe <username> <subscription_id>\n"
        "  stations\n"
        "  routes\n";
}

CommandLine parseCommandLineArgs(int argc, char* argv[])
{
    CommandLine cli;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--at")
            VirtualClock::pin(std::stoll(value()));
        else if (arg == "--direction")
            cli.direction = value();
        else if (arg == "--stop")
            cli.stopId = value();
        else if (arg == "--route")
            cli.routeId = value();
        else if (arg == "--every")
        {
            cli.everySeconds = std::stoi(value());
            if (*cli.everySeconds <= 0)
                throw std::invalid_argument("--every must be a positive number of seconds");
        }
        else if (arg == "--realtime")
            cli.realtimeOnly = true;
        else if (arg == "--alerts")
            cli.alertsOnly = true;
        else if (!arg.empty() && arg[0] == '-')
            std::cerr << "Warning: ignoring unknown argument: " << arg << "\n";
        else if (cli.command.empty())
            cli.command = arg;
        else
            cli.positional.push_back(arg);
    }

    return cli;
}

std::string formatLocal(EpochSeconds t, std::string const& timeZone)
{
    auto when = date::sys_seconds{std::chrono::seconds{t}};
    date::zoned_seconds local{timeZone, when};
    return date::format("%Y-%m-%d %H:%M", local);
}

std::string const& requireArg(CommandLine const& cli, std::size_t index, char const* name)
{
    if (cli.positional.size() <= index)
        throw std::invalid_argument(std::string("missing argument: ") + name);
    return cli.positional[index];
}

boost::asio::awaitable<void> runIngestion(IngestionPipeline& pipeline, boost::asio::io_context& io, CommandLine const& cli)
{
    boost::asio::steady_timer timer(io);
    CycleSelection selection = CycleSelection::fromFlags(cli.realtimeOnly, cli.alertsOnly);

    for (;;)
    {
        try
        {
            co_await pipeline.runCycles(selection);
        }
        catch (std::exception const& e)
        {
            // Storage failures end this cycle only; the next one starts clean.
            std::cerr << "[System] Ingestion cycle failed: " << e.what() << std::endl;
            if (!cli.everySeconds)
                throw;
        }

        if (!cli.everySeconds)
            co_return;

        timer.expires_after(std::chrono::seconds(*cli.everySeconds));
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

void printDepartures(std::string const& label, std::vector<StationDeparture> const& departures, bool withRoute)
{
    for (const auto& d : departures)
    {
        std::cout << label;
        if (withRoute)
            std::cout << " - " << d.routeId << ":";
        std::cout << " Departs in " << d.etaMinutes << " min\n";
    }
}

int runDepartures(SQLiteStore& db, CommandLine const& cli)
{
    DepartureResolver resolver(db);
    std::string const& station = requireArg(cli, 0, "station_id");
    std::optional<std::string> route;
    if (cli.positional.size() > 1)
        route = cli.positional[1];

    std::vector<Direction> directions = {Direction::North, Direction::South};
    if (cli.direction)
    {
        auto parsed = StopManager::parseDirection(*cli.direction);
        if (!parsed)
            throw std::invalid_argument("direction must be N or S: " + *cli.direction);
        directions = {*parsed};
    }

    EpochSeconds now = VirtualClock::now();
    bool any = false;
    for (Direction dir : directions)
    {
        std::string platform = StopManager::platformId(StopManager::stationOf(station), dir);
        std::string label = dir == Direction::North ? "Northbound" : "Southbound";

        auto departures = route ? resolver.routeDepartures(platform, *route, now)
                                : resolver.stationDepartures(platform, now);
        any = any || !departures.empty();
        printDepartures(route ? label + " " + *route : label, departures, !route);
    }

    if (!any)
        std::cout << "No upcoming departures\n";
    return 0;
}

int runAlerts(SQLiteStore& db, CommandLine const& cli, std::string const& timeZone)
{
    SubscriptionStore subscriptions(db);
    AlertMatcher matcher(db);

    std::int64_t userId = subscriptions.getOrCreateUser(requireArg(cli, 0, "username"));
    auto alerts = matcher.fetchUserAlerts(userId, VirtualClock::now());

    std::string currentEntity;
    bool any = false;
    for (const auto& a : alerts)
    {
        if (a.status != AlertStatus::Active)
            continue;

        if (!any || a.entityId != currentEntity)
        {
            currentEntity = a.entityId;
            std::cout << "Alerts for " << currentEntity << ":\n";
        }
        any = true;

        std::cout << "  ! " << a.headerText.value_or("(no header)") << "\n";
        if (a.descriptionText)
            std::cout << "    " << *a.descriptionText << "\n";
        std::cout << "    Active from " << (a.start ? formatLocal(*a.start, timeZone) : std::string("-"))
                  << " to " << (a.end ? formatLocal(*a.end, timeZone) : std::string("-")) << "\n";
    }

    if (!any)
        std::cout << "No new alerts available.\n";
    return 0;
}

int runSubscribe(SQLiteStore& db, CommandLine const& cli)
{
    SubscriptionStore subscriptions(db);
    std::int64_t userId = subscriptions.getOrCreateUser(requireArg(cli, 0, "username"));

    if (cli.stopId.has_value() == cli.routeId.has_value())
        throw std::invalid_argument("subscribe needs exactly one of --stop or --route");

    SubscriptionTarget target = cli.stopId ? SubscriptionTarget{StopTarget{*cli.stopId}}
                                           : SubscriptionTarget{RouteTarget{*cli.routeId}};
    std::string name = cli.stopId ? "station " + *cli.stopId : "route " + *cli.routeId;

    if (subscriptions.subscribe(userId, target))
        std::cout << "Successfully subscribed to " << name << ".\n";
    else
        std::cout << "You are already subscribed to " << name << ".\n";
    return 0;
}

int runSubscriptions(SQLiteStore& db, CommandLine const& cli)
{
    SubscriptionStore subscriptions(db);
    std::int64_t userId = subscriptions.getOrCreateUser(requireArg(cli, 0, "username"));

    auto subs = subscriptions.subscriptions(userId);
    if (subs.empty())
    {
        std::cout << "You don't have any subscriptions yet.\n";
        return 0;
    }

    std::cout << "Your subscriptions:\n";
    for (const auto& s : subs)
    {
        std::cout << "  " << s.subscriptionId << ". ";
        if (auto const* stop = std::get_if<StopTarget>(&s.target))
            std::cout << "station " << stop->stopId << "\n";
        else
            std::cout << "route " << std::get<RouteTarget>(s.target).routeId << "\n";
    }
    return 0;
}

int runUnsubscribe(SQLiteStore& db, CommandLine const& cli)
{
    SubscriptionStore subscriptions(db);
    std::int64_t userId = subscriptions.getOrCreateUser(requireArg(cli, 0, "username"));
    std::int64_t subscriptionId = std::stoll(requireArg(cli, 1, "subscription_id"));

    if (subscriptions.unsubscribe(userId, subscriptionId))
        std::cout << "Successfully unsubscribed!\n";
    else
        std::cout << "No such subscription.\n";
    return 0;
}

int runCatalog(SQLiteStore& db, CommandLine const& cli)
{
    StopManager stops(db);

    if (cli.command == "stations")
    {
        for (const auto& s : stops.stations())
            std::cout << s.stopId << "\t" << s.name << ", " << s.address << " (" << s.trains << ")\n";
    }
    else
    {
        for (const auto& r : stops.routes())
            std::cout << r.routeId << "\t" << r.shortName << " (" << r.longName << ")\n";
    }
    return 0;
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLine cli = parseCommandLineArgs(argc, argv);
        if (cli.command.empty())
        {
            printUsage();
            return 2;
        }

        ConfigurationManager config;
        SQLiteStore db(config.getDatabasePath());

        if (cli.command == "ingest")
        {
            boost::asio::io_context io;
            MtaClient client(io, config.getAPIKey(), config.getFetchTimeout());
            FeedFetcher fetcher(client, config.getFetchTimeout());
            FeedDecoder decoder(config.getTimeZone());
            RealtimeReconciler realtime(db);
            AlertReconciler alerts(db);
            IngestionPipeline pipeline(fetcher, decoder, realtime, alerts, config.getFeeds(), config.getAlertFeed());

            std::exception_ptr failure;
            boost::asio::co_spawn(io, runIngestion(pipeline, io, cli), [&failure](std::exception_ptr e)
            {
                failure = e;
            });

            io.run();
            if (failure)
                std::rethrow_exception(failure);
            return 0;
        }
        if (cli.command == "departures")
            return runDepartures(db, cli);
        if (cli.command == "alerts")
            return runAlerts(db, cli, config.getTimeZone());
        if (cli.command == "subscribe")
            return runSubscribe(db, cli);
        if (cli.command == "subscriptions")
            return runSubscriptions(db, cli);
        if (cli.command == "unsubscribe")
            return runUnsubscribe(db, cli);
        if (cli.command == "stations" || cli.command == "routes")
            return runCatalog(db, cli);

        std::cerr << "Unknown command: " << cli.command << "\n";
        printUsage();
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
