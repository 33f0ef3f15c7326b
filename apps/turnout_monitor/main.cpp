/*
Turnout – turnout_monitor
Role: Host process. Wires config, durable cache, HTTPS source, aggregation and scheduling together.
Usage: turnout_monitor [config.json] [--once] [--live] [--refresh-regions] [--search <query>]
       Without a mode flag the Qt event loop runs the hourly scheduler until SIGINT/SIGTERM.
*/
#include <QCoreApplication>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>
#include "Log.hpp"
#include "EntitySearchIndex.hpp"
#include "UpdateController.hpp"
#include "election/aggregate/AggregationCycle.hpp"
#include "election/aggregate/Aggregator.hpp"
#include "election/aggregate/EntityCatalog.hpp"
#include "election/cache/DurableCache.hpp"
#include "election/cache/RequestCache.hpp"
#include "election/config/MonitorConfig.hpp"
#include "election/source/BeastHttpSource.hpp"
#include "election/source/PresenceUrls.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) { g_stopRequested.store(true); }

struct Options {
    std::string configPath{"turnout.json"};
    bool        once{false};
    bool        live{false};
    bool        refreshRegions{false};
    std::string search;
    bool        hasSearch{false};
};

Options parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--once") {
            opts.once = true;
        } else if (arg == "--live") {
            opts.live = true;
        } else if (arg == "--refresh-regions") {
            opts.refreshRegions = true;
        } else if (arg == "--search") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--search needs a query");
            }
            opts.search = argv[++i];
            opts.hasSearch = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::runtime_error("unknown option " + arg);
        } else {
            opts.configPath = arg;
        }
    }
    return opts;
}

void printReport(const CycleReport& report, EntityCatalog& catalog) {
    if (!report.hadData()) {
        LOG_I("app", "no observation timestamps yet; nothing to report");
        return;
    }
    const auto& last = report.index.back();
    LOG_I("app", "turnout at day {:02d} {:02d}:00", last.day, last.hour);
    for (const auto& entity : report.entities) {
        auto it = report.series.find(entity);
        if (it == report.series.end() || it->second.empty()) continue;
        const auto& s = it->second;
        const std::string name = entity.isRegion() ? catalog.displayName(entity.name()) : entity.label();
        LOG_I("app", "{:<28} round 2: {:>9}  round 1: {:>9}  diff: {:>+9}  delta: {:+.2f}%  last hour: {:+}",
              name, s.current.back(), s.prior.back(), s.difference.back(),
              s.deltaPercent.back(), s.hourlyIncrease.back());
    }
}

void printHourProgress(Aggregator& aggregator) {
    const auto progress = aggregator.votesSinceHourStart();
    const auto hour = toWallTime(localNow()).hour;
    LOG_I("app", "total {} ({}), new votes since {:02d}:00: +{}", progress.currentTotal,
          progress.live ? "live" : "last hourly sample", hour, progress.sinceHourStart);
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Options opts;
    MonitorConfig cfg;
    try {
        opts = parseArgs(argc, argv);
        cfg = loadMonitorConfig(opts.configPath);
    } catch (const std::exception& e) {
        LOG_E("app", "{}", e.what());
        LOG_E("app", "usage: turnout_monitor [config.json] [--once] [--live] [--refresh-regions] [--search <query>]");
        return 1;
    }

    DurableCache durable(cfg.cacheFile);
    durable.load();
    BeastHttpSource source(cfg.http);
    RequestCache cache(source, durable);
    Aggregator aggregator(cache, PresenceUrls(cfg));
    EntityCatalog catalog(cache, cfg);
    AggregationCycle cycle(aggregator, catalog, cache, cfg);

    if (opts.refreshRegions) {
        const auto regions = catalog.refresh();
        LOG_I("app", "region list refreshed: {} entries", regions.size());
        for (const auto& name : regions) {
            LOG_I("app", "{}", catalog.displayName(name));
        }
    }
    if (opts.hasSearch) {
        const auto hits = EntitySearchIndex::search(opts.search, catalog.regions(),
                                                    static_cast<std::size_t>(cfg.searchLimit));
        for (const auto& name : hits) {
            LOG_I("app", "{}", catalog.displayName(name));
        }
    }
    if (opts.once) {
        if (auto report = cycle.run(localNow())) {
            printReport(*report, catalog);
        }
    }
    if (opts.live) {
        printHourProgress(aggregator);
    }
    if (opts.refreshRegions || opts.hasSearch || opts.live || opts.once) {
        return 0;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    UpdateController controller(cycle, UpdateScheduler(cfg.refreshMinute, cfg.refreshSecond));
    QObject::connect(&controller, &UpdateController::nextUpdateChanged,
                     [](const QDateTime& at, qint64 secondsUntil) {
                         LOG_EVERY_N(INFO, 60, "sched", "next update at {} (in {} s)",
                                     at.toString(Qt::ISODate).toStdString(), secondsUntil);
                     });
    QObject::connect(&controller, &UpdateController::cycleFinished, [&controller, &catalog, &aggregator](bool hadData) {
        if (auto report = controller.latestReport()) {
            printReport(*report, catalog);
        }
        if (hadData) {
            printHourProgress(aggregator);
        }
    });

    QTimer stopPoll;
    QObject::connect(&stopPoll, &QTimer::timeout, [&app] {
        if (g_stopRequested.load()) {
            LOG_I("app", "shutting down");
            app.quit();
        }
    });
    stopPoll.start(200);

    controller.start();
    if (!controller.isBusy()) {
        controller.updateNow();
    }
    const int rc = app.exec();
    controller.stop();
    return rc;
}
