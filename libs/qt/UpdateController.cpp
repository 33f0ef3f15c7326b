#include "UpdateController.hpp"
#include "Log.hpp"
#include <QDate>
#include <QMetaObject>
#include <QTime>
#include <utility>

UpdateController::UpdateController(AggregationCycle& cycle, UpdateScheduler scheduler,
                                   Clock clock, QObject* parent)
    : QObject(parent)
    , m_cycle(cycle)
    , m_scheduler(scheduler)
    , m_clock(clock ? std::move(clock) : Clock(&localNow))
{
    m_timer.setInterval(1000);
    connect(&m_timer, &QTimer::timeout, this, &UpdateController::tick);
}

UpdateController::~UpdateController()
{
    stop();
}

QDateTime UpdateController::toQDateTime(LocalSeconds t)
{
    const WallTime w = toWallTime(t);
    return QDateTime(QDate(w.year, w.month, w.day), QTime(w.hour, w.minute, w.second));
}

std::optional<CycleReport> UpdateController::latestReport() const
{
    std::lock_guard lock(m_reportMx);
    return m_latest;
}

void UpdateController::start()
{
    if (m_timer.isActive()) return;
    LOG_I("sched", "polling every second, refresh at mm:ss = {:02d}:{:02d}",
          m_scheduler.minute(), m_scheduler.second());
    m_timer.start();
    tick();
}

void UpdateController::stop()
{
    m_timer.stop();
    joinWorker();
}

void UpdateController::updateNow()
{
    LOG_I("sched", "manual update requested");
    launch(m_clock());
}

void UpdateController::tick()
{
    const LocalSeconds now = m_clock();
    const NextUpdate next = m_scheduler.nextUpdate(now);
    emit nextUpdateChanged(toQDateTime(next.at), static_cast<qint64>(next.wait.count()));

    if (m_scheduler.shouldFire(now)) {
        LOG_I("sched", "scheduled update due");
        launch(now);
    }
}

void UpdateController::launch(LocalSeconds now)
{
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true)) {
        LOG_W("sched", "update already in progress, skipping");
        emit cycleSkipped();
        return;
    }
    joinWorker();
    emit cycleStarted();

    m_worker = std::thread([this, now] {
        std::optional<CycleReport> report;
        try {
            report = m_cycle.run(now);
        } catch (const std::exception& e) {
            LOG_E("sched", "update failed: {}", e.what());
        }

        const bool ran = report.has_value();
        const bool hadData = ran && report->hadData();
        if (ran) {
            std::lock_guard lock(m_reportMx);
            m_latest = std::move(report);
        }
        m_busy.store(false);

        QMetaObject::invokeMethod(this, [this, ran, hadData] {
            if (ran) {
                emit cycleFinished(hadData);
            } else {
                emit cycleSkipped();
            }
        }, Qt::QueuedConnection);
    });
}

void UpdateController::joinWorker()
{
    if (m_worker.joinable()) {
        m_worker.join();
    }
}
