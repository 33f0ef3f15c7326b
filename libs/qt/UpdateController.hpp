/*
Turnout – UpdateController
Role: Host-side driver that turns the UpdateScheduler's decisions into AggregationCycle runs.
Inputs/Outputs: Polls the wall clock once per second; emits the next refresh instant, and cycle
                start/finish/skip notifications. The last CycleReport is kept for the UI to read.
Threading: Lives on the thread that owns its event loop. Cycles run on one worker std::thread so the
           event loop never blocks on network I/O; results come back through queued invocations.
Integration: Owns the QTimer and the worker; does not own the AggregationCycle.
Related: UpdateScheduler.hpp, AggregationCycle.hpp.
*/
#ifndef TURNOUT_UPDATECONTROLLER_H
#define TURNOUT_UPDATECONTROLLER_H

#include <QDateTime>
#include <QObject>
#include <QTimer>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "election/aggregate/AggregationCycle.hpp"
#include "election/time/UpdateScheduler.hpp"
#include "election/time/WallClock.hpp"

class UpdateController : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<LocalSeconds()>;

    // `clock` defaults to localNow(); tests pass a fixed or stepped clock.
    UpdateController(AggregationCycle& cycle, UpdateScheduler scheduler,
                     Clock clock = {}, QObject* parent = nullptr);
    ~UpdateController() override;

    [[nodiscard]] bool isRunning() const { return m_timer.isActive(); }
    [[nodiscard]] bool isBusy() const noexcept { return m_busy.load(); }

    // Copy of the most recent report, if any cycle has completed.
    [[nodiscard]] std::optional<CycleReport> latestReport() const;

    // Local wall time as a Qt::LocalTime QDateTime.
    [[nodiscard]] static QDateTime toQDateTime(LocalSeconds t);

public slots:
    void start();
    void stop();
    void updateNow();
    // One poll: publish the countdown and fire a cycle if the scheduler says so.
    void tick();

signals:
    void nextUpdateChanged(const QDateTime& at, qint64 secondsUntil);
    void cycleStarted();
    void cycleFinished(bool hadData);
    void cycleSkipped();

private:
    void launch(LocalSeconds now);
    void joinWorker();

    AggregationCycle&          m_cycle;
    UpdateScheduler            m_scheduler;
    Clock                      m_clock;
    QTimer                     m_timer;
    std::thread                m_worker;
    std::atomic<bool>          m_busy{false};

    mutable std::mutex         m_reportMx;
    std::optional<CycleReport> m_latest;
};

#endif // TURNOUT_UPDATECONTROLLER_H
