/*
Turnout – UpdateController Tests
Role: Verify the timer-side host: countdown signal, scheduled and manual cycles, busy skip
Testing Strategy: Fixed clock injected into the controller; QSignalSpy waits for queued results
*/
#include <gtest/gtest.h>
#include <QSignalSpy>
#include "UpdateController.hpp"
#include "fixtures/gate_source.hpp"
#include "fixtures/pipeline.hpp"
#include "fixtures/temp_file.hpp"

namespace {

LocalSeconds at(int hour, int minute, int second) {
    return fromWallTime(WallTime{2025, 5, 16, hour, minute, second});
}

UpdateController::Clock fixedClock(LocalSeconds t) {
    return [t] { return t; };
}

} // namespace

TEST(UpdateController, TickBeforeMarkOnlyPublishesCountdown) {
    TempFile file("controller");
    fixtures::Pipeline<FakeSnapshotSource> p(file.path());
    UpdateController controller(p.cycle, UpdateScheduler(1, 1), fixedClock(at(10, 0, 30)));
    QSignalSpy countdown(&controller, &UpdateController::nextUpdateChanged);
    QSignalSpy started(&controller, &UpdateController::cycleStarted);

    controller.tick();

    ASSERT_EQ(countdown.count(), 1);
    EXPECT_EQ(countdown.at(0).at(0).toDateTime(), QDateTime(QDate(2025, 5, 16), QTime(10, 1, 1)));
    EXPECT_EQ(countdown.at(0).at(1).toLongLong(), 31);
    EXPECT_EQ(started.count(), 0);
}

TEST(UpdateController, ScheduledTickRunsCycle) {
    TempFile file("controller");
    fixtures::Pipeline<FakeSnapshotSource> p(file.path());
    p.serve({16, 9}, 100, 90);
    p.serve({16, 10}, 150, 120);
    UpdateController controller(p.cycle, UpdateScheduler(1, 1), fixedClock(at(10, 5, 0)));
    QSignalSpy started(&controller, &UpdateController::cycleStarted);
    QSignalSpy finished(&controller, &UpdateController::cycleFinished);

    controller.tick();
    ASSERT_TRUE(finished.wait(5000));

    EXPECT_EQ(started.count(), 1);
    EXPECT_TRUE(finished.at(0).at(0).toBool());
    auto report = controller.latestReport();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->series.at(EntityId::region("GERMANIA")).current.back(), 150);

    // Same hour: no second cycle
    controller.tick();
    EXPECT_EQ(started.count(), 1);
}

TEST(UpdateController, ManualUpdateAtTopOfHourHasNoData) {
    TempFile file("controller");
    fixtures::Pipeline<FakeSnapshotSource> p(file.path());
    UpdateController controller(p.cycle, UpdateScheduler(1, 1), fixedClock(at(10, 0, 20)));
    QSignalSpy finished(&controller, &UpdateController::cycleFinished);

    controller.updateNow();
    ASSERT_TRUE(finished.wait(5000));

    EXPECT_FALSE(finished.at(0).at(0).toBool());
    EXPECT_EQ(p.source.totalFetches(), 0);
}

TEST(UpdateController, SecondRequestWhileBusyIsSkipped) {
    TempFile file("controller");
    fixtures::Pipeline<GateSource> p(file.path());
    p.serve({16, 9}, 10, 5);
    UpdateController controller(p.cycle, UpdateScheduler(1, 1), fixedClock(at(9, 30, 0)));
    QSignalSpy skipped(&controller, &UpdateController::cycleSkipped);
    QSignalSpy finished(&controller, &UpdateController::cycleFinished);

    controller.updateNow();
    p.source.waitUntilEntered();
    EXPECT_TRUE(controller.isBusy());

    controller.updateNow();
    EXPECT_EQ(skipped.count(), 1);

    p.source.release();
    ASSERT_TRUE(finished.wait(5000));
    EXPECT_TRUE(finished.at(0).at(0).toBool());
}

TEST(UpdateController, StartAndStop) {
    TempFile file("controller");
    fixtures::Pipeline<FakeSnapshotSource> p(file.path());
    UpdateController controller(p.cycle, UpdateScheduler(1, 1), fixedClock(at(10, 0, 30)));
    QSignalSpy countdown(&controller, &UpdateController::nextUpdateChanged);

    controller.start();
    EXPECT_TRUE(controller.isRunning());
    EXPECT_EQ(countdown.count(), 1);

    controller.stop();
    EXPECT_FALSE(controller.isRunning());
}

TEST(UpdateController, ToQDateTimeKeepsWallClockFields) {
    const auto dt = UpdateController::toQDateTime(at(23, 59, 58));
    EXPECT_EQ(dt.date(), QDate(2025, 5, 16));
    EXPECT_EQ(dt.time(), QTime(23, 59, 58));
}
