#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "StateSnapshotManager.h"
#include "mocks/FakeScheduler.hpp"
#include "mocks/MockCommandBus.hpp"

#include <stdexcept>

using ::testing::_;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::InSequence;
using ::testing::Pair;
using ::testing::Return;
using ::testing::Throw;

namespace {
constexpr const char* kDevice = "media_player.bath_sonos";
}

TEST(StateSnapshotManagerTests, SnapshotIncludesGroup) {
    MockCommandBus bus;
    FakeScheduler scheduler;
    StateSnapshotManager snapshots(bus, scheduler);

    EXPECT_CALL(bus, call("sonos", "snapshot", AllOf(Contains(Pair("entity_id", kDevice)),
                                                     Contains(Pair("with_group", "true")))))
        .WillOnce(Return(CommandResult::success()));

    EXPECT_EQ(snapshots.snapshotDetailed(kDevice), SnapshotResult::SNAPSHOT);
}

TEST(StateSnapshotManagerTests, RefusedSnapshotFallsBackToStop) {
    MockCommandBus bus;
    FakeScheduler scheduler;
    StateSnapshotManager snapshots(bus, scheduler);

    InSequence seq;
    EXPECT_CALL(bus, call("sonos", "snapshot", _))
        .WillOnce(Return(CommandResult::failure("Service not found")));
    EXPECT_CALL(bus, call("media_player", "media_stop", Contains(Pair("entity_id", kDevice))))
        .WillOnce(Return(CommandResult::success()));

    EXPECT_EQ(snapshots.snapshotDetailed(kDevice), SnapshotResult::STOPPED);
}

TEST(StateSnapshotManagerTests, BothFailingReportsFalse) {
    MockCommandBus bus;
    FakeScheduler scheduler;
    StateSnapshotManager snapshots(bus, scheduler);

    EXPECT_CALL(bus, call(_, _, _))
        .Times(2)
        .WillRepeatedly(Return(CommandResult::failure("unavailable")));

    EXPECT_FALSE(snapshots.snapshot(kDevice));
}

TEST(StateSnapshotManagerTests, ThrowingBusNeverEscapes) {
    MockCommandBus bus;
    FakeScheduler scheduler;
    StateSnapshotManager snapshots(bus, scheduler);

    EXPECT_CALL(bus, call(_, _, _))
        .WillRepeatedly(Throw(std::runtime_error("connection reset")));

    bool ok = true;
    EXPECT_NO_THROW(ok = snapshots.snapshot(kDevice));
    EXPECT_FALSE(ok);
    EXPECT_NO_THROW(snapshots.restore(kDevice));
}

TEST(StateSnapshotManagerTests, ScheduledRestoreCallsVendorRestore) {
    MockCommandBus bus;
    FakeScheduler scheduler;
    StateSnapshotManager snapshots(bus, scheduler);

    RestorationTask task;
    ASSERT_TRUE(snapshots.scheduleRestore(kDevice, 7000, task));
    EXPECT_EQ(task.kind, RestorationKind::STATE_RESTORE);
    EXPECT_EQ(task.deviceId, kDevice);

    EXPECT_CALL(bus, call("sonos", "restore", Contains(Pair("entity_id", kDevice))))
        .WillOnce(Return(CommandResult::failure("no snapshot")));
    EXPECT_EQ(scheduler.RunAll(), 1u);
}
