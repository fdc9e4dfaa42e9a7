/**
 * @file reconciliation_loop_test.cpp
 * @brief Tests for cache/engine drift correction
 *
 * @date 2025
 */

#include "fake_container_engine.hpp"
#include "temp_dir.hpp"

#include "sandkeep/core/reconciliation_loop.hpp"
#include "sandkeep/core/storage_recovery.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace sandkeep;
using core::SandboxState;
using sandkeep::testkit::EngineOp;
using sandkeep::testkit::FakeContainerEngine;
using sandkeep::testkit::TempDir;

namespace {

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // anonymous namespace

class ReconciliationLoopTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeContainerEngine engine{tmp.Path() / "layers"};
    core::StateStore store{7};
    core::ReconciliationLoop loop{engine, store};
};

TEST_F(ReconciliationLoopTest, CorrectsStaleState) {
    engine.AddContainer("sb", false, std::nullopt, false);
    store.Set("sb", SandboxState::STARTED);

    EXPECT_EQ(loop.RunOnce(), 1u);
    EXPECT_EQ(store.Get("sb"), SandboxState::STOPPED);
}

TEST_F(ReconciliationLoopTest, AddsUncachedSandboxes) {
    engine.AddContainer("running", true, std::nullopt, false);
    engine.AddContainer("stopped", false, std::nullopt, false);

    EXPECT_EQ(loop.RunOnce(), 2u);
    EXPECT_EQ(store.Get("running"), SandboxState::STARTED);
    EXPECT_EQ(store.Get("stopped"), SandboxState::STOPPED);
}

TEST_F(ReconciliationLoopTest, LeavesMatchingStateUntouched) {
    engine.AddContainer("sb", true, std::nullopt, false);
    store.Set("sb", SandboxState::STARTED);
    auto before = store.GetRecord("sb")->last_updated;

    EXPECT_EQ(loop.RunOnce(), 0u);
    EXPECT_EQ(store.GetRecord("sb")->last_updated, before);
}

TEST_F(ReconciliationLoopTest, SkipsRecoveryAliases) {
    engine.AddContainer(core::MakeRecoveryAlias("sb", 1735689600), false, std::nullopt, false);

    EXPECT_EQ(loop.RunOnce(), 0u);
    EXPECT_EQ(store.Size(), 0u);
}

TEST_F(ReconciliationLoopTest, RemovedContainerIsMarkedDestroyed) {
    engine.AddContainer("gone", true, std::nullopt, false);
    loop.RunOnce();
    ASSERT_EQ(store.Get("gone"), SandboxState::STARTED);

    // Removed without a destroy event reaching the cache
    engine.Remove("gone", true);

    EXPECT_EQ(loop.RunOnce(), 1u);
    EXPECT_EQ(store.Get("gone"), SandboxState::DESTROYED);
    EXPECT_EQ(loop.RunOnce(), 0u);
}

TEST_F(ReconciliationLoopTest, VanishedSandboxUnderRecoveryLeaseIsKept) {
    core::RecoveryLeases leases(tmp.Path() / "leases");
    core::ReconciliationLoop guarded(engine, store, &leases);
    store.Set("S", SandboxState::STARTED);
    store.Set("other", SandboxState::STOPPED);

    // Another process is between rename and create
    core::RecoveryLeases recovering(tmp.Path() / "leases");
    auto lease = recovering.TryAcquire("S");
    ASSERT_TRUE(lease);

    EXPECT_EQ(guarded.RunOnce(), 1u);
    EXPECT_EQ(store.Get("S"), SandboxState::STARTED);
    EXPECT_EQ(store.Get("other"), SandboxState::DESTROYED);

    lease.Release();
    EXPECT_EQ(guarded.RunOnce(), 1u);
    EXPECT_EQ(store.Get("S"), SandboxState::DESTROYED);
}

TEST_F(ReconciliationLoopTest, DestroyedRecordsAreNotRewritten) {
    store.Set("old", SandboxState::DESTROYED);
    auto before = store.GetRecord("old")->last_updated;

    EXPECT_EQ(loop.RunOnce(), 0u);
    EXPECT_EQ(store.GetRecord("old")->last_updated, before);
}

TEST_F(ReconciliationLoopTest, FailedListingLeavesCacheAlone) {
    store.Set("sb", SandboxState::STARTED);
    engine.FailNext(EngineOp::LIST, utils::EngineErrorKind::UNAVAILABLE);

    EXPECT_THROW(loop.RunOnce(), utils::EngineError);
    EXPECT_EQ(store.Get("sb"), SandboxState::STARTED);
}

TEST_F(ReconciliationLoopTest, UnmappedStatusIsNotWritten) {
    engine.AddContainer("sb", false, std::nullopt, false);
    engine.SetStatus("sb", "hibernating");
    store.Set("sb", SandboxState::STARTED);

    EXPECT_EQ(loop.RunOnce(), 0u);
    EXPECT_EQ(store.Get("sb"), SandboxState::STARTED);
}

TEST_F(ReconciliationLoopTest, EngineStatusVariantsAreMapped) {
    engine.AddContainer("dead", false, std::nullopt, false);
    engine.SetStatus("dead", "dead");
    engine.AddContainer("restarting", false, std::nullopt, false);
    engine.SetStatus("restarting", "restarting");

    loop.RunOnce();
    EXPECT_EQ(store.Get("dead"), SandboxState::ERROR);
    EXPECT_EQ(store.Get("restarting"), SandboxState::STARTING);
}

TEST_F(ReconciliationLoopTest, RunOncePropagatesEngineErrors) {
    engine.FailNext(EngineOp::LIST, utils::EngineErrorKind::UNAVAILABLE);
    EXPECT_THROW(loop.RunOnce(), utils::EngineError);
}

TEST_F(ReconciliationLoopTest, BackgroundLoopSurvivesEngineFailures) {
    engine.AddContainer("sb", false, std::nullopt, false);
    store.Set("sb", SandboxState::STARTED);
    engine.FailNext(EngineOp::LIST, utils::EngineErrorKind::UNAVAILABLE, 2);

    loop.Start(std::chrono::milliseconds(5));
    EXPECT_TRUE(loop.IsRunning());
    EXPECT_TRUE(WaitUntil([&]() { return store.Get("sb") == SandboxState::STOPPED; }));
    EXPECT_GE(engine.CallCount(EngineOp::LIST), 3);

    loop.Stop();
    EXPECT_FALSE(loop.IsRunning());
    EXPECT_GE(loop.CycleCount(), 3u);
}

TEST_F(ReconciliationLoopTest, DriftIsCorrectedWithinOneInterval) {
    engine.AddContainer("sb", true, std::nullopt, false);
    loop.Start(std::chrono::milliseconds(10));
    ASSERT_TRUE(WaitUntil([&]() { return store.Get("sb") == SandboxState::STARTED; }));

    // Engine changes underneath the cache
    engine.SetStatus("sb", "exited");
    EXPECT_TRUE(WaitUntil([&]() { return store.Get("sb") == SandboxState::STOPPED; }));
    loop.Stop();
}

TEST_F(ReconciliationLoopTest, StopWithoutStartIsHarmless) {
    loop.Stop();
    EXPECT_FALSE(loop.IsRunning());
    EXPECT_EQ(loop.CycleCount(), 0u);
}
