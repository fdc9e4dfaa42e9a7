/**
 * @file storage_recovery_test.cpp
 * @brief Tests for the storage recovery state machine
 *
 * @date 2025
 */

#include "fake_container_engine.hpp"
#include "temp_dir.hpp"

#include "sandkeep/core/storage_recovery.hpp"
#include "sandkeep/utils/storage_opt.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <utility>

using namespace sandkeep;
using sandkeep::testkit::EngineOp;
using sandkeep::testkit::FakeContainerEngine;
using sandkeep::testkit::TempDir;
using core::RecoveryErrorKind;
using core::RecoveryPhase;

namespace {

constexpr std::int64_t kNow = 1735689600;

utils::CopyResult CopyTree(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           std::chrono::seconds) {
    std::filesystem::copy(source, destination,
                          std::filesystem::copy_options::recursive |
                          std::filesystem::copy_options::overwrite_existing |
                          std::filesystem::copy_options::copy_symlinks);
    utils::CopyResult result;
    result.success = true;
    result.exit_code = 0;
    return result;
}

bool Contains(const std::vector<RecoveryPhase>& phases, RecoveryPhase phase) {
    return std::find(phases.begin(), phases.end(), phase) != phases.end();
}

} // anonymous namespace

class StorageRecoveryTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeContainerEngine engine{tmp.Path() / "layers"};
    core::StateStore store{7};
    std::atomic<int> copies{0};
    core::LayerCopier copier;

    void SetUp() override {
        copier = [this](const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        std::chrono::seconds timeout) {
            ++copies;
            return CopyTree(source, destination, timeout);
        };
    }

    core::RecoveryOptions Options() const {
        core::RecoveryOptions options;
        options.stop_retry_delay = std::chrono::milliseconds(1);
        options.create_retry.max_attempts = 5;
        options.create_retry.base_delay = std::chrono::milliseconds(1);
        options.create_retry.max_delay = std::chrono::milliseconds(2);
        return options;
    }

    std::unique_ptr<core::StorageRecovery> MakeRecovery() {
        return MakeRecovery(Options());
    }

    std::unique_ptr<core::StorageRecovery> MakeRecovery(const core::RecoveryOptions& options) {
        return std::make_unique<core::StorageRecovery>(
            engine, store, options, copier, []() { return kNow; });
    }

    std::string Alias(const std::string& id) const {
        return core::MakeRecoveryAlias(id, kNow);
    }
};

// ============================================================================
// END TO END
// ============================================================================

TEST_F(StorageRecoveryTest, EndToEndFiftyGbSandbox) {
    engine.AddContainer("S", true, 50.0);
    auto original_id = engine.Get("S").id;
    testkit::WriteFile(engine.LayerOf("S") / "home/user/data.txt", "user data");
    testkit::WriteFile(engine.LayerOf("S") / "etc/config", "settings");

    auto recovery = MakeRecovery();
    auto result = recovery->Recover("S", 50.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_EQ(result.error, RecoveryErrorKind::NONE);
    EXPECT_TRUE(result.data_copied);
    EXPECT_TRUE(result.compensation_warnings.empty());

    std::vector<std::string> expected_mutations = {
        "stop S",
        "rename S -> " + Alias("S"),
        "create S",
        "remove " + Alias("S")
    };
    EXPECT_EQ(engine.Mutations(), expected_mutations);

    std::vector<RecoveryPhase> expected_phases = {
        RecoveryPhase::INSPECTING, RecoveryPhase::VALIDATING, RecoveryPhase::STOPPING,
        RecoveryPhase::RENAMING, RecoveryPhase::CREATING, RecoveryPhase::MARK_STOPPED,
        RecoveryPhase::COPYING, RecoveryPhase::REMOVING_OLD, RecoveryPhase::DONE
    };
    EXPECT_EQ(result.transitions, expected_phases);

    // Canonical ID is bound to a new, stopped container with the larger quota
    auto replacement = engine.Get("S");
    EXPECT_NE(replacement.id, original_id);
    EXPECT_FALSE(replacement.running);
    EXPECT_EQ(replacement.storage_opt.at("size"), std::to_string(utils::GBToBytes(50.1)));
    EXPECT_EQ(replacement.host_config["StorageOpt"]["size"], std::to_string(utils::GBToBytes(50.1)));
    EXPECT_EQ(replacement.host_config["Memory"], 1073741824);
    EXPECT_EQ(replacement.config["Image"], "sandbox-base:latest");
    EXPECT_EQ(engine.LastPlatform().os, "linux");
    EXPECT_EQ(engine.LastPlatform().architecture, "amd64");

    EXPECT_EQ(testkit::ReadFile(engine.LayerOf("S") / "home/user/data.txt"), "user data");
    EXPECT_EQ(testkit::ReadFile(engine.LayerOf("S") / "etc/config"), "settings");
    EXPECT_FALSE(engine.Exists(Alias("S")));
    EXPECT_EQ(store.Get("S"), core::SandboxState::STOPPED);

    // Second recovery grows the expansion to 0.2 GB
    auto second = recovery->Recover("S", 50.0);
    ASSERT_TRUE(second.Succeeded()) << second.error_message;
    EXPECT_NEAR(second.context.new_expansion_gb, 0.2, 1e-9);
    EXPECT_NEAR(second.context.max_expansion_gb, 5.0, 1e-9);

    // Keep going until the ceiling; 50 successes in total
    int successes = 2;
    core::RecoveryResult last;
    while (true) {
        last = recovery->Recover("S", 50.0);
        if (!last.Succeeded()) {
            break;
        }
        ++successes;
        ASSERT_LT(successes, 100);
    }
    EXPECT_EQ(successes, 50);
    EXPECT_EQ(last.error, RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED);
    EXPECT_FALSE(core::IsRetryable(last.error));
    EXPECT_EQ(testkit::ReadFile(engine.LayerOf("S") / "home/user/data.txt"), "user data");
}

TEST_F(StorageRecoveryTest, ExhaustedRecoveryHasNoSideEffects) {
    engine.AddContainer("S", true, 11.0);
    store.Set("S", core::SandboxState::STARTED);
    auto before = store.GetRecord("S");

    auto result = MakeRecovery()->Recover("S", 10.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED);
    EXPECT_EQ(result.final_phase, RecoveryPhase::FAILED);
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(engine.Get("S").running);
    EXPECT_EQ(store.GetRecord("S")->state, core::SandboxState::STARTED);
    EXPECT_EQ(store.GetRecord("S")->last_updated, before->last_updated);
    EXPECT_EQ(copies.load(), 0);
}

TEST_F(StorageRecoveryTest, QuotaCeilingAtHundredGb) {
    engine.AddContainer("S", false, 100.0, false);
    auto recovery = MakeRecovery();

    for (int attempt = 1; attempt <= 100; ++attempt) {
        auto result = recovery->Recover("S", 100.0);
        ASSERT_TRUE(result.Succeeded()) << "attempt " << attempt << ": " << result.error_message;
        ASSERT_LE(result.context.new_expansion_gb, result.context.max_expansion_gb);
    }

    engine.ClearJournal();
    auto rejected = recovery->Recover("S", 100.0);
    EXPECT_EQ(rejected.error, RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED);
    EXPECT_GT(rejected.context.new_expansion_gb, rejected.context.max_expansion_gb);
    EXPECT_TRUE(engine.Mutations().empty());
}

TEST_F(StorageRecoveryTest, UnsetQuotaIsTreatedAsZero) {
    engine.AddContainer("S", false, std::nullopt, false);

    auto result = MakeRecovery()->Recover("S", 10.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_DOUBLE_EQ(result.context.current_storage_gb, 0.0);
    EXPECT_NEAR(result.context.new_expansion_gb, -9.9, 1e-9);
    EXPECT_NEAR(result.context.new_quota_gb, 0.1, 1e-9);
    EXPECT_EQ(engine.Get("S").storage_opt.at("size"), std::to_string(result.context.new_quota_bytes));
    EXPECT_NEAR(utils::BytesToGB(result.context.new_quota_bytes), 0.1, 1e-8);
}

TEST_F(StorageRecoveryTest, InvalidStorageOptFailsClosed) {
    engine.AddContainer("S", true, 10.0);
    engine.SetStorageOptSize("S", "lots");

    auto result = MakeRecovery()->Recover("S", 10.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::INVALID_STORAGE_OPT);
    EXPECT_TRUE(engine.Mutations().empty());
}

TEST_F(StorageRecoveryTest, OversizedStorageOptFailsClosed) {
    engine.AddContainer("S", true, 10.0);
    engine.SetStorageOptSize("S", "99999999999999999999");

    auto result = MakeRecovery()->Recover("S", 10.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::INVALID_STORAGE_OPT);
    EXPECT_NE(result.error_message.find("out of range"), std::string::npos);
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(engine.Get("S").running);
}

TEST_F(StorageRecoveryTest, UnsupportedFilesystemFailsBeforeStopping) {
    engine.AddContainer("S", true, 10.0);
    engine.SetBackingFilesystem("extfs");

    auto result = MakeRecovery()->Recover("S", 10.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::UNSUPPORTED_FILESYSTEM);
    EXPECT_NE(result.error_message.find("extfs"), std::string::npos);
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(engine.Get("S").running);
}

TEST_F(StorageRecoveryTest, MissingSandboxIsNotFound) {
    auto result = MakeRecovery()->Recover("ghost", 10.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::NOT_FOUND);
    EXPECT_EQ(result.transitions,
              (std::vector<RecoveryPhase>{RecoveryPhase::INSPECTING, RecoveryPhase::FAILED}));
}

// ============================================================================
// FAILURES AND COMPENSATION
// ============================================================================

TEST_F(StorageRecoveryTest, CopyFailureRestoresOriginalContainer) {
    engine.AddContainer("S", true, 20.0);
    auto original_id = engine.Get("S").id;
    auto original_layer = engine.LayerOf("S");
    testkit::WriteFile(original_layer / "work/notes.md", "important");
    testkit::WriteFile(original_layer / "bin/tool", std::string("\x7f" "ELF\0\1\2", 7));

    copier = [](const std::filesystem::path&, const std::filesystem::path& destination,
                std::chrono::seconds) {
        // Partial write into the new layer, then failure
        testkit::WriteFile(destination / "work/notes.md", "imp");
        utils::CopyResult result;
        result.exit_code = 23;
        result.diagnostics = "rsync: write failed: No space left on device (28)";
        return result;
    };

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::COPY_FAILED);
    EXPECT_NE(result.error_message.find("No space left"), std::string::npos);
    EXPECT_TRUE(Contains(result.transitions, RecoveryPhase::COMPENSATE_COPY));
    EXPECT_FALSE(Contains(result.transitions, RecoveryPhase::REMOVING_OLD));
    EXPECT_TRUE(result.compensation_warnings.empty());

    // Canonical ID resolves to the original container and its untouched data
    EXPECT_EQ(engine.Names(), std::vector<std::string>{"S"});
    EXPECT_EQ(engine.Get("S").id, original_id);
    EXPECT_EQ(engine.LayerOf("S"), original_layer);
    EXPECT_EQ(testkit::ReadFile(original_layer / "work/notes.md"), "important");
    EXPECT_EQ(testkit::ReadFile(original_layer / "bin/tool"), std::string("\x7f" "ELF\0\1\2", 7));
    EXPECT_EQ(engine.Get("S").storage_opt.at("size"), std::to_string(utils::GBToBytes(20.0)));
}

TEST_F(StorageRecoveryTest, CopyRollbackRemovesTheCloneById) {
    engine.AddContainer("S", false, 20.0);
    copier = [](const std::filesystem::path&, const std::filesystem::path&, std::chrono::seconds) {
        utils::CopyResult result;
        result.exit_code = 11;
        return result;
    };

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_EQ(result.error, RecoveryErrorKind::COPY_FAILED);
    ASSERT_FALSE(result.context.new_container_id.empty());
    auto mutations = engine.Mutations();
    EXPECT_NE(std::find(mutations.begin(), mutations.end(),
                        "remove " + result.context.new_container_id), mutations.end());
    EXPECT_EQ(std::find(mutations.begin(), mutations.end(), "remove S"), mutations.end());
    EXPECT_EQ(mutations.back(), "rename " + Alias("S") + " -> S");
}

TEST_F(StorageRecoveryTest, CopierExceptionCountsAsCopyFailure) {
    engine.AddContainer("S", false, 20.0);
    auto original_id = engine.Get("S").id;
    copier = [](const std::filesystem::path&, const std::filesystem::path&, std::chrono::seconds)
        -> utils::CopyResult {
        throw std::runtime_error("failed to launch rsync");
    };

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::COPY_FAILED);
    EXPECT_EQ(engine.Get("S").id, original_id);
    EXPECT_FALSE(engine.Exists(Alias("S")));
}

TEST_F(StorageRecoveryTest, CompensationFailuresAreWarningsOnly) {
    engine.AddContainer("S", false, 20.0);
    copier = [](const std::filesystem::path&, const std::filesystem::path&, std::chrono::seconds) {
        utils::CopyResult result;
        result.timed_out = true;
        return result;
    };
    engine.FailNext(EngineOp::REMOVE, utils::EngineErrorKind::UNAVAILABLE);

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::COPY_FAILED);
    EXPECT_NE(result.error_message.find("timed out"), std::string::npos);
    ASSERT_EQ(result.compensation_warnings.size(), 2u);
    EXPECT_EQ(result.final_phase, RecoveryPhase::FAILED);
    // Removal failed, so the clone still holds the name and the original stays parked
    EXPECT_TRUE(engine.Exists("S"));
    EXPECT_TRUE(engine.Exists(Alias("S")));
}

TEST_F(StorageRecoveryTest, CreateFailureRenamesOriginalBack) {
    engine.AddContainer("S", true, 20.0);
    auto original_id = engine.Get("S").id;
    engine.FailNext(EngineOp::CREATE, utils::EngineErrorKind::FAILED, 5);

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::ENGINE_ERROR);
    EXPECT_EQ(engine.CallCount(EngineOp::CREATE), 5);
    EXPECT_TRUE(Contains(result.transitions, RecoveryPhase::COMPENSATE_RENAME));
    EXPECT_FALSE(Contains(result.transitions, RecoveryPhase::MARK_STOPPED));
    EXPECT_EQ(engine.Names(), std::vector<std::string>{"S"});
    EXPECT_EQ(engine.Get("S").id, original_id);
    EXPECT_FALSE(store.Get("S").has_value());
}

TEST_F(StorageRecoveryTest, CreateRetriesTransientFailures) {
    engine.AddContainer("S", false, 20.0);
    engine.FailNext(EngineOp::CREATE, utils::EngineErrorKind::UNAVAILABLE, 2);

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_EQ(engine.CallCount(EngineOp::CREATE), 3);
}

TEST_F(StorageRecoveryTest, CreateUnavailableAfterRetriesIsRetryable) {
    engine.AddContainer("S", false, 20.0);
    engine.FailNext(EngineOp::CREATE, utils::EngineErrorKind::UNAVAILABLE, 5);

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::ENGINE_UNAVAILABLE);
    EXPECT_TRUE(core::IsRetryable(result.error));
    EXPECT_TRUE(engine.Exists("S"));
}

TEST_F(StorageRecoveryTest, StopFailureAbortsBeforeRename) {
    engine.AddContainer("S", true, 20.0);
    engine.FailNext(EngineOp::STOP, utils::EngineErrorKind::UNAVAILABLE, 2);

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::ENGINE_UNAVAILABLE);
    EXPECT_EQ(engine.CallCount(EngineOp::STOP), 2);
    EXPECT_EQ(engine.CallCount(EngineOp::RENAME), 0);
    EXPECT_TRUE(engine.Exists("S"));
}

TEST_F(StorageRecoveryTest, StopEscalatesToKill) {
    engine.AddContainer("S", true, 20.0);
    engine.SetIgnoreStop(true);

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_EQ(engine.CallCount(EngineOp::STOP), 1);
    EXPECT_EQ(engine.CallCount(EngineOp::KILL), 1);
}

TEST_F(StorageRecoveryTest, RenameFailureLeavesSandboxInPlace) {
    engine.AddContainer("S", true, 20.0);
    engine.FailNext(EngineOp::RENAME, utils::EngineErrorKind::CONFLICT);

    auto result = MakeRecovery()->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::ENGINE_ERROR);
    EXPECT_EQ(engine.CallCount(EngineOp::CREATE), 0);
    EXPECT_TRUE(engine.Exists("S"));
    // Stopping is not compensated
    EXPECT_FALSE(engine.Get("S").running);
}

TEST_F(StorageRecoveryTest, OldContainerRemovalFailureOnlyWarns) {
    engine.AddContainer("S", false, 20.0);
    engine.FailNext(EngineOp::REMOVE, utils::EngineErrorKind::FAILED);

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    ASSERT_EQ(result.compensation_warnings.size(), 1u);
    EXPECT_NE(result.compensation_warnings[0].find(Alias("S")), std::string::npos);
    EXPECT_TRUE(engine.Exists(Alias("S")));
    EXPECT_EQ(store.Get("S"), core::SandboxState::STOPPED);
}

// ============================================================================
// LAYER DISCOVERY
// ============================================================================

TEST_F(StorageRecoveryTest, SkipsCopyWhenOldLayerUnknown) {
    engine.AddContainer("S", true, 20.0, false);

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_FALSE(result.data_copied);
    EXPECT_EQ(copies.load(), 0);
    EXPECT_TRUE(result.context.old_layer_path.empty());
}

TEST_F(StorageRecoveryTest, SkipsCopyWhenNewLayerUnknown) {
    engine.AddContainer("S", true, 20.0);
    engine.SetGraphDriver("btrfs");

    auto result = MakeRecovery()->Recover("S", 20.0);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_FALSE(result.data_copied);
    EXPECT_EQ(copies.load(), 0);
    EXPECT_FALSE(result.context.old_layer_path.empty());
    EXPECT_TRUE(result.context.new_layer_path.empty());
}

// ============================================================================
// CONCURRENCY AND CANCELLATION
// ============================================================================

TEST_F(StorageRecoveryTest, ConcurrentRecoveryOfSameSandboxIsRejected) {
    engine.AddContainer("S", true, 20.0);
    auto recovery = MakeRecovery();

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> blocked{false};

    engine.SetOperationHook([&](EngineOp op, const std::string&) {
        if (op == EngineOp::STOP && !blocked.exchange(true)) {
            entered.set_value();
            release_future.wait();
        }
    });

    core::RecoveryResult first;
    std::thread worker([&]() { first = recovery->Recover("S", 20.0); });
    entered.get_future().wait();

    auto second = recovery->Recover("S", 20.0);
    EXPECT_EQ(second.error, RecoveryErrorKind::RECOVERY_IN_PROGRESS);
    EXPECT_TRUE(core::IsRetryable(second.error));
    EXPECT_EQ(engine.CallCount(EngineOp::STOP), 1);
    EXPECT_TRUE(recovery->Leases().IsHeld("S"));

    release.set_value();
    worker.join();

    ASSERT_TRUE(first.Succeeded()) << first.error_message;
    EXPECT_EQ(engine.CallCount(EngineOp::CREATE), 1);
    EXPECT_FALSE(recovery->Leases().IsHeld("S"));

    // Lease released: the next request proceeds
    EXPECT_TRUE(recovery->Recover("S", 20.0).Succeeded());
}

TEST_F(StorageRecoveryTest, RecoveriesSharingALeaseDirectoryExcludeEachOther) {
    engine.AddContainer("S", true, 20.0);
    testkit::WriteFile(engine.LayerOf("S") / "data", "payload");

    auto options = Options();
    options.lease_directory = tmp.Path() / "leases";
    auto first = MakeRecovery(options);
    auto second = MakeRecovery(options);

    core::RecoveryResult inner;
    std::atomic<bool> started{false};
    engine.SetOperationHook([&](EngineOp op, const std::string&) {
        if (op == EngineOp::RENAME && !started.exchange(true)) {
            inner = second->Recover("S", 20.0);
        }
    });

    auto outer = first->Recover("S", 20.0);

    ASSERT_TRUE(started.load());
    EXPECT_EQ(inner.error, RecoveryErrorKind::RECOVERY_IN_PROGRESS);
    ASSERT_TRUE(outer.Succeeded()) << outer.error_message;

    std::vector<std::string> expected_mutations = {
        "stop S",
        "rename S -> " + Alias("S"),
        "create S",
        "remove " + Alias("S")
    };
    EXPECT_EQ(engine.Mutations(), expected_mutations);
    EXPECT_EQ(testkit::ReadFile(engine.LayerOf("S") / "data"), "payload");

    // Both instances see the lease gone once the first recovery returns
    EXPECT_FALSE(second->Leases().IsHeld("S"));
    EXPECT_TRUE(second->Recover("S", 20.0).Succeeded());
}

TEST_F(StorageRecoveryTest, LockFileHeldElsewhereRejectsRecovery) {
    engine.AddContainer("S", true, 20.0);
    auto options = Options();
    options.lease_directory = tmp.Path() / "leases";
    auto recovery = MakeRecovery(options);

    std::filesystem::create_directories(options.lease_directory);
    auto lock_path = recovery->Leases().LockFilePath("S");
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT, 0644);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::flock(fd, LOCK_EX | LOCK_NB), 0);

    auto rejected = recovery->Recover("S", 20.0);
    EXPECT_EQ(rejected.error, RecoveryErrorKind::RECOVERY_IN_PROGRESS);
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(recovery->Leases().IsHeld("S"));
    EXPECT_EQ(recovery->Leases().ActiveCount(), 0u);

    ::close(fd);
    EXPECT_FALSE(recovery->Leases().IsHeld("S"));
    EXPECT_TRUE(recovery->Recover("S", 20.0).Succeeded());
}

TEST_F(StorageRecoveryTest, UnusableLeaseDirectoryFailsWithoutSideEffects) {
    engine.AddContainer("S", true, 20.0);
    testkit::WriteFile(tmp.Path() / "not-a-dir", "x");

    auto options = Options();
    options.lease_directory = tmp.Path() / "not-a-dir" / "leases";
    auto result = MakeRecovery(options)->Recover("S", 20.0);

    EXPECT_EQ(result.error, RecoveryErrorKind::LEASE_FAILED);
    EXPECT_FALSE(core::IsRetryable(result.error));
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(engine.Get("S").running);
}

TEST_F(StorageRecoveryTest, DifferentSandboxesRecoverInParallel) {
    const int sandbox_count = 8;
    for (int i = 0; i < sandbox_count; ++i) {
        engine.AddContainer("sb-" + std::to_string(i), true, 10.0);
    }
    auto recovery = MakeRecovery();

    std::vector<core::RecoveryResult> results(sandbox_count);
    std::vector<std::thread> workers;
    for (int i = 0; i < sandbox_count; ++i) {
        workers.emplace_back([&, i]() {
            results[i] = recovery->Recover("sb-" + std::to_string(i), 10.0);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (int i = 0; i < sandbox_count; ++i) {
        EXPECT_TRUE(results[i].Succeeded()) << results[i].error_message;
        EXPECT_EQ(store.Get("sb-" + std::to_string(i)), core::SandboxState::STOPPED);
    }
}

TEST_F(StorageRecoveryTest, CancelledBeforeStopHasNoSideEffects) {
    engine.AddContainer("S", true, 20.0);
    utils::CancellationToken cancel;
    cancel.Cancel();

    auto result = MakeRecovery()->Recover("S", 20.0, &cancel);

    EXPECT_EQ(result.error, RecoveryErrorKind::CANCELLED);
    EXPECT_TRUE(engine.Mutations().empty());
    EXPECT_TRUE(engine.Get("S").running);
}

TEST_F(StorageRecoveryTest, CancelDuringCreateRetriesRenamesBack) {
    engine.AddContainer("S", true, 20.0);
    auto original_id = engine.Get("S").id;
    engine.FailNext(EngineOp::CREATE, utils::EngineErrorKind::UNAVAILABLE, 5);

    utils::CancellationToken cancel;
    engine.SetOperationHook([&](EngineOp op, const std::string&) {
        if (op == EngineOp::CREATE) {
            cancel.Cancel();
        }
    });

    auto result = MakeRecovery()->Recover("S", 20.0, &cancel);

    EXPECT_EQ(result.error, RecoveryErrorKind::CANCELLED);
    EXPECT_EQ(engine.CallCount(EngineOp::CREATE), 1);
    EXPECT_TRUE(Contains(result.transitions, RecoveryPhase::COMPENSATE_RENAME));
    EXPECT_EQ(engine.Get("S").id, original_id);
}

TEST_F(StorageRecoveryTest, CancellationIgnoredOnceReplacementExists) {
    engine.AddContainer("S", true, 20.0);
    testkit::WriteFile(engine.LayerOf("S") / "file", "payload");

    utils::CancellationToken cancel;
    engine.SetOperationHook([&](EngineOp op, const std::string&) {
        if (op == EngineOp::CREATE) {
            cancel.Cancel();
        }
    });

    auto result = MakeRecovery()->Recover("S", 20.0, &cancel);

    ASSERT_TRUE(result.Succeeded()) << result.error_message;
    EXPECT_TRUE(result.data_copied);
    EXPECT_EQ(testkit::ReadFile(engine.LayerOf("S") / "file"), "payload");
}

// ============================================================================
// HELPERS
// ============================================================================

TEST(RecoveryAliasTest, RecognizesGeneratedAliases) {
    EXPECT_EQ(core::MakeRecoveryAlias("abc", 1735689600), "abc-recovery-1735689600");
    EXPECT_TRUE(core::IsRecoveryAlias("abc-recovery-1735689600"));
    EXPECT_TRUE(core::IsRecoveryAlias(core::MakeRecoveryAlias("my-recovery-box", 7)));
    EXPECT_FALSE(core::IsRecoveryAlias("abc"));
    EXPECT_FALSE(core::IsRecoveryAlias("abc-recovery-"));
    EXPECT_FALSE(core::IsRecoveryAlias("-recovery-123"));
    EXPECT_FALSE(core::IsRecoveryAlias("abc-recovery-12x"));
}

TEST(RecoveryErrorKindTest, OnlyTransientKindsAreRetryable) {
    EXPECT_TRUE(core::IsRetryable(RecoveryErrorKind::ENGINE_UNAVAILABLE));
    EXPECT_TRUE(core::IsRetryable(RecoveryErrorKind::RECOVERY_IN_PROGRESS));
    EXPECT_TRUE(core::IsRetryable(RecoveryErrorKind::CANCELLED));
    EXPECT_FALSE(core::IsRetryable(RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED));
    EXPECT_FALSE(core::IsRetryable(RecoveryErrorKind::UNSUPPORTED_FILESYSTEM));
    EXPECT_FALSE(core::IsRetryable(RecoveryErrorKind::COPY_FAILED));
    EXPECT_FALSE(core::IsRetryable(RecoveryErrorKind::ENGINE_ERROR));
    EXPECT_EQ(core::RecoveryErrorKindToString(RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED),
              "storage_expansion_exhausted");
}

TEST(RecoveryLeasesTest, OneHolderPerSandbox) {
    core::RecoveryLeases leases;
    auto first = leases.TryAcquire("sb");
    ASSERT_TRUE(first);
    EXPECT_EQ(first.Id(), "sb");
    EXPECT_FALSE(leases.TryAcquire("sb"));
    EXPECT_TRUE(leases.TryAcquire("other"));
    EXPECT_EQ(leases.ActiveCount(), 1u);

    {
        auto moved = std::move(first);
        EXPECT_FALSE(first);
        EXPECT_TRUE(leases.IsHeld("sb"));
    }
    EXPECT_FALSE(leases.IsHeld("sb"));
    EXPECT_TRUE(leases.TryAcquire("sb"));
}

TEST(RecoveryLeasesTest, LockFilesAreSharedBetweenRegistries) {
    TempDir tmp;
    core::RecoveryLeases here(tmp.Path() / "leases");
    core::RecoveryLeases elsewhere(tmp.Path() / "leases");

    EXPECT_FALSE(elsewhere.IsHeld("sb"));
    auto lease = here.TryAcquire("sb");
    ASSERT_TRUE(lease);
    EXPECT_TRUE(std::filesystem::exists(here.LockFilePath("sb")));

    EXPECT_TRUE(elsewhere.IsHeld("sb"));
    EXPECT_FALSE(elsewhere.TryAcquire("sb"));
    EXPECT_EQ(elsewhere.ActiveCount(), 0u);
    EXPECT_TRUE(elsewhere.TryAcquire("other"));

    lease.Release();
    EXPECT_FALSE(here.IsHeld("sb"));
    EXPECT_FALSE(elsewhere.IsHeld("sb"));
    EXPECT_TRUE(elsewhere.TryAcquire("sb"));
}

TEST(RecoveryLeasesTest, LockFileNamesStayInsideTheDirectory) {
    core::RecoveryLeases leases("/run/sandkeep/leases");
    EXPECT_EQ(leases.LockFilePath("sb-1_a.b"), std::filesystem::path("/run/sandkeep/leases/sb-1_a.b.lock"));
    EXPECT_EQ(leases.LockFilePath("../etc/x"), std::filesystem::path("/run/sandkeep/leases/.._etc_x.lock"));
}
