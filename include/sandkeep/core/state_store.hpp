/**
 * @file state_store.hpp
 * @brief Authoritative, time-bounded cache of sandbox lifecycle states
 *
 * Every component that needs to know a sandbox's state consults the
 * StateStore: the API layer, health checks, the reconciliation loop, the
 * destroy-event monitor and the storage recovery saga.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/sandbox_state.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @class StateStore
 * @brief Concurrent mapping from sandbox ID to its last-known state
 *
 * **Consistency**: Writes overwrite unconditionally; concurrent writers on
 * the same ID are serialized and the last one wins. Nothing is merged. The
 * store is not linearizable across components: callers that need to know
 * whether, say, a recovery is running must track that themselves.
 *
 * **Retention**: Records in a terminal state (DESTROYED) older than the
 * retention window are removed by Prune(), or lazily when read.
 *
 * **Thread Safety**: All methods are thread-safe.
 *
 * **Usage Example**:
 * @code
 * StateStore store(7);
 * store.Set("sandbox-1", SandboxState::STARTED);
 *
 * if (auto state = store.Get("sandbox-1")) {
 *     spdlog::info("state: {}", SandboxStateToString(*state));
 * }
 *
 * store.Prune();
 * @endcode
 */
class StateStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param retention_days How long terminal records are kept
     * @param clock Time source (defaults to system_clock::now)
     */
    explicit StateStore(int retention_days, Clock clock = nullptr);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Get the cached state
     * @return State, or std::nullopt when the sandbox is unknown or expired
     */
    std::optional<SandboxState> Get(const std::string& sandbox_id);

    std::optional<SandboxStateRecord> GetRecord(const std::string& sandbox_id);

    /**
     * @brief Overwrite the cached state and bump last_updated
     *
     * last_updated never moves backwards, even if the clock does.
     */
    void Set(const std::string& sandbox_id, SandboxState state);

    /**
     * @brief Forget a sandbox entirely
     * @return true if a record was removed
     */
    bool Remove(const std::string& sandbox_id);

    /**
     * @brief Remove expired terminal records
     * @return Number of records removed
     */
    std::size_t Prune();

    /// Copy of every record, ordered by sandbox ID
    std::vector<SandboxStateRecord> Snapshot() const;

    std::size_t Size() const;

    int RetentionDays() const { return retention_days_; }

    /**
     * @brief Persist every record as JSON
     * @throws std::runtime_error if the file cannot be written
     */
    void SaveSnapshot(const std::filesystem::path& path) const;

    /**
     * @brief Merge records from a JSON snapshot file
     *
     * For IDs already present, the record with the newer last_updated wins.
     * Malformed entries are skipped with a warning; expired terminal
     * records are dropped.
     *
     * @return Number of records taken from the file
     * @throws std::runtime_error if the file cannot be read or is not a snapshot
     */
    std::size_t LoadSnapshot(const std::filesystem::path& path);

private:
    int retention_days_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, SandboxStateRecord> records_;

    bool IsExpired(const SandboxStateRecord& record,
                   std::chrono::system_clock::time_point now) const;
};

} // namespace core
} // namespace sandkeep
