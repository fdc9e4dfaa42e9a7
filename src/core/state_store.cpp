/**
 * @file state_store.cpp
 * @brief Implementation of the sandbox state cache
 *
 * **Snapshot Format**:
 * ```
 * {
 *   "version": 1,
 *   "records": [
 *     {"sandbox_id": "abc", "state": "started", "last_updated": 1735689600000}
 *   ]
 * }
 * ```
 * `last_updated` is milliseconds since the Unix epoch.
 *
 * @date 2025
 */

#include "sandkeep/core/state_store.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

using json = nlohmann::json;

namespace sandkeep {
namespace core {

namespace {

constexpr int kSnapshotVersion = 1;

std::int64_t ToUnixMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromUnixMillis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // anonymous namespace

StateStore::StateStore(int retention_days, Clock clock)
    : retention_days_(retention_days)
    , clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {
    spdlog::debug("State store created (retention: {} days)", retention_days_);
}

std::optional<SandboxState> StateStore::Get(const std::string& sandbox_id) {
    auto record = GetRecord(sandbox_id);
    if (!record) {
        return std::nullopt;
    }
    return record->state;
}

std::optional<SandboxStateRecord> StateStore::GetRecord(const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(sandbox_id);
    if (it == records_.end()) {
        return std::nullopt;
    }

    // Lazy prune
    if (IsExpired(it->second, clock_())) {
        spdlog::debug("Pruning expired state record: {}", sandbox_id);
        records_.erase(it);
        return std::nullopt;
    }

    return it->second;
}

void StateStore::Set(const std::string& sandbox_id, SandboxState state) {
    auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = records_.try_emplace(sandbox_id);
    SandboxStateRecord& record = it->second;

    if (inserted) {
        record.sandbox_id = sandbox_id;
        record.last_updated = now;
    } else if (now > record.last_updated) {
        record.last_updated = now;
    }

    if (!inserted && record.state != state) {
        spdlog::debug("Sandbox {} state: {} -> {}", sandbox_id,
                      SandboxStateToString(record.state), SandboxStateToString(state));
    }
    record.state = state;
}

bool StateStore::Remove(const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(sandbox_id) > 0;
}

std::size_t StateStore::Prune() {
    auto now = clock_();
    std::size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
        if (IsExpired(it->second, now)) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::info("Pruned {} expired sandbox state records", removed);
    }
    return removed;
}

std::vector<SandboxStateRecord> StateStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SandboxStateRecord> records;
    records.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        records.push_back(record);
    }
    return records;
}

std::size_t StateStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// SNAPSHOT PERSISTENCE
// ============================================================================

void StateStore::SaveSnapshot(const std::filesystem::path& path) const {
    json records = json::array();
    for (const auto& record : Snapshot()) {
        records.push_back({
            {"sandbox_id", record.sandbox_id},
            {"state", SandboxStateToString(record.state)},
            {"last_updated", ToUnixMillis(record.last_updated)}
        });
    }

    json snapshot = {
        {"version", kSnapshotVersion},
        {"records", records}
    };

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    // Write to a sibling file and rename so readers never see a partial snapshot.
    // Each writer (process and call) gets its own temp file.
    static std::atomic<std::uint64_t> save_sequence{0};
    auto temp_path = path;
    temp_path += "." + std::to_string(::getpid()) + "." + std::to_string(save_sequence++) + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot write state snapshot: " + temp_path.string());
        }
        file << snapshot.dump(2);
        if (!file) {
            throw std::runtime_error("failed writing state snapshot: " + temp_path.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw std::runtime_error("cannot replace state snapshot " + path.string() + ": " + ec.message());
    }

    spdlog::debug("Saved {} state records to {}", records.size(), path.string());
}

std::size_t StateStore::LoadSnapshot(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot read state snapshot: " + path.string());
    }

    json snapshot;
    try {
        snapshot = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error("invalid state snapshot " + path.string() + ": " + e.what());
    }

    if (!snapshot.is_object() || !snapshot.contains("records") || !snapshot["records"].is_array()) {
        throw std::runtime_error("state snapshot has no records array: " + path.string());
    }

    int version = snapshot.value("version", 0);
    if (version != kSnapshotVersion) {
        spdlog::warn("State snapshot version {} (expected {})", version, kSnapshotVersion);
    }

    auto now = clock_();
    std::size_t loaded = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : snapshot["records"]) {
        SandboxStateRecord record;
        try {
            record.sandbox_id = entry.at("sandbox_id").get<std::string>();
            record.state = SandboxStateFromString(entry.at("state").get<std::string>());
            record.last_updated = FromUnixMillis(entry.at("last_updated").get<std::int64_t>());
        }
        catch (const json::exception& e) {
            spdlog::warn("Skipping malformed state record: {}", e.what());
            continue;
        }

        if (record.sandbox_id.empty() || IsExpired(record, now)) {
            continue;
        }

        auto it = records_.find(record.sandbox_id);
        if (it != records_.end() && it->second.last_updated >= record.last_updated) {
            continue;
        }

        records_[record.sandbox_id] = record;
        ++loaded;
    }

    spdlog::info("Loaded {} state records from {}", loaded, path.string());
    return loaded;
}

bool StateStore::IsExpired(const SandboxStateRecord& record,
                           std::chrono::system_clock::time_point now) const {
    if (!IsTerminalState(record.state)) {
        return false;
    }
    return now - record.last_updated > std::chrono::hours(24) * retention_days_;
}

} // namespace core
} // namespace sandkeep
