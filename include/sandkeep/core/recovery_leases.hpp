/**
 * @file recovery_leases.hpp
 * @brief Per-sandbox mutual exclusion for storage recovery
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace sandkeep {
namespace core {

/**
 * @class LeaseError
 * @brief The lock file behind a lease could not be opened or locked
 */
class LeaseError : public std::runtime_error {
public:
    explicit LeaseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class RecoveryLeases
 * @brief Registry of sandbox IDs with a recovery in flight
 *
 * At most one lease per ID exists at any time. Leases for different IDs
 * never contend beyond the registry's short critical section.
 *
 * With a lock directory, each lease also holds an exclusive flock() on
 * `<lock_dir>/<sandbox_id>.lock`, so registries in other processes sharing
 * the directory see it too. The kernel drops the lock if the holder dies.
 * Lock files are left in place; deleting one while it is locked would let
 * a second holder lock a fresh inode.
 *
 * **Usage Example**:
 * @code
 * RecoveryLeases leases("/run/sandkeep/leases");
 * auto lease = leases.TryAcquire("sandbox-1");
 * if (!lease) {
 *     return;  // someone else is recovering sandbox-1
 * }
 * // ... lease released when it goes out of scope
 * @endcode
 */
class RecoveryLeases {
public:
    /**
     * @class Lease
     * @brief Move-only handle; releases its ID on destruction
     */
    class Lease {
    public:
        Lease() = default;
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return owner_ != nullptr; }

        const std::string& Id() const { return id_; }

        /// Release early; a no-op on an empty lease
        void Release();

    private:
        friend class RecoveryLeases;
        Lease(RecoveryLeases* owner, std::string id, int lock_fd);

        RecoveryLeases* owner_{nullptr};
        std::string id_;
        int lock_fd_{-1};
    };

    /**
     * @param lock_dir Directory for lock files; empty keeps leases in-process
     */
    explicit RecoveryLeases(std::filesystem::path lock_dir = {});

    RecoveryLeases(const RecoveryLeases&) = delete;
    RecoveryLeases& operator=(const RecoveryLeases&) = delete;

    /**
     * @brief Take the lease for @p sandbox_id
     * @return Held lease, or an empty one if already taken here or elsewhere
     * @throws LeaseError if the lock file cannot be created or locked
     */
    Lease TryAcquire(const std::string& sandbox_id);

    /**
     * @brief True while any holder (this process or another) has the lease
     */
    bool IsHeld(const std::string& sandbox_id) const;

    /// Leases held through this registry
    std::size_t ActiveCount() const;

    const std::filesystem::path& LockDirectory() const { return lock_dir_; }

    /**
     * @brief Lock file used for @p sandbox_id
     */
    std::filesystem::path LockFilePath(const std::string& sandbox_id) const;

private:
    void ReleaseId(const std::string& sandbox_id);
    int LockFile(const std::string& sandbox_id);

    std::filesystem::path lock_dir_;
    mutable std::mutex mutex_;
    std::set<std::string> held_;
};

} // namespace core
} // namespace sandkeep
