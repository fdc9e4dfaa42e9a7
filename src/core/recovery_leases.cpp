/**
 * @file recovery_leases.cpp
 * @brief Implementation of the per-sandbox lease registry
 *
 * @date 2025
 */

#include "sandkeep/core/recovery_leases.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sandkeep {
namespace core {

namespace {

constexpr int kHeldElsewhere = -2;

// Sandbox IDs are container names; anything else is mapped to '_'
std::string LockFileName(const std::string& sandbox_id) {
    std::string name = sandbox_id.empty() ? "_" : sandbox_id;
    for (char& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            c = '_';
        }
    }
    return name + ".lock";
}

int FlockNoWait(int fd, int operation) {
    int rc;
    do {
        rc = ::flock(fd, operation | LOCK_NB);
    } while (rc != 0 && errno == EINTR);
    return rc;
}

} // anonymous namespace

// ============================================================================
// LEASE
// ============================================================================

RecoveryLeases::Lease::Lease(RecoveryLeases* owner, std::string id, int lock_fd)
    : owner_(owner)
    , id_(std::move(id))
    , lock_fd_(lock_fd) {
}

RecoveryLeases::Lease::~Lease() {
    Release();
}

RecoveryLeases::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_)
    , id_(std::move(other.id_))
    , lock_fd_(other.lock_fd_) {
    other.owner_ = nullptr;
    other.lock_fd_ = -1;
}

RecoveryLeases::Lease& RecoveryLeases::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        owner_ = other.owner_;
        id_ = std::move(other.id_);
        lock_fd_ = other.lock_fd_;
        other.owner_ = nullptr;
        other.lock_fd_ = -1;
    }
    return *this;
}

void RecoveryLeases::Lease::Release() {
    if (lock_fd_ >= 0) {
        // Closing the only descriptor drops the flock
        ::close(lock_fd_);
        lock_fd_ = -1;
    }
    if (owner_) {
        owner_->ReleaseId(id_);
        owner_ = nullptr;
    }
}

// ============================================================================
// REGISTRY
// ============================================================================

RecoveryLeases::RecoveryLeases(std::filesystem::path lock_dir)
    : lock_dir_(std::move(lock_dir)) {
}

std::filesystem::path RecoveryLeases::LockFilePath(const std::string& sandbox_id) const {
    return lock_dir_ / LockFileName(sandbox_id);
}

RecoveryLeases::Lease RecoveryLeases::TryAcquire(const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(sandbox_id).second) {
        spdlog::debug("Recovery lease for {} already held", sandbox_id);
        return Lease();
    }

    if (lock_dir_.empty()) {
        return Lease(this, sandbox_id, -1);
    }

    int fd = -1;
    try {
        fd = LockFile(sandbox_id);
    }
    catch (const LeaseError&) {
        held_.erase(sandbox_id);
        throw;
    }

    if (fd == kHeldElsewhere) {
        held_.erase(sandbox_id);
        spdlog::debug("Recovery lease for {} held by another process", sandbox_id);
        return Lease();
    }
    return Lease(this, sandbox_id, fd);
}

bool RecoveryLeases::IsHeld(const std::string& sandbox_id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (held_.count(sandbox_id) > 0) {
            return true;
        }
    }
    if (lock_dir_.empty()) {
        return false;
    }

    auto path = LockFilePath(sandbox_id);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        // No lock file means nobody ever leased this ID here
        return false;
    }

    bool held = false;
    if (FlockNoWait(fd, LOCK_SH) == 0) {
        ::flock(fd, LOCK_UN);
    } else {
        held = (errno == EWOULDBLOCK);
        if (!held) {
            spdlog::warn("Cannot check lease file {}: {}", path.string(), std::strerror(errno));
        }
    }
    ::close(fd);
    return held;
}

std::size_t RecoveryLeases::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void RecoveryLeases::ReleaseId(const std::string& sandbox_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(sandbox_id);
}

int RecoveryLeases::LockFile(const std::string& sandbox_id) {
    std::error_code ec;
    std::filesystem::create_directories(lock_dir_, ec);
    if (ec) {
        throw LeaseError("cannot create lease directory " + lock_dir_.string() + ": " + ec.message());
    }

    auto path = LockFilePath(sandbox_id);
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw LeaseError("cannot open lease file " + path.string() + ": " + std::strerror(errno));
    }

    if (FlockNoWait(fd, LOCK_EX) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return kHeldElsewhere;
        }
        throw LeaseError("cannot lock lease file " + path.string() + ": " + std::strerror(err));
    }
    return fd;
}

} // namespace core
} // namespace sandkeep
