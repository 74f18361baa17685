#pragma once

/** \file scan_lock.hpp
 *  \brief Non-blocking per-library mutual exclusion for scans.
 *
 * acquire() never queues: when the lock is held it returns lock_contention
 * immediately. The returned Guard releases on every exit path.
 */

#include <expected>
#include <mutex>
#include <string>

#include "hoard/error.hpp"

namespace hoard::core {

class ScanLock {
public:
    class Guard {
    public:
        Guard(Guard&&) noexcept = default;
        Guard& operator=(Guard&&) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        friend class ScanLock;
        explicit Guard(std::unique_lock<std::mutex> lk) : lock_(std::move(lk)) {}
        std::unique_lock<std::mutex> lock_;
    };

    ScanLock() = default;
    ScanLock(const ScanLock&) = delete;
    ScanLock& operator=(const ScanLock&) = delete;

    /** \brief Try to take the lock; \p what names the rejected operation in the error. */
    auto acquire(const std::string& what) -> std::expected<Guard, error> {
        std::unique_lock<std::mutex> lk(mutex_, std::try_to_lock);
        if (!lk.owns_lock()) {
            return std::unexpected(error{error_code::lock_contention,
                                         "There is already a scan task running; " + what + " rejected",
                                         "library.lock"});
        }
        return Guard(std::move(lk));
    }

private:
    std::mutex mutex_;
};

} // namespace hoard::core
