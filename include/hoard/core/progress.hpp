#pragma once

/** \file progress.hpp
 *  \brief Throttled percentage reporting for long-running scans.
 */

#include <algorithm>
#include <cstddef>
#include <functional>

namespace hoard::core {

/** \brief Receives an integer percentage in [0, 100]. */
using ProgressCallback = std::function<void(int)>;

/** \brief Forwards a percentage only when it increases.
 *
 * Values reported through one throttle are monotonically non-decreasing and
 * each distinct value is emitted at most once.
 */
class ProgressThrottle {
public:
    ProgressThrottle(ProgressCallback cb, std::size_t total)
        : cb_(std::move(cb)), total_(total) {}

    /** \brief Report that \p done of total items have been handled. */
    void update(std::size_t done) {
        const int pct = total_ == 0
            ? 100
            : static_cast<int>(std::min<std::size_t>(done, total_) * 100 / total_);
        emit(pct);
    }

    void finish() { emit(100); }

    [[nodiscard]] int last() const noexcept { return last_; }

private:
    void emit(int pct) {
        if (pct <= last_) return;
        last_ = pct;
        if (cb_) cb_(pct);
    }

    ProgressCallback cb_;
    std::size_t total_;
    int last_{-1};
};

} // namespace hoard::core
