#pragma once

/** \file cancel_token.hpp
 *  \brief Cooperative cancellation flag shared between a scan and its controller.
 *
 * Copies share state: the controller keeps one copy and calls cancel(), the
 * worker polls cancelled() once per item. Polling never blocks.
 */

#include <atomic>
#include <memory>

namespace hoard::core {

class CancelToken {
public:
    CancelToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /** \brief Request cancellation; idempotent. */
    void cancel() noexcept { state_->store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

    /** \brief Re-arm the token for another run. */
    void reset() noexcept { state_->store(false, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

/** \brief Null-tolerant poll used by scan loops. */
inline bool is_cancelled(const CancelToken* token) noexcept {
    return token != nullptr && token->cancelled();
}

} // namespace hoard::core
