#pragma once

#include <atomic>
#include <memory>

namespace voice_os {

/**
 * @brief Cooperative cancellation flag shared between the scheduler and a running exchange
 *
 * Blocking calls poll it at their suspension points (the HTTP transfer
 * progress callback) and give up with ErrorType::Cancelled.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace voice_os
