#ifndef SHUTDOWN_SIGNAL_H
#define SHUTDOWN_SIGNAL_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tlcp::common {

/**
 * @brief Single-slot wake-up used to coordinate graceful shutdown.
 *
 * notifyOne() wakes one waiter. If nobody is waiting, one permit is stored and the next
 * wait consumes it. Permits do not accumulate: several notifications before a wait
 * release only one waiter.
 */
class ShutdownSignal {
public:
    /**
     * @brief Wakes one waiter or stores a single permit.
     */
    void notifyOne() {
        std::lock_guard<std::mutex> lock(mtx_);
        permit_ = true;
        cv_.notify_one();
    }

    /**
     * @brief Blocks until a permit is available, then consumes it.
     */
    void wait() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return permit_; });
        permit_ = false;
    }

    /**
     * @brief Waits for a permit with a timeout.
     * @param timeout Maximum time to wait. Zero only checks for a stored permit.
     * @return True if a permit was consumed, false if the timeout expired.
     */
    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (cv_.wait_for(lock, timeout, [this] { return permit_; })) {
            permit_ = false;
            return true;
        }
        return false;
    }

private:
    bool permit_ = false;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace tlcp::common

#endif // SHUTDOWN_SIGNAL_H
