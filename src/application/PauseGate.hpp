/**
 * @file PauseGate.hpp
 * @brief Binary signal deciding whether segment consumption may proceed,
 * plus the independent stop flag checked right after it.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace stenodesk::application {

/**
 * @class PauseGate
 * @brief Running/Paused signal. Waiters block without spinning while it is closed.
 */
class PauseGate {
public:
    PauseGate() = default;
    PauseGate(const PauseGate&) = delete;
    PauseGate& operator=(const PauseGate&) = delete;

    void open();
    void close();
    bool isOpen() const;

    /** @brief Blocks the caller while the gate is closed. */
    void waitUntilOpen();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = true;
};

/**
 * @class CancellationToken
 * @brief Stop flag observed at segment boundaries.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace stenodesk::application
