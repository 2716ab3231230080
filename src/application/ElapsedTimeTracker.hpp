/**
 * @file ElapsedTimeTracker.hpp
 * @brief Pausable stopwatch measuring active transcription time.
 */

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace stenodesk::application {

/**
 * @class ElapsedTimeTracker
 * @brief Accumulates active seconds on the monotonic clock.
 *
 * elapsed() = base + (now - start) while running, base otherwise.
 * Wall-clock adjustments never affect the value.
 */
class ElapsedTimeTracker {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    ElapsedTimeTracker();
    explicit ElapsedTimeTracker(NowFn now);

    /** @brief Resets the stopwatch. A null start leaves it frozen at base. */
    void set(double baseSeconds, std::optional<Clock::time_point> start);

    /** @brief Starts running from base as of now. */
    void start(double baseSeconds);

    double elapsed() const;

    /** @brief Freezes the stopwatch and returns the frozen value. Idempotent. */
    double pause();

    /** @brief Continues accumulating from now. No-op while already running. */
    void resume();

    void clear();

    bool isRunning() const;

    Clock::time_point now() const { return m_now(); }

private:
    double elapsedLocked() const;

    NowFn m_now;
    mutable std::mutex m_mutex;
    double m_base = 0.0;
    std::optional<Clock::time_point> m_start;
};

} // namespace stenodesk::application
