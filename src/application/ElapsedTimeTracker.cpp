/**
 * @file ElapsedTimeTracker.cpp
 * @brief Implementation of ElapsedTimeTracker.
 */

#include "application/ElapsedTimeTracker.hpp"

namespace stenodesk::application {

ElapsedTimeTracker::ElapsedTimeTracker()
    : m_now([] { return Clock::now(); }) {}

ElapsedTimeTracker::ElapsedTimeTracker(NowFn now)
    : m_now(std::move(now)) {}

void ElapsedTimeTracker::set(double baseSeconds, std::optional<Clock::time_point> start) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_base = baseSeconds;
    m_start = start;
}

void ElapsedTimeTracker::start(double baseSeconds) {
    set(baseSeconds, m_now());
}

double ElapsedTimeTracker::elapsed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return elapsedLocked();
}

double ElapsedTimeTracker::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_base = elapsedLocked();
    m_start.reset();
    return m_base;
}

void ElapsedTimeTracker::resume() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_start) {
        m_start = m_now();
    }
}

void ElapsedTimeTracker::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_base = 0.0;
    m_start.reset();
}

bool ElapsedTimeTracker::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_start.has_value();
}

double ElapsedTimeTracker::elapsedLocked() const {
    if (!m_start) {
        return m_base;
    }
    std::chrono::duration<double> running = m_now() - *m_start;
    return running.count() > 0.0 ? m_base + running.count() : m_base;
}

} // namespace stenodesk::application
