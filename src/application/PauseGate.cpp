/**
 * @file PauseGate.cpp
 * @brief Implementation of PauseGate.
 */

#include "application/PauseGate.hpp"

namespace stenodesk::application {

void PauseGate::open() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
    }
    m_cv.notify_all();
}

void PauseGate::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
}

bool PauseGate::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

void PauseGate::waitUntilOpen() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_open; });
}

} // namespace stenodesk::application
