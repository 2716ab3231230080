/**
 * @file QueueWorker.cpp
 * @brief Implementation of QueueWorker.
 */

#include "application/QueueWorker.hpp"
#include "domain/SchedulerErrors.hpp"

#include <iostream>

namespace stenodesk::application {

QueueWorker::QueueWorker(Hooks hooks, std::chrono::milliseconds pollInterval)
    : m_hooks(std::move(hooks)), m_pollInterval(pollInterval) {}

QueueWorker::~QueueWorker() {
    stop();
}

void QueueWorker::ensureRunning() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopRequested = false;
    if (m_active) {
        return;
    }
    // A previous worker already left the loop; reap it before replacing it.
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_active = true;
    m_thread = std::thread(&QueueWorker::loop, this);
}

void QueueWorker::requestStop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
}

void QueueWorker::stop() {
    requestStop();
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        worker = std::move(m_thread);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

bool QueueWorker::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return !m_active; });
}

bool QueueWorker::sleepFor(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, interval, [this] { return m_stopRequested; });
}

void QueueWorker::loop() {
    std::cout << "[QueueWorker] Draining queue." << std::endl;

    while (true) {
        if (m_hooks.executorBusy()) {
            sleepFor(m_pollInterval);
        }

        std::optional<domain::Job> job;
        {
            // Deciding "queue empty" under the same lock as ensureRunning()
            // means a job enqueued concurrently either is seen here or spawns a new worker.
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopRequested) {
                m_active = false;
                m_cv.notify_all();
                std::cout << "[QueueWorker] Stopped." << std::endl;
                return;
            }
            if (m_hooks.executorBusy()) {
                continue;
            }
            try {
                job = m_hooks.nextQueued();
            } catch (const std::exception& e) {
                std::cerr << "[QueueWorker] Failed to read the queue: " << e.what() << std::endl;
            }
            if (!job) {
                m_active = false;
                m_cv.notify_all();
                std::cout << "[QueueWorker] Queue empty, worker exiting." << std::endl;
                return;
            }
        }

        try {
            m_hooks.runJob(*job);
        } catch (const domain::AlreadyRunningError&) {
            // Someone claimed the slot between our check and the start; the job stays queued.
            sleepFor(m_pollInterval);
        } catch (const std::exception& e) {
            std::cerr << "[QueueWorker] Job " << job->id << " failed: " << e.what() << std::endl;
            try {
                m_hooks.markFailed(job->id, e.what());
            } catch (const std::exception& inner) {
                std::cerr << "[QueueWorker] Could not mark job " << job->id << " as failed: " << inner.what() << std::endl;
            }
        }
    }
}

} // namespace stenodesk::application
