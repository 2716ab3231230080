/**
 * @file QueueWorker.hpp
 * @brief Background loop draining queued jobs through the executor slot.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "domain/Job.hpp"

namespace stenodesk::application {

/**
 * @class QueueWorker
 * @brief idle <-> draining state machine with at most one worker thread.
 *
 * The thread is created lazily by ensureRunning() and exits as soon as no
 * queued job is left. Failures of a job are mapped to the error status so
 * one bad file never stalls the queue.
 */
class QueueWorker {
public:
    struct Hooks {
        /** @brief True while the executor slot is occupied. */
        std::function<bool()> executorBusy;
        /** @brief Oldest queued job, if any. */
        std::function<std::optional<domain::Job>()> nextQueued;
        /** @brief Runs one job to completion. AlreadyRunningError means "retry later". */
        std::function<void(const domain::Job&)> runJob;
        /** @brief Records a failure of a job that threw out of runJob. */
        std::function<void(const std::string& jobId, const std::string& error)> markFailed;
    };

    QueueWorker(Hooks hooks, std::chrono::milliseconds pollInterval);
    ~QueueWorker();

    QueueWorker(const QueueWorker&) = delete;
    QueueWorker& operator=(const QueueWorker&) = delete;

    /** @brief Starts the worker thread unless one is already draining. Clears a pending stop. */
    void ensureRunning();

    /** @brief Asks the loop to stop before picking the next job. Does not wait. */
    void requestStop();

    /** @brief requestStop() and join. */
    void stop();

    /** @brief Waits until the worker thread has exited. */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    void loop();
    bool sleepFor(std::chrono::milliseconds interval);

    Hooks m_hooks;
    std::chrono::milliseconds m_pollInterval;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_active = false;
    bool m_stopRequested = false;
    std::thread m_thread;
};

} // namespace stenodesk::application
