/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <future>

namespace stenodesk::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write (or delete) operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    bool remove = false;
    std::promise<bool> done;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 * 
 * All writes pass through one FIFO queue, so the last submitted content of a
 * file is the one left on disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     * @return Resolves to false if the write failed (the reason is logged).
     */
    std::future<bool> saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues the deletion of a file behind any pending write to it. */
    std::future<bool> removeAsync(const std::string& filename);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    std::future<bool> push(SaveTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);
    bool performRemove(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    
    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace stenodesk::infrastructure
