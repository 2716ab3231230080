/**
 * @file TranscriptionScheduler.hpp
 * @brief Facade over the executor slot, the queue worker and the job records.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/ProgressStore.hpp"
#include "application/QueueWorker.hpp"
#include "application/SingleSlotExecutor.hpp"
#include "domain/ExclusivityLease.hpp"
#include "domain/Job.hpp"
#include "domain/JobRepository.hpp"
#include "domain/TranscriptionEngine.hpp"

namespace stenodesk::application {

struct SchedulerOptions {
    ExecutorOptions executor;
    std::chrono::milliseconds queuePoll{250};
    std::chrono::milliseconds cancelTimeout{1500};
    std::chrono::milliseconds stopAllTimeout{500};
    std::chrono::milliseconds leaseHeartbeat{10000};
    std::string ownerId; ///< Generated when empty.
};

/**
 * @struct ProgressReport
 * @brief What a progress poll returns. Live values while the job holds the
 * slot, the persisted snapshot otherwise.
 */
struct ProgressReport {
    domain::JobProgress progress;
    domain::JobStatus status = domain::JobStatus::Waiting;
    std::optional<double> elapsedSeconds;
    bool live = false;
};

struct TranscriptionResult {
    std::string jobId;
    std::vector<domain::Segment> segments;
    domain::JobProgress progress;
    double elapsedSeconds = 0.0;
};

struct EnqueueResult {
    std::vector<std::string> queued;
    std::vector<std::string> skipped;
};

/**
 * @class TranscriptionScheduler
 * @brief The scheduler state object: one executor slot, one progress map,
 * one lazily created queue worker and the exclusivity lease heartbeat.
 *
 * Every public call is safe to issue concurrently with an in-flight job.
 * Control transitions (pause, resume, enqueue, stop) are serialized by one
 * mutex; the executor thread never takes it.
 */
class TranscriptionScheduler {
public:
    TranscriptionScheduler(std::shared_ptr<domain::JobRepository> repository,
                           std::shared_ptr<domain::TranscriptionEngine> engine,
                           std::shared_ptr<domain::ExclusivityLease> lease,
                           SchedulerOptions options = {},
                           ElapsedTimeTracker::NowFn now = nullptr);
    ~TranscriptionScheduler();

    TranscriptionScheduler(const TranscriptionScheduler&) = delete;
    TranscriptionScheduler& operator=(const TranscriptionScheduler&) = delete;

    /**
     * @brief Acquires the lease, rewrites orphaned transcribing jobs to
     * interrupted and resumes draining persisted queued jobs.
     * @return False if another live scheduler owns the lease.
     */
    bool startup();

    /** @brief Stops the worker and the running job, then releases the lease. */
    void shutdown();

    /**
     * @brief Ingests a media file as a new waiting job.
     * @throws NotFoundError if the file does not exist.
     */
    domain::Job registerMedia(const std::string& mediaPath, const std::string& name = "");

    std::vector<domain::Job> listJobs();

    /** @throws NotFoundError */
    domain::Job getJob(const std::string& jobId);

    /**
     * @brief Runs a job in the executor slot and blocks until it settles.
     * @throws AlreadyRunningError if the slot is occupied.
     * @throws CancelledError if the run was stopped.
     * @throws EngineFailureError / PersistenceError if the run failed.
     */
    TranscriptionResult submit(const std::string& jobId);

    /**
     * @brief Parks the running job at the pause gate and persists its progress.
     * A job persisted as transcribing without a live session is marked paused
     * with its last persisted progress.
     * @throws PreconditionFailedError if the job is not transcribing.
     */
    ProgressReport pause(const std::string& jobId);

    /**
     * @brief Reopens the gate of a paused job, or restarts a paused or
     * interrupted job without a live session from its resume offset.
     * @throws PreconditionFailedError, AlreadyRunningError
     */
    void resume(const std::string& jobId);

    /** @brief Global stop: queued jobs revert to waiting, the running job is interrupted. */
    void cancelAll();

    /** @return True if the job was running or paused and is now interrupted. */
    bool cancelJob(const std::string& jobId);

    /** @throws NotFoundError */
    ProgressReport getProgress(const std::string& jobId);

    /**
     * @brief Marks jobs queued and makes sure a worker drains them.
     * Done, transcribing and paused jobs are skipped.
     * @throws NotFoundError before any change if an id is unknown.
     */
    EnqueueResult enqueue(const std::vector<std::string>& jobIds);

    /** @brief Stops the job if it holds the slot, then deletes its record. */
    bool removeJob(const std::string& jobId);

    const std::string& ownerId() const { return m_ownerId; }
    bool isBusy() const;
    std::optional<std::string> currentJobId() const;

    /** @brief Waits for the slot to free and the worker to exit. */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    domain::Job requireJob(const std::string& jobId);
    std::shared_future<RunOutcome> launch(const domain::Job& job, bool fresh);
    void runQueued(const domain::Job& job);
    void heartbeatLoop();
    static std::string GenerateId();

    std::shared_ptr<domain::JobRepository> m_repository;
    std::shared_ptr<domain::TranscriptionEngine> m_engine;
    std::shared_ptr<domain::ExclusivityLease> m_lease;
    SchedulerOptions m_options;
    std::string m_ownerId;

    std::shared_ptr<ProgressStore> m_progress;
    std::unique_ptr<SingleSlotExecutor> m_executor;
    std::unique_ptr<QueueWorker> m_worker;

    std::mutex m_controlMutex;

    std::mutex m_lifecycleMutex;
    std::condition_variable m_heartbeatCv;
    bool m_started = false;
    bool m_heartbeatStop = false;
    std::thread m_heartbeat;
};

} // namespace stenodesk::application
