/**
 * @file SingleSlotExecutor.hpp
 * @brief Runs at most one transcription at a time, with pause, resume and stop.
 */

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/ElapsedTimeTracker.hpp"
#include "application/PauseGate.hpp"
#include "application/ProgressStore.hpp"
#include "domain/Job.hpp"
#include "domain/SchedulerErrors.hpp"
#include "domain/TranscriptionEngine.hpp"

namespace stenodesk::application {

/**
 * @struct ExecutorOptions
 * @brief Snapshot cadence: first segment, then every N segments or after the interval.
 */
struct ExecutorOptions {
    int snapshotEverySegments = 5;
    std::chrono::milliseconds snapshotInterval{2000};
};

/**
 * @struct RunSnapshot
 * @brief Accumulated state of a run, handed to persistence hooks.
 */
struct RunSnapshot {
    std::string jobId;
    std::vector<domain::Segment> segments;
    domain::JobProgress progress;
    double elapsedSeconds = 0.0;
    bool final = false;
};

enum class RunState {
    Completed,
    Cancelled,
    Failed
};

/**
 * @struct RunOutcome
 * @brief How a run settled. Failed carries the error code and message.
 */
struct RunOutcome {
    RunState state = RunState::Failed;
    std::string jobId;
    std::vector<domain::Segment> segments;
    domain::JobProgress progress;
    double elapsedSeconds = 0.0;
    domain::SchedulerErrorCode errorCode = domain::SchedulerErrorCode::EngineFailure;
    std::string error;
};

using SnapshotHook = std::function<void(const RunSnapshot&)>;

/**
 * @struct RunRequest
 * @brief Everything the executor needs to (re)start one job.
 *
 * Hooks run on the executor thread, serialized with pause/resume persistence.
 * onStarted and the final onSnapshot may throw to fail the run; intermediate
 * snapshot failures are logged and ignored.
 */
struct RunRequest {
    std::string jobId;
    std::string mediaPath;
    std::vector<domain::Segment> priorSegments;
    double resumeOffset = 0.0;
    double baseElapsed = 0.0;
    std::optional<double> knownDuration;

    std::function<void()> onStarted;
    SnapshotHook onSnapshot;
    std::function<void(const RunOutcome&)> onSettled;
};

enum class CancelResult {
    NotRunning,
    Settled,
    TimedOut
};

/**
 * @class SingleSlotExecutor
 * @brief Owns the single executor slot: the current session's pause gate,
 * stop flag and stopwatch.
 *
 * The slot is released only after the run has settled and onSettled has
 * returned, so "is X running" never reports a false negative mid-teardown.
 */
class SingleSlotExecutor {
public:
    SingleSlotExecutor(std::shared_ptr<domain::TranscriptionEngine> engine,
                       std::shared_ptr<ProgressStore> progress,
                       ExecutorOptions options = {},
                       ElapsedTimeTracker::NowFn now = nullptr);
    ~SingleSlotExecutor();

    SingleSlotExecutor(const SingleSlotExecutor&) = delete;
    SingleSlotExecutor& operator=(const SingleSlotExecutor&) = delete;

    /**
     * @brief Claims the slot and starts consuming the engine on the executor thread.
     * @throws AlreadyRunningError if another job holds the slot.
     */
    std::shared_future<RunOutcome> start(RunRequest request);

    /**
     * @brief Closes the gate and freezes the stopwatch of a running job.
     * @param persist Called with the frozen snapshot before the call returns.
     * @return The frozen snapshot, or nullopt if jobId holds no live session.
     */
    std::optional<RunSnapshot> pause(const std::string& jobId, const SnapshotHook& persist = nullptr);

    /**
     * @brief Reopens the gate and restarts the stopwatch.
     * @return False if jobId holds no live session (the caller must restart it).
     */
    bool resume(const std::string& jobId, const std::function<void()>& persist = nullptr);

    /**
     * @brief Sets the stop flag and opens the gate, then waits for the run to settle.
     * @param jobId Only cancel if this job holds the slot; nullopt cancels whatever runs.
     */
    CancelResult cancel(const std::optional<std::string>& jobId, std::chrono::milliseconds timeout);

    bool isRunning(const std::string& mediaPath) const;
    bool isBusy() const;
    bool isPaused(const std::string& jobId) const;
    std::optional<std::string> currentJobId() const;

    /** @brief Live snapshot of jobId's session, if it holds the slot. */
    std::optional<RunSnapshot> snapshot(const std::string& jobId) const;

    /** @brief Waits until the slot is free. */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

private:
    struct Session;

    void runSession(std::shared_ptr<Session> session, RunRequest request, std::promise<RunOutcome> promise);
    void consume(Session& session, const RunRequest& request);
    void emitSnapshot(Session& session, const RunRequest& request, bool final);
    std::shared_ptr<Session> sessionFor(const std::string& jobId) const;

    std::shared_ptr<domain::TranscriptionEngine> m_engine;
    std::shared_ptr<ProgressStore> m_progress;
    ExecutorOptions m_options;
    ElapsedTimeTracker::NowFn m_now;

    mutable std::mutex m_mutex;
    std::shared_ptr<Session> m_session;
    std::thread m_thread;
};

} // namespace stenodesk::application
