/**
 * @file SingleSlotExecutor.cpp
 * @brief Implementation of SingleSlotExecutor.
 */

#include "application/SingleSlotExecutor.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <iostream>

namespace stenodesk::application {

using domain::JobProgress;
using domain::JobStatus;
using domain::Segment;

struct SingleSlotExecutor::Session {
    explicit Session(ElapsedTimeTracker::NowFn now) : tracker(std::move(now)) {}

    std::string jobId;
    std::string mediaPath;
    PauseGate gate;
    CancellationToken token;
    ElapsedTimeTracker tracker;
    std::shared_future<RunOutcome> future;

    // Serializes persistence hooks. Lock order: persistMutex, then stateMutex.
    std::mutex persistMutex;
    bool settled = false;

    mutable std::mutex stateMutex;
    std::vector<Segment> segments;
    JobProgress progress;

    RunSnapshot snapshot() const {
        RunSnapshot snap;
        snap.jobId = jobId;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            snap.segments = segments;
            snap.progress = progress;
        }
        snap.elapsedSeconds = tracker.elapsed();
        return snap;
    }
};

namespace {

struct StreamCloser {
    domain::SegmentStream* stream;
    ~StreamCloser() { stream->close(); }
};

} // namespace

SingleSlotExecutor::SingleSlotExecutor(std::shared_ptr<domain::TranscriptionEngine> engine,
                                       std::shared_ptr<ProgressStore> progress,
                                       ExecutorOptions options,
                                       ElapsedTimeTracker::NowFn now)
    : m_engine(std::move(engine)), m_progress(std::move(progress)), m_options(options), m_now(std::move(now)) {
    if (!m_now) {
        m_now = [] { return ElapsedTimeTracker::Clock::now(); };
    }
    if (m_options.snapshotEverySegments <= 0) {
        m_options.snapshotEverySegments = 1;
    }
}

SingleSlotExecutor::~SingleSlotExecutor() {
    cancel(std::nullopt, std::chrono::milliseconds(0));
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::shared_future<RunOutcome> SingleSlotExecutor::start(RunRequest request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session) {
        throw domain::AlreadyRunningError(m_session->jobId);
    }
    // The previous run released the slot; its thread is only publishing the outcome.
    if (m_thread.joinable()) {
        m_thread.join();
    }

    auto session = std::make_shared<Session>(m_now);
    session->jobId = request.jobId;
    session->mediaPath = infrastructure::PathUtils::NormalizeMediaPath(request.mediaPath);
    session->segments = request.priorSegments;
    session->progress = JobProgress::Make(request.resumeOffset, request.knownDuration);
    session->tracker.start(request.baseElapsed);

    std::promise<RunOutcome> promise;
    session->future = promise.get_future().share();
    m_session = session;

    std::cout << "[SingleSlotExecutor] Starting job " << request.jobId
              << " at offset " << request.resumeOffset << "s" << std::endl;

    m_thread = std::thread(&SingleSlotExecutor::runSession, this, session, std::move(request), std::move(promise));
    return session->future;
}

void SingleSlotExecutor::runSession(std::shared_ptr<Session> session, RunRequest request, std::promise<RunOutcome> promise) {
    RunOutcome outcome;
    outcome.jobId = request.jobId;

    try {
        consume(*session, request);
        outcome.state = RunState::Completed;
        std::cout << "[SingleSlotExecutor] Job " << request.jobId << " completed." << std::endl;
    } catch (const domain::CancelledError&) {
        outcome.state = RunState::Cancelled;
        std::cout << "[SingleSlotExecutor] Job " << request.jobId << " interrupted." << std::endl;
    } catch (const domain::SchedulerError& e) {
        outcome.state = RunState::Failed;
        outcome.errorCode = e.code();
        outcome.error = e.what();
        std::cerr << "[SingleSlotExecutor] Job " << request.jobId << " failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        outcome.state = RunState::Failed;
        outcome.errorCode = domain::SchedulerErrorCode::EngineFailure;
        outcome.error = e.what();
        std::cerr << "[SingleSlotExecutor] Job " << request.jobId << " failed: " << e.what() << std::endl;
    }

    outcome.elapsedSeconds = session->tracker.pause();
    {
        std::lock_guard<std::mutex> lock(session->stateMutex);
        outcome.segments = session->segments;
        outcome.progress = session->progress;
    }

    {
        std::lock_guard<std::mutex> persistLock(session->persistMutex);
        session->settled = true;
        if (request.onSettled) {
            try {
                request.onSettled(outcome);
            } catch (const std::exception& e) {
                std::cerr << "[SingleSlotExecutor] Failed to record outcome of job " << request.jobId
                          << ": " << e.what() << std::endl;
            }
        }
    }

    m_progress->clear(session->mediaPath);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session.reset();
    }
    promise.set_value(std::move(outcome));
}

void SingleSlotExecutor::consume(Session& session, const RunRequest& request) {
    if (request.onStarted) {
        std::lock_guard<std::mutex> persistLock(session.persistMutex);
        request.onStarted();
    }

    std::unique_ptr<domain::SegmentStream> stream = m_engine->transcribe(request.mediaPath, request.resumeOffset);
    if (!stream) {
        throw domain::EngineFailureError("Engine produced no stream for " + request.mediaPath);
    }
    StreamCloser closer{stream.get()};

    std::optional<double> duration = stream->duration();
    if (!duration) {
        duration = request.knownDuration;
    }
    {
        std::lock_guard<std::mutex> lock(session.stateMutex);
        session.progress = JobProgress::Make(std::max(session.progress.current, request.resumeOffset), duration);
    }
    m_progress->begin(session.mediaPath, duration, request.resumeOffset);
    if (!session.gate.isOpen()) {
        m_progress->setStatus(session.mediaPath, JobStatus::Paused);
    }

    int accepted = 0;
    auto lastSnapshot = session.tracker.now();

    while (auto segment = stream->next()) {
        session.gate.waitUntilOpen();
        if (session.token.isCancelled()) {
            m_progress->setStatus(session.mediaPath, JobStatus::Interrupted);
            throw domain::CancelledError();
        }

        {
            std::lock_guard<std::mutex> lock(session.stateMutex);
            // A restarted engine may re-emit the boundary segment.
            if (!session.segments.empty() && segment->end <= session.segments.back().end) {
                continue;
            }
            session.segments.push_back(*segment);
        }
        ++accepted;

        auto entry = m_progress->advance(session.mediaPath, segment->end);
        {
            std::lock_guard<std::mutex> lock(session.stateMutex);
            session.progress = entry ? entry->progress
                                     : JobProgress::Make(std::max(session.progress.current, segment->end), duration);
        }

        auto now = session.tracker.now();
        if (accepted == 1 || accepted % m_options.snapshotEverySegments == 0 ||
            now - lastSnapshot >= m_options.snapshotInterval) {
            emitSnapshot(session, request, false);
            lastSnapshot = now;
        }
    }

    auto done = m_progress->markDone(session.mediaPath);
    {
        std::lock_guard<std::mutex> lock(session.stateMutex);
        if (done) {
            session.progress = done->progress;
        } else if (duration) {
            session.progress = JobProgress::Make(*duration, duration);
        }
    }
    session.tracker.pause();
    emitSnapshot(session, request, true);
}

void SingleSlotExecutor::emitSnapshot(Session& session, const RunRequest& request, bool final) {
    std::lock_guard<std::mutex> persistLock(session.persistMutex);
    // Once the final snapshot is under way, pause and resume no longer apply.
    if (final) {
        session.settled = true;
    }
    if (!request.onSnapshot) {
        return;
    }
    RunSnapshot snap = session.snapshot();
    snap.final = final;

    if (final) {
        request.onSnapshot(snap);
        return;
    }
    try {
        request.onSnapshot(snap);
    } catch (const std::exception& e) {
        std::cerr << "[SingleSlotExecutor] Snapshot of job " << request.jobId
                  << " not persisted, continuing: " << e.what() << std::endl;
    }
}

std::optional<RunSnapshot> SingleSlotExecutor::pause(const std::string& jobId, const SnapshotHook& persist) {
    auto session = sessionFor(jobId);
    if (!session) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> persistLock(session->persistMutex);
    if (session->settled || session->token.isCancelled()) {
        return std::nullopt;
    }
    session->gate.close();
    session->tracker.pause();
    m_progress->setStatus(session->mediaPath, JobStatus::Paused);

    RunSnapshot snap = session->snapshot();
    if (persist) {
        persist(snap);
    }
    std::cout << "[SingleSlotExecutor] Job " << jobId << " paused at " << snap.progress.current << "s" << std::endl;
    return snap;
}

bool SingleSlotExecutor::resume(const std::string& jobId, const std::function<void()>& persist) {
    auto session = sessionFor(jobId);
    if (!session) {
        return false;
    }

    std::lock_guard<std::mutex> persistLock(session->persistMutex);
    if (session->settled || session->token.isCancelled()) {
        return false;
    }
    if (persist) {
        persist();
    }
    session->tracker.resume();
    m_progress->setStatus(session->mediaPath, JobStatus::Transcribing);
    session->gate.open();
    std::cout << "[SingleSlotExecutor] Job " << jobId << " resumed." << std::endl;
    return true;
}

CancelResult SingleSlotExecutor::cancel(const std::optional<std::string>& jobId, std::chrono::milliseconds timeout) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session;
    }
    if (!session || (jobId && session->jobId != *jobId)) {
        return CancelResult::NotRunning;
    }

    session->token.cancel();
    m_progress->setStatus(session->mediaPath, JobStatus::Interrupted);
    // A job parked at the gate must wake up to observe the flag.
    session->gate.open();

    if (session->future.wait_for(timeout) == std::future_status::ready) {
        return CancelResult::Settled;
    }
    std::cerr << "[SingleSlotExecutor] Job " << session->jobId << " did not settle within "
              << timeout.count() << "ms, continuing." << std::endl;
    return CancelResult::TimedOut;
}

bool SingleSlotExecutor::isRunning(const std::string& mediaPath) const {
    std::string key = infrastructure::PathUtils::NormalizeMediaPath(mediaPath);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session && m_session->mediaPath == key;
}

bool SingleSlotExecutor::isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session != nullptr;
}

bool SingleSlotExecutor::isPaused(const std::string& jobId) const {
    auto session = sessionFor(jobId);
    return session && !session->gate.isOpen();
}

std::optional<std::string> SingleSlotExecutor::currentJobId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        return std::nullopt;
    }
    return m_session->jobId;
}

std::optional<RunSnapshot> SingleSlotExecutor::snapshot(const std::string& jobId) const {
    auto session = sessionFor(jobId);
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}

bool SingleSlotExecutor::waitForIdle(std::chrono::milliseconds timeout) const {
    std::shared_future<RunOutcome> future;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_session) {
            return true;
        }
        future = m_session->future;
    }
    return future.wait_for(timeout) == std::future_status::ready;
}

std::shared_ptr<SingleSlotExecutor::Session> SingleSlotExecutor::sessionFor(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session && m_session->jobId == jobId) {
        return m_session;
    }
    return nullptr;
}

} // namespace stenodesk::application
