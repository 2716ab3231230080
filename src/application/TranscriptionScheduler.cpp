/**
 * @file TranscriptionScheduler.cpp
 * @brief Implementation of TranscriptionScheduler.
 */

#include "application/TranscriptionScheduler.hpp"
#include "application/ResumeOffset.hpp"
#include "domain/SchedulerErrors.hpp"
#include "infrastructure/PathUtils.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace stenodesk::application {

using domain::Job;
using domain::JobStatus;
using domain::JobUpdate;

namespace {

JobUpdate SnapshotUpdate(const RunSnapshot& snap) {
    JobUpdate update;
    update.segments = snap.segments;
    update.progress = snap.progress;
    update.elapsedSeconds = snap.elapsedSeconds;
    return update;
}

bool CanResumeWithoutSession(JobStatus status) {
    // A transcribing record without a live session was orphaned by a crash.
    return status == JobStatus::Paused || status == JobStatus::Interrupted || status == JobStatus::Transcribing;
}

} // namespace

TranscriptionScheduler::TranscriptionScheduler(std::shared_ptr<domain::JobRepository> repository,
                                               std::shared_ptr<domain::TranscriptionEngine> engine,
                                               std::shared_ptr<domain::ExclusivityLease> lease,
                                               SchedulerOptions options,
                                               ElapsedTimeTracker::NowFn now)
    : m_repository(std::move(repository)),
      m_engine(std::move(engine)),
      m_lease(std::move(lease)),
      m_options(std::move(options)),
      m_progress(std::make_shared<ProgressStore>()) {
    m_ownerId = m_options.ownerId.empty() ? GenerateId() : m_options.ownerId;
    m_executor = std::make_unique<SingleSlotExecutor>(m_engine, m_progress, m_options.executor, std::move(now));

    QueueWorker::Hooks hooks;
    hooks.executorBusy = [this] { return m_executor->isBusy(); };
    hooks.nextQueued = [this] { return m_repository->findOldestQueued(); };
    hooks.runJob = [this](const Job& job) { runQueued(job); };
    hooks.markFailed = [this](const std::string& jobId, const std::string&) {
        m_repository->update(jobId, JobUpdate::Status(JobStatus::Error));
    };
    m_worker = std::make_unique<QueueWorker>(std::move(hooks), m_options.queuePoll);
}

TranscriptionScheduler::~TranscriptionScheduler() {
    shutdown();
    m_worker->requestStop();
    m_executor->cancel(std::nullopt, m_options.stopAllTimeout);
    m_worker.reset();
    m_executor.reset();
}

bool TranscriptionScheduler::startup() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_started) {
        return true;
    }

    if (m_lease && !m_lease->tryAcquire(m_ownerId)) {
        std::cerr << "[TranscriptionScheduler] Lease held by " << m_lease->owner()
                  << ", refusing to start a second scheduler." << std::endl;
        return false;
    }

    for (const auto& job : m_repository->findByStatus(JobStatus::Transcribing)) {
        m_repository->update(job.id, JobUpdate::Status(JobStatus::Interrupted));
        std::cout << "[TranscriptionScheduler] Job " << job.id << " was left transcribing, marked interrupted." << std::endl;
    }

    if (m_lease) {
        m_heartbeatStop = false;
        m_heartbeat = std::thread(&TranscriptionScheduler::heartbeatLoop, this);
    }
    m_started = true;
    std::cout << "[TranscriptionScheduler] Started as " << m_ownerId << std::endl;

    if (m_repository->findOldestQueued()) {
        m_worker->ensureRunning();
    }
    return true;
}

void TranscriptionScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (!m_started) {
            return;
        }
        m_started = false;
        m_heartbeatStop = true;
    }
    m_heartbeatCv.notify_all();

    m_worker->requestStop();
    m_executor->cancel(std::nullopt, m_options.stopAllTimeout);
    m_worker->stop();

    if (m_heartbeat.joinable()) {
        m_heartbeat.join();
    }
    if (m_lease && !m_lease->release(m_ownerId)) {
        std::cerr << "[TranscriptionScheduler] Lease was not ours any more on shutdown." << std::endl;
    }
    std::cout << "[TranscriptionScheduler] Shut down." << std::endl;
}

void TranscriptionScheduler::heartbeatLoop() {
    std::unique_lock<std::mutex> lock(m_lifecycleMutex);
    while (!m_heartbeatCv.wait_for(lock, m_options.leaseHeartbeat, [this] { return m_heartbeatStop; })) {
        lock.unlock();
        if (!m_lease->touch(m_ownerId) && !m_lease->tryAcquire(m_ownerId)) {
            std::cerr << "[TranscriptionScheduler] Lost the scheduler lease to " << m_lease->owner() << std::endl;
        }
        lock.lock();
    }
}

std::string TranscriptionScheduler::GenerateId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << gen() << std::setw(16) << gen();
    return out.str();
}

Job TranscriptionScheduler::requireJob(const std::string& jobId) {
    auto job = m_repository->findById(jobId);
    if (!job) {
        throw domain::NotFoundError("Job not found: " + jobId);
    }
    return *job;
}

Job TranscriptionScheduler::registerMedia(const std::string& mediaPath, const std::string& name) {
    std::string normalized = infrastructure::PathUtils::NormalizeMediaPath(mediaPath);
    std::error_code ec;
    if (!fs::is_regular_file(normalized, ec)) {
        throw domain::NotFoundError("Media file not found: " + mediaPath);
    }

    Job job;
    job.id = GenerateId();
    job.name = name.empty() ? fs::path(normalized).filename().string() : name;
    job.mediaPath = normalized;
    job.status = JobStatus::Waiting;
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;
    m_repository->insert(job);

    std::cout << "[TranscriptionScheduler] Registered " << job.name << " as " << job.id << std::endl;
    return job;
}

std::vector<Job> TranscriptionScheduler::listJobs() {
    return m_repository->findAll();
}

Job TranscriptionScheduler::getJob(const std::string& jobId) {
    return requireJob(jobId);
}

std::shared_future<RunOutcome> TranscriptionScheduler::launch(const Job& job, bool fresh) {
    RunRequest request;
    request.jobId = job.id;
    request.mediaPath = job.mediaPath;
    request.knownDuration = job.progress.duration;
    if (!fresh) {
        request.priorSegments = job.segments;
        request.resumeOffset = ResolveResumeOffset(job.segments, job.progress);
        request.baseElapsed = job.elapsedSeconds.value_or(0.0);
    }

    const std::string jobId = job.id;
    request.onStarted = [this, jobId, fresh] {
        JobUpdate update = JobUpdate::Status(m_executor->isPaused(jobId) ? JobStatus::Paused : JobStatus::Transcribing);
        if (fresh) {
            update.segments = std::vector<domain::Segment>{};
            update.clearProgress = true;
            update.elapsedSeconds = 0.0;
        }
        m_repository->update(jobId, update);
    };
    request.onSnapshot = [this](const RunSnapshot& snap) {
        JobUpdate update = SnapshotUpdate(snap);
        if (snap.final) {
            update.status = JobStatus::Done;
        }
        m_repository->update(snap.jobId, update);
    };
    request.onSettled = [this](const RunOutcome& outcome) {
        if (outcome.state == RunState::Completed) {
            return;
        }
        JobUpdate update;
        update.status = outcome.state == RunState::Cancelled ? JobStatus::Interrupted : JobStatus::Error;
        update.segments = outcome.segments;
        update.progress = outcome.progress;
        update.elapsedSeconds = outcome.elapsedSeconds;
        m_repository->update(outcome.jobId, update);
    };

    return m_executor->start(std::move(request));
}

TranscriptionResult TranscriptionScheduler::submit(const std::string& jobId) {
    std::shared_future<RunOutcome> future;
    {
        std::lock_guard<std::mutex> lock(m_controlMutex);
        Job job = requireJob(jobId);
        if (m_executor->currentJobId() == jobId) {
            throw domain::AlreadyRunningError(jobId);
        }
        std::error_code ec;
        if (!fs::exists(job.mediaPath, ec)) {
            throw domain::NotFoundError("Media file not found on disk: " + job.mediaPath);
        }
        future = launch(job, job.status == JobStatus::Done);
    }

    const RunOutcome& outcome = future.get();
    switch (outcome.state) {
        case RunState::Completed: {
            TranscriptionResult result;
            result.jobId = outcome.jobId;
            result.segments = outcome.segments;
            result.progress = outcome.progress;
            result.elapsedSeconds = outcome.elapsedSeconds;
            return result;
        }
        case RunState::Cancelled:
            throw domain::CancelledError();
        case RunState::Failed:
            break;
    }
    if (outcome.errorCode == domain::SchedulerErrorCode::Persistence) {
        throw domain::PersistenceError(outcome.error);
    }
    throw domain::EngineFailureError(outcome.error);
}

void TranscriptionScheduler::runQueued(const Job& queued) {
    std::shared_future<RunOutcome> future;
    {
        std::lock_guard<std::mutex> lock(m_controlMutex);
        // A stop-all may have reverted the job after the worker picked it.
        auto job = m_repository->findById(queued.id);
        if (!job || job->status != JobStatus::Queued) {
            return;
        }
        future = launch(*job, false);
    }
    const RunOutcome& outcome = future.get();
    if (outcome.state == RunState::Failed) {
        std::cerr << "[TranscriptionScheduler] Queued job " << outcome.jobId << " failed: " << outcome.error << std::endl;
    }
}

ProgressReport TranscriptionScheduler::pause(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    Job job = requireJob(jobId);
    if (m_executor->isPaused(jobId)) {
        throw domain::PreconditionFailedError("Job is already paused: " + jobId);
    }

    auto snap = m_executor->pause(jobId, [this](const RunSnapshot& s) {
        JobUpdate update = SnapshotUpdate(s);
        update.status = JobStatus::Paused;
        m_repository->update(s.jobId, update);
    });
    if (snap) {
        ProgressReport report;
        report.progress = snap->progress;
        report.status = JobStatus::Paused;
        report.elapsedSeconds = snap->elapsedSeconds;
        report.live = true;
        return report;
    }

    if (job.status != JobStatus::Transcribing) {
        throw domain::PreconditionFailedError("Job is not transcribing: " + jobId + " is " + domain::StatusToString(job.status));
    }
    // No live session: keep the last persisted numbers so the caller sees consistent progress.
    m_repository->update(jobId, JobUpdate::Status(JobStatus::Paused));
    std::cout << "[TranscriptionScheduler] Job " << jobId << " had no live session, marked paused." << std::endl;

    ProgressReport report;
    report.progress = job.progress;
    report.status = JobStatus::Paused;
    report.elapsedSeconds = job.elapsedSeconds;
    return report;
}

void TranscriptionScheduler::resume(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    Job job = requireJob(jobId);

    if (m_executor->currentJobId() == jobId) {
        if (!m_executor->isPaused(jobId)) {
            throw domain::PreconditionFailedError("Job is not paused: " + jobId);
        }
        bool resumed = m_executor->resume(jobId, [this, &jobId] {
            m_repository->update(jobId, JobUpdate::Status(JobStatus::Transcribing));
        });
        if (resumed) {
            return;
        }
        // The session settled between the check and the resume; fall through and restart.
        job = requireJob(jobId);
    }

    if (!CanResumeWithoutSession(job.status)) {
        throw domain::PreconditionFailedError("Job cannot be resumed: " + jobId + " is " + domain::StatusToString(job.status));
    }
    launch(job, false);
    std::cout << "[TranscriptionScheduler] Job " << jobId << " restarted from its resume offset." << std::endl;
}

void TranscriptionScheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    m_worker->requestStop();

    for (const auto& job : m_repository->findByStatus(JobStatus::Queued)) {
        m_repository->update(job.id, JobUpdate::Status(JobStatus::Waiting));
    }

    auto current = m_executor->currentJobId();
    CancelResult result = m_executor->cancel(std::nullopt, m_options.stopAllTimeout);
    if (current) {
        std::cout << "[TranscriptionScheduler] Stop-all interrupted job " << *current
                  << (result == CancelResult::TimedOut ? " (still unwinding)" : "") << std::endl;
    }
}

bool TranscriptionScheduler::cancelJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    Job job = requireJob(jobId);

    CancelResult result = m_executor->cancel(jobId, m_options.cancelTimeout);
    if (result != CancelResult::NotRunning) {
        return true;
    }
    if (job.status == JobStatus::Transcribing || job.status == JobStatus::Paused) {
        m_repository->update(jobId, JobUpdate::Status(JobStatus::Interrupted));
        return true;
    }
    return false;
}

ProgressReport TranscriptionScheduler::getProgress(const std::string& jobId) {
    Job job = requireJob(jobId);

    ProgressReport report;
    if (auto entry = m_progress->get(job.mediaPath)) {
        report.progress = entry->progress;
        report.status = entry->status;
        report.live = true;
        if (auto snap = m_executor->snapshot(jobId)) {
            report.elapsedSeconds = snap->elapsedSeconds;
        }
        return report;
    }
    report.progress = job.progress;
    report.status = job.status;
    report.elapsedSeconds = job.elapsedSeconds;
    return report;
}

EnqueueResult TranscriptionScheduler::enqueue(const std::vector<std::string>& jobIds) {
    EnqueueResult result;
    {
        std::lock_guard<std::mutex> lock(m_controlMutex);
        std::vector<Job> jobs;
        jobs.reserve(jobIds.size());
        for (const auto& id : jobIds) {
            jobs.push_back(requireJob(id));
        }

        for (const auto& job : jobs) {
            switch (job.status) {
                case JobStatus::Waiting:
                case JobStatus::Interrupted:
                case JobStatus::Error:
                    m_repository->update(job.id, JobUpdate::Status(JobStatus::Queued));
                    result.queued.push_back(job.id);
                    break;
                case JobStatus::Queued:
                    result.queued.push_back(job.id);
                    break;
                case JobStatus::Transcribing:
                case JobStatus::Paused:
                case JobStatus::Done:
                    result.skipped.push_back(job.id);
                    break;
            }
        }
    }

    if (!result.queued.empty()) {
        m_worker->ensureRunning();
    }
    return result;
}

bool TranscriptionScheduler::removeJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    requireJob(jobId);
    if (m_executor->cancel(jobId, m_options.cancelTimeout) == CancelResult::TimedOut) {
        std::cerr << "[TranscriptionScheduler] Removing job " << jobId << " before its run settled." << std::endl;
    }
    return m_repository->remove(jobId);
}

bool TranscriptionScheduler::isBusy() const {
    return m_executor->isBusy();
}

std::optional<std::string> TranscriptionScheduler::currentJobId() const {
    return m_executor->currentJobId();
}

bool TranscriptionScheduler::waitUntilIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    if (!m_worker->waitUntilIdle(timeout)) {
        return false;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }
    return m_executor->waitForIdle(remaining);
}

} // namespace stenodesk::application
