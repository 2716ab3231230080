/**
 * @file SchedulerErrors.hpp
 * @brief Typed failures reported by the transcription scheduler.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace stenodesk::domain {

enum class SchedulerErrorCode {
    AlreadyRunning,
    NotFound,
    PreconditionFailed,
    EngineFailure,
    Cancelled,
    Persistence
};

/**
 * @class SchedulerError
 * @brief Base of every error the scheduler surfaces to its callers.
 */
class SchedulerError : public std::runtime_error {
public:
    SchedulerError(SchedulerErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    SchedulerErrorCode code() const { return m_code; }

private:
    SchedulerErrorCode m_code;
};

/** @brief Another job occupies the executor slot. Not retried. */
class AlreadyRunningError : public SchedulerError {
public:
    explicit AlreadyRunningError(const std::string& runningJobId)
        : SchedulerError(SchedulerErrorCode::AlreadyRunning, "Another transcription is running: " + runningJobId),
          m_runningJobId(runningJobId) {}

    const std::string& runningJobId() const { return m_runningJobId; }

private:
    std::string m_runningJobId;
};

class NotFoundError : public SchedulerError {
public:
    explicit NotFoundError(const std::string& what)
        : SchedulerError(SchedulerErrorCode::NotFound, what) {}
};

/** @brief The job is not in a status that allows the requested transition. */
class PreconditionFailedError : public SchedulerError {
public:
    explicit PreconditionFailedError(const std::string& what)
        : SchedulerError(SchedulerErrorCode::PreconditionFailed, what) {}
};

class EngineFailureError : public SchedulerError {
public:
    explicit EngineFailureError(const std::string& what)
        : SchedulerError(SchedulerErrorCode::EngineFailure, what) {}
};

/** @brief Expected outcome of a stop request. Maps to the interrupted status, never to error. */
class CancelledError : public SchedulerError {
public:
    explicit CancelledError(const std::string& what = "Transcription interrupted")
        : SchedulerError(SchedulerErrorCode::Cancelled, what) {}
};

class PersistenceError : public SchedulerError {
public:
    explicit PersistenceError(const std::string& what)
        : SchedulerError(SchedulerErrorCode::Persistence, what) {}
};

} // namespace stenodesk::domain
