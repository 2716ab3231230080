/**
 * @file Job.cpp
 * @brief Implementation of the job value helpers.
 */

#include "domain/Job.hpp"

#include <algorithm>

namespace stenodesk::domain {

std::string StatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Waiting: return "waiting";
        case JobStatus::Queued: return "queued";
        case JobStatus::Transcribing: return "transcribing";
        case JobStatus::Paused: return "paused";
        case JobStatus::Interrupted: return "interrupted";
        case JobStatus::Done: return "done";
        case JobStatus::Error: return "error";
    }
    return "waiting";
}

JobStatus StatusFromString(const std::string& value) {
    if (value == "queued") return JobStatus::Queued;
    if (value == "transcribing") return JobStatus::Transcribing;
    if (value == "paused") return JobStatus::Paused;
    if (value == "interrupted") return JobStatus::Interrupted;
    if (value == "done") return JobStatus::Done;
    if (value == "error") return JobStatus::Error;
    return JobStatus::Waiting;
}

JobProgress JobProgress::Make(double current, std::optional<double> duration) {
    JobProgress p;
    p.current = std::max(current, 0.0);
    if (duration && *duration > 0.0) {
        p.duration = duration;
        p.current = std::min(p.current, *duration);
        p.percent = std::min(p.current / *duration * 100.0, 100.0);
    } else {
        p.duration = duration;
    }
    return p;
}

void JobUpdate::applyTo(Job& job) const {
    if (status) job.status = *status;
    if (segments) job.segments = *segments;

    if (elapsedSeconds) job.elapsedSeconds = elapsedSeconds;

    if (clearProgress) {
        job.progress = JobProgress{};
    } else if (progress) {
        job.progress = *progress;
    }

    job.updatedAt = std::chrono::system_clock::now();
}

} // namespace stenodesk::domain
