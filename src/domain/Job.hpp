/**
 * @file Job.hpp
 * @brief Transcription job record, its segments and progress.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stenodesk::domain {

/**
 * @enum JobStatus
 * @brief Lifecycle of a media item's transcription.
 */
enum class JobStatus {
    Waiting,
    Queued,
    Transcribing,
    Paused,
    Interrupted,
    Done,
    Error
};

std::string StatusToString(JobStatus status);

/** @brief Unknown strings fall back to Waiting. */
JobStatus StatusFromString(const std::string& value);

/**
 * @struct Segment
 * @brief A timestamped text span produced by the transcription engine.
 */
struct Segment {
    double start = 0.0; ///< Seconds from the beginning of the media.
    double end = 0.0;   ///< Seconds from the beginning of the media.
    std::string text;
};

inline bool operator==(const Segment& a, const Segment& b) {
    return a.start == b.start && a.end == b.end && a.text == b.text;
}

/**
 * @struct JobProgress
 * @brief How far the engine got into the media.
 */
struct JobProgress {
    double current = 0.0;
    std::optional<double> duration;
    std::optional<double> percent;

    /**
     * @brief Builds a progress value, clamping current to duration when known.
     * percent = min(current / duration * 100, 100); null while the duration is unknown.
     */
    static JobProgress Make(double current, std::optional<double> duration);
};

/**
 * @struct Job
 * @brief One media file's transcription unit of work.
 */
struct Job {
    std::string id;
    std::string name;
    std::string mediaPath;
    JobStatus status = JobStatus::Waiting;
    std::vector<Segment> segments;
    std::optional<double> elapsedSeconds;
    JobProgress progress;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
};

/**
 * @struct JobUpdate
 * @brief Partial update of a job record. Unset fields are left untouched.
 */
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<std::vector<Segment>> segments;
    std::optional<double> elapsedSeconds;
    std::optional<JobProgress> progress;
    bool clearProgress = false;

    static JobUpdate Status(JobStatus status) {
        JobUpdate u;
        u.status = status;
        return u;
    }

    void applyTo(Job& job) const;
};

} // namespace stenodesk::domain
