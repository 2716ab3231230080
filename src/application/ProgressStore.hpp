/**
 * @file ProgressStore.hpp
 * @brief Live progress of running transcriptions, keyed by media path.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "domain/Job.hpp"

namespace stenodesk::application {

/**
 * @struct ProgressEntry
 * @brief Live progress of one media file.
 */
struct ProgressEntry {
    domain::JobProgress progress;
    domain::JobStatus status = domain::JobStatus::Transcribing;
};

/**
 * @class ProgressStore
 * @brief Process-local progress map. Lost on restart.
 *
 * Keys are normalized absolute media paths so that any request deriving
 * the path from a job record finds the same entry.
 */
class ProgressStore {
public:
    /** @brief Creates or replaces the entry for a run starting at startOffset. */
    void begin(const std::string& mediaPath, std::optional<double> duration, double startOffset);

    /**
     * @brief Moves current forward to segmentEnd. Never regresses.
     * @return The entry after the update, or nullopt if no entry exists.
     */
    std::optional<ProgressEntry> advance(const std::string& mediaPath, double segmentEnd);

    void setStatus(const std::string& mediaPath, domain::JobStatus status);

    /** @brief 100% (when the duration is known) and status done. */
    std::optional<ProgressEntry> markDone(const std::string& mediaPath);

    std::optional<ProgressEntry> get(const std::string& mediaPath) const;

    void clear(const std::string& mediaPath);

    size_t size() const;

private:
    static std::string Key(const std::string& mediaPath);

    mutable std::mutex m_mutex;
    std::map<std::string, ProgressEntry> m_entries;
};

} // namespace stenodesk::application
