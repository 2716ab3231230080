/**
 * @file ProgressStore.cpp
 * @brief Implementation of ProgressStore.
 */

#include "application/ProgressStore.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>

namespace stenodesk::application {

using domain::JobProgress;
using domain::JobStatus;

std::string ProgressStore::Key(const std::string& mediaPath) {
    return infrastructure::PathUtils::NormalizeMediaPath(mediaPath);
}

void ProgressStore::begin(const std::string& mediaPath, std::optional<double> duration, double startOffset) {
    ProgressEntry entry;
    entry.progress = JobProgress::Make(startOffset, duration);
    entry.status = JobStatus::Transcribing;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[Key(mediaPath)] = entry;
}

std::optional<ProgressEntry> ProgressStore::advance(const std::string& mediaPath, double segmentEnd) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(Key(mediaPath));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    auto& entry = it->second;
    double current = std::max(entry.progress.current, segmentEnd);
    entry.progress = JobProgress::Make(current, entry.progress.duration);
    return entry;
}

void ProgressStore::setStatus(const std::string& mediaPath, JobStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(Key(mediaPath));
    if (it != m_entries.end()) {
        it->second.status = status;
    }
}

std::optional<ProgressEntry> ProgressStore::markDone(const std::string& mediaPath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(Key(mediaPath));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    auto& entry = it->second;
    if (entry.progress.duration) {
        entry.progress = JobProgress::Make(*entry.progress.duration, entry.progress.duration);
    }
    entry.status = JobStatus::Done;
    return entry;
}

std::optional<ProgressEntry> ProgressStore::get(const std::string& mediaPath) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(Key(mediaPath));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProgressStore::clear(const std::string& mediaPath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(Key(mediaPath));
}

size_t ProgressStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace stenodesk::application
