/**
 * @file JobRepositoryFs.cpp
 * @brief Implementation of JobRepositoryFs.
 */

#include "infrastructure/JobRepositoryFs.hpp"
#include "domain/SchedulerErrors.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stenodesk::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::Job;
using domain::JobStatus;

namespace {

std::string FormatUtc(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return out.str();
}

std::chrono::system_clock::time_point ParseUtc(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        in >> millis;
    }
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}

json OptionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<double> ReadOptionalNumber(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

} // namespace

JobRepositoryFs::JobRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence)
    : m_jobsDir((fs::path(dataRoot) / "jobs").string()), m_persistence(std::move(persistence)) {
    std::error_code ec;
    fs::create_directories(m_jobsDir, ec);
    if (ec) {
        std::cerr << "[JobRepositoryFs] Could not create " << m_jobsDir << ": " << ec.message() << std::endl;
    }
    loadAll();
}

json JobRepositoryFs::ToJson(const Job& job) {
    json segments = json::array();
    for (const auto& seg : job.segments) {
        segments.push_back({{"start", seg.start}, {"end", seg.end}, {"text", seg.text}});
    }

    json j;
    j["id"] = job.id;
    j["name"] = job.name;
    j["media_path"] = job.mediaPath;
    j["status"] = domain::StatusToString(job.status);
    j["transcription"] = segments;
    j["transcribe_elapsed"] = OptionalNumber(job.elapsedSeconds);
    j["transcribe_progress"] = OptionalNumber(job.progress.percent);
    j["transcribe_progress_current"] = job.progress.current;
    j["transcribe_progress_duration"] = OptionalNumber(job.progress.duration);
    j["created_at"] = FormatUtc(job.createdAt);
    j["updated_at"] = FormatUtc(job.updatedAt);
    return j;
}

Job JobRepositoryFs::FromJson(const json& j) {
    Job job;
    job.id = j.at("id").get<std::string>();
    job.name = j.value("name", "");
    job.mediaPath = j.value("media_path", "");
    job.status = domain::StatusFromString(j.value("status", "waiting"));

    if (j.contains("transcription") && j["transcription"].is_array()) {
        for (const auto& s : j["transcription"]) {
            domain::Segment seg;
            seg.start = s.value("start", 0.0);
            seg.end = s.value("end", 0.0);
            seg.text = s.value("text", "");
            job.segments.push_back(seg);
        }
    }

    job.elapsedSeconds = ReadOptionalNumber(j, "transcribe_elapsed");
    double current = ReadOptionalNumber(j, "transcribe_progress_current").value_or(0.0);
    job.progress = domain::JobProgress::Make(current, ReadOptionalNumber(j, "transcribe_progress_duration"));
    if (!job.progress.percent) {
        job.progress.percent = ReadOptionalNumber(j, "transcribe_progress");
    }

    job.createdAt = ParseUtc(j.value("created_at", ""));
    job.updatedAt = ParseUtc(j.value("updated_at", ""));
    return job;
}

void JobRepositoryFs::loadAll() {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_jobsDir, ec)) {
        if (entry.path().extension() != ".json") continue;
        try {
            std::ifstream in(entry.path());
            json j;
            in >> j;
            Job job = FromJson(j);
            m_jobs[job.id] = std::move(job);
        } catch (const std::exception& e) {
            std::cerr << "[JobRepositoryFs] Skipping unreadable record " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[JobRepositoryFs] Could not list " << m_jobsDir << ": " << ec.message() << std::endl;
    }
    std::cout << "[JobRepositoryFs] Loaded " << m_jobs.size() << " job(s) from " << m_jobsDir << std::endl;
}

std::string JobRepositoryFs::pathFor(const std::string& id) const {
    return (fs::path(m_jobsDir) / (id + ".json")).string();
}

void JobRepositoryFs::write(const Job& job) {
    if (!m_persistence->saveTextAsync(pathFor(job.id), ToJson(job).dump(2)).get()) {
        throw domain::PersistenceError("Could not write job " + job.id);
    }
}

void JobRepositoryFs::insert(const Job& job) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_jobs.count(job.id)) {
        throw domain::PersistenceError("Job already exists: " + job.id);
    }
    write(job);
    m_jobs[job.id] = job;
}

std::optional<Job> JobRepositoryFs::findById(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Job> JobRepositoryFs::findAll() {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, job] : m_jobs) {
            jobs.push_back(job);
        }
    }
    std::stable_sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        return a.createdAt < b.createdAt;
    });
    return jobs;
}

std::vector<Job> JobRepositoryFs::findByStatus(JobStatus status) {
    std::vector<Job> jobs;
    for (auto& job : findAll()) {
        if (job.status == status) {
            jobs.push_back(std::move(job));
        }
    }
    return jobs;
}

std::optional<Job> JobRepositoryFs::findOldestQueued() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Job* oldest = nullptr;
    for (const auto& [id, job] : m_jobs) {
        if (job.status != JobStatus::Queued) continue;
        if (!oldest || job.updatedAt < oldest->updatedAt ||
            (job.updatedAt == oldest->updatedAt && job.createdAt < oldest->createdAt)) {
            oldest = &job;
        }
    }
    if (!oldest) {
        return std::nullopt;
    }
    return *oldest;
}

void JobRepositoryFs::update(const std::string& id, const domain::JobUpdate& fields) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        throw domain::NotFoundError("Job not found: " + id);
    }
    Job updated = it->second;
    fields.applyTo(updated);
    write(updated);
    it->second = std::move(updated);
}

bool JobRepositoryFs::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return false;
    }
    if (!m_persistence->removeAsync(pathFor(id)).get()) {
        throw domain::PersistenceError("Could not delete job " + id);
    }
    m_jobs.erase(it);
    return true;
}

} // namespace stenodesk::infrastructure
