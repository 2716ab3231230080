#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

#include "domain/SchedulerErrors.hpp"
#include "infrastructure/JobRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestSupport.hpp"

using namespace stenodesk;
using domain::Job;
using domain::JobStatus;
using domain::JobUpdate;
using test::MakeSegments;
using test::Near;

namespace {

Job MakeJob(const std::string& id, std::chrono::system_clock::time_point created) {
    Job job;
    job.id = id;
    job.name = id + ".mp3";
    job.mediaPath = "/media/" + id + ".mp3";
    job.createdAt = created;
    job.updatedAt = created;
    return job;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JobRepositoryFs Test..." << std::endl;

    test::TempDir dir("jobrepo");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto t0 = std::chrono::system_clock::now();

    {
        infrastructure::JobRepositoryFs repo(dir.str(), persistence);
        repo.insert(MakeJob("aaa", t0));
        repo.insert(MakeJob("bbb", t0 + std::chrono::seconds(1)));
        repo.insert(MakeJob("ccc", t0 + std::chrono::seconds(2)));

        bool duplicate = false;
        try {
            repo.insert(MakeJob("aaa", t0));
        } catch (const domain::PersistenceError&) {
            duplicate = true;
        }
        assert(duplicate);

        JobUpdate snapshot;
        snapshot.status = JobStatus::Paused;
        snapshot.segments = MakeSegments(3);
        snapshot.elapsedSeconds = 12.5;
        snapshot.progress = domain::JobProgress::Make(30.0, 100.0);
        repo.update("bbb", snapshot);

        bool missing = false;
        try {
            repo.update("zzz", JobUpdate::Status(JobStatus::Done));
        } catch (const domain::NotFoundError&) {
            missing = true;
        }
        assert(missing);
        std::cout << "[PASS] Insert and partial update." << std::endl;

        // Queue order: updatedAt, then createdAt.
        repo.update("ccc", JobUpdate::Status(JobStatus::Queued));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        repo.update("aaa", JobUpdate::Status(JobStatus::Queued));
        auto oldest = repo.findOldestQueued();
        assert(oldest && oldest->id == "ccc");
        repo.update("ccc", JobUpdate::Status(JobStatus::Done));
        assert(repo.findOldestQueued()->id == "aaa");
        assert(repo.findByStatus(JobStatus::Done).size() == 1);
        std::cout << "[PASS] Oldest queued job first." << std::endl;
    }

    // Reload from disk.
    infrastructure::JobRepositoryFs reloaded(dir.str(), persistence);
    auto all = reloaded.findAll();
    assert(all.size() == 3);
    assert(all[0].id == "aaa" && all[1].id == "bbb" && all[2].id == "ccc");

    auto bbb = reloaded.findById("bbb");
    assert(bbb);
    assert(bbb->status == JobStatus::Paused);
    assert(bbb->segments == MakeSegments(3));
    assert(bbb->elapsedSeconds && Near(*bbb->elapsedSeconds, 12.5));
    assert(Near(bbb->progress.current, 30.0));
    assert(bbb->progress.duration && Near(*bbb->progress.duration, 100.0));
    assert(bbb->progress.percent && Near(*bbb->progress.percent, 30.0));
    assert(std::chrono::duration_cast<std::chrono::milliseconds>(bbb->createdAt.time_since_epoch()).count() ==
           std::chrono::duration_cast<std::chrono::milliseconds>((t0 + std::chrono::seconds(1)).time_since_epoch()).count());
    std::cout << "[PASS] Records survive a reload." << std::endl;

    // On-disk field names.
    {
        std::ifstream in(dir.path() / "jobs" / "bbb.json");
        nlohmann::json j;
        in >> j;
        assert(j["status"] == "paused");
        assert(j["transcription"].size() == 3);
        assert(j["transcribe_elapsed"].get<double>() == 12.5);
        assert(j["transcribe_progress"].get<double>() == 30.0);
        assert(j["transcribe_progress_current"].get<double>() == 30.0);
        assert(j["transcribe_progress_duration"].get<double>() == 100.0);
    }
    std::cout << "[PASS] Persisted field names." << std::endl;

    // Unknown status strings load as waiting.
    {
        std::ofstream out(dir.path() / "jobs" / "legacy.json");
        out << R"({"id":"legacy","status":"uploading","media_path":"/m.wav"})";
    }
    infrastructure::JobRepositoryFs withLegacy(dir.str(), persistence);
    assert(withLegacy.findById("legacy")->status == JobStatus::Waiting);

    assert(withLegacy.remove("legacy"));
    assert(!withLegacy.remove("legacy"));
    assert(!std::filesystem::exists(dir.path() / "jobs" / "legacy.json"));
    std::cout << "[PASS] Legacy status and removal." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
