#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/SingleSlotExecutor.hpp"
#include "test/TestSupport.hpp"

using namespace stenodesk;
using namespace stenodesk::application;
using test::FakeTranscriptionEngine;
using test::MakeSegments;
using test::Near;
using std::chrono::milliseconds;

namespace {

struct Recorder {
    std::mutex mutex;
    std::vector<RunSnapshot> snapshots;
    std::vector<RunOutcome> outcomes;
    int started = 0;
};

RunRequest MakeRequest(const std::string& jobId, const std::string& media, Recorder& rec) {
    RunRequest request;
    request.jobId = jobId;
    request.mediaPath = media;
    request.onStarted = [&rec] {
        std::lock_guard<std::mutex> lock(rec.mutex);
        ++rec.started;
    };
    request.onSnapshot = [&rec](const RunSnapshot& snap) {
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.snapshots.push_back(snap);
    };
    request.onSettled = [&rec](const RunOutcome& outcome) {
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.outcomes.push_back(outcome);
    };
    return request;
}

void TestCompletesAndSnapshotsAtCadence() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(12), 120.0);
    auto progress = std::make_shared<ProgressStore>();
    SingleSlotExecutor executor(engine, progress);
    Recorder rec;

    auto outcome = executor.start(MakeRequest("job-1", "/media/a.wav", rec)).get();
    assert(outcome.state == RunState::Completed);
    assert(outcome.segments == MakeSegments(12));
    assert(Near(outcome.progress.current, 120.0));
    assert(Near(*outcome.progress.percent, 100.0));

    // First segment, every 5th, then the final one.
    assert(rec.started == 1);
    assert(rec.snapshots.size() == 4);
    assert(rec.snapshots[0].segments.size() == 1);
    assert(rec.snapshots[1].segments.size() == 5);
    assert(rec.snapshots[2].segments.size() == 10);
    assert(rec.snapshots[3].final && rec.snapshots[3].segments.size() == 12);

    double last = 0.0;
    for (const auto& snap : rec.snapshots) {
        assert(snap.progress.current >= last);
        last = snap.progress.current;
    }

    assert(!executor.isBusy());
    assert(progress->size() == 0);
    assert(engine->closedStreams() == 1);
    std::cout << "[PASS] Run completes with bounded snapshot cadence." << std::endl;
}

void TestSecondStartFailsWhileBusy() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(5), 50.0);
    SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
    Recorder recA, recB;

    engine->holdAt(2);
    auto future = executor.start(MakeRequest("job-a", "/media/a.wav", recA));
    assert(engine->waitUntilHeld());
    assert(executor.isRunning("/media/./a.wav"));
    assert(!executor.isRunning("/media/b.wav"));

    bool rejected = false;
    try {
        executor.start(MakeRequest("job-b", "/media/b.wav", recB));
    } catch (const domain::AlreadyRunningError& e) {
        rejected = e.runningJobId() == "job-a";
    }
    assert(rejected);

    engine->release();
    assert(future.get().state == RunState::Completed);
    assert(!executor.isBusy());

    auto second = executor.start(MakeRequest("job-b", "/media/b.wav", recB)).get();
    assert(second.state == RunState::Completed);
    std::cout << "[PASS] AlreadyRunning while the slot is held, free after settle." << std::endl;
}

void TestPauseResumeKeepsSegments() {
    test::ManualClock clock;
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(10), 100.0);
    auto progress = std::make_shared<ProgressStore>();
    SingleSlotExecutor executor(engine, progress, ExecutorOptions{}, clock.fn());
    Recorder rec;

    engine->holdAt(3);
    auto future = executor.start(MakeRequest("job-p", "/media/p.wav", rec));
    assert(engine->waitUntilHeld());
    clock.advance(std::chrono::seconds(10));

    std::optional<RunSnapshot> persisted;
    auto snap = executor.pause("job-p", [&](const RunSnapshot& s) { persisted = s; });
    assert(snap && persisted);
    assert(Near(snap->progress.current, 30.0));
    assert(Near(snap->elapsedSeconds, 10.0));
    assert(executor.isPaused("job-p"));
    assert(progress->get("/media/p.wav")->status == domain::JobStatus::Paused);

    // The engine delivers one more segment; it stays parked at the gate.
    engine->release();
    clock.advance(std::chrono::seconds(300));
    std::this_thread::sleep_for(milliseconds(100));
    assert(Near(executor.snapshot("job-p")->progress.current, 30.0));
    assert(Near(executor.snapshot("job-p")->elapsedSeconds, 10.0));

    bool persistedResume = false;
    assert(executor.resume("job-p", [&] { persistedResume = true; }));
    assert(persistedResume);

    auto outcome = future.get();
    assert(outcome.state == RunState::Completed);
    assert(outcome.segments == MakeSegments(10));
    assert(Near(outcome.elapsedSeconds, 10.0));
    assert(!executor.resume("job-p"));
    std::cout << "[PASS] Pause then resume replays nothing and excludes paused time." << std::endl;
}

void TestCancelWhilePaused() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(10), 100.0);
    SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
    Recorder rec;

    engine->holdAt(2);
    auto future = executor.start(MakeRequest("job-c", "/media/c.wav", rec));
    assert(engine->waitUntilHeld());
    assert(executor.pause("job-c"));
    engine->release();

    assert(executor.cancel(std::string("other-job"), milliseconds(100)) == CancelResult::NotRunning);
    assert(executor.cancel(std::string("job-c"), milliseconds(1500)) == CancelResult::Settled);
    assert(!executor.isBusy());
    assert(!executor.currentJobId());

    auto outcome = future.get();
    assert(outcome.state == RunState::Cancelled);
    assert(outcome.segments.size() == 2);
    assert(rec.outcomes.size() == 1 && rec.outcomes[0].state == RunState::Cancelled);
    assert(engine->closedStreams() == 1);
    assert(executor.cancel(std::nullopt, milliseconds(10)) == CancelResult::NotRunning);
    std::cout << "[PASS] Cancel of a paused job settles within the timeout." << std::endl;
}

void TestResumeDropsBoundarySegment() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(6), 60.0);
    engine->setReemitBoundary(true);
    SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
    Recorder rec;

    RunRequest request = MakeRequest("job-r", "/media/r.wav", rec);
    request.priorSegments = MakeSegments(3);
    request.resumeOffset = 30.0;
    request.baseElapsed = 7.0;
    request.knownDuration = 60.0;

    auto outcome = executor.start(std::move(request)).get();
    assert(outcome.state == RunState::Completed);
    assert(outcome.segments == MakeSegments(6));
    assert(outcome.elapsedSeconds >= 7.0);
    assert(Near(engine->calls().back().second, 30.0));
    std::cout << "[PASS] Restarted run skips the re-emitted boundary segment." << std::endl;
}

void TestEngineFailure() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(3), 30.0);
    engine->failFor("/media/broken.wav");
    SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
    Recorder rec;

    auto outcome = executor.start(MakeRequest("job-f", "/media/broken.wav", rec)).get();
    assert(outcome.state == RunState::Failed);
    assert(outcome.errorCode == domain::SchedulerErrorCode::EngineFailure);
    assert(!outcome.error.empty());
    assert(!executor.isBusy());
    std::cout << "[PASS] Engine failure settles as Failed." << std::endl;
}

void TestFinalSnapshotFailureFailsRun() {
    auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(7), 70.0);
    SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
    Recorder rec;

    RunRequest request = MakeRequest("job-s", "/media/s.wav", rec);
    request.onSnapshot = [](const RunSnapshot& snap) {
        throw domain::PersistenceError(snap.final ? "disk full (final)" : "disk full");
    };
    auto outcome = executor.start(std::move(request)).get();
    assert(outcome.state == RunState::Failed);
    assert(outcome.errorCode == domain::SchedulerErrorCode::Persistence);
    assert(outcome.segments.size() == 7 && "Intermediate failures do not stop the stream.");
    std::cout << "[PASS] Intermediate snapshot failures are swallowed, the final one surfaces." << std::endl;
}

void TestPauseAfterFinalSnapshotIsRefused() {
    for (int round = 0; round < 20; ++round) {
        auto engine = std::make_shared<FakeTranscriptionEngine>(MakeSegments(3), 30.0);
        SingleSlotExecutor executor(engine, std::make_shared<ProgressStore>());
        Recorder rec;

        std::thread pauser;
        std::optional<RunSnapshot> paused;
        bool pausePersisted = false;
        RunRequest request = MakeRequest("job-f", "/media/f.wav", rec);
        request.onSnapshot = [&](const RunSnapshot& snap) {
            if (snap.final) {
                pauser = std::thread([&] {
                    paused = executor.pause("job-f", [&](const RunSnapshot&) { pausePersisted = true; });
                });
            }
        };

        auto outcome = executor.start(std::move(request)).get();
        pauser.join();
        assert(outcome.state == RunState::Completed);
        assert(!paused && "A finished run cannot be paused.");
        assert(!pausePersisted);
        assert(!executor.resume("job-f", {}));
    }
    std::cout << "[PASS] Pause racing the final snapshot is refused." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SingleSlotExecutor Test..." << std::endl;

    TestCompletesAndSnapshotsAtCadence();
    TestSecondStartFailsWhileBusy();
    TestPauseResumeKeepsSegments();
    TestCancelWhilePaused();
    TestResumeDropsBoundarySegment();
    TestEngineFailure();
    TestFinalSnapshotFailureFailsRun();
    TestPauseAfterFinalSnapshotIsRefused();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
