#include <cassert>
#include <chrono>
#include <iostream>

#include "application/ElapsedTimeTracker.hpp"
#include "test/TestSupport.hpp"

using namespace stenodesk::application;
using stenodesk::test::ManualClock;
using stenodesk::test::Near;
using std::chrono::seconds;

int main() {
    std::cout << "[Test] Starting ElapsedTimeTracker Test..." << std::endl;

    ManualClock clock;
    ElapsedTimeTracker tracker(clock.fn());

    // Stopped tracker reports its base.
    tracker.set(12.5, std::nullopt);
    assert(!tracker.isRunning());
    clock.advance(seconds(30));
    assert(Near(tracker.elapsed(), 12.5));
    std::cout << "[PASS] Base is reported while stopped." << std::endl;

    // Pause/resume cycles accumulate only active time.
    tracker.start(0.0);
    clock.advance(seconds(10));
    assert(Near(tracker.elapsed(), 10.0));
    assert(Near(tracker.pause(), 10.0));
    clock.advance(seconds(500));
    assert(Near(tracker.elapsed(), 10.0));
    tracker.resume();
    clock.advance(seconds(4));
    tracker.pause();
    clock.advance(seconds(60));
    tracker.resume();
    clock.advance(seconds(6));
    assert(Near(tracker.elapsed(), 20.0));
    std::cout << "[PASS] Paused time is excluded from elapsed." << std::endl;

    // resume() on a running tracker keeps the original start.
    tracker.resume();
    clock.advance(seconds(1));
    assert(Near(tracker.elapsed(), 21.0));

    // A second pause returns the frozen value.
    double frozen = tracker.pause();
    assert(Near(tracker.pause(), frozen));

    // Resuming from a persisted base.
    tracker.start(100.0);
    clock.advance(seconds(2));
    assert(Near(tracker.elapsed(), 102.0));

    tracker.clear();
    assert(!tracker.isRunning());
    assert(Near(tracker.elapsed(), 0.0));
    std::cout << "[PASS] Restart from base and clear." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
