/**
 * @file TestSupport.hpp
 * @brief Scripted engine, manual clock and temp directories shared by the tests.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "domain/Job.hpp"
#include "domain/SchedulerErrors.hpp"
#include "domain/TranscriptionEngine.hpp"

namespace stenodesk::test {

inline bool Near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

/** @brief count segments of `step` seconds each: [0,10) "seg-0", [10,20) "seg-1", ... */
inline std::vector<domain::Segment> MakeSegments(int count, double step = 10.0) {
    std::vector<domain::Segment> segments;
    for (int i = 0; i < count; ++i) {
        segments.push_back({i * step, (i + 1) * step, "seg-" + std::to_string(i)});
    }
    return segments;
}

/**
 * @class TempDir
 * @brief Unique scratch directory removed on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        m_path = std::filesystem::temp_directory_path() /
                 ("stenodesk_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

    /** @brief Creates a placeholder media file and returns its path. */
    std::string touch(const std::string& filename) const {
        auto p = m_path / filename;
        std::ofstream(p) << "RIFF";
        return p.string();
    }

private:
    std::filesystem::path m_path;
};

/**
 * @class ManualClock
 * @brief Steady-clock stand-in advanced explicitly by the test.
 */
class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const {
        return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(m_ns.load()));
    }
    void advance(std::chrono::nanoseconds d) { m_ns += d.count(); }

    std::function<std::chrono::steady_clock::time_point()> fn() {
        return [this] { return now(); };
    }

private:
    std::atomic<long long> m_ns{1000000000LL};
};

/**
 * @class FakeTranscriptionEngine
 * @brief Replays a fixed segment script for every media file.
 *
 * A restarted stream skips segments that start before the resume offset, or
 * with reemitBoundary also repeats the one ending exactly at the offset.
 * holdAt(n) parks the stream inside next() once n segments were emitted in
 * total, until release() or another holdAt().
 */
class FakeTranscriptionEngine : public domain::TranscriptionEngine {
public:
    FakeTranscriptionEngine(std::vector<domain::Segment> script, std::optional<double> duration)
        : m_script(std::move(script)), m_duration(duration) {}

    std::unique_ptr<domain::SegmentStream> transcribe(const std::string& mediaPath, double resumeOffset) override {
        std::vector<domain::Segment> remaining;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.emplace_back(mediaPath, resumeOffset);
            if (m_failing.count(mediaPath)) {
                throw domain::EngineFailureError("Scripted engine failure for " + mediaPath);
            }
            for (const auto& seg : m_script) {
                bool keep = m_reemitBoundary ? seg.end >= resumeOffset : seg.start >= resumeOffset;
                if (keep) remaining.push_back(seg);
            }
        }
        return std::make_unique<Stream>(this, std::move(remaining));
    }

    void holdAt(int totalEmitted) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_holdAt = totalEmitted;
        m_held = false;
        m_cv.notify_all();
    }

    void release() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_holdAt.reset();
        m_held = false;
        m_cv.notify_all();
    }

    bool waitUntilHeld(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_held; });
    }

    void failFor(const std::string& mediaPath) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(mediaPath);
    }

    void setReemitBoundary(bool value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reemitBoundary = value;
    }

    void setSegmentDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_delay = delay;
    }

    std::vector<std::pair<std::string, double>> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    int emitted() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_emitted;
    }

    int closedStreams() const { return m_closed.load(); }

private:
    class Stream : public domain::SegmentStream {
    public:
        Stream(FakeTranscriptionEngine* engine, std::vector<domain::Segment> segments)
            : m_engine(engine), m_segments(std::move(segments)) {}

        std::optional<double> duration() const override { return m_engine->m_duration; }

        std::optional<domain::Segment> next() override {
            std::chrono::milliseconds delay;
            {
                std::unique_lock<std::mutex> lock(m_engine->m_mutex);
                if (m_closed) return std::nullopt;
                if (m_engine->m_holdAt && m_engine->m_emitted == *m_engine->m_holdAt) {
                    m_engine->m_held = true;
                    m_engine->m_cv.notify_all();
                    m_engine->m_cv.wait_for(lock, std::chrono::seconds(10), [this] {
                        return !m_engine->m_holdAt || m_engine->m_emitted != *m_engine->m_holdAt;
                    });
                }
                if (m_index >= m_segments.size()) return std::nullopt;
                ++m_engine->m_emitted;
                delay = m_engine->m_delay;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            return m_segments[m_index++];
        }

        void close() override {
            if (!m_closed) {
                m_closed = true;
                ++m_engine->m_closed;
            }
        }

    private:
        FakeTranscriptionEngine* m_engine;
        std::vector<domain::Segment> m_segments;
        size_t m_index = 0;
        bool m_closed = false;
    };

    std::vector<domain::Segment> m_script;
    std::optional<double> m_duration;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<int> m_holdAt;
    bool m_held = false;
    int m_emitted = 0;
    bool m_reemitBoundary = false;
    std::chrono::milliseconds m_delay{0};
    std::set<std::string> m_failing;
    std::vector<std::pair<std::string, double>> m_calls;
    std::atomic<int> m_closed{0};
};

} // namespace stenodesk::test
