#include "infrastructure/ScriptTranscriptionEngine.hpp"
#include "domain/SchedulerErrors.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

namespace stenodesk::infrastructure {

using json = nlohmann::json;

namespace {

class ScriptSegmentStream : public domain::SegmentStream {
public:
    ScriptSegmentStream(pid_t pid, FILE* out) : m_pid(pid), m_out(out) {
        readHeader();
    }

    ~ScriptSegmentStream() override {
        close();
    }

    std::optional<double> duration() const override {
        return m_duration;
    }

    std::optional<domain::Segment> next() override {
        if (m_closed) {
            return std::nullopt;
        }
        if (m_pending) {
            auto seg = std::move(m_pending);
            m_pending.reset();
            return seg;
        }
        std::string line;
        while (readLine(line)) {
            if (line.empty()) continue;
            json j = parse(line);
            if (j.contains("duration") && !j.contains("text")) {
                continue;
            }
            return toSegment(j);
        }
        finish();
        return std::nullopt;
    }

    void close() override {
        m_closed = true;
        if (m_pid > 0) {
            ::kill(m_pid, SIGTERM);
        }
        reap();
    }

private:
    void readHeader() {
        std::string line;
        while (readLine(line)) {
            if (line.empty()) continue;
            json j = parse(line);
            if (j.contains("duration")) {
                if (j["duration"].is_number()) {
                    m_duration = j["duration"].get<double>();
                }
                return;
            }
            // No header: the first line is already a segment.
            m_pending = toSegment(j);
            return;
        }
    }

    bool readLine(std::string& line) {
        line.clear();
        if (!m_out) return false;
        char buf[4096];
        while (std::fgets(buf, sizeof(buf), m_out)) {
            line += buf;
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
                return true;
            }
        }
        return !line.empty();
    }

    json parse(const std::string& line) {
        try {
            return json::parse(line);
        } catch (const json::parse_error& e) {
            close();
            throw domain::EngineFailureError("Malformed transcription output: " + std::string(e.what()));
        }
    }

    domain::Segment toSegment(const json& j) {
        try {
            domain::Segment seg;
            seg.start = j.at("start").get<double>();
            seg.end = j.at("end").get<double>();
            seg.text = j.at("text").get<std::string>();
            return seg;
        } catch (const json::exception& e) {
            close();
            throw domain::EngineFailureError("Malformed segment: " + std::string(e.what()));
        }
    }

    void finish() {
        int status = reap();
        if (status != 0) {
            throw domain::EngineFailureError("Transcription script failed with code: " + std::to_string(status));
        }
    }

    int reap() {
        if (m_out) {
            std::fclose(m_out);
            m_out = nullptr;
        }
        if (m_pid <= 0) {
            return m_exitCode;
        }
        int status = 0;
        while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {
        }
        m_pid = -1;
        m_exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return m_exitCode;
    }

    pid_t m_pid;
    FILE* m_out;
    int m_exitCode = 0;
    bool m_closed = false;
    std::optional<double> m_duration;
    std::optional<domain::Segment> m_pending;
};

} // namespace

ScriptTranscriptionEngine::ScriptTranscriptionEngine(const std::string& interpreterPath, const std::string& scriptPath)
    : m_interpreterPath(interpreterPath)
    , m_scriptPath(scriptPath)
{}

std::unique_ptr<domain::SegmentStream> ScriptTranscriptionEngine::transcribe(const std::string& mediaPath, double resumeOffset) {
    if (!std::filesystem::exists(mediaPath)) {
        throw domain::EngineFailureError("Audio file not found: " + mediaPath);
    }

    std::ostringstream offset;
    offset << std::fixed << std::setprecision(3) << resumeOffset;
    std::vector<std::string> args = {m_interpreterPath, m_scriptPath, mediaPath, "--offset", offset.str()};

    // Built before fork(): the child may only make async-signal-safe calls.
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // Close-on-exec keeps the pipe out of other children; dup2 clears it on stdout.
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw domain::EngineFailureError("pipe2() failed: " + std::string(std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw domain::EngineFailureError("fork() failed: " + std::string(std::strerror(errno)));
    }
    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    FILE* out = ::fdopen(fds[0], "r");
    if (!out) {
        ::close(fds[0]);
        ::kill(pid, SIGTERM);
        ::waitpid(pid, nullptr, 0);
        throw domain::EngineFailureError("fdopen() failed: " + std::string(std::strerror(errno)));
    }

    std::cout << "[ScriptTranscriptionEngine] Running: " << m_interpreterPath << " " << m_scriptPath << " "
              << mediaPath << " --offset " << offset.str() << std::endl;
    return std::make_unique<ScriptSegmentStream>(pid, out);
}

} // namespace stenodesk::infrastructure
