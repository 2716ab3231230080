/**
 * @file WhisperCppEngine.cpp
 * @brief Implementation of the WhisperCppEngine class.
 */
#include "infrastructure/WhisperCppEngine.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/SchedulerErrors.hpp"
#include "whisper.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

namespace stenodesk::infrastructure {

namespace {

/** @brief Capacity-1 hand-off between the inference thread and the consumer. */
struct Handoff {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<domain::Segment> slot;
    bool finished = false;
    std::string error;
    std::atomic<bool> aborted{false};
};

class WhisperSegmentStream : public domain::SegmentStream {
public:
    WhisperSegmentStream(whisper_context* ctx,
                         std::shared_ptr<std::mutex> inferenceMutex,
                         std::vector<float> pcm,
                         double resumeOffset,
                         std::string language,
                         int threads)
        : m_state(std::make_shared<Handoff>()),
          m_duration(AudioUtils::DurationSeconds(pcm)) {
        m_thread = std::thread([ctx, inferenceMutex, state = m_state, pcm = std::move(pcm),
                                resumeOffset, language = std::move(language), threads]() {
            std::lock_guard<std::mutex> inference(*inferenceMutex);

            whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
            wparams.print_progress = false;
            wparams.print_special = false;
            wparams.print_realtime = false;
            wparams.print_timestamps = false;
            wparams.language = language.c_str();
            wparams.n_threads = threads;
            wparams.offset_ms = static_cast<int>(resumeOffset * 1000.0);

            wparams.new_segment_callback = [](whisper_context*, whisper_state* wstate, int n_new, void* user_data) {
                auto* handoff = static_cast<Handoff*>(user_data);
                const int total = whisper_full_n_segments_from_state(wstate);
                for (int i = total - n_new; i < total; ++i) {
                    domain::Segment seg;
                    seg.start = whisper_full_get_segment_t0_from_state(wstate, i) * 0.01;
                    seg.end = whisper_full_get_segment_t1_from_state(wstate, i) * 0.01;
                    const char* text = whisper_full_get_segment_text_from_state(wstate, i);
                    seg.text = text ? text : "";

                    std::unique_lock<std::mutex> lock(handoff->mutex);
                    handoff->cv.wait(lock, [handoff] { return !handoff->slot || handoff->aborted.load(); });
                    if (handoff->aborted) {
                        return;
                    }
                    handoff->slot = std::move(seg);
                    handoff->cv.notify_all();
                }
            };
            wparams.new_segment_callback_user_data = state.get();

            wparams.abort_callback = [](void* data) -> bool {
                return static_cast<Handoff*>(data)->aborted.load();
            };
            wparams.abort_callback_user_data = state.get();

            int rc = whisper_full(ctx, wparams, pcm.data(), static_cast<int>(pcm.size()));

            std::lock_guard<std::mutex> lock(state->mutex);
            if (rc != 0 && !state->aborted) {
                state->error = "Whisper inference failed (code " + std::to_string(rc) + ")";
            }
            state->finished = true;
            state->cv.notify_all();
        });
    }

    ~WhisperSegmentStream() override {
        close();
    }

    std::optional<double> duration() const override {
        return m_duration;
    }

    std::optional<domain::Segment> next() override {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->cv.wait(lock, [this] { return m_state->slot || m_state->finished || m_state->aborted.load(); });
        if (m_state->slot) {
            std::optional<domain::Segment> seg = std::move(m_state->slot);
            m_state->slot.reset();
            m_state->cv.notify_all();
            return seg;
        }
        if (!m_state->error.empty()) {
            throw domain::EngineFailureError(m_state->error);
        }
        return std::nullopt;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            m_state->aborted = true;
        }
        m_state->cv.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

private:
    std::shared_ptr<Handoff> m_state;
    double m_duration;
    std::thread m_thread;
};

} // namespace

WhisperCppEngine::WhisperCppEngine(const std::string& modelPath, const std::string& language, int threads)
    : m_modelPath(modelPath),
      m_language(language.empty() ? "auto" : language),
      m_threads(threads > 0 ? threads : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      m_inferenceMutex(std::make_shared<std::mutex>()) {
    // Loaded on first use so startup stays fast.
}

WhisperCppEngine::~WhisperCppEngine() {
    std::lock_guard<std::mutex> inference(*m_inferenceMutex);
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppEngine::loadModel(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_loadMutex);
    if (m_ctx) return true;
    
    if (!std::filesystem::exists(m_modelPath)) {
        errorMsg = "Model file not found at " + m_modelPath + ". Download a ggml model (e.g. ggml-base.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        errorMsg = "Failed to initialize the whisper context from " + m_modelPath;
        return false;
    }

    std::cout << "[WhisperCppEngine] Loaded model " << m_modelPath << std::endl;
    return true;
}

std::unique_ptr<domain::SegmentStream> WhisperCppEngine::transcribe(const std::string& mediaPath, double resumeOffset) {
    if (!std::filesystem::exists(mediaPath)) {
        throw domain::EngineFailureError("Audio file not found: " + mediaPath);
    }

    std::string error;
    if (!loadModel(error)) {
        throw domain::EngineFailureError(error);
    }

    std::vector<float> pcmf32;
    if (!AudioUtils::LoadMedia(mediaPath, pcmf32, error)) {
        throw domain::EngineFailureError("Failed to load audio: " + error);
    }

    std::cout << "[WhisperCppEngine] Decoding " << mediaPath << " from " << resumeOffset << "s of "
              << AudioUtils::DurationSeconds(pcmf32) << "s" << std::endl;
    return std::make_unique<WhisperSegmentStream>(m_ctx, m_inferenceMutex, std::move(pcmf32), resumeOffset, m_language, m_threads);
}

} // namespace stenodesk::infrastructure
