#pragma once

#include "domain/TranscriptionEngine.hpp"
#include <memory>
#include <mutex>
#include <string>

struct whisper_context;

namespace stenodesk::infrastructure {

/**
 * @class WhisperCppEngine
 * @brief whisper.cpp backed engine.
 *
 * The model is loaded on first use and shared by all runs. Inference runs on
 * its own thread and hands segments over one at a time, so a consumer parked
 * at the pause gate also parks inference. Closing the stream aborts it.
 */
class WhisperCppEngine : public domain::TranscriptionEngine {
public:
    WhisperCppEngine(const std::string& modelPath, const std::string& language, int threads);
    ~WhisperCppEngine() override;

    std::unique_ptr<domain::SegmentStream> transcribe(const std::string& mediaPath, double resumeOffset) override;

private:
    bool loadModel(std::string& errorMsg);

    std::string m_modelPath;
    std::string m_language;
    int m_threads;

    // One context; runs are serialized on m_inferenceMutex.
    whisper_context* m_ctx = nullptr;
    std::mutex m_loadMutex;
    std::shared_ptr<std::mutex> m_inferenceMutex;
};

} // namespace stenodesk::infrastructure
