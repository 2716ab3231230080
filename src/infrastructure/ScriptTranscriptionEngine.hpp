#pragma once

#include "domain/TranscriptionEngine.hpp"
#include <string>

namespace stenodesk::infrastructure {

/**
 * @class ScriptTranscriptionEngine
 * @brief Runs an external transcription script and streams its output.
 *
 * Command line: <interpreter> <script> <media> --offset <seconds>.
 * The script prints one JSON object per line on stdout: a header
 * {"duration": <seconds or null>} followed by {"start","end","text"} per segment.
 */
class ScriptTranscriptionEngine : public domain::TranscriptionEngine {
public:
    ScriptTranscriptionEngine(const std::string& interpreterPath, const std::string& scriptPath);
    ~ScriptTranscriptionEngine() override = default;

    std::unique_ptr<domain::SegmentStream> transcribe(const std::string& mediaPath, double resumeOffset) override;

private:
    std::string m_interpreterPath;
    std::string m_scriptPath;
};

} // namespace stenodesk::infrastructure
