#pragma once

#include <string>
#include <vector>

namespace stenodesk::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    static constexpr int kSampleRate = 16000;

    /**
     * @brief Executes a system command.
     */
    static int ExecCmd(const std::string& cmd);

    /**
     * @brief Converts an audio or video file to 16kHz mono WAV using ffmpeg.
     * @param inputPath Path to source file.
     * @param outputPath Output path (a unique temp file, populated automatically).
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error);

    /**
     * @brief Loads a WAV file and converts it to 16kHz float32 mono (Whisper format).
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error);

    /** @brief True for a ".wav" extension in any letter case; those skip ffmpeg. */
    static bool IsWavPath(const std::string& path);

    /** @brief Converts when needed, then loads. Temp files are removed before returning. */
    static bool LoadMedia(const std::string& mediaPath, std::vector<float>& pcmf32, std::string& error);

    static double DurationSeconds(const std::vector<float>& pcmf32) {
        return static_cast<double>(pcmf32.size()) / kSampleRate;
    }
};

} // namespace stenodesk::infrastructure
