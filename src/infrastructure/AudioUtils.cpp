#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace stenodesk::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

int AudioUtils::ExecCmd(const std::string& cmd) {
    return std::system(cmd.c_str());
}

bool AudioUtils::ConvertAudioToWav(const std::string& inputPath, std::string& outputPath, std::string& error) {
    static std::atomic<unsigned> counter{0};
    fs::path tempPath = fs::temp_directory_path() /
        (fs::path(inputPath).stem().string() + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".wav");
    outputPath = tempPath.string();

    std::error_code ec;
    fs::remove(tempPath, ec);

    std::string cmd = "ffmpeg -y -loglevel error -i " + ShellQuote(inputPath) +
                      " -ar 16000 -ac 1 -c:a pcm_s16le " + ShellQuote(outputPath);
    
    int ret = ExecCmd(cmd);
    if (ret != 0) {
        error = "ffmpeg failed to convert " + inputPath + " (is ffmpeg installed?)";
        return false;
    }
    
    if (!fs::exists(outputPath)) {
        error = "Converted file not found: " + outputPath;
        return false;
    }

    return true;
}

bool AudioUtils::LoadAudioSDL(const std::string& fname, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioSpec targetSpec;
    SDL_zero(targetSpec);
    targetSpec.freq = kSampleRate;
    targetSpec.format = AUDIO_F32SYS;
    targetSpec.channels = 1;

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          targetSpec.format, targetSpec.channels, targetSpec.freq) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = wavLength;
    cvt.buf = (Uint8 *)SDL_malloc(cvt.len * cvt.len_mult);
    if (!cvt.buf) {
        error = "Out of memory converting " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);
    
    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    int sampleCount = cvt.len_cvt / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, cvt.len_cvt);

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);
    
    return true;
}

bool AudioUtils::IsWavPath(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wav";
}

bool AudioUtils::LoadMedia(const std::string& mediaPath, std::vector<float>& pcmf32, std::string& error) {
    if (IsWavPath(mediaPath)) {
        return LoadAudioSDL(mediaPath, pcmf32, error);
    }

    std::string wavPath;
    if (!ConvertAudioToWav(mediaPath, wavPath, error)) {
        return false;
    }
    bool ok = LoadAudioSDL(wavPath, pcmf32, error);
    std::error_code ec;
    fs::remove(wavPath, ec);
    return ok;
}

} // namespace stenodesk::infrastructure
