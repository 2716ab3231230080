/**
 * @file TranscriptionEngine.hpp
 * @brief Interface for speech-to-text engines producing segment streams.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/Job.hpp"

namespace stenodesk::domain {

/**
 * @class SegmentStream
 * @brief Lazy, finite, non-restartable sequence of segments for one media file.
 */
class SegmentStream {
public:
    virtual ~SegmentStream() = default;

    /** @brief Total media duration in seconds, if the engine knows it. */
    virtual std::optional<double> duration() const = 0;

    /**
     * @brief Blocks until the engine produces the next segment.
     * Timestamps are absolute (already shifted by the resume offset).
     * @return std::nullopt once the media is exhausted.
     * @throws EngineFailureError if the engine fails mid-stream.
     */
    virtual std::optional<Segment> next() = 0;

    /** @brief Releases engine resources. Further next() calls return std::nullopt. */
    virtual void close() = 0;
};

/**
 * @class TranscriptionEngine
 * @brief Abstract speech-to-text engine.
 */
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    /**
     * @brief Starts decoding a media file.
     * @param mediaPath Path to the audio or video file.
     * @param resumeOffset Media time in seconds from which decoding restarts.
     * @throws EngineFailureError if the engine cannot start.
     */
    virtual std::unique_ptr<SegmentStream> transcribe(const std::string& mediaPath, double resumeOffset) = 0;
};

} // namespace stenodesk::domain
