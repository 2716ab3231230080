/**
 * @file TranscriptExporter.hpp
 * @brief Renders finished transcripts as subtitle or plain-text files.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Job.hpp"

namespace stenodesk::application {

enum class ExportFormat {
    Vtt,
    Srt,
    Txt
};

/**
 * @class TranscriptExporter
 * @brief Stateless subtitle writers.
 */
class TranscriptExporter {
public:
    /** @throws PreconditionFailedError for anything but "vtt", "srt" or "txt". */
    static ExportFormat ParseFormat(const std::string& name);

    static std::string Render(const std::vector<domain::Segment>& segments, ExportFormat format);

    static std::string ToVtt(const std::vector<domain::Segment>& segments);
    static std::string ToSrt(const std::vector<domain::Segment>& segments);
    static std::string ToTxt(const std::vector<domain::Segment>& segments);

    /** @brief HH:MM:SS.mmm, or HH:MM:SS,mmm for SRT. */
    static std::string FormatTimestamp(double seconds, bool srt);

    static std::string MimeType(ExportFormat format);
    static std::string Extension(ExportFormat format);
};

} // namespace stenodesk::application
