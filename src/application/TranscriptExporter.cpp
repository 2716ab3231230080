/**
 * @file TranscriptExporter.cpp
 * @brief Implementation of TranscriptExporter.
 */

#include "application/TranscriptExporter.hpp"
#include "domain/SchedulerErrors.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace stenodesk::application {

ExportFormat TranscriptExporter::ParseFormat(const std::string& name) {
    if (name == "vtt") return ExportFormat::Vtt;
    if (name == "srt") return ExportFormat::Srt;
    if (name == "txt") return ExportFormat::Txt;
    throw domain::PreconditionFailedError("Unsupported export format: " + name);
}

std::string TranscriptExporter::Render(const std::vector<domain::Segment>& segments, ExportFormat format) {
    switch (format) {
        case ExportFormat::Vtt: return ToVtt(segments);
        case ExportFormat::Srt: return ToSrt(segments);
        case ExportFormat::Txt: return ToTxt(segments);
    }
    return ToTxt(segments);
}

std::string TranscriptExporter::FormatTimestamp(double seconds, bool srt) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    long long totalMs = static_cast<long long>(std::floor(seconds * 1000.0 + 0.5));
    long long hours = totalMs / 3600000;
    long long minutes = (totalMs % 3600000) / 60000;
    long long secs = (totalMs % 60000) / 1000;
    long long msecs = totalMs % 1000;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld%c%03lld", hours, minutes, secs, srt ? ',' : '.', msecs);
    return buf;
}

std::string TranscriptExporter::ToVtt(const std::vector<domain::Segment>& segments) {
    std::ostringstream out;
    out << "WEBVTT\n\n";
    for (const auto& seg : segments) {
        out << FormatTimestamp(seg.start, false) << " --> " << FormatTimestamp(seg.end, false) << "\n"
            << seg.text << "\n\n";
    }
    return out.str();
}

std::string TranscriptExporter::ToSrt(const std::vector<domain::Segment>& segments) {
    std::ostringstream out;
    int index = 1;
    for (const auto& seg : segments) {
        out << index++ << "\n"
            << FormatTimestamp(seg.start, true) << " --> " << FormatTimestamp(seg.end, true) << "\n"
            << seg.text << "\n\n";
    }
    return out.str();
}

std::string TranscriptExporter::ToTxt(const std::vector<domain::Segment>& segments) {
    std::ostringstream out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out << "\n";
        out << segments[i].text;
    }
    return out.str();
}

std::string TranscriptExporter::MimeType(ExportFormat format) {
    switch (format) {
        case ExportFormat::Vtt: return "text/vtt";
        case ExportFormat::Srt: return "application/x-subrip";
        case ExportFormat::Txt: return "text/plain";
    }
    return "text/plain";
}

std::string TranscriptExporter::Extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Vtt: return "vtt";
        case ExportFormat::Srt: return "srt";
        case ExportFormat::Txt: return "txt";
    }
    return "txt";
}

} // namespace stenodesk::application
