#include <cassert>
#include <iostream>

#include "application/TranscriptExporter.hpp"
#include "domain/SchedulerErrors.hpp"

using namespace stenodesk;
using application::ExportFormat;
using application::TranscriptExporter;

int main() {
    std::cout << "[Test] Starting TranscriptExporter Test..." << std::endl;

    std::vector<domain::Segment> segments = {
        {0.0, 1.5, "Hello"},
        {1.5, 3661.2346, "World"},
    };

    assert(TranscriptExporter::ToVtt(segments) ==
           "WEBVTT\n\n"
           "00:00:00.000 --> 00:00:01.500\nHello\n\n"
           "00:00:01.500 --> 01:01:01.235\nWorld\n\n");
    std::cout << "[PASS] VTT" << std::endl;

    assert(TranscriptExporter::ToSrt(segments) ==
           "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n"
           "2\n00:00:01,500 --> 01:01:01,235\nWorld\n\n");
    std::cout << "[PASS] SRT" << std::endl;

    assert(TranscriptExporter::ToTxt(segments) == "Hello\nWorld");
    assert(TranscriptExporter::Render(segments, ExportFormat::Txt) == "Hello\nWorld");

    assert(TranscriptExporter::ToVtt({}) == "WEBVTT\n\n");
    assert(TranscriptExporter::ToSrt({}).empty());
    assert(TranscriptExporter::ToTxt({}).empty());

    assert(TranscriptExporter::FormatTimestamp(-3.0, false) == "00:00:00.000");
    assert(TranscriptExporter::FormatTimestamp(59.9999, false) == "00:01:00.000");
    assert(TranscriptExporter::FormatTimestamp(7322.25, true) == "02:02:02,250");
    std::cout << "[PASS] Timestamps round to milliseconds." << std::endl;

    assert(TranscriptExporter::ParseFormat("srt") == ExportFormat::Srt);
    assert(TranscriptExporter::MimeType(ExportFormat::Vtt) == "text/vtt");
    assert(TranscriptExporter::MimeType(ExportFormat::Srt) == "application/x-subrip");
    assert(TranscriptExporter::Extension(ExportFormat::Txt) == "txt");

    bool rejected = false;
    try {
        TranscriptExporter::ParseFormat("docx");
    } catch (const domain::PreconditionFailedError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Format names" << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
