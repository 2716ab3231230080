/**
 * @file ResumeOffset.cpp
 * @brief Implementation of ResolveResumeOffset.
 */

#include "application/ResumeOffset.hpp"

namespace stenodesk::application {

double ResolveResumeOffset(const std::vector<domain::Segment>& segments, const domain::JobProgress& persisted) {
    if (!segments.empty()) {
        return segments.back().end;
    }
    if (persisted.current > 0.0) {
        return persisted.current;
    }
    return 0.0;
}

} // namespace stenodesk::application
