/**
 * @file ResumeOffset.hpp
 * @brief Where a (re)started job continues decoding.
 */

#pragma once

#include <vector>
#include "domain/Job.hpp"

namespace stenodesk::application {

/**
 * @brief Resume point in media seconds.
 *
 * Priority: end of the last accumulated segment, then the persisted
 * progress.current, then zero (full restart).
 */
double ResolveResumeOffset(const std::vector<domain::Segment>& segments, const domain::JobProgress& persisted);

} // namespace stenodesk::application
