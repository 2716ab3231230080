/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/TranscriptionScheduler.hpp"
#include "domain/ExclusivityLease.hpp"
#include "domain/JobRepository.hpp"
#include "domain/TranscriptionEngine.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace stenodesk::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::JobRepository> jobRepository;
    std::shared_ptr<domain::TranscriptionEngine> engine;
    std::shared_ptr<domain::ExclusivityLease> lease;
    std::shared_ptr<TranscriptionScheduler> scheduler;
};

} // namespace stenodesk::application
