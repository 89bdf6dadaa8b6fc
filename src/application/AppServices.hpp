/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/JobOrchestrator.hpp"
#include "application/ReviewService.hpp"
#include "domain/CellRepository.hpp"
#include "domain/DocumentSource.hpp"
#include "domain/EngineConfig.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace lextable::application {

// Declaration order is teardown order in reverse: the orchestrator joins its
// jobs before the repository and the persistence queue go away.
struct AppServices {
    domain::EngineConfig config;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::CellRepository> repository;
    std::shared_ptr<domain::DocumentSource> documentSource;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::unique_ptr<JobOrchestrator> orchestrator;
    std::unique_ptr<ReviewService> reviewService;
};

} // namespace lextable::application
