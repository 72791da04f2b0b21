/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AnalysisPipeline.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/PipelineContext.hpp"
#include "domain/BaselineStore.hpp"
#include "domain/EntityRegistry.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace worldpulse::application {

struct AppServices {
    std::shared_ptr<const domain::EntityRegistry> registry;
    std::shared_ptr<domain::BaselineStore> baselineStore;
    std::shared_ptr<PipelineContext> context;
    std::shared_ptr<AnalysisPipeline> pipeline;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace worldpulse::application
