/**
 * @file PipelineContext.hpp
 * @brief State that outlives a single analysis cycle, owned in one place.
 */

#pragma once

#include <memory>
#include <optional>
#include "application/AnalysisConfig.hpp"
#include "application/CountryInstabilityScorer.hpp"
#include "application/SignalGenerator.hpp"
#include "domain/BaselineStore.hpp"
#include "domain/EntityRegistry.hpp"

namespace worldpulse::application {

/**
 * @struct PipelineContext
 * @brief Registry, baselines, trend history and dedup table handed to the pipeline stages.
 *
 * Only AnalysisPipeline::runCycle mutates it, and only in its commit step.
 */
struct PipelineContext {
    PipelineContext(std::shared_ptr<const domain::EntityRegistry> reg,
                    std::shared_ptr<domain::BaselineStore> store,
                    const AnalysisConfig& config,
                    domain::Timestamp started);

    std::shared_ptr<const domain::EntityRegistry> registry;
    std::shared_ptr<domain::BaselineStore> baselineStore;
    CountryInstabilityScorer scorer;
    DedupTable dedup;
    std::optional<int> previousRiskComposite;
    domain::Timestamp startedAt;
};

inline ScorerSettings MakeScorerSettings(const AnalysisConfig& config) {
    ScorerSettings settings;
    settings.dampingThreshold = config.newsVolumeDampingThreshold;
    settings.monitoredCountries.insert(config.monitoredCountries.begin(), config.monitoredCountries.end());
    settings.floors = config.countryFloors;
    return settings;
}

inline PipelineContext::PipelineContext(std::shared_ptr<const domain::EntityRegistry> reg,
                                        std::shared_ptr<domain::BaselineStore> store,
                                        const AnalysisConfig& config,
                                        domain::Timestamp started)
    : registry(reg),
      baselineStore(std::move(store)),
      scorer(reg, MakeScorerSettings(config)),
      startedAt(started) {}

} // namespace worldpulse::application
