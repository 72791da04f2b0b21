/**
 * @file WorldPulseApp.cpp
 * @brief Implementation of the WorldPulseApp class.
 */
#include "app/WorldPulseApp.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include "domain/MalformedConfiguration.hpp"
#include "infrastructure/EntityCatalog.hpp"
#include "infrastructure/JsonBaselineStore.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/PathUtils.hpp"

namespace worldpulse::app {

namespace {

std::atomic<bool> g_stopRequested{false};

} // namespace

WorldPulseApp::WorldPulseApp(AppOptions options) : m_options(std::move(options)) {}

void WorldPulseApp::RequestStop() {
    g_stopRequested = true;
}

bool WorldPulseApp::Init() {
    std::string settingsPath = m_options.settingsPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath().string()
        : m_options.settingsPath;

    std::vector<domain::EntityRecord> catalog;
    try {
        m_settings = infrastructure::ConfigLoader::Load(settingsPath);
        catalog = m_settings.entityCatalog.empty()
            ? infrastructure::DefaultEntityCatalog()
            : infrastructure::ConfigLoader::LoadEntityCatalog(m_settings.entityCatalog);
        m_services.registry = std::make_shared<const domain::EntityRegistry>(std::move(catalog));
    } catch (const domain::MalformedConfiguration& e) {
        std::cerr << "[WorldPulseApp] " << e.what() << std::endl;
        return false;
    }

    if (m_options.inputDir) m_settings.inputDir = *m_options.inputDir;
    if (m_options.stateDir) m_settings.stateDir = *m_options.stateDir;
    if (m_options.serve) m_settings.http.enabled = true;

    std::filesystem::path stateDir = m_settings.stateDir.empty()
        ? infrastructure::PathUtils::GetStateDir()
        : std::filesystem::path(m_settings.stateDir);

    // Dependency Injection / Composition Root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    auto store = std::make_shared<infrastructure::JsonBaselineStore>(
        (stateDir / "baselines.json").string(), m_services.persistenceService);
    store->load();
    m_services.baselineStore = store;

    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();
    m_services.context = std::make_shared<application::PipelineContext>(
        m_services.registry, m_services.baselineStore, m_settings.analysis, domain::Clock::now());
    m_services.pipeline = std::make_shared<application::AnalysisPipeline>(
        m_settings.analysis, m_services.context, m_services.taskManager);

    m_reader = std::make_unique<infrastructure::InputBatchReader>(m_settings.inputDir, m_settings.sourceTiers);

    std::cout << "[WorldPulseApp] " << m_services.registry->size() << " entities, "
              << m_settings.analysis.monitoredCountries.size() << " monitored countries, input from "
              << m_settings.inputDir << ", state in " << stateDir.string() << std::endl;

    if (m_settings.http.enabled && !m_options.once) {
        m_server = std::make_unique<infrastructure::SnapshotServer>(
            m_services.pipeline, m_settings.http.host, m_settings.http.port);
        if (!m_server->start()) {
            m_server.reset();
        }
    }
    return true;
}

application::CycleStatus WorldPulseApp::RunOnce() {
    auto input = m_reader->read(domain::Clock::now());
    std::cout << "[WorldPulseApp] Read " << input.news.size() << " headlines, " << input.quotes.size()
              << " quotes, " << input.geoEvents.size() << " geo events, " << input.upstreamDetections.size()
              << " upstream detections." << std::endl;

    auto result = m_services.pipeline->runCycle(input);
    if (result.status == application::CycleStatus::Completed && result.learningMode) {
        std::cout << "[WorldPulseApp] Learning mode: instability alerts are withheld." << std::endl;
    }
    return result.status;
}

void WorldPulseApp::Shutdown() {
    if (m_server) {
        m_server->stop();
        m_server.reset();
    }
    if (m_services.taskManager) {
        m_services.taskManager->WaitIdle();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
    }
}

int WorldPulseApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    if (m_options.once) {
        auto status = RunOnce();
        if (auto latest = m_services.pipeline->latest()) {
            std::cout << infrastructure::codec::ToJson(*latest).dump(2) << std::endl;
        }
        Shutdown();
        return status == application::CycleStatus::Completed ? 0 : 2;
    }

    const auto interval = std::chrono::seconds(m_settings.analysis.refreshIntervalSeconds);
    while (!g_stopRequested) {
        auto cycleStart = std::chrono::steady_clock::now();
        RunOnce();
        while (!g_stopRequested && std::chrono::steady_clock::now() - cycleStart < interval) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    std::cout << "[WorldPulseApp] Stopping." << std::endl;
    Shutdown();
    return 0;
}

} // namespace worldpulse::app
