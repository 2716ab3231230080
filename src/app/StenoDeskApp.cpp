/**
 * @file StenoDeskApp.cpp
 * @brief Implementation of the StenoDeskApp class.
 */
#include "app/StenoDeskApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

#include "infrastructure/ExclusivityLeaseFs.hpp"
#include "infrastructure/HttpControlServer.hpp"
#include "infrastructure/JobRepositoryFs.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ScriptTranscriptionEngine.hpp"
#include "infrastructure/WhisperCppEngine.hpp"

namespace stenodesk::app {

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}

} // namespace

StenoDeskApp::StenoDeskApp(LaunchOptions options) : m_options(std::move(options)) {}

StenoDeskApp::~StenoDeskApp() {
    Shutdown();
}

std::shared_ptr<domain::TranscriptionEngine> StenoDeskApp::CreateEngine() const {
    if (m_config.engineKind == "script") {
        std::cout << "[StenoDeskApp] Using script engine " << m_config.scriptPath << std::endl;
        return std::make_shared<infrastructure::ScriptTranscriptionEngine>(m_config.interpreter, m_config.scriptPath);
    }

    std::string modelPath = m_config.modelPath;
    if (modelPath.empty()) {
        modelPath = (infrastructure::PathUtils::GetModelsDir() / "ggml-base.bin").string();
        if (!std::filesystem::exists(modelPath) && std::filesystem::exists("ggml-base.bin")) {
            modelPath = std::filesystem::absolute("ggml-base.bin").string();
        }
    }
    std::cout << "[StenoDeskApp] Using whisper.cpp model " << modelPath << std::endl;
    return std::make_shared<infrastructure::WhisperCppEngine>(modelPath, m_config.language, m_config.threads);
}

bool StenoDeskApp::Init() {
    std::string configPath = m_options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultConfigPath().string()
        : m_options.configPath;
    m_config = infrastructure::ConfigLoader::Load(configPath);
    if (m_options.port > 0) {
        m_config.httpPort = m_options.port;
    }

    m_dataDir = m_config.dataDir.empty()
        ? infrastructure::PathUtils::GetAppDataDir().string()
        : m_config.dataDir;
    std::cout << "[StenoDeskApp] Data directory: " << m_dataDir << std::endl;

    // Dependency Injection / Composition Root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.jobRepository = std::make_shared<infrastructure::JobRepositoryFs>(m_dataDir, m_services.persistenceService);
    m_services.lease = std::make_shared<infrastructure::ExclusivityLeaseFs>(
        m_dataDir, std::chrono::seconds(m_config.leaseStaleSeconds));
    m_services.engine = CreateEngine();

    application::SchedulerOptions options;
    options.executor.snapshotEverySegments = m_config.snapshotEverySegments;
    options.executor.snapshotInterval = std::chrono::milliseconds(m_config.snapshotIntervalMs);
    options.queuePoll = std::chrono::milliseconds(m_config.queuePollMs);
    options.cancelTimeout = std::chrono::milliseconds(m_config.cancelTimeoutMs);
    options.stopAllTimeout = std::chrono::milliseconds(m_config.stopAllTimeoutMs);
    options.leaseHeartbeat = std::chrono::seconds(m_config.leaseHeartbeatSeconds);
    m_services.scheduler = std::make_shared<application::TranscriptionScheduler>(
        m_services.jobRepository, m_services.engine, m_services.lease, options);

    if (!m_services.scheduler->startup()) {
        std::cerr << "[StenoDeskApp] Another scheduler owns " << m_dataDir << ", exiting." << std::endl;
        return false;
    }
    m_schedulerStarted = true;

    m_server = std::make_unique<infrastructure::HttpControlServer>(m_services.scheduler);
    return m_server->start(m_config.httpHost, m_config.httpPort);
}

void StenoDeskApp::Shutdown() {
    // Stop-all first: a transcribe handler blocks until its run settles, and
    // the server cannot stop while a handler is still running.
    if (m_schedulerStarted) {
        m_services.scheduler->cancelAll();
    }
    if (m_server) {
        m_server->stop();
        m_server.reset();
    }
    if (m_schedulerStarted) {
        m_services.scheduler->shutdown();
        m_schedulerStarted = false;
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
}

int StenoDeskApp::Run() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!Init()) {
        Shutdown();
        return 1;
    }

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[StenoDeskApp] Stop requested, shutting down." << std::endl;
    Shutdown();
    return 0;
}

} // namespace stenodesk::app
