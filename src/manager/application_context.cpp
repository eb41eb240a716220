#include "application_context.h"
#include <QDir>
#include <stdexcept>

#include <config/config_manager.h>
#include <manager/mirror_pipeline.h>
#include <log/log_manager.h>

ApplicationContext& ApplicationContext::instance()
{
    static ApplicationContext instance;
    return instance;
}

ApplicationContext::ApplicationContext(QObject* parent)
    : QObject(parent)
    , m_initialized(false)
    , m_currentPhase(0)
{
}

ApplicationContext::~ApplicationContext() = default;

void ApplicationContext::initialize(const QString& configFilePath)
{
    if (m_initialized) {
        LOG_WARN("ApplicationContext already initialized");
        return;
    }

    try {
        initializePhase1(configFilePath);
        initializePhase2();
    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to initialize ApplicationContext: {}", e.what());
        throw;
    }
}

void ApplicationContext::initializePhase1(const QString& configFilePath)
{
    // 1. ConfigManager first - logging needs its directory and level
    initializeConfigManager(configFilePath);

    // 2. Logging
    initializeLogging();

    LOG_INFO("Phase 1: configuration loaded from {}", m_configManager->getConfigFilePath().toStdString());
    setupManagerConnections();

    m_currentPhase = 1;
    emit phaseInitialized(1);
    emit configLoaded();
}

void ApplicationContext::initializePhase2()
{
    if (m_currentPhase < 1) {
        throw std::logic_error("ApplicationContext phase 2 requires phase 1");
    }

    LOG_INFO("Phase 2: Initializing pipeline");
    initializeMirrorPipeline();

    m_currentPhase = 2;
    m_initialized = true;
    emit phaseInitialized(2);
    emit managersInitialized();

    LOG_INFO("ApplicationContext initialized successfully");
}

void ApplicationContext::initializeConfigManager(const QString& configFilePath)
{
    m_configManager = std::make_unique<ConfigManager>();
    m_configManager->initialize(configFilePath);
    m_configManager->applyEnvironment();
}

void ApplicationContext::initializeLogging()
{
    QString logDir = m_configManager->getLogDirectory();
    LogManager::instance().initialize(QDir::cleanPath(logDir).toStdString());
    LogManager::instance().setLogLevel(LogManager::parseLogLevel(m_configManager->getLogLevel().toStdString()));
}

void ApplicationContext::initializeMirrorPipeline()
{
    LOG_DEBUG("Creating MirrorPipeline...");
    m_mirrorPipeline = std::make_unique<MirrorPipeline>(m_configManager.get());
    LOG_DEBUG("MirrorPipeline initialized");
}

void ApplicationContext::setupManagerConnections()
{
    LOG_DEBUG("Setting up cross-manager signal connections...");

    // Log level follows the configuration, including -v/-q overrides
    connect(m_configManager.get(), &ConfigManager::configurationChanged,
            this, [this](const QString& key) {
                if (key != ConfigManager::KeyLogLevel || !m_configManager) return;
                QString level = m_configManager->getLogLevel();
                LogManager::instance().setLogLevel(LogManager::parseLogLevel(level.toStdString()));
                LOG_DEBUG("Log level changed to: {}", level.toStdString());
            });
}

bool ApplicationContext::isPhaseInitialized(int phase) const
{
    return m_currentPhase >= phase;
}

void ApplicationContext::shutdown()
{
    if (m_currentPhase == 0) {
        LOG_DEBUG("ApplicationContext already shutdown or not initialized");
        return;
    }

    LOG_INFO("Shutting down ApplicationContext...");

    m_mirrorPipeline.reset();

    // Overrides are in memory only, this persists defaults written on first start
    if (m_configManager) {
        m_configManager->saveToFile();
        disconnect(m_configManager.get(), nullptr, this, nullptr);
    }
    m_configManager.reset();

    m_initialized = false;
    m_currentPhase = 0;
    emit shutdownCompleted();
    LOG_INFO("ApplicationContext shutdown complete");

    // Shutdown logging system last (after all other logging is complete)
    LogManager::instance().flush();
    LogManager::instance().shutdown();
}
