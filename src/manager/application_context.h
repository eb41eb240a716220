#pragma once

#include <QObject>
#include <QString>
#include <memory>

// Forward declarations
class ConfigManager;
class MirrorPipeline;

/**
 * Central application context that holds all global managers
 * Provides controlled access to shared services with proper initialization order
 */
class ApplicationContext : public QObject
{
    Q_OBJECT

public:
    static ApplicationContext& instance();

    // Initialize all managers with proper dependency order (call once in main.cpp)
    void initialize(const QString& configFilePath);

    // Step-by-step initialization: command line overrides go between the two phases
    void initializePhase1(const QString& configFilePath); // Config + logging
    void initializePhase2();                              // Pipeline

    // Manager access (returns nullptr if not yet initialized)
    ConfigManager* configManager() const { return m_configManager.get(); }
    MirrorPipeline* mirrorPipeline() const { return m_mirrorPipeline.get(); }

    // Check initialization status
    bool isInitialized() const { return m_initialized; }
    bool isPhaseInitialized(int phase) const;

    // Cleanup
    void shutdown();

signals:
    void managersInitialized();
    void phaseInitialized(int phase);
    void configLoaded();
    void shutdownCompleted();

private:
    explicit ApplicationContext(QObject* parent = nullptr);
    ~ApplicationContext();
    Q_DISABLE_COPY(ApplicationContext)

    void initializeConfigManager(const QString& configFilePath);
    void initializeLogging();
    void initializeMirrorPipeline();

    // Cross-manager connections
    void setupManagerConnections();

    // Smart pointers for automatic cleanup
    std::unique_ptr<ConfigManager> m_configManager;
    std::unique_ptr<MirrorPipeline> m_mirrorPipeline;

    bool m_initialized = false;
    int m_currentPhase = 0;
};

// Convenience macros for easy access
#define APP_CONTEXT ApplicationContext::instance()
#define CONFIG_MANAGER APP_CONTEXT.configManager()
#define MIRROR_PIPELINE APP_CONTEXT.mirrorPipeline()
