#include "config_manager.h"
#include <log/log_manager.h>
#include <QDir>
#include <QFileInfo>
#include <fmt/format.h>
#include <stdexcept>

const QString ConfigManager::KeyCratesRoot = QStringLiteral("paths/crates_root");
const QString ConfigManager::KeyOutputDir = QStringLiteral("paths/output_dir");
const QString ConfigManager::KeyDestinationRoot = QStringLiteral("paths/destination_root");
const QString ConfigManager::KeyLibraryFile = QStringLiteral("paths/library_file");
const QString ConfigManager::KeyCaseInsensitive = QStringLiteral("paths/case_insensitive");
const QString ConfigManager::KeyLayoutMode = QStringLiteral("output/mode");
const QString ConfigManager::KeyFlatSeparator = QStringLiteral("output/flat_separator");
const QString ConfigManager::KeyPlaceholder = QStringLiteral("naming/placeholder");
const QString ConfigManager::KeyMaxComponentBytes = QStringLiteral("naming/max_component_bytes");
const QString ConfigManager::KeyFallbackName = QStringLiteral("naming/fallback_name");
const QString ConfigManager::KeyLogLevel = QStringLiteral("log/level");
const QString ConfigManager::KeyLogDirectory = QStringLiteral("log/directory");

namespace
{
    const char* kDefaultOutputDir = "output";
    const char* kDefaultDestinationRoot = "/data/music";
    const char* kDefaultSeparator = " - ";
    const char* kDefaultLogLevel = "info";
    const char* kDefaultLogDirectory = "log";

    bool isKnownLogLevel(const QString& level)
    {
        static const QStringList known = {"trace", "debug", "info", "warn", "warning", "error", "critical"};
        return known.contains(level.trimmed().toLower());
    }
}

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , m_settings(nullptr)
{
    LOG_DEBUG("ConfigManager created");
}

ConfigManager::~ConfigManager()
{
    if (m_settings) {
        delete m_settings;
    }
    LOG_DEBUG("ConfigManager destroyed");
}

void ConfigManager::initialize(const QString& configFilePath)
{
    QFileInfo info(configFilePath);
    m_configFilePath = info.absoluteFilePath();
    LOG_INFO("Initializing ConfigManager with config file: {}", m_configFilePath.toStdString());

    QDir configDir = info.absoluteDir();
    if (!configDir.exists()) {
        if (!configDir.mkpath(configDir.absolutePath())) {
            std::string error = fmt::format("Failed to create config directory: {}", configDir.absolutePath().toStdString());
            LOG_ERROR(error);
            throw std::runtime_error(error);
        }
        LOG_INFO("Created config directory: {}", configDir.absolutePath().toStdString());
    }

    if (m_settings) {
        delete m_settings;
    }
    m_settings = new QSettings(m_configFilePath, QSettings::IniFormat);

    setupDefaults();
    loadFromFile();
}

void ConfigManager::setupDefaults()
{
    if (!m_settings) return;

    LOG_DEBUG("Setting up default configuration values");

    // Required paths are written empty so the file documents them
    if (!m_settings->contains(KeyCratesRoot)) {
        m_settings->setValue(KeyCratesRoot, "");
    }
    if (!m_settings->contains(KeyLibraryFile)) {
        m_settings->setValue(KeyLibraryFile, "");
    }
    if (!m_settings->contains(KeyOutputDir)) {
        m_settings->setValue(KeyOutputDir, kDefaultOutputDir);
    }
    if (!m_settings->contains(KeyDestinationRoot)) {
        m_settings->setValue(KeyDestinationRoot, kDefaultDestinationRoot);
    }
    if (!m_settings->contains(KeyCaseInsensitive)) {
        m_settings->setValue(KeyCaseInsensitive, false);
    }

    // Output layout
    if (!m_settings->contains(KeyLayoutMode)) {
        m_settings->setValue(KeyLayoutMode, m3u::layoutModeToString(m3u::LayoutMode::Nested));
    }
    if (!m_settings->contains(KeyFlatSeparator)) {
        m_settings->setValue(KeyFlatSeparator, kDefaultSeparator);
    }

    // Naming rules
    naming::SanitizerRules defaults;
    if (!m_settings->contains(KeyPlaceholder)) {
        m_settings->setValue(KeyPlaceholder, QString(defaults.placeholder));
    }
    if (!m_settings->contains(KeyMaxComponentBytes)) {
        m_settings->setValue(KeyMaxComponentBytes, defaults.maxComponentBytes);
    }
    if (!m_settings->contains(KeyFallbackName)) {
        m_settings->setValue(KeyFallbackName, defaults.fallbackName);
    }

    // Logging
    if (!m_settings->contains(KeyLogLevel)) {
        m_settings->setValue(KeyLogLevel, kDefaultLogLevel);
    }
    if (!m_settings->contains(KeyLogDirectory)) {
        m_settings->setValue(KeyLogDirectory, kDefaultLogDirectory);
    }

    m_settings->sync();
    LOG_DEBUG("Default configuration values set");
}

void ConfigManager::loadFromFile()
{
    if (!m_settings) {
        LOG_ERROR("Settings not initialized");
        return;
    }

    LOG_INFO("Loading configuration from file");
    m_settings->sync();

    if (m_settings->status() == QSettings::FormatError) {
        std::string error = fmt::format("Malformed config file: {}", m_configFilePath.toStdString());
        LOG_ERROR(error);
        throw std::runtime_error(error);
    }

    LOG_INFO("Configuration loaded successfully");
}

void ConfigManager::saveToFile()
{
    if (!m_settings) {
        LOG_ERROR("Settings not initialized");
        return;
    }

    LOG_DEBUG("Saving configuration to file");
    m_settings->sync();

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration file");
    } else {
        LOG_DEBUG("Configuration saved successfully");
    }
}

QString ConfigManager::getBaseDirectory() const
{
    if (m_configFilePath.isEmpty()) {
        return QDir::currentPath();
    }
    return QFileInfo(m_configFilePath).absolutePath();
}

QString ConfigManager::getAbsolutePath(const QString& path) const
{
    if (path.isEmpty()) {
        return path;
    }
    if (QFileInfo(path).isAbsolute()) {
        return QDir::cleanPath(path);
    }
    return QDir::cleanPath(QDir(getBaseDirectory()).absoluteFilePath(path));
}

void ConfigManager::applyEnvironment(const QProcessEnvironment& env)
{
    // Relative paths from the environment are relative to the working directory
    auto applyPath = [&](const char* variable, const QString& key) {
        QString value = env.value(QString::fromLatin1(variable));
        if (value.isEmpty()) return;
        setOverride(key, QDir::cleanPath(QDir::current().absoluteFilePath(value)));
        LOG_DEBUG("Environment {} overrides {}", variable, key.toStdString());
    };

    applyPath("CRATES_ROOT", KeyCratesRoot);
    applyPath("OUTPUT_DIR", KeyOutputDir);
    applyPath("LIBRARY_FILE", KeyLibraryFile);

    // Destination root lives on the media server, it is never resolved locally
    QString destination = env.value(QStringLiteral("DESTINATION_ROOT"));
    if (destination.isEmpty()) {
        destination = env.value(QStringLiteral("JELLYFIN_ROOT"));
    }
    if (!destination.isEmpty()) {
        setOverride(KeyDestinationRoot, destination);
    }

    QString level = env.value(QStringLiteral("LOG_LEVEL"));
    if (!level.isEmpty()) {
        if (isKnownLogLevel(level)) {
            setOverride(KeyLogLevel, level.trimmed().toLower());
        } else {
            LOG_WARN("Ignoring unknown LOG_LEVEL '{}'", level.toStdString());
        }
    }
}

void ConfigManager::setOverride(const QString& key, const QVariant& value)
{
    m_overrides.insert(key, value);
    emit configurationChanged(key);
}

QVariant ConfigManager::value(const QString& key, const QVariant& defaultValue) const
{
    auto it = m_overrides.constFind(key);
    if (it != m_overrides.constEnd()) {
        return it.value();
    }
    return m_settings ? m_settings->value(key, defaultValue) : defaultValue;
}

void ConfigManager::storeValue(const QString& key, const QVariant& value)
{
    // An explicit setter wins over a previous override
    m_overrides.remove(key);
    if (m_settings) {
        m_settings->setValue(key, value);
    }
    emit configurationChanged(key);
}

QString ConfigManager::pathValue(const QString& key, const QString& defaultValue) const
{
    if (m_overrides.contains(key)) {
        return m_overrides.value(key).toString();
    }
    return getAbsolutePath(value(key, defaultValue).toString().trimmed());
}

// Paths
QString ConfigManager::getCratesRoot() const
{
    return pathValue(KeyCratesRoot, QString());
}

QString ConfigManager::getOutputDirectory() const
{
    return pathValue(KeyOutputDir, kDefaultOutputDir);
}

QString ConfigManager::getDestinationRoot() const
{
    return value(KeyDestinationRoot, kDefaultDestinationRoot).toString().trimmed();
}

QString ConfigManager::getLibraryFile() const
{
    return pathValue(KeyLibraryFile, QString());
}

bool ConfigManager::getCaseInsensitivePaths() const
{
    return value(KeyCaseInsensitive, false).toBool();
}

void ConfigManager::setCratesRoot(const QString& path)
{
    storeValue(KeyCratesRoot, path);
    LOG_INFO("Crates root set to: {}", path.toStdString());
}

void ConfigManager::setOutputDirectory(const QString& path)
{
    storeValue(KeyOutputDir, path);
    LOG_INFO("Output directory set to: {}", path.toStdString());
}

bool ConfigManager::setDestinationRoot(const QString& root)
{
    if (root.trimmed().isEmpty()) {
        LOG_ERROR("Destination root must not be empty");
        return false;
    }
    storeValue(KeyDestinationRoot, root.trimmed());
    LOG_INFO("Destination root set to: {}", root.toStdString());
    return true;
}

void ConfigManager::setLibraryFile(const QString& path)
{
    storeValue(KeyLibraryFile, path);
    LOG_INFO("Library file set to: {}", path.toStdString());
}

void ConfigManager::setCaseInsensitivePaths(bool enabled)
{
    storeValue(KeyCaseInsensitive, enabled);
}

// Output layout
m3u::LayoutMode ConfigManager::getLayoutMode() const
{
    QString text = value(KeyLayoutMode, m3u::layoutModeToString(m3u::LayoutMode::Nested)).toString();
    auto mode = m3u::parseLayoutMode(text);
    if (!mode) {
        LOG_WARN("Unknown output mode '{}', using nested", text.toStdString());
        return m3u::LayoutMode::Nested;
    }
    return *mode;
}

QString ConfigManager::getFlatSeparator() const
{
    return value(KeyFlatSeparator, kDefaultSeparator).toString();
}

void ConfigManager::setLayoutMode(m3u::LayoutMode mode)
{
    storeValue(KeyLayoutMode, m3u::layoutModeToString(mode));
}

bool ConfigManager::setFlatSeparator(const QString& separator)
{
    if (separator.isEmpty() || separator.contains('/') || separator.contains('\\')) {
        LOG_ERROR("Invalid flat separator '{}'", separator.toStdString());
        return false;
    }
    storeValue(KeyFlatSeparator, separator);
    return true;
}

// Naming rules
naming::SanitizerRules ConfigManager::getSanitizerRules() const
{
    naming::SanitizerRules rules;
    QString placeholder = value(KeyPlaceholder, QString(rules.placeholder)).toString();
    if (placeholder.size() == 1) {
        rules.placeholder = placeholder.at(0);
    } else {
        LOG_WARN("Placeholder must be a single character, got '{}'", placeholder.toStdString());
    }
    rules.maxComponentBytes = value(KeyMaxComponentBytes, rules.maxComponentBytes).toInt();
    rules.fallbackName = value(KeyFallbackName, rules.fallbackName).toString();
    return rules;
}

bool ConfigManager::rulesAreValid(const naming::SanitizerRules& rules) const
{
    try {
        naming::NameSanitizer probe(rules);
        return true;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Rejected naming rules: {}", e.what());
        return false;
    }
}

bool ConfigManager::setPlaceholder(QChar placeholder)
{
    naming::SanitizerRules rules = getSanitizerRules();
    rules.placeholder = placeholder;
    if (!rulesAreValid(rules)) return false;
    storeValue(KeyPlaceholder, QString(placeholder));
    return true;
}

bool ConfigManager::setMaxComponentBytes(int bytes)
{
    naming::SanitizerRules rules = getSanitizerRules();
    rules.maxComponentBytes = bytes;
    if (!rulesAreValid(rules)) return false;
    storeValue(KeyMaxComponentBytes, bytes);
    return true;
}

bool ConfigManager::setFallbackName(const QString& name)
{
    naming::SanitizerRules rules = getSanitizerRules();
    rules.fallbackName = name;
    if (!rulesAreValid(rules)) return false;
    storeValue(KeyFallbackName, name);
    return true;
}

// Logging
QString ConfigManager::getLogLevel() const
{
    return value(KeyLogLevel, kDefaultLogLevel).toString().trimmed().toLower();
}

QString ConfigManager::getLogDirectory() const
{
    return pathValue(KeyLogDirectory, kDefaultLogDirectory);
}

void ConfigManager::setLogLevel(const QString& level)
{
    if (!isKnownLogLevel(level)) {
        LOG_WARN("Ignoring unknown log level '{}'", level.toStdString());
        return;
    }
    storeValue(KeyLogLevel, level.trimmed().toLower());
}

QStringList ConfigManager::checkForProblems() const
{
    QStringList problems;

    QString cratesRoot = getCratesRoot();
    if (cratesRoot.isEmpty()) {
        problems << QStringLiteral("crates root is not configured (%1 or CRATES_ROOT)").arg(KeyCratesRoot);
    } else if (!QFileInfo(cratesRoot).isDir()) {
        problems << QStringLiteral("crates root is not a directory: %1").arg(cratesRoot);
    }

    QString library = getLibraryFile();
    if (library.isEmpty()) {
        problems << QStringLiteral("library file is not configured (%1 or LIBRARY_FILE)").arg(KeyLibraryFile);
    } else if (!QFileInfo(library).isFile() || !QFileInfo(library).isReadable()) {
        problems << QStringLiteral("library file is not readable: %1").arg(library);
    }

    if (getOutputDirectory().isEmpty()) {
        problems << QStringLiteral("output directory is not configured");
    }
    if (getDestinationRoot().isEmpty()) {
        problems << QStringLiteral("destination root is not configured");
    }

    QString mode = value(KeyLayoutMode, QString()).toString();
    if (!mode.isEmpty() && !m3u::parseLayoutMode(mode)) {
        problems << QStringLiteral("unknown output mode: %1").arg(mode);
    }

    QString placeholder = value(KeyPlaceholder, QStringLiteral("-")).toString();
    if (placeholder.size() != 1) {
        problems << QStringLiteral("placeholder must be a single character: '%1'").arg(placeholder);
    } else {
        try {
            naming::NameSanitizer probe(getSanitizerRules());
        } catch (const std::invalid_argument& e) {
            problems << QString::fromStdString(e.what());
        }
    }

    if (!isKnownLogLevel(getLogLevel())) {
        problems << QStringLiteral("unknown log level: %1").arg(getLogLevel());
    }

    return problems;
}
