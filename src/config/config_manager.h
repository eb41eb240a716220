#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QSettings>
#include <QHash>
#include <QVariant>
#include <QProcessEnvironment>
#include <naming/name_sanitizer.h>
#include <m3u/tree_builder.h>

/**
 * Configuration Manager - handles all pipeline settings
 * Backed by an INI file (QSettings). Relative paths in the file are resolved against the
 * directory of the config file. Environment variables and command line options are kept
 * as in-memory overrides and are never written back.
 *
 * Precedence: command line > environment > config file > defaults
 */
class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    // Opens (and creates if missing) the config file, writes defaults for absent keys
    void initialize(const QString& configFilePath);
    void loadFromFile();
    void saveToFile();

    QString getConfigFilePath() const { return m_configFilePath; }
    QString getBaseDirectory() const;
    QString getAbsolutePath(const QString& path) const;

    // CRATES_ROOT, OUTPUT_DIR, JELLYFIN_ROOT/DESTINATION_ROOT, LIBRARY_FILE, LOG_LEVEL
    void applyEnvironment(const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());
    void setOverride(const QString& key, const QVariant& value);
    bool hasOverride(const QString& key) const { return m_overrides.contains(key); }

    // Paths
    QString getCratesRoot() const;
    QString getOutputDirectory() const;
    QString getDestinationRoot() const;
    QString getLibraryFile() const;
    bool getCaseInsensitivePaths() const;
    void setCratesRoot(const QString& path);
    void setOutputDirectory(const QString& path);
    bool setDestinationRoot(const QString& root);
    void setLibraryFile(const QString& path);
    void setCaseInsensitivePaths(bool enabled);

    // Output layout
    m3u::LayoutMode getLayoutMode() const;
    QString getFlatSeparator() const;
    void setLayoutMode(m3u::LayoutMode mode);
    bool setFlatSeparator(const QString& separator);

    // Naming rules
    naming::SanitizerRules getSanitizerRules() const;
    bool setPlaceholder(QChar placeholder);
    bool setMaxComponentBytes(int bytes);
    bool setFallbackName(const QString& name);

    // Logging
    QString getLogLevel() const;
    QString getLogDirectory() const;
    void setLogLevel(const QString& level);

    // Problems that prevent a run (missing crates root, unreadable library, ...)
    QStringList checkForProblems() const;

    static const QString KeyCratesRoot;
    static const QString KeyOutputDir;
    static const QString KeyDestinationRoot;
    static const QString KeyLibraryFile;
    static const QString KeyCaseInsensitive;
    static const QString KeyLayoutMode;
    static const QString KeyFlatSeparator;
    static const QString KeyPlaceholder;
    static const QString KeyMaxComponentBytes;
    static const QString KeyFallbackName;
    static const QString KeyLogLevel;
    static const QString KeyLogDirectory;

signals:
    void configurationChanged(const QString& key);

private:
    void setupDefaults();
    QVariant value(const QString& key, const QVariant& defaultValue) const;
    void storeValue(const QString& key, const QVariant& value);
    QString pathValue(const QString& key, const QString& defaultValue) const;
    bool rulesAreValid(const naming::SanitizerRules& rules) const;

    QSettings* m_settings;
    QString m_configFilePath;
    QHash<QString, QVariant> m_overrides;
};
