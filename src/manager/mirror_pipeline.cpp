#include "mirror_pipeline.h"
#include <config/config_manager.h>
#include <log/log_manager.h>
#include <security/path_validator.h>
#include <naming/name_sanitizer.h>
#include <naming/unique_name_resolver.h>
#include <m3u/playlist_sink.h>
#include <m3u/sync_plan.h>
#include <QDir>
#include <QFileInfo>
#include <QMap>
#include <iostream>
#include <fmt/format.h>

namespace
{
    // Canonical form when the path exists, cleaned absolute form otherwise
    QString resolvedDirectory(const QString& path)
    {
        QFileInfo info(path);
        QString canonical = info.canonicalFilePath();
        return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
    }
}

MirrorPipeline::MirrorPipeline(ConfigManager* config)
    : m_config(config)
{
    if (!m_config) {
        throw std::invalid_argument("MirrorPipeline requires a ConfigManager");
    }
    LOG_DEBUG("MirrorPipeline created");
}

MirrorPipeline::~MirrorPipeline() = default;

playlist::PlaylistForest MirrorPipeline::loadLibrary(playlist::LoadStatistics& stats) const
{
    QString libraryFile = m_config->getLibraryFile();
    if (libraryFile.isEmpty()) {
        std::string error = "No library file configured";
        LOG_ERROR(error);
        throw ConfigurationError(error);
    }

    playlist::LibraryLoader loader;
    playlist::PlaylistForest forest = loader.loadFromFile(libraryFile);
    stats = loader.statistics();
    return forest;
}

std::unique_ptr<security::PathValidator> MirrorPipeline::createValidator() const
{
    QString cratesRoot = m_config->getCratesRoot();
    if (cratesRoot.isEmpty()) {
        std::string error = "No crates root configured";
        LOG_ERROR(error);
        throw ConfigurationError(error);
    }

    Qt::CaseSensitivity sensitivity = m_config->getCaseInsensitivePaths() ? Qt::CaseInsensitive : Qt::CaseSensitive;
    try {
        return std::make_unique<security::PathValidator>(
            cratesRoot, m_config->getDestinationRoot(),
            std::make_shared<security::FileSystemCanonicalizer>(sensitivity));
    } catch (const std::invalid_argument& e) {
        std::string error = fmt::format("Invalid path configuration: {}", e.what());
        LOG_ERROR(error);
        throw ConfigurationError(error);
    }
}

bool MirrorPipeline::isUnsafeOutputDirectory(const QString& outputDirectory, const QString& cratesRoot, QString* reason)
{
    auto refuse = [reason](const QString& why) {
        if (reason) *reason = why;
        return true;
    };

    if (outputDirectory.trimmed().isEmpty()) {
        return refuse(QStringLiteral("output directory is empty"));
    }

    QString output = resolvedDirectory(outputDirectory);
    if (output == QLatin1String("/") || QDir(output).isRoot()) {
        return refuse(QStringLiteral("output directory is the filesystem root"));
    }
    if (output == resolvedDirectory(QDir::homePath())) {
        return refuse(QStringLiteral("output directory is the home directory"));
    }

    if (!cratesRoot.isEmpty()) {
        QString crates = resolvedDirectory(cratesRoot);
        if (crates == output) {
            return refuse(QStringLiteral("output directory is the crates root"));
        }
        if (crates.startsWith(output + QLatin1Char('/'))) {
            return refuse(QStringLiteral("output directory contains the crates root"));
        }
    }
    return false;
}

void MirrorPipeline::prepareOutputDirectory(const QString& outputDirectory) const
{
    QString reason;
    if (isUnsafeOutputDirectory(outputDirectory, m_config->getCratesRoot(), &reason)) {
        std::string error = fmt::format("Refusing to clean {}: {}", outputDirectory.toStdString(), reason.toStdString());
        LOG_ERROR(error);
        throw ConfigurationError(error);
    }

    QDir dir(outputDirectory);
    if (dir.exists()) {
        LOG_INFO("Cleaning output directory: {}", outputDirectory.toStdString());
        if (!dir.removeRecursively()) {
            LOG_ERROR("Failed to remove output directory: {}", outputDirectory.toStdString());
            throw m3u::WriteFailure(outputDirectory, QStringLiteral("cannot remove existing directory"));
        }
    }
    if (!QDir().mkpath(outputDirectory)) {
        LOG_ERROR("Failed to create output directory: {}", outputDirectory.toStdString());
        throw m3u::WriteFailure(outputDirectory, QStringLiteral("cannot create directory"));
    }
    LOG_DEBUG("Output directory ready: {}", outputDirectory.toStdString());
}

RunReport MirrorPipeline::createPlaylists(bool dryRun)
{
    RunReport report;
    report.dryRun = dryRun;
    report.outputDirectory = m_config->getOutputDirectory();
    report.mode = m_config->getLayoutMode();

    // Configuration problems surface before anything is touched on disk
    std::unique_ptr<security::PathValidator> validator = createValidator();
    std::unique_ptr<naming::NameSanitizer> sanitizer;
    try {
        sanitizer = std::make_unique<naming::NameSanitizer>(m_config->getSanitizerRules());
    } catch (const std::invalid_argument& e) {
        std::string error = fmt::format("Invalid naming rules: {}", e.what());
        LOG_ERROR(error);
        throw ConfigurationError(error);
    }

    playlist::PlaylistForest forest = loadLibrary(report.load);

    m3u::BuildOptions options;
    options.mode = report.mode;
    options.flatSeparator = m_config->getFlatSeparator();
    m3u::PlaylistTreeBuilder builder(*validator, *sanitizer, options);

    LOG_INFO("Creating {} playlists in {}{}", m3u::layoutModeToString(options.mode).toStdString(),
             report.outputDirectory.toStdString(), dryRun ? " (dry run)" : "");

    try {
        if (dryRun) {
            m3u::DryRunSink sink;
            report.build = builder.build(forest, sink);
        } else {
            prepareOutputDirectory(report.outputDirectory);
            m3u::FileSystemSink sink(report.outputDirectory);
            report.build = builder.build(forest, sink);
        }
    } catch (const naming::CollisionBoundExceeded& e) {
        LOG_CRITICAL("Build aborted, too many names collide with '{}' in scope '{}'",
                     e.rawName().toStdString(), e.scopeId().toStdString());
        throw;
    } catch (const m3u::WriteFailure& e) {
        LOG_CRITICAL("Build aborted, cannot write {}: {}", e.path().toStdString(), e.what());
        throw;
    }

    logReport(report);
    return report;
}

QList<m3u::SyncEntry> MirrorPipeline::buildSyncPlan()
{
    std::unique_ptr<security::PathValidator> validator = createValidator();
    playlist::LoadStatistics stats;
    playlist::PlaylistForest forest = loadLibrary(stats);

    naming::NameSanitizer sanitizer;
    m3u::PlaylistTreeBuilder builder(*validator, sanitizer);
    m3u::ForestValidation validation = builder.validate(forest);

    LOG_INFO("Sync plan: {} files, {} rejected references", validation.syncEntries.size(),
             validation.rejections.size());
    return validation.syncEntries;
}

int MirrorPipeline::writeSyncPlan(const QString& outputFile)
{
    QList<m3u::SyncEntry> entries = buildSyncPlan();
    if (outputFile.isEmpty() || outputFile == QLatin1String("-")) {
        m3u::writeSyncPlan(entries, std::cout);
        std::cout.flush();
    } else {
        m3u::writeSyncPlanFile(entries, outputFile);
    }
    return static_cast<int>(entries.size());
}

void MirrorPipeline::logReport(const RunReport& report) const
{
    int tracks = 0;
    for (const m3u::WrittenPlaylist& written : report.build.playlists) {
        tracks += written.trackCount;
    }

    LOG_INFO("{} {} playlists with {} entries, {} directories",
             report.dryRun ? "Would write" : "Wrote",
             report.build.playlists.size(), tracks, report.build.directoriesCreated);

    if (!report.build.rejections.isEmpty()) {
        QMap<QString, int> byReason;
        for (const security::PathRejection& rejection : report.build.rejections) {
            byReason[security::reasonToString(rejection.reason)] += 1;
        }
        for (auto it = byReason.constBegin(); it != byReason.constEnd(); ++it) {
            LOG_WARN("{} track references excluded: {}", it.value(), it.key().toStdString());
        }
    }
    if (report.build.fallbackNames > 0) {
        LOG_WARN("{} playlist names were replaced by the fallback name", report.build.fallbackNames);
    }
}
