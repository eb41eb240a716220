#pragma once

#include <QString>
#include <QList>
#include <memory>
#include <stdexcept>
#include <playlist/library_loader.h>
#include <m3u/tree_builder.h>

class ConfigManager;

namespace security { class PathValidator; }

/**
 * Raised for problems the user fixes in the configuration: missing crates root,
 * unusable output directory, invalid naming rules
 */
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct RunReport {
    playlist::LoadStatistics load;
    m3u::BuildResult build;
    QString outputDirectory;
    m3u::LayoutMode mode = m3u::LayoutMode::Nested;
    bool dryRun = false;
};

/**
 * Mirror Pipeline - one run of library -> validated tracks -> playlist tree
 * Reads every setting from the ConfigManager at the time of the call, so command line
 * overrides applied after construction are honoured.
 */
class MirrorPipeline
{
public:
    explicit MirrorPipeline(ConfigManager* config);
    ~MirrorPipeline();

    /**
     * @brief Loads the library, cleans the output directory and writes the playlist tree
     * @param dryRun Record the tree in memory instead of touching the output directory
     * @throws ConfigurationError, playlist::LibraryLoadError on bad input
     * @throws naming::CollisionBoundExceeded, m3u::WriteFailure when the pass aborts
     */
    RunReport createPlaylists(bool dryRun);

    // Loads and validates without writing playlists
    QList<m3u::SyncEntry> buildSyncPlan();

    // "-" writes to stdout
    int writeSyncPlan(const QString& outputFile);

    /**
     * @brief Removes and recreates the output directory
     * @throws ConfigurationError if the directory is "/", the home directory, or equals
     *         or contains the crates root
     * @throws m3u::WriteFailure if it cannot be removed or created
     */
    void prepareOutputDirectory(const QString& outputDirectory) const;

    static bool isUnsafeOutputDirectory(const QString& outputDirectory, const QString& cratesRoot,
                                        QString* reason = nullptr);

private:
    playlist::PlaylistForest loadLibrary(playlist::LoadStatistics& stats) const;
    std::unique_ptr<security::PathValidator> createValidator() const;
    void logReport(const RunReport& report) const;

    ConfigManager* m_config;
};
