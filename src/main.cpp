#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QFileInfo>
#include <manager/application_context.h>
#include <manager/mirror_pipeline.h>
#include <config/config_manager.h>
#include <naming/unique_name_resolver.h>
#include <m3u/playlist_sink.h>
#include <exception>
#include <iostream>
#include <log/log_manager.h>
#include <fmt/format.h>

namespace
{
    enum ExitCode {
        ExitSuccess = 0,
        ExitConfigError = 1,
        ExitBuildFailure = 2
    };

    const char* kCreatePlaylists = "create-playlists";
    const char* kSyncPlan = "sync-plan";
    const char* kConfigCheck = "config-check";

    QString absoluteFromCwd(const QString& path)
    {
        return QDir::cleanPath(QDir::current().absoluteFilePath(path));
    }

    void printReport(const RunReport& report)
    {
        int entries = 0;
        for (const m3u::WrittenPlaylist& written : report.build.playlists) {
            entries += written.trackCount;
            if (report.dryRun) {
                fmt::print("  {} ({} tracks)\n", written.relativePath.toStdString(), written.trackCount);
            }
        }

        fmt::print("{} {} playlists ({} layout) with {} entries to {}\n",
                   report.dryRun ? "Would write" : "Wrote",
                   report.build.playlists.size(),
                   m3u::layoutModeToString(report.mode).toStdString(),
                   entries, report.outputDirectory.toStdString());
        fmt::print("Library: {} playlists, {} tracks; skipped {} deleted playlists, {} deleted tracks\n",
                   report.load.playlists, report.load.tracks,
                   report.load.deletedPlaylists, report.load.deletedTracks);

        if (!report.build.rejections.isEmpty()) {
            fmt::print("Excluded {} track references:\n", report.build.rejections.size());
            for (const security::PathRejection& rejection : report.build.rejections) {
                fmt::print("  [{}] {} (in '{}')\n",
                           security::reasonToString(rejection.reason).toStdString(),
                           rejection.candidate.toStdString(),
                           rejection.playlistPath.toStdString());
            }
        }
        if (report.build.fallbackNames > 0) {
            fmt::print("{} playlist names were empty after sanitizing and use the fallback name\n",
                       report.build.fallbackNames);
        }
    }

    int runConfigCheck(ConfigManager* config)
    {
        naming::SanitizerRules rules = config->getSanitizerRules();
        fmt::print("Config file:        {}\n", config->getConfigFilePath().toStdString());
        fmt::print("Crates root:        {}\n", config->getCratesRoot().toStdString());
        fmt::print("Library file:       {}\n", config->getLibraryFile().toStdString());
        fmt::print("Output directory:   {}\n", config->getOutputDirectory().toStdString());
        fmt::print("Destination root:   {}\n", config->getDestinationRoot().toStdString());
        fmt::print("Layout:             {}\n", m3u::layoutModeToString(config->getLayoutMode()).toStdString());
        fmt::print("Flat separator:     '{}'\n", config->getFlatSeparator().toStdString());
        fmt::print("Placeholder:        '{}'\n", QString(rules.placeholder).toStdString());
        fmt::print("Max component size: {} bytes\n", rules.maxComponentBytes);
        fmt::print("Fallback name:      {}\n", rules.fallbackName.toStdString());
        fmt::print("Case insensitive:   {}\n", config->getCaseInsensitivePaths() ? "yes" : "no");
        fmt::print("Log level:          {}\n", config->getLogLevel().toStdString());

        QStringList problems = config->checkForProblems();
        if (problems.isEmpty()) {
            fmt::print("Configuration OK\n");
            return ExitSuccess;
        }
        for (const QString& problem : problems) {
            fmt::print("Problem: {}\n", problem.toStdString());
        }
        return ExitConfigError;
    }
}

int main(int argc, char *argv[])
{
    // Make uncaught exceptions visible before the process dies
    std::set_terminate([]() {
        if (std::current_exception()) {
            try { std::rethrow_exception(std::current_exception()); }
            catch (const std::exception &e) {
                std::cerr << "terminate due to exception: " << e.what() << std::endl;
            }
            catch (...) {
                std::cerr << "terminate due to unknown non-std exception" << std::endl;
            }
        } else {
            std::cerr << "terminate called without an active exception" << std::endl;
        }
        std::abort();
    });

    QCoreApplication app(argc, argv);
    app.setApplicationName("playlist_mirror");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Mirrors a playlist library into a collision-free tree of .m3u files");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    "Configuration file.", "file", "playlist_mirror.ini");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Log debug messages.");
    QCommandLineOption quietOption(QStringList() << "q" << "quiet", "Log warnings and errors only.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(quietOption);
    parser.addPositionalArgument("command", "create-playlists | sync-plan | config-check");

    // First pass only finds the command, its options are added below
    parser.parse(app.arguments());
    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.first();

    QCommandLineOption outputDirOption("output-dir", "Directory the playlists are written to.", "dir");
    QCommandLineOption flatOption("flat", "Write all playlists into one directory.");
    QCommandLineOption nestedOption("nested", "Mirror the playlist hierarchy as directories.");
    QCommandLineOption dryRunOption("dry-run", "Show what would be written without touching the disk.");
    QCommandLineOption outputOption(QStringList() << "o" << "output", "Sync plan file, '-' for stdout.", "file", "-");

    parser.clearPositionalArguments();
    if (command == kCreatePlaylists) {
        parser.addPositionalArgument(kCreatePlaylists, "Create the playlist tree.");
        parser.addOption(outputDirOption);
        parser.addOption(flatOption);
        parser.addOption(nestedOption);
        parser.addOption(dryRunOption);
    } else if (command == kSyncPlan) {
        parser.addPositionalArgument(kSyncPlan, "Write the list of files to transfer as JSON.");
        parser.addOption(outputOption);
    } else if (command == kConfigCheck) {
        parser.addPositionalArgument(kConfigCheck, "Show the effective configuration.");
    } else {
        parser.addPositionalArgument("command", "create-playlists | sync-plan | config-check");
    }
    parser.process(app);

    if (command != kCreatePlaylists && command != kSyncPlan && command != kConfigCheck) {
        if (!command.isEmpty()) {
            std::cerr << "Unknown command: " << command.toStdString() << std::endl;
        }
        std::cerr << parser.helpText().toStdString();
        return ExitConfigError;
    }
    if (parser.isSet(verboseOption) && parser.isSet(quietOption)) {
        std::cerr << "--verbose and --quiet are mutually exclusive" << std::endl;
        return ExitConfigError;
    }
    if (parser.isSet(flatOption) && parser.isSet(nestedOption)) {
        std::cerr << "--flat and --nested are mutually exclusive" << std::endl;
        return ExitConfigError;
    }

    try {
        APP_CONTEXT.initializePhase1(absoluteFromCwd(parser.value(configOption)));
    } catch (const std::exception& e) {
        std::cerr << "Initialization failed: " << e.what() << std::endl;
        return ExitConfigError;
    }

    // Command line overrides environment and config file
    ConfigManager* config = CONFIG_MANAGER;
    if (parser.isSet(verboseOption)) {
        config->setOverride(ConfigManager::KeyLogLevel, "debug");
    } else if (parser.isSet(quietOption)) {
        config->setOverride(ConfigManager::KeyLogLevel, "warn");
    }
    if (parser.isSet(outputDirOption)) {
        config->setOverride(ConfigManager::KeyOutputDir, absoluteFromCwd(parser.value(outputDirOption)));
    }
    if (parser.isSet(flatOption)) {
        config->setOverride(ConfigManager::KeyLayoutMode, m3u::layoutModeToString(m3u::LayoutMode::Flat));
    } else if (parser.isSet(nestedOption)) {
        config->setOverride(ConfigManager::KeyLayoutMode, m3u::layoutModeToString(m3u::LayoutMode::Nested));
    }

    int exitCode = ExitSuccess;
    try {
        APP_CONTEXT.initializePhase2();

        if (command == kConfigCheck) {
            exitCode = runConfigCheck(config);
        } else if (command == kCreatePlaylists) {
            RunReport report = MIRROR_PIPELINE->createPlaylists(parser.isSet(dryRunOption));
            printReport(report);
        } else {
            QString output = parser.value(outputOption);
            if (output != QLatin1String("-")) {
                output = absoluteFromCwd(output);
            }
            int count = MIRROR_PIPELINE->writeSyncPlan(output);
            if (output != QLatin1String("-")) {
                fmt::print("Wrote sync plan with {} entries to {}\n", count, output.toStdString());
            }
        }
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        exitCode = ExitConfigError;
    } catch (const playlist::LibraryLoadError& e) {
        LOG_ERROR("Library error: {}", e.what());
        std::cerr << "Library error: " << e.what() << std::endl;
        exitCode = ExitConfigError;
    } catch (const naming::CollisionBoundExceeded& e) {
        std::cerr << "Build failed: " << e.what() << std::endl;
        exitCode = ExitBuildFailure;
    } catch (const m3u::WriteFailure& e) {
        std::cerr << "Build failed: " << e.what() << std::endl;
        exitCode = ExitBuildFailure;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unexpected failure: {}", e.what());
        std::cerr << "Unexpected failure: " << e.what() << std::endl;
        exitCode = ExitBuildFailure;
    }

    APP_CONTEXT.shutdown();
    return exitCode;
}
