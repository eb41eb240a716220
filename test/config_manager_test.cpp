#include <catch2/catch_test_macros.hpp>
#include <QCoreApplication>
#include "test_utils.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QSignalSpy>

#include <config/config_manager.h>

TEST_CASE("ConfigManager: defaults for a new config file", "[ConfigManager]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    QString configFile = tmp.filePath("playlist_mirror.ini");

    ConfigManager cfg;
    cfg.initialize(configFile);

    REQUIRE(QFileInfo(configFile).exists());
    REQUIRE(cfg.getConfigFilePath() == QFileInfo(configFile).absoluteFilePath());
    REQUIRE(cfg.getCratesRoot().isEmpty());
    REQUIRE(cfg.getLibraryFile().isEmpty());
    REQUIRE(cfg.getOutputDirectory() == QDir::cleanPath(tmp.filePath("output")));
    REQUIRE(cfg.getDestinationRoot() == "/data/music");
    REQUIRE(cfg.getLayoutMode() == m3u::LayoutMode::Nested);
    REQUIRE(cfg.getFlatSeparator() == " - ");
    REQUIRE_FALSE(cfg.getCaseInsensitivePaths());
    REQUIRE(cfg.getLogLevel() == "info");
    REQUIRE(cfg.getLogDirectory() == QDir::cleanPath(tmp.filePath("log")));

    naming::SanitizerRules rules = cfg.getSanitizerRules();
    REQUIRE(rules.placeholder == QLatin1Char('-'));
    REQUIRE(rules.maxComponentBytes == 255);
    REQUIRE(rules.fallbackName == "untitled");
}

TEST_CASE("ConfigManager: values from an existing file", "[ConfigManager]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    QString configFile = tmp.filePath("mirror.ini");
    QByteArray ini =
        "[paths]\n"
        "crates_root=crates\n"
        "output_dir=/srv/playlists\n"
        "destination_root=/media/library/\n"
        "case_insensitive=true\n"
        "[output]\n"
        "mode=flat\n"
        "flat_separator=\" | \"\n"
        "[naming]\n"
        "placeholder=_\n"
        "max_component_bytes=128\n";
    REQUIRE(testutils::writeFile(configFile, ini));

    ConfigManager cfg;
    cfg.initialize(configFile);

    REQUIRE(cfg.getCratesRoot() == QDir::cleanPath(tmp.filePath("crates")));
    REQUIRE(cfg.getOutputDirectory() == "/srv/playlists");
    REQUIRE(cfg.getDestinationRoot() == "/media/library/");
    REQUIRE(cfg.getCaseInsensitivePaths());
    REQUIRE(cfg.getLayoutMode() == m3u::LayoutMode::Flat);
    REQUIRE(cfg.getFlatSeparator() == " | ");
    REQUIRE(cfg.getSanitizerRules().placeholder == QLatin1Char('_'));
    REQUIRE(cfg.getSanitizerRules().maxComponentBytes == 128);
}

TEST_CASE("ConfigManager: environment and command line overrides", "[ConfigManager]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    ConfigManager cfg;
    cfg.initialize(tmp.filePath("playlist_mirror.ini"));
    cfg.setCratesRoot("from-file");

    QProcessEnvironment env;
    env.insert("CRATES_ROOT", "/srv/crates");
    env.insert("OUTPUT_DIR", "/srv/out");
    env.insert("JELLYFIN_ROOT", "/jellyfin/music");
    env.insert("LIBRARY_FILE", "/srv/library.json");
    env.insert("LOG_LEVEL", "DEBUG");

    QSignalSpy spy(&cfg, &ConfigManager::configurationChanged);
    cfg.applyEnvironment(env);

    SECTION("environment wins over the file") {
        REQUIRE(cfg.getCratesRoot() == "/srv/crates");
        REQUIRE(cfg.getOutputDirectory() == "/srv/out");
        REQUIRE(cfg.getDestinationRoot() == "/jellyfin/music");
        REQUIRE(cfg.getLibraryFile() == "/srv/library.json");
        REQUIRE(cfg.getLogLevel() == "debug");
        REQUIRE(spy.count() == 5);
    }

    SECTION("command line wins over the environment") {
        cfg.setOverride(ConfigManager::KeyOutputDir, "/cli/out");
        REQUIRE(cfg.getOutputDirectory() == "/cli/out");
    }

    SECTION("overrides are not written to the file") {
        cfg.saveToFile();
        ConfigManager reloaded;
        reloaded.initialize(tmp.filePath("playlist_mirror.ini"));
        REQUIRE(reloaded.getCratesRoot() == QDir::cleanPath(tmp.filePath("from-file")));
    }

    SECTION("unknown log level is ignored") {
        ConfigManager other;
        other.initialize(tmp.filePath("other.ini"));
        QProcessEnvironment bad;
        bad.insert("LOG_LEVEL", "chatty");
        other.applyEnvironment(bad);
        REQUIRE(other.getLogLevel() == "info");
        REQUIRE_FALSE(other.hasOverride(ConfigManager::KeyLogLevel));
    }
}

TEST_CASE("ConfigManager: setters validate and notify", "[ConfigManager]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    ConfigManager cfg;
    cfg.initialize(tmp.filePath("playlist_mirror.ini"));
    QSignalSpy spy(&cfg, &ConfigManager::configurationChanged);

    SECTION("byte budget") {
        REQUIRE_FALSE(cfg.setMaxComponentBytes(10));
        REQUIRE_FALSE(cfg.setMaxComponentBytes(300));
        REQUIRE(spy.count() == 0);
        REQUIRE(cfg.setMaxComponentBytes(100));
        REQUIRE(spy.count() == 1);
        REQUIRE(spy.at(0).at(0).toString() == ConfigManager::KeyMaxComponentBytes);
        REQUIRE(cfg.getSanitizerRules().maxComponentBytes == 100);
    }

    SECTION("placeholder") {
        REQUIRE_FALSE(cfg.setPlaceholder(QLatin1Char('/')));
        REQUIRE_FALSE(cfg.setPlaceholder(QLatin1Char(' ')));
        REQUIRE(cfg.setPlaceholder(QLatin1Char('_')));
        REQUIRE(cfg.getSanitizerRules().placeholder == QLatin1Char('_'));
        REQUIRE(spy.count() == 1);
    }

    SECTION("fallback name") {
        REQUIRE_FALSE(cfg.setFallbackName(""));
        REQUIRE_FALSE(cfg.setFallbackName("CON"));
        REQUIRE(cfg.setFallbackName("Unnamed"));
        REQUIRE(cfg.getSanitizerRules().fallbackName == "Unnamed");
    }

    SECTION("flat separator and destination root") {
        REQUIRE_FALSE(cfg.setFlatSeparator(""));
        REQUIRE_FALSE(cfg.setFlatSeparator(" / "));
        REQUIRE(cfg.setFlatSeparator(" ~ "));
        REQUIRE_FALSE(cfg.setDestinationRoot("  "));
        REQUIRE(cfg.setDestinationRoot("/mnt/music"));
        REQUIRE(cfg.getDestinationRoot() == "/mnt/music");
    }

    SECTION("layout and log level") {
        cfg.setLayoutMode(m3u::LayoutMode::Flat);
        REQUIRE(cfg.getLayoutMode() == m3u::LayoutMode::Flat);
        cfg.setLogLevel("verbose");
        REQUIRE(cfg.getLogLevel() == "info");
        cfg.setLogLevel("Warn");
        REQUIRE(cfg.getLogLevel() == "warn");
        REQUIRE(spy.count() == 2);
    }

    SECTION("a setter replaces an override") {
        cfg.setOverride(ConfigManager::KeyDestinationRoot, "/override");
        REQUIRE(cfg.getDestinationRoot() == "/override");
        REQUIRE(cfg.setDestinationRoot("/explicit"));
        REQUIRE(cfg.getDestinationRoot() == "/explicit");
    }

    SECTION("values persist") {
        REQUIRE(cfg.setMaxComponentBytes(64));
        cfg.setLayoutMode(m3u::LayoutMode::Flat);
        cfg.saveToFile();

        ConfigManager reloaded;
        reloaded.initialize(tmp.filePath("playlist_mirror.ini"));
        REQUIRE(reloaded.getSanitizerRules().maxComponentBytes == 64);
        REQUIRE(reloaded.getLayoutMode() == m3u::LayoutMode::Flat);
    }
}

TEST_CASE("ConfigManager: problems that block a run", "[ConfigManager]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    ConfigManager cfg;
    cfg.initialize(tmp.filePath("playlist_mirror.ini"));
    REQUIRE(cfg.checkForProblems().size() == 2);

    cfg.setCratesRoot(tmp.filePath("crates"));
    cfg.setLibraryFile(tmp.filePath("library.json"));
    REQUIRE(cfg.checkForProblems().size() == 2);

    QDir().mkpath(tmp.filePath("crates"));
    REQUIRE(testutils::writeFile(tmp.filePath("library.json"), "{}"));
    REQUIRE(cfg.checkForProblems().isEmpty());

    cfg.setOverride(ConfigManager::KeyLayoutMode, "spiral");
    REQUIRE(cfg.checkForProblems().size() == 1);
}
