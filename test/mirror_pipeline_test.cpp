#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

#include <config/config_manager.h>
#include <manager/mirror_pipeline.h>
#include <m3u/playlist_sink.h>
#include "test_utils.h"

namespace {

struct PipelineFixture {
    QTemporaryDir tmp;
    QString base;
    QString crates;
    QString output;
    ConfigManager config;

    PipelineFixture() {
        testutils::ensureQCoreApplication();
        base = QFileInfo(tmp.path()).canonicalFilePath();
        crates = base + "/crates";
        output = base + "/out";

        testutils::writeFile(crates + "/a.mp3");
        testutils::writeFile(crates + "/b.mp3");
        testutils::writeFile(base + "/elsewhere/c.mp3");
        testutils::writeFile(output + "/stale.m3u", "#EXTM3U\n");

        QString library = QString(R"({
          "tracks": [
            { "id": "a", "path": "%1/a.mp3", "artist": "A", "title": "One", "duration": 10 },
            { "id": "b", "path": "%1/b.mp3", "artist": "B", "title": "Two" },
            { "id": "c", "path": "%2/elsewhere/c.mp3", "artist": "C", "title": "Three" },
            { "id": "l", "path": "%1/later.mp3", "artist": "L", "title": "Later" }
          ],
          "playlists": [
            { "name": "Sets", "folder": true, "children": [
              { "name": "Warm/up", "tracks": ["a", "b", "c"] }
            ] },
            { "name": "All", "tracks": ["b", "l"] }
          ]
        })").arg(crates, base);
        testutils::writeFile(base + "/library.json", library.toUtf8());

        config.initialize(base + "/playlist_mirror.ini");
        config.setCratesRoot(crates);
        config.setLibraryFile(base + "/library.json");
        config.setOutputDirectory(output);
        config.setDestinationRoot("/data/music");
    }
};

}

TEST_CASE("MirrorPipeline: creates the playlist tree", "[pipeline]") {
    PipelineFixture fx;
    REQUIRE(fx.tmp.isValid());
    MirrorPipeline pipeline(&fx.config);

    SECTION("nested") {
        RunReport report = pipeline.createPlaylists(false);
        REQUIRE(testutils::listFilesRecursively(fx.output) ==
                QStringList{"All/All.m3u", "Sets/Warm-up/Warm-up.m3u"});
        REQUIRE(report.build.playlists.size() == 2);
        REQUIRE(report.build.rejections.size() == 1);
        REQUIRE(report.load.playlists == 3);
        REQUIRE(testutils::readFile(fx.output + "/All/All.m3u") ==
                QByteArray("#EXTM3U\n"
                           "#EXTINF:-1,B - Two\n/data/music/b.mp3\n"
                           "#EXTINF:-1,L - Later\n/data/music/later.mp3\n"));
    }

    SECTION("flat") {
        fx.config.setLayoutMode(m3u::LayoutMode::Flat);
        RunReport report = pipeline.createPlaylists(false);
        REQUIRE(report.mode == m3u::LayoutMode::Flat);
        REQUIRE(testutils::listFilesRecursively(fx.output) ==
                QStringList{"All.m3u", "Sets - Warm-up.m3u"});
    }

    SECTION("dry run leaves the output alone") {
        RunReport report = pipeline.createPlaylists(true);
        REQUIRE(report.dryRun);
        REQUIRE(report.build.playlists.size() == 2);
        REQUIRE(testutils::listFilesRecursively(fx.output) == QStringList{"stale.m3u"});
    }

    SECTION("second run gives the same tree") {
        pipeline.createPlaylists(false);
        QByteArray first = testutils::readFile(fx.output + "/Sets/Warm-up/Warm-up.m3u");
        pipeline.createPlaylists(false);
        REQUIRE(testutils::readFile(fx.output + "/Sets/Warm-up/Warm-up.m3u") == first);
        REQUIRE(testutils::listFilesRecursively(fx.output).size() == 2);
    }
}

TEST_CASE("MirrorPipeline: sync plan", "[pipeline]") {
    PipelineFixture fx;
    REQUIRE(fx.tmp.isValid());
    MirrorPipeline pipeline(&fx.config);

    QList<m3u::SyncEntry> entries = pipeline.buildSyncPlan();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries.at(0).sourcePath == fx.crates + "/a.mp3");
    REQUIRE(entries.at(2).destinationPath == "/data/music/later.mp3");
    REQUIRE_FALSE(entries.at(2).existsLocally);

    QString planFile = fx.base + "/plan.json";
    REQUIRE(pipeline.writeSyncPlan(planFile) == 3);
    REQUIRE(QFileInfo(planFile).isFile());

    // Nothing is written to the output directory
    REQUIRE(testutils::listFilesRecursively(fx.output) == QStringList{"stale.m3u"});
}

TEST_CASE("MirrorPipeline: configuration errors", "[pipeline]") {
    PipelineFixture fx;
    REQUIRE(fx.tmp.isValid());
    MirrorPipeline pipeline(&fx.config);

    SECTION("missing crates root") {
        fx.config.setCratesRoot(fx.base + "/nope");
        REQUIRE_THROWS_AS(pipeline.createPlaylists(false), ConfigurationError);
    }

    SECTION("library not configured") {
        fx.config.setLibraryFile("");
        REQUIRE_THROWS_AS(pipeline.createPlaylists(false), ConfigurationError);
    }

    SECTION("library missing") {
        fx.config.setLibraryFile(fx.base + "/missing.json");
        REQUIRE_THROWS_AS(pipeline.createPlaylists(false), playlist::LibraryLoadError);
    }

    SECTION("output directory is the crates root") {
        fx.config.setOutputDirectory(fx.crates);
        REQUIRE_THROWS_AS(pipeline.createPlaylists(false), ConfigurationError);
        REQUIRE(QFileInfo(fx.crates + "/a.mp3").isFile());
    }

    SECTION("output directory contains the crates root") {
        fx.config.setOutputDirectory(fx.base);
        REQUIRE_THROWS_AS(pipeline.createPlaylists(false), ConfigurationError);
        REQUIRE(QFileInfo(fx.base + "/library.json").isFile());
    }
}

TEST_CASE("MirrorPipeline: unsafe output directories", "[pipeline]") {
    PipelineFixture fx;
    REQUIRE(fx.tmp.isValid());

    QString reason;
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory("/", QString(), &reason));
    REQUIRE(reason.contains("root"));
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory(QDir::homePath(), QString()));
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory("", QString()));
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory(fx.crates, fx.crates));
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory(fx.crates + "/../crates", fx.crates));
    REQUIRE(MirrorPipeline::isUnsafeOutputDirectory(fx.base, fx.crates));
    REQUIRE_FALSE(MirrorPipeline::isUnsafeOutputDirectory(fx.output, fx.crates));
    REQUIRE_FALSE(MirrorPipeline::isUnsafeOutputDirectory(fx.base + "/not-yet-created", fx.crates));
}

TEST_CASE("MirrorPipeline: write failure aborts the run", "[pipeline]") {
    PipelineFixture fx;
    REQUIRE(fx.tmp.isValid());
    MirrorPipeline pipeline(&fx.config);

    // A regular file where the output's parent directory should be
    REQUIRE(testutils::writeFile(fx.base + "/blocker"));
    fx.config.setOutputDirectory(fx.base + "/blocker/out");
    REQUIRE_THROWS_AS(pipeline.createPlaylists(false), m3u::WriteFailure);
}
