#include <catch2/catch_test_macros.hpp>

#include <QTemporaryDir>
#include <json/json.h>
#include <sstream>

#include <m3u/sync_plan.h>
#include "test_utils.h"

using namespace m3u;

namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream stream(text);
    REQUIRE(Json::parseFromStream(builder, stream, &root, &errs));
    return root;
}

QList<SyncEntry> sampleEntries() {
    SyncEntry present;
    present.destinationPath = "/data/music/a.mp3";
    present.sourcePath = "/crates/a.mp3";
    present.existsLocally = true;

    SyncEntry missing;
    missing.destinationPath = QString::fromUtf8("/data/music/Björk/b.mp3");
    missing.sourcePath = QString::fromUtf8("/crates/Björk/b.mp3");
    missing.existsLocally = false;

    return {present, missing};
}

}

TEST_CASE("SyncPlan: JSON document", "[m3u][sync]") {
    Json::Value root = parse(syncPlanToJson(sampleEntries()));

    REQUIRE(root["missing"].asInt() == 1);
    REQUIRE(root["entries"].size() == 2);
    REQUIRE(root["entries"][0]["destination"].asString() == "/data/music/a.mp3");
    REQUIRE(root["entries"][0]["source"].asString() == "/crates/a.mp3");
    REQUIRE(root["entries"][0]["existsLocally"].asBool());
    REQUIRE(root["entries"][1]["destination"].asString() == "/data/music/Bj\xc3\xb6rk/b.mp3");
    REQUIRE_FALSE(root["entries"][1]["existsLocally"].asBool());
}

TEST_CASE("SyncPlan: empty plan", "[m3u][sync]") {
    Json::Value root = parse(syncPlanToJson({}));
    REQUIRE(root["entries"].isArray());
    REQUIRE(root["entries"].empty());
    REQUIRE(root["missing"].asInt() == 0);
}

TEST_CASE("SyncPlan: written to a file", "[m3u][sync]") {
    testutils::ensureQCoreApplication();
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    QString path = tmp.filePath("plan.json");
    writeSyncPlanFile(sampleEntries(), path);
    Json::Value root = parse(testutils::readFile(path).toStdString());
    REQUIRE(root["entries"].size() == 2);

    REQUIRE_THROWS_AS(writeSyncPlanFile(sampleEntries(), tmp.filePath("no/such/dir/plan.json")), WriteFailure);
}
