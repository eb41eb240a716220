#include "library_loader.h"
#include <log/log_manager.h>
#include <json/json.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <fmt/format.h>

namespace playlist
{
    namespace
    {
        const QString kUnknown = QStringLiteral("Unknown");

        QString stringField(const Json::Value& object, const char* key, const QString& fallback = QString())
        {
            const Json::Value& value = object[key];
            if (value.isString()) {
                return QString::fromStdString(value.asString());
            }
            if (value.isIntegral()) {
                return QString::number(value.asLargestInt());
            }
            return fallback;
        }

        bool boolField(const Json::Value& object, const char* key)
        {
            const Json::Value& value = object[key];
            return value.isBool() && value.asBool();
        }

        QString idOf(const Json::Value& value)
        {
            if (value.isString()) return QString::fromStdString(value.asString());
            if (value.isIntegral()) return QString::number(value.asLargestInt());
            return QString();
        }
    }

    PlaylistForest LibraryLoader::loadFromFile(const QString& filePath)
    {
        LOG_INFO("Loading playlist library from {}", filePath.toStdString());

        std::ifstream file(filePath.toStdString());
        if (!file.is_open()) {
            std::string error = fmt::format("Failed to open library file: {}", filePath.toStdString());
            LOG_ERROR(error);
            throw LibraryLoadError(error);
        }

        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, file, &root, &errs)) {
            std::string error = fmt::format("JSON parse error in library file {}: {}", filePath.toStdString(), errs);
            LOG_ERROR(error);
            throw LibraryLoadError(error);
        }
        file.close();

        return parse(root);
    }

    PlaylistForest LibraryLoader::loadFromString(const std::string& json)
    {
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream stream(json);
        if (!Json::parseFromStream(builder, stream, &root, &errs)) {
            std::string error = fmt::format("JSON parse error in library: {}", errs);
            LOG_ERROR(error);
            throw LibraryLoadError(error);
        }
        return parse(root);
    }

    PlaylistForest LibraryLoader::parse(const Json::Value& root)
    {
        m_stats = LoadStatistics();

        if (!root.isObject()) {
            std::string error = "Library root must be a JSON object";
            LOG_ERROR(error);
            throw LibraryLoadError(error);
        }

        PlaylistForest forest;
        QHash<QString, int> trackIds;
        QSet<QString> deletedTrackIds;

        for (const Json::Value& value : root["tracks"]) {
            if (!value.isObject()) {
                LOG_WARN("Skipping malformed track entry");
                continue;
            }
            QString id = idOf(value["id"]);
            if (id.isEmpty()) {
                LOG_WARN("Skipping track without id");
                continue;
            }
            if (boolField(value, "deleted")) {
                deletedTrackIds.insert(id);
                continue;
            }
            if (trackIds.contains(id)) {
                LOG_WARN("Duplicate track id '{}', keeping the first definition", id.toStdString());
                continue;
            }

            Track track;
            track.sourcePath = stringField(value, "path");
            track.artist = stringField(value, "artist", kUnknown);
            track.title = stringField(value, "title", kUnknown);
            if (track.artist.isEmpty()) track.artist = kUnknown;
            if (track.title.isEmpty()) track.title = kUnknown;

            const Json::Value& duration = value["duration"];
            if (duration.isNumeric() && duration.asDouble() >= 0 && duration.asDouble() < 1e9) {
                track.durationSeconds = static_cast<int>(std::lround(duration.asDouble()));
            }

            trackIds.insert(id, forest.addTrack(track));
        }

        for (const Json::Value& value : root["playlists"]) {
            parsePlaylist(value, -1, forest, trackIds, deletedTrackIds);
        }

        m_stats.tracks = forest.trackCount();
        LOG_INFO("Loaded {} playlists and {} tracks; skipped {} deleted playlists and {} deleted track references",
                 m_stats.playlists, m_stats.tracks, m_stats.deletedPlaylists, m_stats.deletedTracks);
        if (m_stats.unknownTrackReferences > 0) {
            LOG_WARN("{} playlist entries reference unknown track ids", m_stats.unknownTrackReferences);
        }
        return forest;
    }

    void LibraryLoader::parsePlaylist(const Json::Value& value, int parentIndex, PlaylistForest& forest,
                                      const QHash<QString, int>& trackIds, const QSet<QString>& deletedTrackIds)
    {
        if (!value.isObject()) {
            LOG_WARN("Skipping malformed playlist entry");
            return;
        }

        QString name = stringField(value, "name");
        if (boolField(value, "deleted")) {
            int skipped = countPlaylists(value);
            m_stats.deletedPlaylists += skipped;
            LOG_DEBUG("Skipped deleted playlist '{}' ({} playlists in subtree)", name.toStdString(), skipped);
            return;
        }

        int index = forest.addPlaylist(name, parentIndex);
        ++m_stats.playlists;

        if (!boolField(value, "folder")) {
            int deletedHere = 0;
            for (const Json::Value& ref : value["tracks"]) {
                QString id = idOf(ref);
                if (deletedTrackIds.contains(id)) {
                    ++deletedHere;
                    continue;
                }
                auto it = trackIds.constFind(id);
                if (it == trackIds.constEnd()) {
                    ++m_stats.unknownTrackReferences;
                    LOG_WARN("Playlist '{}' references unknown track '{}'", name.toStdString(), id.toStdString());
                    continue;
                }
                forest.addTrackToPlaylist(index, it.value());
            }
            if (deletedHere > 0) {
                m_stats.deletedTracks += deletedHere;
                LOG_DEBUG("Playlist '{}': skipped {} deleted tracks", name.toStdString(), deletedHere);
            }
        }

        for (const Json::Value& child : value["children"]) {
            parsePlaylist(child, index, forest, trackIds, deletedTrackIds);
        }
    }

    int LibraryLoader::countPlaylists(const Json::Value& value) const
    {
        int count = 1;
        for (const Json::Value& child : value["children"]) {
            if (child.isObject()) {
                count += countPlaylists(child);
            }
        }
        return count;
    }
}
