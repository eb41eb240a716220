#pragma once

#include <QString>
#include <QHash>
#include <QSet>
#include <stdexcept>
#include <string>
#include "playlist.h"

namespace Json { class Value; }

namespace playlist
{
    class LibraryLoadError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct LoadStatistics {
        int playlists = 0;
        int tracks = 0;
        int deletedPlaylists = 0;     // Including everything nested below them
        int deletedTracks = 0;        // Track references skipped because the track is deleted
        int unknownTrackReferences = 0;
    };

    /**
     * Library Loader - reads an exported playlist library (JSON) into a PlaylistForest
     *
     * Format:
     *   { "tracks":    [ { "id", "path", "artist", "title", "duration", "deleted" } ],
     *     "playlists": [ { "name", "folder", "deleted", "tracks": [id...], "children": [...] } ] }
     *
     * Deleted tracks and playlists are skipped, deleted playlists with their whole subtree.
     * Folders keep their children but never contribute tracks of their own.
     */
    class LibraryLoader
    {
    public:
        // @throws LibraryLoadError if the file cannot be read or parsed
        PlaylistForest loadFromFile(const QString& filePath);
        PlaylistForest loadFromString(const std::string& json);

        const LoadStatistics& statistics() const { return m_stats; }

    private:
        PlaylistForest parse(const Json::Value& root);
        void parsePlaylist(const Json::Value& value, int parentIndex, PlaylistForest& forest,
                           const QHash<QString, int>& trackIds, const QSet<QString>& deletedTrackIds);
        int countPlaylists(const Json::Value& value) const;

        LoadStatistics m_stats;
    };
}
