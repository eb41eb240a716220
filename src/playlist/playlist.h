#pragma once

#include <QString>
#include <QStringList>
#include <QList>
#include <QMetaType>
#include <optional>

namespace playlist
{
    struct Track {
        QString sourcePath;                  // Absolute path in the source library
        QString artist;
        QString title;
        std::optional<int> durationSeconds;  // Empty if unknown
    };

    struct PlaylistNode {
        QString name;            // Raw name as it appears in the source library
        QList<int> trackIndices; // Indices into PlaylistForest::tracks, in playlist order
        QList<int> childIndices; // Indices into PlaylistForest::nodes, in original order
        int parentIndex = -1;    // -1 for root playlists
    };

    /**
     * Playlist forest stored as an arena: all nodes in one flat list, children referenced
     * by index. Tracks live in a shared table so several playlists can reference the same
     * track without copying it.
     *
     * Nodes can only be attached to parents that already exist, so the structure is
     * acyclic by construction.
     */
    class PlaylistForest
    {
    public:
        int addTrack(const Track& track);

        // Appends a node under parentIndex (-1 for a root); returns its index
        int addPlaylist(const QString& name, int parentIndex = -1);
        void addTrackToPlaylist(int nodeIndex, int trackIndex);

        const Track& track(int index) const { return m_tracks.at(index); }
        const PlaylistNode& node(int index) const { return m_nodes.at(index); }
        const QList<int>& roots() const { return m_roots; }

        int trackCount() const { return m_tracks.size(); }
        int nodeCount() const { return m_nodes.size(); }
        bool isEmpty() const { return m_roots.isEmpty(); }

        // Raw names from the root down to nodeIndex
        QStringList ancestry(int nodeIndex) const;
        // 1 for a root playlist
        int depth(int nodeIndex) const;

    private:
        QList<Track> m_tracks;
        QList<PlaylistNode> m_nodes;
        QList<int> m_roots;
    };
}

Q_DECLARE_METATYPE(playlist::Track)
