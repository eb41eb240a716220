#include "playlist.h"
#include <stdexcept>
#include <fmt/format.h>

namespace playlist
{
    int PlaylistForest::addTrack(const Track& track)
    {
        m_tracks.append(track);
        return m_tracks.size() - 1;
    }

    int PlaylistForest::addPlaylist(const QString& name, int parentIndex)
    {
        if (parentIndex < -1 || parentIndex >= m_nodes.size()) {
            throw std::out_of_range(fmt::format("Parent playlist index {} out of range", parentIndex));
        }

        PlaylistNode node;
        node.name = name;
        node.parentIndex = parentIndex;
        m_nodes.append(node);
        int index = m_nodes.size() - 1;

        if (parentIndex == -1) {
            m_roots.append(index);
        } else {
            m_nodes[parentIndex].childIndices.append(index);
        }
        return index;
    }

    void PlaylistForest::addTrackToPlaylist(int nodeIndex, int trackIndex)
    {
        if (nodeIndex < 0 || nodeIndex >= m_nodes.size()) {
            throw std::out_of_range(fmt::format("Playlist index {} out of range", nodeIndex));
        }
        if (trackIndex < 0 || trackIndex >= m_tracks.size()) {
            throw std::out_of_range(fmt::format("Track index {} out of range", trackIndex));
        }
        m_nodes[nodeIndex].trackIndices.append(trackIndex);
    }

    QStringList PlaylistForest::ancestry(int nodeIndex) const
    {
        QStringList names;
        for (int i = nodeIndex; i != -1; i = m_nodes.at(i).parentIndex) {
            names.prepend(m_nodes.at(i).name);
        }
        return names;
    }

    int PlaylistForest::depth(int nodeIndex) const
    {
        int d = 0;
        for (int i = nodeIndex; i != -1; i = m_nodes.at(i).parentIndex) {
            ++d;
        }
        return d;
    }
}
