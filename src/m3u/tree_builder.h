#pragma once

#include <QList>
#include <QString>
#include <optional>
#include <playlist/playlist.h>
#include <security/path_validator.h>
#include <naming/name_sanitizer.h>
#include "playlist_sink.h"

namespace naming { class UniqueNameResolver; }

namespace m3u
{
    enum class LayoutMode {
        Nested = 0,   // One directory per playlist node
        Flat = 1      // All files in the destination root, ancestry joined into the name
    };

    QString layoutModeToString(LayoutMode mode);
    std::optional<LayoutMode> parseLayoutMode(const QString& text);

    struct BuildOptions {
        LayoutMode mode = LayoutMode::Nested;
        QString flatSeparator = QStringLiteral(" - ");
    };

    struct WrittenPlaylist {
        QString relativePath;   // File path relative to the destination directory
        QString playlistPath;   // Raw ancestry joined with '/', for reporting
        int trackCount = 0;
    };

    // Handed to the external sync collaborator
    struct SyncEntry {
        QString destinationPath;
        QString sourcePath;     // Canonical source location
        bool existsLocally = false;
    };

    struct ValidTrack {
        int trackIndex = -1;
        QString destinationPath;
    };

    struct ForestValidation {
        QList<QList<ValidTrack>> validTracks;     // Per node index
        QList<bool> subtreeHasOutput;             // Per node index
        QList<security::PathRejection> rejections;
        QList<SyncEntry> syncEntries;             // Deduplicated by destination, first seen first

        int nonEmptyPlaylistCount() const;
    };

    struct BuildResult {
        QList<WrittenPlaylist> playlists;
        QList<security::PathRejection> rejections;
        QList<SyncEntry> syncEntries;
        int directoriesCreated = 0;
        int fallbackNames = 0;          // Names that sanitized to nothing
    };

    /**
     * @brief Emits the playlist forest as a tree of .m3u files
     *
     * Depth-first over the forest, children in original order, which fixes the order in
     * which sibling names are claimed and makes repeated runs byte-identical.
     *
     * Nodes without valid tracks write no file. In Nested mode their directory is still
     * created when a descendant writes one, and subtrees without any output consume no
     * names at all.
     */
    class PlaylistTreeBuilder
    {
    public:
        PlaylistTreeBuilder(const security::PathValidator& validator,
                            const naming::NameSanitizer& sanitizer,
                            const BuildOptions& options = BuildOptions());

        // Validates every track reference without writing anything
        ForestValidation validate(const playlist::PlaylistForest& forest) const;

        /**
         * @throws naming::CollisionBoundExceeded on pathological name repetition
         * @throws WriteFailure if the sink cannot create a directory or file
         */
        BuildResult build(const playlist::PlaylistForest& forest, PlaylistSink& sink) const;

        const BuildOptions& options() const { return m_options; }

    private:
        struct Pass;

        void emitNested(Pass& pass, int nodeIndex, const QString& parentPath) const;
        void emitFlat(Pass& pass, int nodeIndex) const;
        void writeNode(Pass& pass, int nodeIndex, const QString& relativePath) const;

        const security::PathValidator& m_validator;
        const naming::NameSanitizer& m_sanitizer;
        BuildOptions m_options;
    };
}
