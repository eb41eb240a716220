#include "tree_builder.h"
#include "m3u_format.h"
#include <naming/unique_name_resolver.h>
#include <log/log_manager.h>
#include <QHash>
#include <QSet>

namespace m3u
{
    QString layoutModeToString(LayoutMode mode)
    {
        return mode == LayoutMode::Flat ? QStringLiteral("flat") : QStringLiteral("nested");
    }

    std::optional<LayoutMode> parseLayoutMode(const QString& text)
    {
        QString mode = text.trimmed().toLower();
        if (mode == QLatin1String("nested")) return LayoutMode::Nested;
        if (mode == QLatin1String("flat")) return LayoutMode::Flat;
        return std::nullopt;
    }

    int ForestValidation::nonEmptyPlaylistCount() const
    {
        int count = 0;
        for (const auto& tracks : validTracks) {
            if (!tracks.isEmpty()) ++count;
        }
        return count;
    }

    namespace
    {
        struct ValidationPass {
            const playlist::PlaylistForest& forest;
            const security::PathValidator& validator;
            ForestValidation& out;
            QHash<int, security::ValidationResult> cache;   // Tracks shared between playlists
            QSet<QString> seenDestinations;

            bool visit(int nodeIndex)
            {
                const playlist::PlaylistNode& node = forest.node(nodeIndex);
                QString playlistPath = forest.ancestry(nodeIndex).join('/');

                for (int trackIndex : node.trackIndices) {
                    auto it = cache.find(trackIndex);
                    if (it == cache.end()) {
                        it = cache.insert(trackIndex, validator.validate(forest.track(trackIndex).sourcePath));
                    }
                    const security::ValidationResult& result = it.value();

                    if (!result.isAccepted()) {
                        security::PathRejection rejection = result.rejection;
                        rejection.playlistPath = playlistPath;
                        LOG_WARN("Excluded track from '{}': {} ({}: {})",
                                 playlistPath.toStdString(), rejection.candidate.toStdString(),
                                 security::reasonToString(rejection.reason).toStdString(),
                                 rejection.detail.toStdString());
                        out.rejections.append(rejection);
                        continue;
                    }

                    const security::ValidatedPath& path = *result.accepted;
                    ValidTrack valid;
                    valid.trackIndex = trackIndex;
                    valid.destinationPath = path.destinationPath;
                    out.validTracks[nodeIndex].append(valid);

                    if (!seenDestinations.contains(path.destinationPath)) {
                        seenDestinations.insert(path.destinationPath);
                        SyncEntry entry;
                        entry.destinationPath = path.destinationPath;
                        entry.sourcePath = path.canonicalSource;
                        entry.existsLocally = path.existsLocally;
                        out.syncEntries.append(entry);
                    }
                }

                bool hasOutput = !out.validTracks[nodeIndex].isEmpty();
                for (int child : node.childIndices) {
                    bool childOutput = visit(child);
                    hasOutput = hasOutput || childOutput;
                }
                out.subtreeHasOutput[nodeIndex] = hasOutput;
                return hasOutput;
            }
        };
    }

    struct PlaylistTreeBuilder::Pass {
        Pass(const playlist::PlaylistForest& f, const ForestValidation& v,
             PlaylistSink& s, const naming::NameSanitizer& sanitizer)
            : forest(f), validation(v), sink(s), resolver(sanitizer)
        {
        }

        const playlist::PlaylistForest& forest;
        const ForestValidation& validation;
        PlaylistSink& sink;
        naming::UniqueNameResolver resolver;
        BuildResult result;
    };

    PlaylistTreeBuilder::PlaylistTreeBuilder(const security::PathValidator& validator,
                                             const naming::NameSanitizer& sanitizer,
                                             const BuildOptions& options)
        : m_validator(validator)
        , m_sanitizer(sanitizer)
        , m_options(options)
    {
    }

    ForestValidation PlaylistTreeBuilder::validate(const playlist::PlaylistForest& forest) const
    {
        ForestValidation validation;
        validation.validTracks = QList<QList<ValidTrack>>(forest.nodeCount());
        validation.subtreeHasOutput = QList<bool>(forest.nodeCount(), false);

        ValidationPass pass{forest, m_validator, validation, {}, {}};
        for (int root : forest.roots()) {
            pass.visit(root);
        }

        LOG_DEBUG("Validated {} playlists: {} accepted files, {} rejected references",
                  forest.nodeCount(), validation.syncEntries.size(), validation.rejections.size());
        return validation;
    }

    BuildResult PlaylistTreeBuilder::build(const playlist::PlaylistForest& forest, PlaylistSink& sink) const
    {
        LOG_INFO("Building {} playlist tree from {} root playlists",
                 layoutModeToString(m_options.mode).toStdString(), forest.roots().size());

        ForestValidation validation = validate(forest);
        Pass pass(forest, validation, sink, m_sanitizer);
        pass.result.rejections = validation.rejections;
        pass.result.syncEntries = validation.syncEntries;

        for (int root : forest.roots()) {
            if (m_options.mode == LayoutMode::Nested) {
                emitNested(pass, root, QString());
            } else {
                emitFlat(pass, root);
            }
        }
        pass.resolver.reset(QString());

        LOG_INFO("Wrote {} playlists in {} directories, {} track references rejected",
                 pass.result.playlists.size(), pass.result.directoriesCreated, pass.result.rejections.size());
        return pass.result;
    }

    void PlaylistTreeBuilder::emitNested(Pass& pass, int nodeIndex, const QString& parentPath) const
    {
        if (!pass.validation.subtreeHasOutput.at(nodeIndex)) {
            return;
        }

        const playlist::PlaylistNode& node = pass.forest.node(nodeIndex);
        naming::ResolvedName dir = pass.resolver.resolveDetailed(parentPath, node.name, true);
        if (dir.fallbackUsed) {
            ++pass.result.fallbackNames;
        }

        QString dirPath = parentPath.isEmpty() ? dir.name : parentPath + "/" + dir.name;
        pass.sink.createDirectory(dirPath);
        ++pass.result.directoriesCreated;

        // Claimed before the children so a child directory can never take the file's name
        QString fileName;
        if (!pass.validation.validTracks.at(nodeIndex).isEmpty()) {
            fileName = pass.resolver.resolve(dirPath, dir.name + ".m3u", false);
        }

        for (int child : node.childIndices) {
            emitNested(pass, child, dirPath);
        }

        if (!fileName.isEmpty()) {
            writeNode(pass, nodeIndex, dirPath + "/" + fileName);
        }
        pass.resolver.reset(dirPath);
    }

    void PlaylistTreeBuilder::emitFlat(Pass& pass, int nodeIndex) const
    {
        if (!pass.validation.subtreeHasOutput.at(nodeIndex)) {
            return;
        }

        if (!pass.validation.validTracks.at(nodeIndex).isEmpty()) {
            QString joined = pass.forest.ancestry(nodeIndex).join(m_options.flatSeparator);
            naming::SanitizeResult stem = m_sanitizer.sanitizeDetailed(joined, true);
            if (stem.fallbackUsed) {
                LOG_WARN("Playlist name '{}' sanitized to nothing, using '{}'",
                         joined.toStdString(), stem.name.toStdString());
                ++pass.result.fallbackNames;
            }
            QString fileName = pass.resolver.resolve(QString(), stem.name + ".m3u", false);
            writeNode(pass, nodeIndex, fileName);
        }

        for (int child : pass.forest.node(nodeIndex).childIndices) {
            emitFlat(pass, child);
        }
    }

    void PlaylistTreeBuilder::writeNode(Pass& pass, int nodeIndex, const QString& relativePath) const
    {
        const QList<ValidTrack>& tracks = pass.validation.validTracks.at(nodeIndex);

        QList<M3uEntry> entries;
        entries.reserve(tracks.size());
        for (const ValidTrack& valid : tracks) {
            const playlist::Track& track = pass.forest.track(valid.trackIndex);
            M3uEntry entry;
            entry.durationSeconds = track.durationSeconds.value_or(-1);
            entry.artist = track.artist;
            entry.title = track.title;
            entry.location = valid.destinationPath;
            entries.append(entry);
        }

        pass.sink.writePlaylist(relativePath, renderPlaylist(entries));

        WrittenPlaylist written;
        written.relativePath = relativePath;
        written.playlistPath = pass.forest.ancestry(nodeIndex).join('/');
        written.trackCount = static_cast<int>(entries.size());
        pass.result.playlists.append(written);

        LOG_INFO("Created playlist: {} with {} tracks", relativePath.toStdString(), written.trackCount);
    }
}
