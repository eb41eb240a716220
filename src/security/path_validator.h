#pragma once

#include <QString>
#include <memory>
#include <optional>
#include "path_canonicalizer.h"

namespace security
{
    enum class RejectReason {
        OutsideRoot = 0,    // Resolves to a location outside the source root
        Unresolvable = 1,   // Empty, relative, malformed or impossible to resolve safely
        NotAFile = 2        // Exists inside the root but is not a regular file
    };

    // "outside-root", "unresolvable", "not-a-file"
    QString reasonToString(RejectReason reason);

    struct PathRejection {
        QString candidate;      // Path exactly as supplied by the library
        RejectReason reason = RejectReason::Unresolvable;
        QString detail;         // Resolved path or diagnostic text
        QString playlistPath;   // Filled in by the caller that knows the playlist context
    };

    struct ValidatedPath {
        QString destinationPath;  // Re-rooted under the destination root
        QString canonicalSource;  // Physical source location
        bool existsLocally = false;
    };

    struct ValidationResult {
        std::optional<ValidatedPath> accepted;
        PathRejection rejection;  // Meaningful only when accepted is empty

        bool isAccepted() const { return accepted.has_value(); }
    };

    /**
     * @brief Containment check and rewrite of media paths
     *
     * A candidate is accepted iff its canonical form (symlinks resolved) is the source root
     * or lies below it. Accepted paths are re-rooted under the destination root, keeping
     * the relative part verbatim. Rejections are returned, never thrown: callers drop the
     * track and keep going.
     */
    class PathValidator
    {
    public:
        /**
         * @param sourceRoot Trusted directory all media must live in; must exist
         * @param destinationRoot Prefix understood by the playback system, e.g. /data/music
         * @param canonicalizer Resolution policy; defaults to FileSystemCanonicalizer
         * @throws std::invalid_argument if the source root cannot be resolved to a directory
         *         or the destination root is empty
         */
        PathValidator(const QString& sourceRoot,
                      const QString& destinationRoot,
                      std::shared_ptr<const PathCanonicalizer> canonicalizer = nullptr);

        ValidationResult validate(const QString& candidate) const;

        const QString& canonicalRoot() const { return m_canonicalRoot; }
        const QString& destinationRoot() const { return m_destinationRoot; }

        // True if the already-canonical path is the root or lies below it
        bool isWithinRoot(const QString& canonicalPath) const;

    private:
        ValidationResult reject(const QString& candidate, RejectReason reason, const QString& detail) const;

        std::shared_ptr<const PathCanonicalizer> m_canonicalizer;
        QString m_canonicalRoot;
        QString m_rootPrefix;       // Canonical root with exactly one trailing '/'
        QString m_destinationRoot;  // No trailing '/', empty when the destination is "/"
    };
}
