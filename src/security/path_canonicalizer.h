#pragma once

#include <QString>
#include <Qt>
#include <optional>

namespace security
{
    struct CanonicalPath {
        QString path;         // Absolute, '/'-separated, symlinks resolved
        bool exists = false;  // False when only a prefix of the path exists
        bool isFile = false;  // Regular file after symlink resolution
    };

    /**
     * @brief Policy that turns a path into the form used for containment checks
     *
     * Symlink resolution and case rules differ per target filesystem, so the validator
     * only talks to this interface. Whatever the policy, the returned path must be the
     * physical location the kernel would open, never a lexical approximation.
     */
    class PathCanonicalizer
    {
    public:
        virtual ~PathCanonicalizer() = default;

        /**
         * @param path Absolute path
         * @return Canonical form, or std::nullopt if the path cannot be resolved safely
         */
        virtual std::optional<CanonicalPath> canonicalize(const QString& path) const = 0;

        // How canonical paths are compared against each other
        virtual Qt::CaseSensitivity caseSensitivity() const = 0;
    };

    /**
     * @brief Canonicalizer backed by the local filesystem (realpath semantics)
     *
     * Existing paths are resolved with QFileInfo::canonicalFilePath(). For a path that does
     * not exist, the longest existing prefix is resolved and the missing segments are
     * appended unchanged. A missing remainder containing ".." or starting at a dangling
     * symlink cannot be reasoned about and yields std::nullopt.
     */
    class FileSystemCanonicalizer : public PathCanonicalizer
    {
    public:
        explicit FileSystemCanonicalizer(Qt::CaseSensitivity sensitivity = Qt::CaseSensitive);

        std::optional<CanonicalPath> canonicalize(const QString& path) const override;
        Qt::CaseSensitivity caseSensitivity() const override { return m_sensitivity; }

    private:
        Qt::CaseSensitivity m_sensitivity;
    };
}
