#include "path_canonicalizer.h"
#include <log/log_manager.h>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

namespace security
{
    namespace
    {
        QString joinSegments(const QStringList& segments, int count)
        {
            return "/" + segments.mid(0, count).join('/');
        }

        QString appendSegments(const QString& base, const QStringList& segments)
        {
            if (segments.isEmpty()) return base;
            return base.endsWith('/') ? base + segments.join('/') : base + "/" + segments.join('/');
        }
    }

    FileSystemCanonicalizer::FileSystemCanonicalizer(Qt::CaseSensitivity sensitivity)
        : m_sensitivity(sensitivity)
    {
    }

    std::optional<CanonicalPath> FileSystemCanonicalizer::canonicalize(const QString& path) const
    {
        if (path.isEmpty() || !QDir::isAbsolutePath(path)) {
            return std::nullopt;
        }

        QFileInfo info(path);
        if (info.exists()) {
            QString canonical = info.canonicalFilePath();
            if (canonical.isEmpty()) {
                LOG_TRACE("canonicalFilePath failed for existing path: {}", path.toStdString());
                return std::nullopt;
            }
            CanonicalPath result;
            result.path = canonical;
            result.exists = true;
            result.isFile = QFileInfo(canonical).isFile();
            return result;
        }

        if (info.isSymLink()) {
            LOG_TRACE("Dangling symlink: {}", path.toStdString());
            return std::nullopt;
        }

        // Keep ".." segments: they are only safe to interpret after the prefix is resolved
        QStringList segments = QDir::fromNativeSeparators(path).split('/', Qt::SkipEmptyParts);
        segments.removeAll(QStringLiteral("."));

        int existing = segments.size() - 1;
        while (existing > 0 && !QFileInfo::exists(joinSegments(segments, existing))) {
            --existing;
        }

        QStringList remainder = segments.mid(existing);
        if (remainder.contains(QStringLiteral(".."))) {
            LOG_TRACE("Parent reference below missing directory: {}", path.toStdString());
            return std::nullopt;
        }

        QString prefix = joinSegments(segments, existing);
        QFileInfo prefixInfo(prefix);
        if (!prefixInfo.isDir()) {
            return std::nullopt;
        }
        if (QFileInfo(appendSegments(prefix, remainder.mid(0, 1))).isSymLink()) {
            return std::nullopt;
        }

        QString canonicalPrefix = prefixInfo.canonicalFilePath();
        if (canonicalPrefix.isEmpty()) {
            return std::nullopt;
        }

        CanonicalPath result;
        result.path = appendSegments(canonicalPrefix, remainder);
        result.exists = false;
        result.isFile = false;
        return result;
    }
}
