#include "path_validator.h"
#include <log/log_manager.h>
#include <QDir>
#include <stdexcept>
#include <fmt/format.h>

namespace security
{
    QString reasonToString(RejectReason reason)
    {
        switch (reason) {
            case RejectReason::OutsideRoot:  return QStringLiteral("outside-root");
            case RejectReason::Unresolvable: return QStringLiteral("unresolvable");
            case RejectReason::NotAFile:     return QStringLiteral("not-a-file");
        }
        return QStringLiteral("unresolvable");
    }

    PathValidator::PathValidator(const QString& sourceRoot,
                                 const QString& destinationRoot,
                                 std::shared_ptr<const PathCanonicalizer> canonicalizer)
        : m_canonicalizer(std::move(canonicalizer))
    {
        if (!m_canonicalizer) {
            m_canonicalizer = std::make_shared<FileSystemCanonicalizer>();
        }
        QString absoluteRoot = QDir(sourceRoot).absolutePath();
        auto root = m_canonicalizer->canonicalize(absoluteRoot);
        if (sourceRoot.isEmpty() || !root || !root->exists || root->isFile) {
            std::string error = fmt::format("Source root is not an existing directory: '{}'", sourceRoot.toStdString());
            LOG_ERROR(error);
            throw std::invalid_argument(error);
        }
        m_canonicalRoot = root->path;
        m_rootPrefix = m_canonicalRoot.endsWith('/') ? m_canonicalRoot : m_canonicalRoot + "/";

        QString dest = QDir::fromNativeSeparators(destinationRoot.trimmed());
        if (dest.isEmpty()) {
            std::string error = "Destination root must not be empty";
            LOG_ERROR(error);
            throw std::invalid_argument(error);
        }
        while (dest.endsWith('/')) {
            dest.chop(1);
        }
        m_destinationRoot = dest;

        LOG_DEBUG("PathValidator: source root '{}' -> destination root '{}'",
                  m_canonicalRoot.toStdString(), m_destinationRoot.isEmpty() ? "/" : m_destinationRoot.toStdString());
    }

    bool PathValidator::isWithinRoot(const QString& canonicalPath) const
    {
        Qt::CaseSensitivity cs = m_canonicalizer->caseSensitivity();
        return canonicalPath.compare(m_canonicalRoot, cs) == 0
            || canonicalPath.startsWith(m_rootPrefix, cs);
    }

    ValidationResult PathValidator::reject(const QString& candidate, RejectReason reason, const QString& detail) const
    {
        LOG_TRACE("Rejected '{}' ({}): {}", candidate.toStdString(),
                  reasonToString(reason).toStdString(), detail.toStdString());
        ValidationResult result;
        result.rejection.candidate = candidate;
        result.rejection.reason = reason;
        result.rejection.detail = detail;
        return result;
    }

    ValidationResult PathValidator::validate(const QString& candidate) const
    {
        if (candidate.trimmed().isEmpty()) {
            return reject(candidate, RejectReason::Unresolvable, QStringLiteral("empty path"));
        }
        // CR/LF would split the path across playlist lines
        if (candidate.contains(QChar(0)) || candidate.contains('\n') || candidate.contains('\r')) {
            return reject(candidate, RejectReason::Unresolvable, QStringLiteral("control character in path"));
        }
        if (!QDir::isAbsolutePath(candidate)) {
            return reject(candidate, RejectReason::Unresolvable, QStringLiteral("relative path"));
        }

        auto canonical = m_canonicalizer->canonicalize(candidate);
        if (!canonical) {
            return reject(candidate, RejectReason::Unresolvable, QStringLiteral("cannot resolve path"));
        }
        if (!isWithinRoot(canonical->path)) {
            return reject(candidate, RejectReason::OutsideRoot, canonical->path);
        }
        if (canonical->exists && !canonical->isFile) {
            return reject(candidate, RejectReason::NotAFile, canonical->path);
        }

        QString relative = canonical->path.mid(m_rootPrefix.length());

        ValidatedPath validated;
        validated.destinationPath = m_destinationRoot + "/" + relative;
        validated.canonicalSource = canonical->path;
        validated.existsLocally = canonical->exists;

        ValidationResult result;
        result.accepted = validated;
        return result;
    }
}
