#include "unique_name_resolver.h"
#include <log/log_manager.h>
#include <fmt/format.h>

namespace naming
{
    CollisionBoundExceeded::CollisionBoundExceeded(const QString& rawName, const QString& scopeId, int bound)
        : std::runtime_error(fmt::format("More than {} names collide with '{}' in scope '{}'",
                                         bound, rawName.toStdString(), scopeId.toStdString()))
        , m_rawName(rawName)
        , m_scopeId(scopeId)
    {
    }

    UniqueNameResolver::UniqueNameResolver(const NameSanitizer& sanitizer, int maxSuffix)
        : m_sanitizer(sanitizer)
        , m_maxSuffix(maxSuffix > 0 ? maxSuffix : kDefaultMaxSuffix)
    {
    }

    QString UniqueNameResolver::foldKey(const QString& name)
    {
        return name.toCaseFolded();
    }

    QString UniqueNameResolver::resolve(const QString& scopeId, const QString& rawName, bool isDirectory)
    {
        return resolveDetailed(scopeId, rawName, isDirectory).name;
    }

    ResolvedName UniqueNameResolver::resolveDetailed(const QString& scopeId, const QString& rawName, bool isDirectory)
    {
        SanitizeResult sanitized = m_sanitizer.sanitizeDetailed(rawName, isDirectory);
        if (sanitized.fallbackUsed) {
            LOG_WARN("Name '{}' in scope '{}' sanitized to nothing, using '{}'",
                     rawName.toStdString(), scopeId.toStdString(), sanitized.name.toStdString());
        }

        NameScope& scope = m_scopes[scopeId];
        const QString baseKey = foldKey(sanitized.name);

        ResolvedName result;
        result.fallbackUsed = sanitized.fallbackUsed;

        if (!scope.taken.contains(baseKey)) {
            scope.taken.insert(baseKey);
            scope.nextSuffix.insert(baseKey, 1);
            result.name = sanitized.name;
            return result;
        }

        // A later name may already sanitize to a suffixed form, so every candidate is checked
        for (int n = scope.nextSuffix.value(baseKey, 1); n <= m_maxSuffix; ++n) {
            QString candidate = m_sanitizer.withSuffix(sanitized.name, QString(" (%1)").arg(n), isDirectory);
            QString key = foldKey(candidate);
            if (scope.taken.contains(key)) {
                continue;
            }
            scope.taken.insert(key);
            scope.nextSuffix.insert(baseKey, n + 1);
            LOG_DEBUG("Name collision in scope '{}': '{}' -> '{}'",
                      scopeId.toStdString(), rawName.toStdString(), candidate.toStdString());
            result.name = candidate;
            result.suffixed = true;
            return result;
        }

        LOG_ERROR("Collision bound {} exceeded for '{}' in scope '{}'",
                  m_maxSuffix, rawName.toStdString(), scopeId.toStdString());
        throw CollisionBoundExceeded(rawName, scopeId, m_maxSuffix);
    }

    void UniqueNameResolver::reset(const QString& scopeId)
    {
        m_scopes.remove(scopeId);
    }
}
