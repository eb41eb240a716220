#pragma once

#include <QString>
#include <QHash>
#include <QSet>
#include <stdexcept>
#include "name_sanitizer.h"

namespace naming
{
    /**
     * @brief Thrown when a scope needs more collision suffixes than the configured bound
     *
     * Only reachable with pathological input (thousands of siblings sanitizing to the
     * same name), so it aborts the pass instead of producing a mangled tree.
     */
    class CollisionBoundExceeded : public std::runtime_error
    {
    public:
        CollisionBoundExceeded(const QString& rawName, const QString& scopeId, int bound);

        const QString& rawName() const { return m_rawName; }
        const QString& scopeId() const { return m_scopeId; }

    private:
        QString m_rawName;
        QString m_scopeId;
    };

    struct ResolvedName {
        QString name;
        bool fallbackUsed = false;  // Raw name sanitized to nothing
        bool suffixed = false;      // A " (n)" suffix was needed
    };

    /**
     * @brief Hands out unique sibling names, one registry per parent scope
     *
     * The first request for a sanitized base keeps the clean name; later requests get
     * "<base> (1)", "<base> (2)", ... (before the extension for files). Names are compared
     * case-folded, so "Mix" and "mix" collide as they would on a case-insensitive volume.
     *
     * Results depend only on the sequence of calls per scope, which makes output
     * reproducible for a fixed traversal order.
     */
    class UniqueNameResolver
    {
    public:
        static constexpr int kDefaultMaxSuffix = 10000;

        explicit UniqueNameResolver(const NameSanitizer& sanitizer, int maxSuffix = kDefaultMaxSuffix);

        /**
         * @throws CollisionBoundExceeded if no free suffix exists within the bound
         */
        QString resolve(const QString& scopeId, const QString& rawName, bool isDirectory);
        ResolvedName resolveDetailed(const QString& scopeId, const QString& rawName, bool isDirectory);

        // Drops the registry of a scope once all of its children are named
        void reset(const QString& scopeId);

        bool hasScope(const QString& scopeId) const { return m_scopes.contains(scopeId); }
        int scopeCount() const { return m_scopes.size(); }

    private:
        struct NameScope {
            QHash<QString, int> nextSuffix;  // Folded base name -> next suffix to try
            QSet<QString> taken;             // Folded final names handed out
        };

        static QString foldKey(const QString& name);

        const NameSanitizer& m_sanitizer;
        int m_maxSuffix;
        QHash<QString, NameScope> m_scopes;
    };
}
