#pragma once

#include <QString>
#include <QChar>
#include <utility>

namespace naming
{
    struct SanitizerRules {
        QChar placeholder = QLatin1Char('-');        // Substitute for each illegal character
        int maxComponentBytes = 255;                 // UTF-8 bytes per path component
        QString fallbackName = QStringLiteral("untitled");
    };

    struct SanitizeResult {
        QString name;
        bool fallbackUsed = false;   // Input sanitized to nothing; name is the fallback
    };

    /**
     * @brief Turns one arbitrary name into a component legal on Windows, macOS and Linux
     *
     * Pure and deterministic for a given rule set:
     * - NFC normalization
     * - control characters and / \ : * ? " < > | become the placeholder, runs collapsed
     * - separators normalized: a placeholder with blanks around it, or a run of two or
     *   more blanks, becomes " - " (with the configured placeholder)
     * - leading whitespace and trailing dots/spaces trimmed
     * - reserved device names (CON, NUL, COM1, ...) get '_' appended, also when
     *   truncation exposes one
     * - truncated to the byte budget, keeping a file extension intact
     * - empty results replaced by the fallback name
     */
    class NameSanitizer
    {
    public:
        /**
         * @throws std::invalid_argument if the placeholder or fallback are not legal
         *         themselves, or the byte budget is outside [16, 255]
         */
        explicit NameSanitizer(const SanitizerRules& rules = SanitizerRules());

        QString sanitize(const QString& raw, bool isDirectory) const;
        SanitizeResult sanitizeDetailed(const QString& raw, bool isDirectory) const;

        /**
         * @brief Appends suffix to an already sanitized name
         *
         * For files the suffix goes before the extension ("Mix (1).m3u"). The stem is
         * shortened when needed so the result stays within the byte budget.
         */
        QString withSuffix(const QString& sanitized, const QString& suffix, bool isDirectory) const;

        const SanitizerRules& rules() const { return m_rules; }

        static bool isIllegalCodePoint(char32_t cp);
        static bool isReservedDeviceName(const QString& name);
        static int utf8Length(const QString& text);

        // Splits "name.ext" into {"name", ".ext"}; extension is empty if there is none
        static std::pair<QString, QString> splitExtension(const QString& name);

    private:
        QString fitToBudget(const QString& stem, const QString& tail) const;

        SanitizerRules m_rules;
    };
}
