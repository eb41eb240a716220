#include "name_sanitizer.h"
#include <QStringList>
#include <stdexcept>
#include <fmt/format.h>

namespace naming
{
    namespace
    {
        constexpr int kMinComponentBytes = 16;
        constexpr int kMaxComponentBytes = 255;
        constexpr int kMaxExtensionLength = 16;

        const QStringList& reservedDeviceNames()
        {
            static const QStringList names = {
                "CON", "PRN", "AUX", "NUL",
                "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
                "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
            };
            return names;
        }

        int codePointBytes(char32_t cp)
        {
            if (cp < 0x80) return 1;
            if (cp < 0x800) return 2;
            if (cp < 0x10000) return 3;
            return 4;
        }

        QString fromCodePoint(char32_t cp)
        {
            return QString::fromUcs4(&cp, 1);
        }

        // Leading whitespace, trailing whitespace and dots
        QString trimName(const QString& name)
        {
            int begin = 0;
            while (begin < name.size() && name.at(begin).isSpace()) {
                ++begin;
            }
            int end = name.size();
            while (end > begin && (name.at(end - 1).isSpace() || name.at(end - 1) == QLatin1Char('.'))) {
                --end;
            }
            return name.mid(begin, end - begin);
        }

        // Windows also reserves "CON.txt", so only the part before the first dot counts
        QString escapeReservedName(const QString& name)
        {
            int dot = name.indexOf(QLatin1Char('.'));
            QString head = dot < 0 ? name : name.left(dot);
            if (!NameSanitizer::isReservedDeviceName(head)) {
                return name;
            }
            QString escaped = name;
            escaped.insert(head.size(), QLatin1Char('_'));
            return escaped;
        }

        /*
         * A placeholder run with whitespace on either side becomes " - ", and two or
         * more interior blanks count as a removed separator. "a / b", "a  b" and
         * "a -- b" all end up as "a - b"; "AC/DC" stays "AC-DC".
         */
        QString normalizeSeparators(const QString& name, QChar ph)
        {
            const QString spaced = QLatin1Char(' ') + QString(ph) + QLatin1Char(' ');
            QString out;
            out.reserve(name.size());
            int i = 0;
            while (i < name.size()) {
                QChar c = name.at(i);
                if (!c.isSpace() && c != ph) {
                    out.append(c);
                    ++i;
                    continue;
                }
                int blanks = 0;
                bool hasPlaceholder = false;
                int runStart = i;
                while (i < name.size() && (name.at(i).isSpace() || name.at(i) == ph)) {
                    if (name.at(i) == ph) {
                        hasPlaceholder = true;
                    } else {
                        ++blanks;
                    }
                    ++i;
                }
                if (hasPlaceholder) {
                    out.append(blanks == 0 ? QString(ph) : spaced);
                } else if (blanks >= 2) {
                    out.append(spaced);
                } else {
                    out.append(name.at(runStart));
                }
            }
            return out;
        }

        // Never splits a code point
        QString truncateUtf8(const QString& text, int maxBytes)
        {
            QString out;
            int bytes = 0;
            for (uint cp : text.toUcs4()) {
                int n = codePointBytes(cp);
                if (bytes + n > maxBytes) break;
                out.append(fromCodePoint(cp));
                bytes += n;
            }
            return out;
        }
    }

    NameSanitizer::NameSanitizer(const SanitizerRules& rules)
        : m_rules(rules)
    {
        const QChar ph = m_rules.placeholder;
        if (ph.isNull() || ph.isSpace() || ph.isSurrogate() || ph == QLatin1Char('.')
            || isIllegalCodePoint(ph.unicode())) {
            throw std::invalid_argument(fmt::format("Illegal placeholder character U+{:04X}",
                                                    static_cast<unsigned>(ph.unicode())));
        }
        if (m_rules.maxComponentBytes < kMinComponentBytes || m_rules.maxComponentBytes > kMaxComponentBytes) {
            throw std::invalid_argument(fmt::format("Component byte budget {} outside [{}, {}]",
                                                    m_rules.maxComponentBytes, kMinComponentBytes, kMaxComponentBytes));
        }

        const QString& fallback = m_rules.fallbackName;
        bool fallbackLegal = !fallback.isEmpty()
            && trimName(fallback) == fallback
            && !isReservedDeviceName(fallback)
            && utf8Length(fallback) <= m_rules.maxComponentBytes;
        for (uint cp : fallback.toUcs4()) {
            if (isIllegalCodePoint(cp)) fallbackLegal = false;
        }
        if (!fallbackLegal) {
            throw std::invalid_argument(fmt::format("Illegal fallback name '{}'", fallback.toStdString()));
        }
    }

    bool NameSanitizer::isIllegalCodePoint(char32_t cp)
    {
        if (cp < 0x20 || cp == 0x7F) return true;
        switch (cp) {
            case U'/': case U'\\': case U':': case U'*': case U'?':
            case U'"': case U'<': case U'>': case U'|':
                return true;
            default:
                return false;
        }
    }

    bool NameSanitizer::isReservedDeviceName(const QString& name)
    {
        return reservedDeviceNames().contains(name, Qt::CaseInsensitive);
    }

    int NameSanitizer::utf8Length(const QString& text)
    {
        return static_cast<int>(text.toUtf8().size());
    }

    std::pair<QString, QString> NameSanitizer::splitExtension(const QString& name)
    {
        int dot = name.lastIndexOf(QLatin1Char('.'));
        if (dot <= 0 || dot == name.size() - 1) {
            return { name, QString() };
        }
        QString ext = name.mid(dot);
        if (ext.size() - 1 > kMaxExtensionLength || ext.contains(QLatin1Char(' '))) {
            return { name, QString() };
        }
        return { name.left(dot), ext };
    }

    QString NameSanitizer::sanitize(const QString& raw, bool isDirectory) const
    {
        return sanitizeDetailed(raw, isDirectory).name;
    }

    SanitizeResult NameSanitizer::sanitizeDetailed(const QString& raw, bool isDirectory) const
    {
        const QChar ph = m_rules.placeholder;
        QString normalized = raw.normalized(QString::NormalizationForm_C);

        QString out;
        out.reserve(normalized.size());
        for (uint cp : normalized.toUcs4()) {
            if (isIllegalCodePoint(cp) || cp == ph.unicode()) {
                if (!out.endsWith(ph)) {
                    out.append(ph);
                }
                continue;
            }
            out.append(fromCodePoint(cp));
        }
        out = trimName(out);
        out = escapeReservedName(trimName(normalizeSeparators(out, ph)));

        SanitizeResult result;
        if (out.isEmpty()) {
            result.name = m_rules.fallbackName;
            result.fallbackUsed = true;
            return result;
        }

        if (utf8Length(out) > m_rules.maxComponentBytes) {
            if (isDirectory) {
                out = fitToBudget(out, QString());
            } else {
                auto parts = splitExtension(out);
                out = fitToBudget(parts.first, parts.second);
            }
        }
        result.name = out;
        return result;
    }

    QString NameSanitizer::withSuffix(const QString& sanitized, const QString& suffix, bool isDirectory) const
    {
        if (isDirectory) {
            return fitToBudget(sanitized, suffix);
        }
        auto parts = splitExtension(sanitized);
        return fitToBudget(parts.first, suffix + parts.second);
    }

    QString NameSanitizer::fitToBudget(const QString& stem, const QString& tail) const
    {
        int budget = m_rules.maxComponentBytes - utf8Length(tail);
        if (utf8Length(stem) <= budget) {
            return stem + tail;
        }
        QString truncated = trimName(truncateUtf8(stem, budget));
        if (truncated.isEmpty()) {
            truncated = truncateUtf8(m_rules.fallbackName, budget);
        }
        // The cut can expose a device name, "CON . . x" becomes "CON"
        return escapeReservedName(truncated) + tail;
    }
}
