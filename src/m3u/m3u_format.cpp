#include "m3u_format.h"

namespace m3u
{
    QString singleLine(const QString& text)
    {
        QString out = text;
        out.replace(QLatin1String("\r\n"), QLatin1String(" "));
        out.replace(QLatin1Char('\r'), QLatin1Char(' '));
        out.replace(QLatin1Char('\n'), QLatin1Char(' '));
        return out;
    }

    QByteArray renderPlaylist(const QList<M3uEntry>& entries)
    {
        QString text = QStringLiteral("#EXTM3U\n");
        for (const M3uEntry& entry : entries) {
            int duration = entry.durationSeconds < 0 ? -1 : entry.durationSeconds;
            text += QStringLiteral("#EXTINF:%1,%2 - %3\n")
                        .arg(duration)
                        .arg(singleLine(entry.artist), singleLine(entry.title));
            text += entry.location;
            text += QLatin1Char('\n');
        }
        return text.toUtf8();
    }
}
