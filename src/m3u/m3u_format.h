#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

namespace m3u
{
    struct M3uEntry {
        int durationSeconds = -1;   // -1 if unknown
        QString artist;
        QString title;
        QString location;           // Rewritten destination path
    };

    // "#EXTM3U" header, then "#EXTINF:<duration>,<artist> - <title>" and the location per
    // entry, '\n' line endings, UTF-8
    QByteArray renderPlaylist(const QList<M3uEntry>& entries);

    // CR and LF inside display text would break the line structure
    QString singleLine(const QString& text);
}
