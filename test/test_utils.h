#pragma once

#include <QFile>
#include <QDir>
#include <QFileInfo>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QCoreApplication>
#include <memory>

namespace testutils {

// Ensure a QCoreApplication exists for tests that use Qt core features.
// Safe to call multiple times; only one application instance will be created.
inline void ensureQCoreApplication()
{
    if (QCoreApplication::instance()) return;
    static int argc = 1;
    static char arg0[] = "test";
    static char* argv[] = { arg0, nullptr };
    static std::unique_ptr<QCoreApplication> s_app = std::make_unique<QCoreApplication>(argc, argv);
    (void)s_app;
}

// Writes content to path, creating parent directories. Returns true on success.
inline bool writeFile(const QString& path, const QByteArray& content = QByteArray("audio"))
{
    QDir outDir = QFileInfo(path).dir();
    if (!outDir.exists()) outDir.mkpath(".");
    QFile out(path);
    if (!out.open(QFile::WriteOnly | QFile::Truncate)) return false;
    qint64 written = out.write(content);
    out.close();
    return written == content.size();
}

inline QByteArray readFile(const QString& path)
{
    QFile in(path);
    if (!in.open(QFile::ReadOnly)) return QByteArray();
    return in.readAll();
}

// Relative paths of all regular files below root, sorted
inline QStringList listFilesRecursively(const QString& root, const QString& prefix = QString())
{
    QStringList result;
    QDir dir(root);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                                                    QDir::Name);
    for (const QFileInfo& entry : entries) {
        QString relative = prefix.isEmpty() ? entry.fileName() : prefix + "/" + entry.fileName();
        if (entry.isDir()) {
            result += listFilesRecursively(entry.absoluteFilePath(), relative);
        } else {
            result << relative;
        }
    }
    result.sort();
    return result;
}

} // namespace testutils
