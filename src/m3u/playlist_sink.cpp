#include "playlist_sink.h"
#include <log/log_manager.h>
#include <QDir>
#include <QFile>
#include <fmt/format.h>

namespace m3u
{
    WriteFailure::WriteFailure(const QString& path, const QString& reason)
        : std::runtime_error(fmt::format("Write failed for '{}': {}", path.toStdString(), reason.toStdString()))
        , m_path(path)
    {
    }

    FileSystemSink::FileSystemSink(const QString& rootDirectory)
        : m_rootDirectory(QDir(rootDirectory).absolutePath())
    {
    }

    void FileSystemSink::createDirectory(const QString& relativePath)
    {
        QString absolutePath = QDir(m_rootDirectory).filePath(relativePath);
        QDir dir;
        if (!dir.mkpath(absolutePath)) {
            LOG_ERROR("Failed to create directory: {}", absolutePath.toStdString());
            throw WriteFailure(absolutePath, QStringLiteral("cannot create directory"));
        }
        LOG_TRACE("Created directory: {}", absolutePath.toStdString());
    }

    void FileSystemSink::writePlaylist(const QString& relativePath, const QByteArray& content)
    {
        QString absolutePath = QDir(m_rootDirectory).filePath(relativePath);
        QFile file(absolutePath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            LOG_ERROR("Failed to open file for writing: {} ({})", absolutePath.toStdString(), file.errorString().toStdString());
            throw WriteFailure(absolutePath, file.errorString());
        }
        if (file.write(content) != content.size() || !file.flush()) {
            QString reason = file.errorString();
            file.close();
            LOG_ERROR("Failed to write file: {} ({})", absolutePath.toStdString(), reason.toStdString());
            throw WriteFailure(absolutePath, reason);
        }
        file.close();
    }

    void DryRunSink::createDirectory(const QString& relativePath)
    {
        m_directories.append(relativePath);
    }

    void DryRunSink::writePlaylist(const QString& relativePath, const QByteArray& content)
    {
        m_files.insert(relativePath, content);
    }
}
