#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <stdexcept>

namespace m3u
{
    /**
     * @brief I/O failure while creating a directory or writing a playlist file
     *
     * Fatal for the whole pass; the destination is left partially populated.
     */
    class WriteFailure : public std::runtime_error
    {
    public:
        WriteFailure(const QString& path, const QString& reason);

        const QString& path() const { return m_path; }

    private:
        QString m_path;
    };

    /**
     * @brief Destination of the emitted tree
     *
     * Paths are relative to the destination directory and '/'-separated. Every component
     * has already been sanitized and made unique by the caller.
     */
    class PlaylistSink
    {
    public:
        virtual ~PlaylistSink() = default;

        virtual void createDirectory(const QString& relativePath) = 0;
        virtual void writePlaylist(const QString& relativePath, const QByteArray& content) = 0;
    };

    class FileSystemSink : public PlaylistSink
    {
    public:
        explicit FileSystemSink(const QString& rootDirectory);

        void createDirectory(const QString& relativePath) override;
        void writePlaylist(const QString& relativePath, const QByteArray& content) override;

        const QString& rootDirectory() const { return m_rootDirectory; }

    private:
        QString m_rootDirectory;
    };

    // Records what would be written; used for --dry-run
    class DryRunSink : public PlaylistSink
    {
    public:
        void createDirectory(const QString& relativePath) override;
        void writePlaylist(const QString& relativePath, const QByteArray& content) override;

        const QStringList& directories() const { return m_directories; }
        const QMap<QString, QByteArray>& files() const { return m_files; }

    private:
        QStringList m_directories;
        QMap<QString, QByteArray> m_files;
    };
}
