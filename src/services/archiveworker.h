/**
 * @file archiveworker.h
 * @brief Worker object that unpacks ZIP archives on a background thread.
 */

#ifndef ARCHIVEWORKER_H
#define ARCHIVEWORKER_H

#include <QObject>
#include <QString>
#include <QStringList>

#include <atomic>

class KArchiveDirectory;

/**
 * @brief Extracts the media files of one archive at a time.
 *
 * Lives on the thread owned by ArchiveExtractor. Only entries whose
 * suffix is in the requested extension list are written; folder
 * structure inside the archive is kept below the target folder.
 */
class ArchiveWorker : public QObject
{
    Q_OBJECT

public:
    explicit ArchiveWorker(QObject *parent = nullptr);

    /**
     * @brief Requests cancellation. Checked between entries.
     */
    void requestAbort() { abortRequested_.store(true); }

    /**
     * @brief Extracts synchronously on the calling thread.
     * @param archivePath The ZIP file.
     * @param targetDir Existing folder that receives the files.
     * @param extensions Lowercase media suffixes without the dot.
     * @param error Set when false is returned.
     * @param files Receives the written files, sorted by path.
     * @return False if the archive cannot be read or a file cannot be written.
     */
    bool extractMedia(const QString &archivePath, const QString &targetDir,
                      const QStringList &extensions, QStringList *files, QString *error);

public slots:
    void extract(const QString &archivePath, const QString &targetDir,
                 const QStringList &extensions);

signals:
    void finished(const QString &archivePath, const QString &targetDir, const QStringList &files);
    void failed(const QString &archivePath, const QString &targetDir, const QString &error);

private:
    bool extractDirectory(const KArchiveDirectory *directory, const QString &relativePath,
                          const QString &targetDir, const QStringList &extensions,
                          QStringList *files, QString *error);

    std::atomic<bool> abortRequested_{false};
};

#endif // ARCHIVEWORKER_H
