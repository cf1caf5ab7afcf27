/**
 * @file archiveextractor.h
 * @brief Threaded ZIP extraction into temporary folders.
 */

#ifndef ARCHIVEEXTRACTOR_H
#define ARCHIVEEXTRACTOR_H

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

class QThread;
class QTemporaryDir;
class ArchiveWorker;

/**
 * @brief Unpacks archives so their media files can be queued.
 *
 * Each archive gets its own QTemporaryDir. The folder stays on disk
 * until release() is called, which the owner does once no queued job
 * reads from it any more. Extraction runs on a worker thread; signals
 * are delivered on the thread that owns the extractor.
 *
 * @par Example usage:
 * @code
 * auto *archives = new ArchiveExtractor(this);
 * connect(archives, &ArchiveExtractor::extracted, this,
 *         [](const QString &archive, const QString &folder, const QStringList &files) {
 *     // queue files, release(folder) when they are copied
 * });
 * archives->extract("/home/user/Downloads/show.zip", {"mkv", "mp4"});
 * @endcode
 */
class ArchiveExtractor : public QObject
{
    Q_OBJECT

public:
    explicit ArchiveExtractor(QObject *parent = nullptr);
    ~ArchiveExtractor() override;

    /**
     * @brief Suffixes treated as archives, lowercase without the dot.
     */
    [[nodiscard]] static QStringList archiveExtensions();
    [[nodiscard]] static bool isArchive(const QString &path);

    /**
     * @brief Starts extracting the media files of @p archivePath.
     * @return False if the archive is already being extracted or no
     *         temporary folder could be created.
     */
    bool extract(const QString &archivePath, const QStringList &extensions);

    [[nodiscard]] bool isExtracting(const QString &archivePath) const;
    [[nodiscard]] int extractingCount() const;

    /**
     * @brief Temporary folders whose extraction has finished.
     */
    [[nodiscard]] QStringList extractedFolders() const;

    /**
     * @brief Removes an extracted folder and everything in it.
     */
    void release(const QString &folder);

signals:
    void extracted(const QString &archivePath, const QString &folder, const QStringList &files);
    void extractionFailed(const QString &archivePath, const QString &error);

private slots:
    void onWorkerFinished(const QString &archivePath, const QString &folder, const QStringList &files);
    void onWorkerFailed(const QString &archivePath, const QString &folder, const QString &error);

private:
    struct Extraction {
        QString archivePath;
        std::shared_ptr<QTemporaryDir> dir;
        bool done = false;
    };

    int indexOfFolder(const QString &folder) const;

    QThread *thread_ = nullptr;
    ArchiveWorker *worker_ = nullptr;
    QList<Extraction> extractions_;
};

#endif // ARCHIVEEXTRACTOR_H
