/**
 * @file transferservice.h
 * @brief Service for queueing media files for copy to the destination drive.
 *
 * This service encapsulates the queueing workflow, providing high-level
 * operations and signals for UI widgets instead of direct TransferQueue
 * coupling.
 */

#ifndef TRANSFERSERVICE_H
#define TRANSFERSERVICE_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "destinationresolver.h"
#include "models/transferqueue.h"

class ArchiveExtractor;

/**
 * @brief Service for coordinating copy jobs.
 *
 * TransferService turns user selections into TransferJobs: files are
 * labelled by MediaMetadataExtractor, planned by DestinationResolver
 * and appended to the TransferQueue. Folders are expanded recursively
 * into the media files they contain. ZIP archives are unpacked into a
 * temporary folder first; the folder is removed once none of its files
 * is waiting in the queue any more.
 *
 * @par Example usage:
 * @code
 * TransferService *service = new TransferService(queue, this);
 * service->setDestination("/media/user/USBSTICK");
 * service->addPath("/home/user/Downloads/movie.2020.1080p.mkv");
 * service->start();
 * @endcode
 */
class TransferService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer service.
     * @param queue The transfer queue to delegate operations to (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferService(TransferQueue *queue, QObject *parent = nullptr);

    ~TransferService() override;

    /// @name Configuration
    /// @{
    void setDestination(const QString &root);
    [[nodiscard]] QString destination() const;

    void setLayout(DestinationLayout layout);
    [[nodiscard]] DestinationLayout layout() const { return resolver_.layout(); }

    /**
     * @brief Sets the extensions used when expanding folders.
     * @param extensions Lowercase suffixes without the dot.
     */
    void setVideoExtensions(const QStringList &extensions);
    [[nodiscard]] QStringList videoExtensions() const { return extensions_; }
    /// @}

    /// @name Adding Jobs
    /// @{

    /**
     * @brief Queues a file, or every media file below a folder.
     * @param path File or folder selected by the user.
     * @return Number of jobs queued now. Files from archives are queued
     *         later, when their extraction finishes.
     */
    int addPath(const QString &path);

    /**
     * @brief Queues several paths in order.
     * @return Total number of jobs queued.
     */
    int addPaths(const QStringList &paths);

    /**
     * @brief Queues a single file.
     * @return False if the file is missing or already queued.
     */
    bool enqueueFile(const QString &filePath);

    /**
     * @brief Starts unpacking an archive; its media files are queued when done.
     * @return False if the archive is missing or already being unpacked.
     */
    bool enqueueArchive(const QString &archivePath);

    /**
     * @brief Lists the media files and archives below a folder, sorted by path.
     */
    [[nodiscard]] QStringList collectMediaFiles(const QString &folder) const;

    [[nodiscard]] ArchiveExtractor *archiveExtractor() const { return archives_; }
    /// @}

    /// @name Queue Management
    /// @{
    void start();
    void stop();
    void clear();
    bool removeJob(int row);
    bool retry(int row);
    void removeFinished();
    /// @}

    /// @name Queue State
    /// @{
    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] bool isEmpty() const;
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] QueueState state() const;
    [[nodiscard]] TransferQueue *queue() const { return queue_; }
    /// @}

signals:
    /// @name Forwarded queue signals
    /// @{
    void jobStarted(const QString &displayName);
    void jobProgress(const QString &displayName, qint64 copied, qint64 total);
    void jobCompleted(const QString &displayName, const QString &destinationPath);
    void jobFailed(const QString &displayName, const QString &error);
    void jobSkipped(const QString &displayName, const QString &destinationPath);
    void allJobsCompleted();
    void queueHalted(const QString &reason);
    void queueChanged();
    /// @}

    /**
     * @brief Emitted when a file was queued.
     * @param sourcePath The queued file.
     * @param displayName Label shown in the queue.
     */
    void jobQueued(const QString &sourcePath, const QString &displayName);

    /**
     * @brief Emitted when a selection could not be queued.
     * @param path The rejected path.
     * @param reason Human-readable reason.
     */
    void pathRejected(const QString &path, const QString &reason);

    /**
     * @brief Emitted when a file name could not be parsed into a label.
     * @param fileName The file name used unchanged as its label.
     */
    void labelFallback(const QString &fileName);

    /// @name Archive progress
    /// @{
    void archiveExtracting(const QString &archivePath);
    void archiveExtracted(const QString &archivePath, int queued);
    /// @}

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private slots:
    void onArchiveExtracted(const QString &archivePath, const QString &folder,
                            const QStringList &files);
    void onArchiveFailed(const QString &archivePath, const QString &error);
    void releaseIdleArchives();

private:
    bool hasUnfinishedJobBelow(const QString &folder) const;

    TransferQueue *queue_ = nullptr;
    ArchiveExtractor *archives_ = nullptr;
    bool queueingArchive_ = false;
    DestinationResolver resolver_;
    QStringList extensions_;
};

#endif // TRANSFERSERVICE_H
