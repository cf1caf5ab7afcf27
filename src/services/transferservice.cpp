#include "transferservice.h"
#include "archiveextractor.h"
#include "mediametadataextractor.h"
#include "utils/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

TransferService::TransferService(TransferQueue *queue, QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , archives_(new ArchiveExtractor(this))
    , extensions_(MediaMetadataExtractor::defaultVideoExtensions())
{
    // Forward signals from TransferQueue
    connect(queue_, &TransferQueue::jobStarted,
            this, &TransferService::jobStarted);
    connect(queue_, &TransferQueue::jobProgress,
            this, &TransferService::jobProgress);
    connect(queue_, &TransferQueue::jobCompleted,
            this, &TransferService::jobCompleted);
    connect(queue_, &TransferQueue::jobFailed,
            this, &TransferService::jobFailed);
    connect(queue_, &TransferQueue::jobSkipped,
            this, &TransferService::jobSkipped);
    connect(queue_, &TransferQueue::allJobsCompleted,
            this, &TransferService::allJobsCompleted);
    connect(queue_, &TransferQueue::queueHalted,
            this, &TransferService::queueHalted);
    connect(queue_, &TransferQueue::queueChanged,
            this, &TransferService::queueChanged);
    connect(queue_, &TransferQueue::statusMessage,
            this, &TransferService::statusMessage);

    // Extracted folders live until their jobs leave the queue
    connect(queue_, &TransferQueue::queueChanged,
            this, &TransferService::releaseIdleArchives);
    connect(archives_, &ArchiveExtractor::extracted,
            this, &TransferService::onArchiveExtracted);
    connect(archives_, &ArchiveExtractor::extractionFailed,
            this, &TransferService::onArchiveFailed);
}

TransferService::~TransferService() = default;

void TransferService::setDestination(const QString &root)
{
    queue_->setDestinationRoot(root);
    if (!root.isEmpty()) {
        emit statusMessage(tr("Destination: %1").arg(QDir::toNativeSeparators(root)), 3000);
    }
}

QString TransferService::destination() const
{
    return queue_->destinationRoot();
}

void TransferService::setLayout(DestinationLayout layout)
{
    resolver_.setLayout(layout);
}

void TransferService::setVideoExtensions(const QStringList &extensions)
{
    QStringList cleaned;
    for (const QString &ext : extensions) {
        QString e = ext.trimmed().toLower();
        while (e.startsWith('.')) {
            e.remove(0, 1);
        }
        if (!e.isEmpty() && !cleaned.contains(e)) {
            cleaned.append(e);
        }
    }
    extensions_ = cleaned.isEmpty() ? MediaMetadataExtractor::defaultVideoExtensions() : cleaned;
}

int TransferService::addPath(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        const QString reason = tr("Item missing: %1").arg(QDir::toNativeSeparators(path));
        emit pathRejected(path, reason);
        emit statusMessage(reason, 3000);
        return 0;
    }

    if (info.isFile()) {
        if (ArchiveExtractor::isArchive(info.fileName())) {
            enqueueArchive(info.absoluteFilePath());
            return 0;
        }
        return enqueueFile(info.absoluteFilePath()) ? 1 : 0;
    }

    const QStringList files = collectMediaFiles(info.absoluteFilePath());
    int queued = 0;
    for (const QString &file : files) {
        if (ArchiveExtractor::isArchive(file)) {
            enqueueArchive(file);
        } else if (enqueueFile(file)) {
            queued++;
        }
    }

    if (files.isEmpty()) {
        emit statusMessage(tr("No media files in %1").arg(info.fileName()), 3000);
    } else {
        emit statusMessage(tr("Queued %1 file(s) from %2").arg(queued).arg(info.fileName()), 3000);
    }
    return queued;
}

int TransferService::addPaths(const QStringList &paths)
{
    int queued = 0;
    for (const QString &path : paths) {
        queued += addPath(path);
    }
    return queued;
}

bool TransferService::enqueueFile(const QString &filePath)
{
    const QFileInfo info(filePath);
    if (!info.isFile()) {
        const QString reason = tr("Item missing: %1").arg(QDir::toNativeSeparators(filePath));
        emit pathRejected(filePath, reason);
        emit statusMessage(reason, 3000);
        return false;
    }

    const QString sourcePath = info.absoluteFilePath();
    if (queue_->containsSource(sourcePath)) {
        const QString reason = tr("Already queued: %1").arg(info.fileName());
        emit pathRejected(sourcePath, reason);
        emit statusMessage(reason, 3000);
        return false;
    }

    const QString fileName = info.fileName();
    const MediaMetadataExtractor::MediaInfo media = MediaMetadataExtractor::parse(fileName);
    if (!media.valid) {
        emit labelFallback(fileName);
    }

    const DestinationPlan plan = resolver_.plan(media, fileName);

    TransferJob job;
    job.sourcePath = sourcePath;
    job.targetFolder = plan.folder;
    job.targetFileName = plan.fileName;
    job.displayName = MediaMetadataExtractor::displayLabel(media, fileName);
    job.totalBytes = info.size();

    queue_->enqueue(job);
    LOG_VERBOSE() << "TransferService: queued" << sourcePath << "->"
                  << plan.folder << plan.fileName;
    emit jobQueued(sourcePath, job.displayName);
    return true;
}

bool TransferService::enqueueArchive(const QString &archivePath)
{
    const QFileInfo info(archivePath);
    if (!info.isFile()) {
        const QString reason = tr("Item missing: %1").arg(QDir::toNativeSeparators(archivePath));
        emit pathRejected(archivePath, reason);
        emit statusMessage(reason, 3000);
        return false;
    }

    const QString path = info.absoluteFilePath();
    if (archives_->isExtracting(path) || !archives_->extract(path, extensions_)) {
        const QString reason = archives_->isExtracting(path)
            ? tr("Already extracting: %1").arg(info.fileName())
            : tr("Failed to extract %1: no temporary folder").arg(info.fileName());
        emit pathRejected(path, reason);
        emit statusMessage(reason, 3000);
        return false;
    }

    emit archiveExtracting(path);
    emit statusMessage(tr("Extracting %1").arg(info.fileName()), 3000);
    return true;
}

void TransferService::onArchiveExtracted(const QString &archivePath, const QString &folder,
                                         const QStringList &files)
{
    const QString archiveName = QFileInfo(archivePath).fileName();

    int queued = 0;
    queueingArchive_ = true;
    for (const QString &file : files) {
        if (enqueueFile(file)) {
            queued++;
        }
    }
    queueingArchive_ = false;

    if (files.isEmpty()) {
        const QString reason = tr("No media files in %1").arg(archiveName);
        emit pathRejected(archivePath, reason);
        emit statusMessage(reason, 3000);
    } else {
        emit statusMessage(tr("Queued %1 file(s) from %2").arg(queued).arg(archiveName), 3000);
    }
    emit archiveExtracted(archivePath, queued);

    // Nothing queued from it means nothing will ever read the folder
    if (queued == 0) {
        archives_->release(folder);
    }
    releaseIdleArchives();
}

void TransferService::onArchiveFailed(const QString &archivePath, const QString &error)
{
    const QString reason = tr("Failed to extract %1: %2")
        .arg(QFileInfo(archivePath).fileName(), error);
    emit pathRejected(archivePath, reason);
    emit statusMessage(reason, 5000);
}

void TransferService::releaseIdleArchives()
{
    if (queueingArchive_) {
        return;
    }
    const QStringList folders = archives_->extractedFolders();
    for (const QString &folder : folders) {
        if (!hasUnfinishedJobBelow(folder)) {
            archives_->release(folder);
        }
    }
}

bool TransferService::hasUnfinishedJobBelow(const QString &folder) const
{
    const QString prefix = QDir::cleanPath(folder) + QLatin1Char('/');
    for (int row = 0; row < queue_->rowCount(); ++row) {
        const TransferJob job = queue_->job(row);
        if (!job.isFinished() && job.sourcePath.startsWith(prefix)) {
            return true;
        }
    }
    return false;
}

QStringList TransferService::collectMediaFiles(const QString &folder) const
{
    QStringList files;
    QDirIterator it(folder, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (MediaMetadataExtractor::isVideoFile(path, extensions_)
            || ArchiveExtractor::isArchive(path)) {
            files.append(path);
        }
    }
    files.sort();
    return files;
}

void TransferService::start()
{
    if (queue_->destinationRoot().isEmpty()) {
        emit statusMessage(tr("Choose a destination before starting"), 5000);
    }
    queue_->start();
}

void TransferService::stop()
{
    queue_->stop();
}

void TransferService::clear()
{
    queue_->clear();
    emit statusMessage(tr("Queue cleared"), 3000);
}

bool TransferService::removeJob(int row)
{
    return queue_->removeJob(row);
}

bool TransferService::retry(int row)
{
    if (!queue_->retry(row)) {
        return false;
    }
    emit statusMessage(tr("Re-queued %1").arg(queue_->job(queue_->rowCount() - 1).displayName), 3000);
    return true;
}

void TransferService::removeFinished()
{
    queue_->removeFinished();
}

bool TransferService::isRunning() const
{
    return queue_->isRunning();
}

bool TransferService::isEmpty() const
{
    return queue_->isEmpty();
}

int TransferService::pendingCount() const
{
    return queue_->pendingCount();
}

int TransferService::activeCount() const
{
    return queue_->activeCount();
}

QueueState TransferService::state() const
{
    return queue_->state();
}
