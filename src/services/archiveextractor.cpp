#include "archiveextractor.h"
#include "archiveworker.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QThread>

ArchiveExtractor::ArchiveExtractor(QObject *parent)
    : QObject(parent)
    , thread_(new QThread(this))
    , worker_(new ArchiveWorker)
{
    thread_->setObjectName(QStringLiteral("ArchiveExtractorThread"));
    worker_->moveToThread(thread_);

    connect(thread_, &QThread::finished, worker_, &QObject::deleteLater);

    connect(worker_, &ArchiveWorker::finished, this, &ArchiveExtractor::onWorkerFinished);
    connect(worker_, &ArchiveWorker::failed, this, &ArchiveExtractor::onWorkerFailed);

    thread_->start();
}

ArchiveExtractor::~ArchiveExtractor()
{
    worker_->requestAbort();
    thread_->quit();
    thread_->wait();
}

QStringList ArchiveExtractor::archiveExtensions()
{
    return {QStringLiteral("zip")};
}

bool ArchiveExtractor::isArchive(const QString &path)
{
    return archiveExtensions().contains(QFileInfo(path).suffix().toLower());
}

bool ArchiveExtractor::extract(const QString &archivePath, const QStringList &extensions)
{
    if (isExtracting(archivePath)) {
        return false;
    }

    auto dir = std::make_shared<QTemporaryDir>(
        QDir(QDir::tempPath()).filePath(QStringLiteral("pendrivebutler-zip-XXXXXX")));
    if (!dir->isValid()) {
        qWarning() << "ArchiveExtractor: cannot create temporary folder" << dir->errorString();
        return false;
    }

    Extraction extraction;
    extraction.archivePath = archivePath;
    extraction.dir = dir;
    extractions_.append(extraction);

    qInfo() << "ArchiveExtractor: extracting" << archivePath << "to" << dir->path();

    // Calls queue up on the worker thread, so archives unpack one after another
    ArchiveWorker *worker = worker_;
    const QString target = dir->path();
    QMetaObject::invokeMethod(worker_, [worker, archivePath, target, extensions]() {
        worker->extract(archivePath, target, extensions);
    }, Qt::QueuedConnection);
    return true;
}

bool ArchiveExtractor::isExtracting(const QString &archivePath) const
{
    for (const auto &extraction : extractions_) {
        if (!extraction.done && extraction.archivePath == archivePath) {
            return true;
        }
    }
    return false;
}

int ArchiveExtractor::extractingCount() const
{
    int count = 0;
    for (const auto &extraction : extractions_) {
        if (!extraction.done) {
            count++;
        }
    }
    return count;
}

QStringList ArchiveExtractor::extractedFolders() const
{
    QStringList folders;
    for (const auto &extraction : extractions_) {
        if (extraction.done) {
            folders.append(extraction.dir->path());
        }
    }
    return folders;
}

void ArchiveExtractor::release(const QString &folder)
{
    const int index = indexOfFolder(folder);
    if (index < 0 || !extractions_[index].done) {
        return;
    }
    LOG_VERBOSE() << "ArchiveExtractor: removing" << folder;
    // QTemporaryDir removes the folder recursively on destruction
    extractions_.removeAt(index);
}

void ArchiveExtractor::onWorkerFinished(const QString &archivePath, const QString &folder,
                                        const QStringList &files)
{
    const int index = indexOfFolder(folder);
    if (index < 0) {
        return;
    }
    extractions_[index].done = true;
    emit extracted(archivePath, folder, files);
}

void ArchiveExtractor::onWorkerFailed(const QString &archivePath, const QString &folder,
                                      const QString &error)
{
    const int index = indexOfFolder(folder);
    if (index >= 0) {
        extractions_.removeAt(index);
    }
    emit extractionFailed(archivePath, error);
}

int ArchiveExtractor::indexOfFolder(const QString &folder) const
{
    for (int i = 0; i < extractions_.size(); ++i) {
        if (extractions_[i].dir->path() == folder) {
            return i;
        }
    }
    return -1;
}
