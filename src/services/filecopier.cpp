#include "filecopier.h"
#include "copyworker.h"
#include "utils/logging.h"

#include <QThread>

FileCopier::FileCopier(QObject *parent)
    : IFileCopier(parent)
    , thread_(new QThread(this))
    , worker_(new CopyWorker)
{
    thread_->setObjectName(QStringLiteral("FileCopierThread"));
    worker_->moveToThread(thread_);

    connect(thread_, &QThread::finished, worker_, &QObject::deleteLater);

    connect(worker_, &CopyWorker::progress, this, &FileCopier::onWorkerProgress);
    connect(worker_, &CopyWorker::finished, this, &FileCopier::onWorkerFinished);
    connect(worker_, &CopyWorker::failed, this, &FileCopier::onWorkerFailed);
    connect(worker_, &CopyWorker::unwritable, this, &FileCopier::onWorkerUnwritable);

    thread_->start();
}

FileCopier::~FileCopier()
{
    worker_->requestAbort();
    thread_->quit();
    thread_->wait();
}

void FileCopier::copy(const QString &sourcePath, const QString &destinationPath,
                      const QString &destinationRoot)
{
    if (busy_) {
        qWarning() << "FileCopier: copy requested while busy, rejecting" << sourcePath;
        emit copyFailed(sourcePath, tr("Copier is busy"));
        return;
    }

    busy_ = true;
    worker_->clearAbort();
    LOG_VERBOSE() << "FileCopier: queueing copy" << sourcePath << "->" << destinationPath;

    CopyWorker *worker = worker_;
    QMetaObject::invokeMethod(worker_, [worker, sourcePath, destinationPath, destinationRoot]() {
        worker->copyFile(sourcePath, destinationPath, destinationRoot);
    }, Qt::QueuedConnection);
}

void FileCopier::abort()
{
    if (busy_) {
        worker_->requestAbort();
    }
}

void FileCopier::onWorkerProgress(const QString &sourcePath, qint64 copied, qint64 total)
{
    emit copyProgress(sourcePath, copied, total);
}

void FileCopier::onWorkerFinished(const QString &sourcePath, const QString &destinationPath)
{
    busy_ = false;
    emit copyFinished(sourcePath, destinationPath);
}

void FileCopier::onWorkerFailed(const QString &sourcePath, const QString &error)
{
    busy_ = false;
    emit copyFailed(sourcePath, error);
}

void FileCopier::onWorkerUnwritable(const QString &sourcePath, const QString &error)
{
    busy_ = false;
    emit destinationUnwritable(sourcePath, error);
}
