#include "transferqueue.h"
#include "services/destinationresolver.h"
#include "services/drivedetector.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QTimer>
#include <QDebug>

TransferQueue::TransferQueue(QObject *parent)
    : QAbstractListModel(parent)
{
}

TransferQueue::~TransferQueue()
{
    // Disconnect from the copier BEFORE this object is destroyed so a
    // late queued result never reaches a half-destroyed queue.
    if (copier_) {
        disconnect(copier_, nullptr, this, nullptr);
    }
}

void TransferQueue::scheduleProcessNext()
{
    // Queue the processNext() call for deferred execution.
    // This prevents re-entrancy issues where signal handlers
    // calling processNext() could cause nested state changes.
    eventQueue_.enqueue([this]() {
        if (running_) {
            processNext();
        }
    });

    // Schedule event processing if not already scheduled
    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
    }
}

void TransferQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;

    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }

    processingEvents_ = false;
}

void TransferQueue::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;

    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }

    processingEvents_ = false;
}

void TransferQueue::transitionTo(QueueState newState)
{
    if (state_ == newState) {
        return;
    }

    qDebug() << "TransferQueue: State transition"
             << queueStateToString(state_) << "->" << queueStateToString(newState);

    state_ = newState;
    emit stateChanged();
}

void TransferQueue::setFileCopier(IFileCopier *copier)
{
    if (copier_) {
        disconnect(copier_, nullptr, this, nullptr);
    }

    copier_ = copier;

    if (copier_) {
        connect(copier_, &IFileCopier::copyProgress,
                this, &TransferQueue::onCopyProgress);
        connect(copier_, &IFileCopier::copyFinished,
                this, &TransferQueue::onCopyFinished);
        connect(copier_, &IFileCopier::copyFailed,
                this, &TransferQueue::onCopyFailed);
        connect(copier_, &IFileCopier::destinationUnwritable,
                this, &TransferQueue::onDestinationUnwritable);
    }
}

void TransferQueue::setDestinationRoot(const QString &root)
{
    const QString cleaned = root.isEmpty() ? QString() : QDir::cleanPath(root);
    if (destinationRoot_ == cleaned) {
        return;
    }
    destinationRoot_ = cleaned;
    LOG_VERBOSE() << "TransferQueue: destination root set to" << destinationRoot_;
}

int TransferQueue::enqueue(const TransferJob &job)
{
    TransferJob item = job;
    item.id = nextId_++;
    item.status = TransferJob::Status::Pending;
    item.bytesCopied = 0;
    item.errorMessage.clear();
    item.destinationPath.clear();

    const QFileInfo sourceInfo(item.sourcePath);
    if (item.targetFileName.isEmpty()) {
        item.targetFileName = sourceInfo.fileName();
    }
    if (item.displayName.isEmpty()) {
        item.displayName = sourceInfo.fileName();
    }
    if (item.totalBytes <= 0 && sourceInfo.exists()) {
        item.totalBytes = sourceInfo.size();
    }

    const int row = jobs_.size();
    beginInsertRows(QModelIndex(), row, row);
    jobs_.append(item);
    endInsertRows();

    LOG_VERBOSE() << "TransferQueue: enqueued job" << item.id << item.sourcePath
                  << "as" << item.displayName;

    emit queueChanged();

    if (running_ && activeId_ < 0) {
        scheduleProcessNext();
    }
    return item.id;
}

void TransferQueue::processNext()
{
    if (activeId_ >= 0) {
        return;
    }

    if (!copier_) {
        qWarning() << "TransferQueue: processNext called without a file copier";
        return;
    }

    const int row = firstPendingRow();
    if (row < 0) {
        transitionTo(running_ ? QueueState::Idle : QueueState::Stopped);
        if (hadWork_) {
            hadWork_ = false;
            emit allJobsCompleted();
        }
        return;
    }

    if (destinationRoot_.isEmpty()) {
        halt(tr("No destination selected"));
        return;
    }
    if (!DriveDetector::isAvailable(destinationRoot_)) {
        halt(tr("Destination %1 is no longer available")
                 .arg(QDir::toNativeSeparators(destinationRoot_)));
        return;
    }

    const DestinationResolution resolution =
        DestinationResolver::resolve(jobs_[row], destinationRoot_);
    jobs_[row].destinationPath = resolution.path;

    const QString displayName = jobs_[row].displayName;
    const QString sourcePath = jobs_[row].sourcePath;
    const QString destinationPath = resolution.path;

    if (resolution.conflict) {
        jobs_[row].status = TransferJob::Status::Skipped;
        jobs_[row].errorMessage = tr("Already exists on destination");
        hadWork_ = true;
        qInfo() << "TransferQueue: skipping" << sourcePath << "- exists at" << destinationPath;

        emitRowChanged(row);
        emit jobSkipped(displayName, destinationPath);
        emit queueChanged();

        if (running_) {
            scheduleProcessNext();
        } else {
            transitionTo(QueueState::Stopped);
        }
        return;
    }

    jobs_[row].status = TransferJob::Status::InProgress;
    jobs_[row].bytesCopied = 0;
    activeId_ = jobs_[row].id;
    transitionTo(QueueState::Copying);

    emitRowChanged(row);
    emit jobStarted(displayName);
    emit queueChanged();

    // The copier checks the root for writability on its own thread
    copier_->copy(sourcePath, destinationPath, destinationRoot_);
}

bool TransferQueue::isEmpty() const
{
    for (const auto &job : jobs_) {
        if (job.status == TransferJob::Status::Pending ||
            job.status == TransferJob::Status::InProgress) {
            return false;
        }
    }
    return true;
}

void TransferQueue::start()
{
    if (running_) {
        return;
    }

    running_ = true;
    haltReason_.clear();
    if (activeId_ < 0) {
        transitionTo(QueueState::Idle);
    }
    qInfo() << "TransferQueue: started with" << pendingCount() << "pending job(s)";
    scheduleProcessNext();
}

void TransferQueue::stop()
{
    if (!running_) {
        return;
    }

    running_ = false;
    if (activeId_ < 0) {
        transitionTo(QueueState::Stopped);
        emit statusMessage(tr("Queue stopped"), 3000);
    } else {
        emit statusMessage(tr("Queue will stop after the current file"), 3000);
    }
    qInfo() << "TransferQueue: stopped";
}

void TransferQueue::clear()
{
    beginResetModel();
    QList<TransferJob> kept;
    for (const auto &job : jobs_) {
        if (job.status == TransferJob::Status::InProgress) {
            kept.append(job);
        }
    }
    jobs_ = kept;
    endResetModel();

    emit queueChanged();
}

bool TransferQueue::removeJob(int row)
{
    if (row < 0 || row >= jobs_.size()) {
        return false;
    }
    if (jobs_[row].status == TransferJob::Status::InProgress) {
        return false;
    }

    beginRemoveRows(QModelIndex(), row, row);
    jobs_.removeAt(row);
    endRemoveRows();

    emit queueChanged();
    return true;
}

void TransferQueue::removeFinished()
{
    for (int i = jobs_.size() - 1; i >= 0; --i) {
        if (jobs_[i].isFinished()) {
            beginRemoveRows(QModelIndex(), i, i);
            jobs_.removeAt(i);
            endRemoveRows();
        }
    }
    emit queueChanged();
}

bool TransferQueue::retry(int row)
{
    if (row < 0 || row >= jobs_.size()) {
        return false;
    }
    const TransferJob::Status status = jobs_[row].status;
    if (status != TransferJob::Status::Failed && status != TransferJob::Status::Skipped) {
        return false;
    }

    TransferJob resubmitted = jobs_[row];

    beginRemoveRows(QModelIndex(), row, row);
    jobs_.removeAt(row);
    endRemoveRows();

    LOG_VERBOSE() << "TransferQueue: retrying" << resubmitted.sourcePath;
    enqueue(resubmitted);
    return true;
}

TransferJob TransferQueue::job(int row) const
{
    if (row < 0 || row >= jobs_.size()) {
        return TransferJob();
    }
    return jobs_[row];
}

TransferJob::Status TransferQueue::jobStatus(int row) const
{
    if (row < 0 || row >= jobs_.size()) {
        return TransferJob::Status::Pending;
    }
    return jobs_[row].status;
}

int TransferQueue::indexOfJob(int id) const
{
    for (int i = 0; i < jobs_.size(); ++i) {
        if (jobs_[i].id == id) {
            return i;
        }
    }
    return -1;
}

int TransferQueue::pendingCount() const
{
    int count = 0;
    for (const auto &job : jobs_) {
        if (job.status == TransferJob::Status::Pending) {
            count++;
        }
    }
    return count;
}

int TransferQueue::activeCount() const
{
    int count = 0;
    for (const auto &job : jobs_) {
        if (job.status == TransferJob::Status::InProgress) {
            count++;
        }
    }
    return count;
}

int TransferQueue::finishedCount() const
{
    int count = 0;
    for (const auto &job : jobs_) {
        if (job.isFinished()) {
            count++;
        }
    }
    return count;
}

bool TransferQueue::containsSource(const QString &sourcePath) const
{
    const QString cleaned = QDir::cleanPath(sourcePath);
    for (const auto &job : jobs_) {
        if (!job.isFinished() && QDir::cleanPath(job.sourcePath) == cleaned) {
            return true;
        }
    }
    return false;
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return jobs_.size();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= jobs_.size()) {
        return QVariant();
    }

    const TransferJob &job = jobs_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case DisplayNameRole:
        return job.displayName;
    case Qt::ToolTipRole: {
        QString tip = QDir::toNativeSeparators(job.sourcePath);
        if (!job.destinationPath.isEmpty()) {
            tip += QStringLiteral("\n-> ") + QDir::toNativeSeparators(job.destinationPath);
        }
        if (!job.errorMessage.isEmpty()) {
            tip += QStringLiteral("\n") + job.errorMessage;
        }
        return tip;
    }
    case FileNameRole:
        return QFileInfo(job.sourcePath).fileName();
    case SourcePathRole:
        return job.sourcePath;
    case DestinationPathRole:
        return job.destinationPath;
    case StatusRole:
        return static_cast<int>(job.status);
    case ProgressRole:
        return job.progressPercent();
    case BytesCopiedRole:
        return job.bytesCopied;
    case TotalBytesRole:
        return job.totalBytes;
    case ErrorMessageRole:
        return job.errorMessage;
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[SourcePathRole] = "sourcePath";
    roles[DestinationPathRole] = "destinationPath";
    roles[DisplayNameRole] = "displayName";
    roles[StatusRole] = "status";
    roles[ProgressRole] = "progress";
    roles[BytesCopiedRole] = "bytesCopied";
    roles[TotalBytesRole] = "totalBytes";
    roles[ErrorMessageRole] = "errorMessage";
    roles[FileNameRole] = "fileName";
    return roles;
}

void TransferQueue::onCopyProgress(const QString &sourcePath, qint64 copied, qint64 total)
{
    const int row = activeRow();
    if (row < 0 || jobs_[row].sourcePath != sourcePath) {
        return;
    }

    jobs_[row].bytesCopied = copied;
    if (total > 0) {
        jobs_[row].totalBytes = total;
    }
    emitRowChanged(row);
    emit jobProgress(jobs_[row].displayName, copied, jobs_[row].totalBytes);
}

void TransferQueue::onCopyFinished(const QString &sourcePath, const QString &destinationPath)
{
    const int row = activeRow();
    if (row < 0 || jobs_[row].sourcePath != sourcePath) {
        qWarning() << "TransferQueue: copy result for unknown job" << sourcePath;
        return;
    }

    jobs_[row].status = TransferJob::Status::Done;
    jobs_[row].bytesCopied = jobs_[row].totalBytes;
    jobs_[row].destinationPath = destinationPath;
    const QString displayName = jobs_[row].displayName;

    qInfo() << "TransferQueue: copied" << sourcePath << "->" << destinationPath;

    finishActive();
    emitRowChanged(row);
    emit jobCompleted(displayName, destinationPath);
    emit queueChanged();
}

void TransferQueue::onCopyFailed(const QString &sourcePath, const QString &error)
{
    const int row = activeRow();
    if (row < 0 || jobs_[row].sourcePath != sourcePath) {
        qWarning() << "TransferQueue: copy failure for unknown job" << sourcePath << error;
        return;
    }

    jobs_[row].status = TransferJob::Status::Failed;
    jobs_[row].errorMessage = error;
    const QString displayName = jobs_[row].displayName;

    qWarning() << "TransferQueue: copy failed" << sourcePath << "-" << error;

    if (!DriveDetector::isAvailable(destinationRoot_)) {
        activeId_ = -1;
        hadWork_ = true;
        emitRowChanged(row);
        emit jobFailed(displayName, error);
        halt(tr("Destination %1 was disconnected")
                 .arg(QDir::toNativeSeparators(destinationRoot_)));
        return;
    }

    finishActive();
    emitRowChanged(row);
    emit jobFailed(displayName, error);
    emit queueChanged();
}

void TransferQueue::onDestinationUnwritable(const QString &sourcePath, const QString &error)
{
    const int row = activeRow();
    if (row < 0 || jobs_[row].sourcePath != sourcePath) {
        qWarning() << "TransferQueue: unwritable report for unknown job" << sourcePath;
        return;
    }

    // Nothing was written, so the job goes back to waiting
    jobs_[row].status = TransferJob::Status::Pending;
    jobs_[row].bytesCopied = 0;
    jobs_[row].destinationPath.clear();
    activeId_ = -1;

    emitRowChanged(row);
    halt(error);
}

void TransferQueue::finishActive()
{
    activeId_ = -1;
    hadWork_ = true;

    if (running_) {
        transitionTo(QueueState::Idle);
        scheduleProcessNext();
    } else {
        transitionTo(QueueState::Stopped);
    }
}

void TransferQueue::halt(const QString &reason)
{
    qWarning() << "TransferQueue: halted -" << reason;

    running_ = false;
    haltReason_ = reason;
    transitionTo(QueueState::Halted);

    emit queueHalted(reason);
    emit queueChanged();
}

int TransferQueue::activeRow() const
{
    return activeId_ < 0 ? -1 : indexOfJob(activeId_);
}

int TransferQueue::firstPendingRow() const
{
    for (int i = 0; i < jobs_.size(); ++i) {
        if (jobs_[i].status == TransferJob::Status::Pending) {
            return i;
        }
    }
    return -1;
}

void TransferQueue::emitRowChanged(int row)
{
    emit dataChanged(index(row), index(row));
}
