#include "mockfilecopier.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

MockFileCopier::MockFileCopier(QObject *parent)
    : IFileCopier(parent)
{
}

void MockFileCopier::copy(const QString &sourcePath, const QString &destinationPath,
                          const QString &destinationRoot)
{
    copyRequests_.append(sourcePath);
    destinations_.append(destinationPath);
    roots_.append(destinationRoot);

    PendingOp op;
    op.sourcePath = sourcePath;
    op.destinationPath = destinationPath;
    op.destinationRoot = destinationRoot;
    pendingOps_.enqueue(op);

    maxConcurrent_ = qMax(maxConcurrent_, static_cast<int>(pendingOps_.size()));
}

void MockFileCopier::abort()
{
    abortCount_++;
    while (!pendingOps_.isEmpty()) {
        PendingOp op = pendingOps_.dequeue();
        emit copyFailed(op.sourcePath, QStringLiteral("Copy aborted"));
    }
}

// === Mock control methods ===

void MockFileCopier::mockSetFailure(const QString &sourcePath, const QString &errorMessage)
{
    failures_[sourcePath] = errorMessage;
}

void MockFileCopier::mockSetNextOperationFails(const QString &errorMessage)
{
    nextOpFails_ = true;
    nextOpError_ = errorMessage;
}

void MockFileCopier::mockSetNextDestinationUnwritable(const QString &errorMessage)
{
    nextUnwritable_ = true;
    unwritableError_ = errorMessage;
}

void MockFileCopier::mockSetBeforeNextOperation(const std::function<void()> &callback)
{
    beforeNextOp_ = callback;
}

void MockFileCopier::mockProcessNextOperation()
{
    if (pendingOps_.isEmpty()) {
        return;
    }

    PendingOp op = pendingOps_.dequeue();

    if (beforeNextOp_) {
        auto callback = beforeNextOp_;
        beforeNextOp_ = nullptr;
        callback();
    }

    if (nextUnwritable_) {
        nextUnwritable_ = false;
        emit destinationUnwritable(op.sourcePath, unwritableError_);
        return;
    }

    if (nextOpFails_) {
        nextOpFails_ = false;
        emit copyFailed(op.sourcePath, nextOpError_);
        return;
    }

    if (failures_.contains(op.sourcePath)) {
        emit copyFailed(op.sourcePath, failures_.value(op.sourcePath));
        return;
    }

    // Write the file for real so tests can inspect the destination
    if (!QDir().mkpath(QFileInfo(op.destinationPath).absolutePath())) {
        emit copyFailed(op.sourcePath, QStringLiteral("Cannot create folder"));
        return;
    }
    if (!QFile::copy(op.sourcePath, op.destinationPath)) {
        emit copyFailed(op.sourcePath, QStringLiteral("Copy failed"));
        return;
    }

    const qint64 size = QFileInfo(op.destinationPath).size();
    emit copyProgress(op.sourcePath, size, size);
    emit copyFinished(op.sourcePath, op.destinationPath);
}

void MockFileCopier::mockProcessAllOperations()
{
    while (!pendingOps_.isEmpty()) {
        mockProcessNextOperation();
    }
}

void MockFileCopier::mockReset()
{
    pendingOps_.clear();
    failures_.clear();
    copyRequests_.clear();
    destinations_.clear();
    roots_.clear();
    maxConcurrent_ = 0;
    abortCount_ = 0;
    nextOpFails_ = false;
    nextOpError_.clear();
    nextUnwritable_ = false;
    unwritableError_.clear();
    beforeNextOp_ = nullptr;
}
