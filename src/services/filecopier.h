/**
 * @file filecopier.h
 * @brief Threaded IFileCopier implementation.
 */

#ifndef FILECOPIER_H
#define FILECOPIER_H

#include "ifilecopier.h"

class QThread;
class CopyWorker;

/**
 * @brief Copies files on a dedicated worker thread.
 *
 * The blocking disk I/O runs in a CopyWorker moved to a QThread owned
 * by this object. All signals are delivered on the thread that owns
 * the FileCopier (normally the GUI thread).
 */
class FileCopier : public IFileCopier
{
    Q_OBJECT

public:
    explicit FileCopier(QObject *parent = nullptr);
    ~FileCopier() override;

    void copy(const QString &sourcePath, const QString &destinationPath,
              const QString &destinationRoot = QString()) override;
    void abort() override;
    [[nodiscard]] bool isBusy() const override { return busy_; }

private slots:
    void onWorkerProgress(const QString &sourcePath, qint64 copied, qint64 total);
    void onWorkerFinished(const QString &sourcePath, const QString &destinationPath);
    void onWorkerFailed(const QString &sourcePath, const QString &error);
    void onWorkerUnwritable(const QString &sourcePath, const QString &error);

private:
    QThread *thread_ = nullptr;
    CopyWorker *worker_ = nullptr;
    bool busy_ = false;
};

#endif // FILECOPIER_H
