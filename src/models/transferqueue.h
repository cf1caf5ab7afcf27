#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QList>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <functional>

#include "transferjob.h"
#include "services/ifilecopier.h"  // Full include needed for QPointer

/**
 * @brief State machine states for TransferQueue.
 */
enum class QueueState {
    Stopped,    ///< Not draining; jobs may still be added
    Idle,       ///< Started, nothing left to copy
    Copying,    ///< Exactly one job is InProgress
    Halted      ///< Destination lost; remaining jobs stay Pending until restarted
};

/// @brief Convert QueueState to string for debugging
[[nodiscard]] inline const char* queueStateToString(QueueState state) {
    switch (state) {
        case QueueState::Stopped: return "Stopped";
        case QueueState::Idle: return "Idle";
        case QueueState::Copying: return "Copying";
        case QueueState::Halted: return "Halted";
    }
    return "Unknown";
}

/**
 * @brief Ordered list of copy jobs drained one at a time.
 *
 * Jobs are processed strictly in insertion order. Each job is resolved
 * against the destination root right before it starts: an existing
 * file makes the job Skipped, a missing or read-only root halts the
 * queue and leaves the remaining jobs Pending. A failed copy marks the
 * job Failed and the queue moves on.
 *
 * Copies are delegated to an IFileCopier whose results arrive as
 * signals. Follow-up work is deferred through an internal event queue
 * so slots connected to the job signals never re-enter the queue.
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        SourcePathRole = Qt::UserRole + 1,
        DestinationPathRole,
        DisplayNameRole,
        StatusRole,
        ProgressRole,
        BytesCopiedRole,
        TotalBytesRole,
        ErrorMessageRole,
        FileNameRole
    };

    explicit TransferQueue(QObject *parent = nullptr);
    ~TransferQueue() override;

    void setFileCopier(IFileCopier *copier);

    /**
     * @brief Sets the drive root that jobs are resolved against.
     *
     * Takes effect for the next job that starts. Clearing the root
     * while started halts the queue at the next job.
     */
    void setDestinationRoot(const QString &root);
    [[nodiscard]] QString destinationRoot() const { return destinationRoot_; }

    /// @name Queue operations
    /// @{

    /**
     * @brief Appends a job to the tail of the queue.
     * @return The id assigned to the job.
     */
    int enqueue(const TransferJob &job);

    /**
     * @brief Starts the first Pending job.
     *
     * Does nothing while a job is already InProgress. When called
     * directly on a stopped queue exactly one job is processed.
     */
    void processNext();

    /**
     * @brief Returns true when no job is Pending or InProgress.
     */
    [[nodiscard]] bool isEmpty() const;

    void start();
    void stop();

    void clear();
    bool removeJob(int row);
    void removeFinished();

    /**
     * @brief Re-submits a Failed or Skipped job at the tail of the queue.
     * @return False if the row is not a Failed or Skipped job.
     */
    bool retry(int row);
    /// @}

    /// @name Status queries
    /// @{
    [[nodiscard]] TransferJob job(int row) const;
    [[nodiscard]] TransferJob::Status jobStatus(int row) const;
    [[nodiscard]] QList<TransferJob> jobs() const { return jobs_; }
    [[nodiscard]] int indexOfJob(int id) const;
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] int finishedCount() const;
    [[nodiscard]] bool containsSource(const QString &sourcePath) const;
    [[nodiscard]] QueueState state() const { return state_; }
    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] QString haltReason() const { return haltReason_; }
    /// @}

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void jobStarted(const QString &displayName);
    void jobProgress(const QString &displayName, qint64 copied, qint64 total);
    void jobCompleted(const QString &displayName, const QString &destinationPath);
    void jobFailed(const QString &displayName, const QString &error);
    void jobSkipped(const QString &displayName, const QString &destinationPath);
    void allJobsCompleted();
    void queueHalted(const QString &reason);
    void queueChanged();
    void stateChanged();

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private slots:
    void onCopyProgress(const QString &sourcePath, qint64 copied, qint64 total);
    void onCopyFinished(const QString &sourcePath, const QString &destinationPath);
    void onCopyFailed(const QString &sourcePath, const QString &error);
    void onDestinationUnwritable(const QString &sourcePath, const QString &error);

private:
    void scheduleProcessNext();  // Defers processNext() to prevent re-entrancy
    void processEventQueue();    // Processes pending events
    void halt(const QString &reason);
    void finishActive();
    [[nodiscard]] int activeRow() const;
    [[nodiscard]] int firstPendingRow() const;
    void emitRowChanged(int row);

    QPointer<IFileCopier> copier_;
    QList<TransferJob> jobs_;
    QString destinationRoot_;
    QString haltReason_;
    int nextId_ = 1;
    int activeId_ = -1;
    bool running_ = false;
    bool hadWork_ = false;  // Set once a job finishes; cleared when allJobsCompleted fires

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;  // Re-entrancy guard
    bool eventProcessingScheduled_ = false;  // Prevents multiple timer posts

    QueueState state_ = QueueState::Stopped;
    void transitionTo(QueueState newState);
};

#endif // TRANSFERQUEUE_H
