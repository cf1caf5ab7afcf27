/**
 * @file mockfilecopier.h
 * @brief Mock file copier for queue and service tests.
 *
 * This mock implements IFileCopier and can be injected at runtime for
 * testing components that depend on copy functionality.
 */

#ifndef MOCKFILECOPIER_H
#define MOCKFILECOPIER_H

#include <QMap>
#include <QQueue>
#include <QStringList>
#include <functional>

#include "services/ifilecopier.h"

/**
 * @brief Mock file copier implementing IFileCopier for testing.
 *
 * @par Features:
 * - Queue-based operation processing (manual)
 * - Successful operations really copy the file, so the destination
 *   tree can be inspected afterwards
 * - Per-source and next-operation failure simulation
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockFileCopier *mock = new MockFileCopier(this);
 * queue->setFileCopier(mock);
 * queue->enqueue(job);
 * queue->start();
 * queue->flushEventQueue();
 *
 * mock->mockProcessNextOperation();
 * QCOMPARE(mock->mockGetCopyRequests().first(), job.sourcePath);
 * @endcode
 */
class MockFileCopier : public IFileCopier
{
    Q_OBJECT

public:
    explicit MockFileCopier(QObject *parent = nullptr);
    ~MockFileCopier() override = default;

    /// @name IFileCopier Implementation
    /// @{
    void copy(const QString &sourcePath, const QString &destinationPath,
              const QString &destinationRoot = QString()) override;
    void abort() override;
    [[nodiscard]] bool isBusy() const override { return !pendingOps_.isEmpty(); }
    /// @}

    /// @name Mock Control Methods
    /// @{

    /**
     * @brief Completes one pending copy and emits its signals.
     */
    void mockProcessNextOperation();

    /**
     * @brief Completes all pending copies.
     */
    void mockProcessAllOperations();

    /**
     * @brief Makes every copy of a given source fail.
     * @param sourcePath The source to fail.
     * @param errorMessage The error message to emit.
     */
    void mockSetFailure(const QString &sourcePath, const QString &errorMessage);

    /**
     * @brief Configures next operation to fail with error.
     * @param errorMessage The error message to emit.
     */
    void mockSetNextOperationFails(const QString &errorMessage);

    /**
     * @brief Makes the writability check of the next operation fail.
     *
     * The operation then emits destinationUnwritable() without copying.
     */
    void mockSetNextDestinationUnwritable(const QString &errorMessage);

    /**
     * @brief Runs a callback right before the next operation completes.
     *
     * Used to simulate the destination disappearing mid-copy.
     */
    void mockSetBeforeNextOperation(const std::function<void()> &callback);

    /**
     * @brief Resets all mock state.
     */
    void mockReset();
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] int mockPendingOperationCount() const { return pendingOps_.size(); }
    [[nodiscard]] QStringList mockGetCopyRequests() const { return copyRequests_; }
    [[nodiscard]] QStringList mockGetDestinations() const { return destinations_; }
    [[nodiscard]] QStringList mockGetDestinationRoots() const { return roots_; }
    [[nodiscard]] int mockMaxConcurrentOperations() const { return maxConcurrent_; }
    [[nodiscard]] int mockAbortCount() const { return abortCount_; }
    /// @}

private:
    struct PendingOp {
        QString sourcePath;
        QString destinationPath;
        QString destinationRoot;
    };

    QQueue<PendingOp> pendingOps_;
    QMap<QString, QString> failures_;
    QStringList copyRequests_;
    QStringList destinations_;
    QStringList roots_;
    int maxConcurrent_ = 0;
    int abortCount_ = 0;

    // Error simulation
    bool nextOpFails_ = false;
    QString nextOpError_;
    bool nextUnwritable_ = false;
    QString unwritableError_;
    std::function<void()> beforeNextOp_;
};

#endif // MOCKFILECOPIER_H
