/**
 * @file ifilecopier.h
 * @brief Interface for file copy implementations.
 *
 * This interface allows the transfer queue to be driven by either the
 * threaded production copier or a mock in tests.
 */

#ifndef IFILECOPIER_H
#define IFILECOPIER_H

#include <QObject>
#include <QString>

/**
 * @brief Abstract interface for single-file copiers.
 *
 * Implementations copy one file at a time and report the outcome
 * asynchronously through signals. Exactly one of copyFinished(),
 * copyFailed() or destinationUnwritable() is emitted for every copy().
 *
 * @par Example usage:
 * @code
 * IFileCopier *copier = new FileCopier(this);   // production
 * IFileCopier *copier = new MockFileCopier(this); // tests
 * queue->setFileCopier(copier);
 * @endcode
 */
class IFileCopier : public QObject
{
    Q_OBJECT

public:
    explicit IFileCopier(QObject *parent = nullptr) : QObject(parent) {}
    ~IFileCopier() override = default;

    /**
     * @brief Starts copying a file.
     * @param sourcePath Existing file to read.
     * @param destinationPath Final path to write. Parent folders are created.
     * @param destinationRoot Drive or folder checked for writability before
     *        anything is written. Empty skips the check.
     */
    virtual void copy(const QString &sourcePath, const QString &destinationPath,
                      const QString &destinationRoot) = 0;

    /**
     * @brief Cancels the active copy, if any.
     *
     * The partially written file is removed and copyFailed() is emitted.
     */
    virtual void abort() = 0;

    /**
     * @brief Returns true while a copy is running.
     */
    [[nodiscard]] virtual bool isBusy() const = 0;

signals:
    /**
     * @brief Emitted while a copy is running.
     * @param sourcePath The file being copied.
     * @param copied Bytes written so far.
     * @param total Size of the source file.
     */
    void copyProgress(const QString &sourcePath, qint64 copied, qint64 total);

    /**
     * @brief Emitted when a copy completes.
     * @param sourcePath The file that was copied.
     * @param destinationPath Where it was written.
     */
    void copyFinished(const QString &sourcePath, const QString &destinationPath);

    /**
     * @brief Emitted when a copy fails or is aborted.
     * @param sourcePath The file that was being copied.
     * @param error Human-readable error description.
     */
    void copyFailed(const QString &sourcePath, const QString &error);

    /**
     * @brief Emitted instead of starting when the destination root rejects writes.
     * @param sourcePath The file that was not copied.
     * @param error Human-readable error description.
     *
     * Nothing was written, so the job can simply be tried again later.
     */
    void destinationUnwritable(const QString &sourcePath, const QString &error);
};

#endif // IFILECOPIER_H
