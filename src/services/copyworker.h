/**
 * @file copyworker.h
 * @brief Worker object that performs chunked file copies on a background thread.
 */

#ifndef COPYWORKER_H
#define COPYWORKER_H

#include <QObject>
#include <QString>

#include <atomic>

/**
 * @brief Copies one file at a time in fixed-size chunks.
 *
 * Lives on the thread owned by FileCopier. Data is written to a
 * "<destination>.tmp" sibling which is renamed into place once the
 * last chunk is flushed, so an interrupted copy never leaves a
 * truncated file under the final name.
 */
class CopyWorker : public QObject
{
    Q_OBJECT

public:
    static constexpr qint64 ChunkSize = 1024 * 1024;

    explicit CopyWorker(QObject *parent = nullptr);

    /**
     * @brief Requests cancellation of the running copy.
     *
     * Safe to call from any thread. Checked between chunks.
     */
    void requestAbort() { abortRequested_.store(true); }

    /**
     * @brief Clears a previous abort request before a new copy is queued.
     */
    void clearAbort() { abortRequested_.store(false); }

    /**
     * @brief Returns the suffix used for in-flight files.
     */
    [[nodiscard]] static QString temporarySuffix() { return QStringLiteral(".tmp"); }

public slots:
    /**
     * @brief Copies @p sourcePath to @p destinationPath.
     *
     * When @p destinationRoot is set it is checked with
     * DriveDetector::isWritable() first, on this worker's thread.
     */
    void copyFile(const QString &sourcePath, const QString &destinationPath,
                  const QString &destinationRoot = QString());

signals:
    void progress(const QString &sourcePath, qint64 copied, qint64 total);
    void finished(const QString &sourcePath, const QString &destinationPath);
    void failed(const QString &sourcePath, const QString &error);
    void unwritable(const QString &sourcePath, const QString &error);

private:
    std::atomic<bool> abortRequested_{false};
};

#endif // COPYWORKER_H
