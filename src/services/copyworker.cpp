#include "copyworker.h"
#include "drivedetector.h"
#include "utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

CopyWorker::CopyWorker(QObject *parent)
    : QObject(parent)
{
}

void CopyWorker::copyFile(const QString &sourcePath, const QString &destinationPath,
                          const QString &destinationRoot)
{
    const QString tempPath = destinationPath + temporarySuffix();

    if (!destinationRoot.isEmpty() && !DriveDetector::isWritable(destinationRoot)) {
        const QString error = tr("Destination %1 is not writable")
            .arg(QDir::toNativeSeparators(destinationRoot));
        qWarning() << "CopyWorker:" << error;
        emit unwritable(sourcePath, error);
        return;
    }

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        emit failed(sourcePath, tr("Cannot open source: %1").arg(source.errorString()));
        return;
    }

    const QString parentDir = QFileInfo(destinationPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        emit failed(sourcePath, tr("Cannot create folder: %1").arg(parentDir));
        return;
    }

    // A stale temp file from an earlier crash would make open() append garbage
    if (QFile::exists(tempPath)) {
        QFile::remove(tempPath);
    }

    QFile target(tempPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        emit failed(sourcePath, tr("Cannot create %1: %2").arg(tempPath, target.errorString()));
        return;
    }

    const qint64 total = source.size();
    qint64 copied = 0;
    emit progress(sourcePath, 0, total);

    auto failAndCleanUp = [&](const QString &error) {
        target.close();
        QFile::remove(tempPath);
        qWarning() << "CopyWorker: copy failed" << sourcePath << "-" << error;
        emit failed(sourcePath, error);
    };

    while (!source.atEnd()) {
        if (abortRequested_.load()) {
            failAndCleanUp(tr("Copy aborted"));
            return;
        }

        const QByteArray chunk = source.read(ChunkSize);
        if (chunk.isEmpty() && source.error() != QFileDevice::NoError) {
            failAndCleanUp(tr("Read error: %1").arg(source.errorString()));
            return;
        }

        const qint64 written = target.write(chunk);
        if (written != chunk.size()) {
            failAndCleanUp(tr("Write error: %1").arg(target.errorString()));
            return;
        }

        copied += written;
        emit progress(sourcePath, copied, total);
    }

    if (!target.flush()) {
        failAndCleanUp(tr("Write error: %1").arg(target.errorString()));
        return;
    }
    // Empty sources never enter the loop, and an abort may land after the last chunk
    if (abortRequested_.load()) {
        failAndCleanUp(tr("Copy aborted"));
        return;
    }
    target.close();
    source.close();

    // QFile::rename refuses to replace an existing file, which keeps a
    // file that appeared during the copy intact
    if (!QFile::rename(tempPath, destinationPath)) {
        QFile::remove(tempPath);
        const QString error = QFile::exists(destinationPath)
            ? tr("Destination appeared during copy: %1").arg(destinationPath)
            : tr("Cannot rename %1 into place").arg(tempPath);
        qWarning() << "CopyWorker:" << error;
        emit failed(sourcePath, error);
        return;
    }

    LOG_VERBOSE() << "CopyWorker: copied" << copied << "bytes" << sourcePath << "->" << destinationPath;
    emit finished(sourcePath, destinationPath);
}
