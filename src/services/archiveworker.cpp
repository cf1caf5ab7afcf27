#include "archiveworker.h"
#include "mediametadataextractor.h"
#include "utils/logging.h"

#include <KArchiveDirectory>
#include <KArchiveFile>
#include <KZip>

#include <QDir>
#include <QFileInfo>

ArchiveWorker::ArchiveWorker(QObject *parent)
    : QObject(parent)
{
}

void ArchiveWorker::extract(const QString &archivePath, const QString &targetDir,
                            const QStringList &extensions)
{
    QStringList files;
    QString error;
    if (!extractMedia(archivePath, targetDir, extensions, &files, &error)) {
        qWarning() << "ArchiveWorker: extraction failed" << archivePath << "-" << error;
        emit failed(archivePath, targetDir, error);
        return;
    }

    LOG_VERBOSE() << "ArchiveWorker: extracted" << files.size() << "media file(s) from" << archivePath;
    emit finished(archivePath, targetDir, files);
}

bool ArchiveWorker::extractMedia(const QString &archivePath, const QString &targetDir,
                                 const QStringList &extensions, QStringList *files,
                                 QString *error)
{
    KZip zip(archivePath);
    if (!zip.open(QIODevice::ReadOnly)) {
        *error = tr("Cannot open archive: %1").arg(zip.errorString());
        return false;
    }

    const KArchiveDirectory *root = zip.directory();
    if (!root) {
        *error = tr("Archive has no contents");
        return false;
    }

    QStringList written;
    const bool ok = extractDirectory(root, QString(), targetDir, extensions, &written, error);
    zip.close();

    written.sort();
    *files = written;
    return ok;
}

bool ArchiveWorker::extractDirectory(const KArchiveDirectory *directory,
                                     const QString &relativePath,
                                     const QString &targetDir,
                                     const QStringList &extensions,
                                     QStringList *files, QString *error)
{
    const QStringList names = directory->entries();
    for (const QString &name : names) {
        if (abortRequested_.load()) {
            *error = tr("Extraction aborted");
            return false;
        }

        // Entries may not climb out of the target folder
        if (name.isEmpty() || name == QLatin1String(".") || name == QLatin1String("..")) {
            continue;
        }

        const KArchiveEntry *entry = directory->entry(name);
        if (!entry) {
            continue;
        }

        const QString entryPath = relativePath.isEmpty() ? name : relativePath + '/' + name;

        if (entry->isDirectory()) {
            if (!extractDirectory(static_cast<const KArchiveDirectory *>(entry), entryPath,
                                  targetDir, extensions, files, error)) {
                return false;
            }
            continue;
        }

        if (!entry->isFile() || !MediaMetadataExtractor::isVideoFile(name, extensions)) {
            continue;
        }

        const QString folder = QDir(targetDir).filePath(relativePath);
        if (!QDir().mkpath(folder)) {
            *error = tr("Cannot create folder: %1").arg(folder);
            return false;
        }

        // copyTo() writes the entry under its own name into the folder
        const auto *file = static_cast<const KArchiveFile *>(entry);
        if (!file->copyTo(folder)) {
            *error = tr("Cannot extract %1").arg(entryPath);
            return false;
        }
        files->append(QDir::cleanPath(QDir(folder).filePath(name)));
    }
    return true;
}
