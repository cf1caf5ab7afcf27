#include "drivedetector.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QStorageInfo>
#include <QTemporaryFile>
#include <QThread>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

QStringList DriveDetector::removableDrives()
{
    QStringList drives;

    const QList<QStorageInfo> volumes = QStorageInfo::mountedVolumes();
    for (const QStorageInfo &volume : volumes) {
        if (!volume.isValid() || !volume.isReady()) {
            continue;
        }
        const QString root = volume.rootPath();
        if (isRemovableMountPoint(root)) {
            drives.append(root);
        }
    }

    drives.removeDuplicates();
    drives.sort();
    LOG_VERBOSE() << "DriveDetector: found" << drives.size() << "removable drive(s)" << drives;
    return drives;
}

bool DriveDetector::isRemovableMountPoint(const QString &root)
{
    if (root.isEmpty()) {
        return false;
    }

#ifdef Q_OS_WIN
    const QString native = QDir::toNativeSeparators(root);
    const UINT type = GetDriveTypeW(reinterpret_cast<LPCWSTR>(native.utf16()));
    return type == DRIVE_REMOVABLE;
#else
    static const QStringList prefixes = {
        QStringLiteral("/media/"),
        QStringLiteral("/run/media/"),
        QStringLiteral("/mnt/")
    };
    for (const QString &prefix : prefixes) {
        if (root.startsWith(prefix)) {
            return true;
        }
    }
    return false;
#endif
}

bool DriveDetector::isWritable(const QString &root, int attempts)
{
    if (!isAvailable(root)) {
        return false;
    }

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        QTemporaryFile scratch(QDir(root).filePath(QStringLiteral(".butler_check_XXXXXX")));
        if (scratch.open()) {
            // QTemporaryFile removes the file when it goes out of scope
            if (scratch.write("ok", 2) == 2) {
                return true;
            }
        }
        LOG_VERBOSE() << "DriveDetector: write check" << attempt << "failed for" << root
                      << scratch.errorString();
        if (attempt < attempts) {
            QThread::msleep(WriteRetryDelayMs);
        }
    }

    qWarning() << "DriveDetector: destination is not writable:" << root;
    return false;
}

bool DriveDetector::isAvailable(const QString &root)
{
    if (root.isEmpty()) {
        return false;
    }
    const QFileInfo info(root);
    return info.exists() && info.isDir();
}

qint64 DriveDetector::bytesAvailable(const QString &root)
{
    if (!isAvailable(root)) {
        return -1;
    }
    const QStorageInfo storage(root);
    if (!storage.isValid()) {
        return -1;
    }
    return storage.bytesAvailable();
}

QString DriveDetector::displayName(const QString &root)
{
    const QStorageInfo storage(root);
    const QString name = storage.isValid() ? storage.name() : QString();
    const QString path = QDir::toNativeSeparators(root);
    if (name.isEmpty()) {
        return path;
    }
    return QString("%1 (%2)").arg(name, path);
}
