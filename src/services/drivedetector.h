/**
 * @file drivedetector.h
 * @brief Removable drive enumeration and destination probing.
 */

#ifndef DRIVEDETECTOR_H
#define DRIVEDETECTOR_H

#include <QString>
#include <QStringList>

/**
 * @brief Static helpers for finding and checking destination drives.
 *
 * On Windows a drive is removable when the shell reports it as such.
 * Elsewhere any mounted volume under /media, /run/media or /mnt is
 * treated as removable, which covers udisks and manual mounts.
 */
class DriveDetector
{
public:
    /// Number of write attempts before a destination is declared read-only
    static constexpr int DefaultWriteAttempts = 3;

    /// Delay between write attempts
    static constexpr int WriteRetryDelayMs = 100;

    /**
     * @brief Lists mounted removable volumes.
     * @return Sorted, de-duplicated list of mount roots.
     */
    [[nodiscard]] static QStringList removableDrives();

    /**
     * @brief Checks whether a mount root looks like a removable volume.
     */
    [[nodiscard]] static bool isRemovableMountPoint(const QString &root);

    /**
     * @brief Checks a destination by creating and removing a temporary file.
     * @param root Destination directory.
     * @param attempts Number of attempts before giving up.
     * @return True if a scratch file could be written.
     */
    [[nodiscard]] static bool isWritable(const QString &root, int attempts = DefaultWriteAttempts);

    /**
     * @brief Returns true if the root exists and is a directory.
     */
    [[nodiscard]] static bool isAvailable(const QString &root);

    /**
     * @brief Returns free bytes on the volume holding root, or -1 if unknown.
     */
    [[nodiscard]] static qint64 bytesAvailable(const QString &root);

    /**
     * @brief Human readable name for a drive, e.g. "KINGSTON (E:)".
     */
    [[nodiscard]] static QString displayName(const QString &root);

private:
    DriveDetector() = default;
};

#endif // DRIVEDETECTOR_H
