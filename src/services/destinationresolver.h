/**
 * @file destinationresolver.h
 * @brief Computes where a file lands on the destination drive.
 */

#ifndef DESTINATIONRESOLVER_H
#define DESTINATIONRESOLVER_H

#include <QString>

#include "mediametadataextractor.h"

struct TransferJob;

/**
 * @brief How copied files are organised under the destination root.
 */
enum class DestinationLayout {
    LabelFolder,    ///< <root>/<label>/<original file name>
    Library         ///< <root>/Movies/<Title (Year)>.ext, <root>/<Series>/Season NN/<Series> - SxxEyy.ext
};

/**
 * @brief Folder and file name relative to the destination root.
 */
struct DestinationPlan {
    QString folder;     ///< Relative folder, empty for the root itself
    QString fileName;
};

/**
 * @brief Result of resolving a job against a destination root.
 */
struct DestinationResolution {
    bool valid = false;     ///< False if no root was given
    QString path;           ///< Absolute final write path
    bool conflict = false;  ///< True if a file already exists at path
};

/**
 * @brief Plans and resolves destination paths.
 *
 * Planning happens when a file is queued and only depends on its
 * name and the layout. Resolution happens right before the copy,
 * against whatever root is active at that moment, and reports an
 * existing file as a conflict so the caller can skip the job
 * instead of overwriting it.
 */
class DestinationResolver
{
public:
    explicit DestinationResolver(DestinationLayout layout = DestinationLayout::LabelFolder);

    [[nodiscard]] DestinationLayout layout() const { return layout_; }
    void setLayout(DestinationLayout layout) { layout_ = layout; }

    /**
     * @brief Plans the relative destination for a source file.
     * @param sourcePath Path (or bare name) of the source file.
     */
    [[nodiscard]] DestinationPlan plan(const QString &sourcePath) const;

    /**
     * @brief Plans the relative destination from already parsed metadata.
     * @param info Parsed metadata for @p fileName.
     * @param fileName Source file name without directory.
     */
    [[nodiscard]] DestinationPlan plan(const MediaMetadataExtractor::MediaInfo &info,
                                       const QString &fileName) const;

    /**
     * @brief Resolves a job's final write path under a root.
     * @param job Job carrying targetFolder and targetFileName.
     * @param root Destination root (drive or folder).
     */
    [[nodiscard]] static DestinationResolution resolve(const TransferJob &job, const QString &root);

    /**
     * @brief Joins root, relative folder and file name.
     */
    [[nodiscard]] static QString joinPath(const QString &root, const QString &folder,
                                          const QString &fileName);

    /**
     * @brief Removes characters that are invalid in file names.
     * @return The cleaned name, or "unnamed" if nothing is left.
     */
    [[nodiscard]] static QString sanitizeFileName(const QString &name);

    [[nodiscard]] static QString layoutToString(DestinationLayout layout);
    [[nodiscard]] static DestinationLayout layoutFromString(const QString &value);

private:
    DestinationLayout layout_;
};

#endif // DESTINATIONRESOLVER_H
