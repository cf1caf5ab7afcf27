#include "destinationresolver.h"
#include "models/transferjob.h"

#include <QDir>
#include <QFileInfo>

DestinationResolver::DestinationResolver(DestinationLayout layout)
    : layout_(layout)
{
}

DestinationPlan DestinationResolver::plan(const QString &sourcePath) const
{
    const QString fileName = QFileInfo(sourcePath).fileName();
    return plan(MediaMetadataExtractor::parse(fileName), fileName);
}

DestinationPlan DestinationResolver::plan(const MediaMetadataExtractor::MediaInfo &info,
                                          const QString &fileName) const
{
    using Kind = MediaMetadataExtractor::MediaInfo::Kind;

    DestinationPlan result;
    result.fileName = fileName;

    if (layout_ == DestinationLayout::LabelFolder) {
        // Unparsed names go to the root rather than into a folder named after the file
        if (info.valid) {
            result.folder = sanitizeFileName(MediaMetadataExtractor::displayLabel(info, fileName));
        }
        return result;
    }

    const QString suffix = QFileInfo(fileName).suffix();
    const QString extension = suffix.isEmpty() ? QString() : "." + suffix;

    if (info.valid && info.kind == Kind::Episode) {
        const QString series = sanitizeFileName(info.title);
        const QString season = QString("%1").arg(info.season, 2, 10, QChar('0'));
        const QString episode = QString("%1").arg(info.episode, 2, 10, QChar('0'));
        result.folder = QString("%1/Season %2").arg(series, season);
        result.fileName = QString("%1 - S%2E%3%4").arg(series, season, episode, extension);
        return result;
    }

    result.folder = QStringLiteral("Movies");
    if (info.valid) {
        const QString title = sanitizeFileName(info.title);
        if (info.year > 0) {
            result.fileName = QString("%1 (%2)%3").arg(title).arg(info.year).arg(extension);
        } else {
            result.fileName = title + extension;
        }
    }
    return result;
}

DestinationResolution DestinationResolver::resolve(const TransferJob &job, const QString &root)
{
    DestinationResolution resolution;
    if (root.isEmpty() || job.targetFileName.isEmpty()) {
        return resolution;
    }

    resolution.valid = true;
    resolution.path = joinPath(root, job.targetFolder, job.targetFileName);
    resolution.conflict = QFileInfo::exists(resolution.path);
    return resolution;
}

QString DestinationResolver::joinPath(const QString &root, const QString &folder,
                                      const QString &fileName)
{
    QDir rootDir(root);
    const QString relative = folder.isEmpty() ? fileName : folder + "/" + fileName;
    return QDir::cleanPath(rootDir.absoluteFilePath(relative));
}

QString DestinationResolver::sanitizeFileName(const QString &name)
{
    static const QString invalid = QStringLiteral("<>:\"/\\|?*");

    QString out;
    out.reserve(name.size());
    for (const QChar ch : name) {
        if (!invalid.contains(ch)) {
            out.append(ch);
        }
    }

    out = out.simplified();
    return out.isEmpty() ? QStringLiteral("unnamed") : out;
}

QString DestinationResolver::layoutToString(DestinationLayout layout)
{
    switch (layout) {
    case DestinationLayout::LabelFolder:
        return QStringLiteral("label-folder");
    case DestinationLayout::Library:
        return QStringLiteral("library");
    }
    return QStringLiteral("label-folder");
}

DestinationLayout DestinationResolver::layoutFromString(const QString &value)
{
    if (value == QLatin1String("library")) {
        return DestinationLayout::Library;
    }
    return DestinationLayout::LabelFolder;
}
