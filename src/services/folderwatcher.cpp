#include "folderwatcher.h"
#include "archiveextractor.h"
#include "mediametadataextractor.h"
#include "utils/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QTimer>

FolderWatcher::FolderWatcher(QObject *parent)
    : QObject(parent)
    , timer_(new QTimer(this))
    , extensions_(MediaMetadataExtractor::defaultVideoExtensions())
{
    timer_->setInterval(DefaultPollIntervalMs);
    connect(timer_, &QTimer::timeout, this, &FolderWatcher::poll);
}

FolderWatcher::~FolderWatcher() = default;

void FolderWatcher::setFolder(const QString &folder)
{
    const QString cleaned = folder.isEmpty() ? QString() : QDir::cleanPath(folder);
    if (folder_ == cleaned) {
        return;
    }
    folder_ = cleaned;
    reset();
}

void FolderWatcher::setExtensions(const QStringList &extensions)
{
    extensions_ = extensions;
}

void FolderWatcher::setPollInterval(int ms)
{
    timer_->setInterval(ms > 0 ? ms : DefaultPollIntervalMs);
}

int FolderWatcher::pollInterval() const
{
    return timer_->interval();
}

void FolderWatcher::setEnabled(bool enabled)
{
    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;

    if (enabled_) {
        qInfo() << "FolderWatcher: monitoring" << folder_ << "every" << timer_->interval() << "ms";
        timer_->start();
        QTimer::singleShot(0, this, &FolderWatcher::poll);
    } else {
        qInfo() << "FolderWatcher: monitoring stopped";
        timer_->stop();
    }
    emit enabledChanged(enabled_);
}

int FolderWatcher::poll()
{
    if (folder_.isEmpty() || !QFileInfo(folder_).isDir()) {
        LOG_VERBOSE() << "FolderWatcher: folder not available" << folder_;
        return 0;
    }

    QSet<QString> present;
    QStringList found;
    QDirIterator it(folder_, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (!MediaMetadataExtractor::isVideoFile(path, extensions_)
            && !ArchiveExtractor::isArchive(path)) {
            continue;
        }
        present.insert(path);
        if (!seen_.contains(path)) {
            found.append(path);
        }
    }

    // Only files still on disk are remembered; one that comes back is new again
    seen_.intersect(present);
    found.sort();

    for (const QString &path : found) {
        seen_.insert(path);
        emit mediaFileDiscovered(path);
    }

    if (!found.isEmpty()) {
        LOG_VERBOSE() << "FolderWatcher: discovered" << found.size() << "file(s) in" << folder_;
    }
    return found.size();
}

void FolderWatcher::reset()
{
    seen_.clear();
}
