#include "sourcefilterproxymodel.h"
#include "services/archiveextractor.h"
#include "services/mediametadataextractor.h"

#include <QDir>
#include <QDirIterator>

SourceFilterProxyModel::SourceFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
    , extensions_(MediaMetadataExtractor::defaultVideoExtensions())
{
    setRecursiveFilteringEnabled(false);
}

void SourceFilterProxyModel::setSearchTerm(const QString &term)
{
    const QString normalized = term.trimmed().toLower();
    if (normalized == searchTerm_) {
        return;
    }
    searchTerm_ = normalized;
    folderMatchCache_.clear();
    invalidateFilter();
}

void SourceFilterProxyModel::setRootPath(const QString &path)
{
    rootPath_ = QDir::cleanPath(path);
    folderMatchCache_.clear();
    invalidateFilter();
}

void SourceFilterProxyModel::setVideoExtensions(const QStringList &extensions)
{
    extensions_ = extensions;
}

QString SourceFilterProxyModel::filePath(const QModelIndex &proxyIndex) const
{
    QFileSystemModel *fsModel = sourceFileModel();
    if (!fsModel || !proxyIndex.isValid()) {
        return QString();
    }
    return fsModel->filePath(mapToSource(proxyIndex));
}

bool SourceFilterProxyModel::isDir(const QModelIndex &proxyIndex) const
{
    QFileSystemModel *fsModel = sourceFileModel();
    if (!fsModel || !proxyIndex.isValid()) {
        return false;
    }
    return fsModel->isDir(mapToSource(proxyIndex));
}

QVariant SourceFilterProxyModel::data(const QModelIndex &index, int role) const
{
    QFileSystemModel *fsModel = sourceFileModel();
    if (!fsModel) {
        return QSortFilterProxyModel::data(index, role);
    }

    QModelIndex sourceIdx = mapToSource(index);
    QModelIndex nameIdx = sourceIdx.sibling(sourceIdx.row(), 0);

    // Column 2: Type - mark media files
    if (index.column() == 2 && role == Qt::DisplayRole) {
        if (fsModel->isDir(nameIdx)) {
            return tr("Folder");
        }
        if (MediaMetadataExtractor::isVideoFile(fsModel->fileName(nameIdx), extensions_)) {
            return tr("Video");
        }
        if (ArchiveExtractor::isArchive(fsModel->fileName(nameIdx))) {
            return tr("Archive");
        }
        return tr("File");
    }

    // Tooltip on the name shows the label the file will be queued as
    if (index.column() == 0 && role == Qt::ToolTipRole && !fsModel->isDir(nameIdx)) {
        const QString fileName = fsModel->fileName(nameIdx);
        if (MediaMetadataExtractor::isVideoFile(fileName, extensions_)) {
            return MediaMetadataExtractor::labelFor(fileName);
        }
    }

    return QSortFilterProxyModel::data(index, role);
}

QVariant SourceFilterProxyModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation == Qt::Horizontal && section == 2 && role == Qt::DisplayRole) {
        return tr("Type");
    }
    return QSortFilterProxyModel::headerData(section, orientation, role);
}

bool SourceFilterProxyModel::pathMatches(const QString &path, bool isDirectory) const
{
    if (searchTerm_.isEmpty()) {
        return true;
    }

    // Only the part below the root counts, so a term matching the root
    // folder name itself does not accept everything
    auto relativeMatches = [this](const QString &candidate) {
        QString relative = candidate;
        if (!rootPath_.isEmpty() && candidate.startsWith(rootPath_ + QLatin1Char('/'))) {
            relative = candidate.mid(rootPath_.size() + 1);
        }
        return relative.toLower().contains(searchTerm_);
    };

    if (relativeMatches(path)) {
        return true;
    }
    if (!isDirectory) {
        return false;
    }

    auto cached = folderMatchCache_.constFind(path);
    if (cached != folderMatchCache_.constEnd()) {
        return cached.value();
    }

    bool found = false;
    QDirIterator it(path, QDir::AllEntries | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (relativeMatches(it.next())) {
            found = true;
            break;
        }
    }
    folderMatchCache_.insert(path, found);
    return found;
}

bool SourceFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    QFileSystemModel *fsModel = sourceFileModel();
    if (!fsModel || searchTerm_.isEmpty()) {
        return true;
    }

    const QModelIndex index = fsModel->index(sourceRow, 0, sourceParent);
    const QString path = fsModel->filePath(index);

    // Only entries below the root are filtered
    if (rootPath_.isEmpty() || !path.startsWith(rootPath_ + QLatin1Char('/'))) {
        return true;
    }

    return pathMatches(path, fsModel->isDir(index));
}

bool SourceFilterProxyModel::lessThan(const QModelIndex &left, const QModelIndex &right) const
{
    QFileSystemModel *fsModel = sourceFileModel();
    if (!fsModel) {
        return QSortFilterProxyModel::lessThan(left, right);
    }

    QModelIndex leftName = left.sibling(left.row(), 0);
    QModelIndex rightName = right.sibling(right.row(), 0);

    bool leftIsDir = fsModel->isDir(leftName);
    bool rightIsDir = fsModel->isDir(rightName);

    // Directories come before files
    if (leftIsDir && !rightIsDir) {
        return sortOrder() == Qt::AscendingOrder;
    }
    if (!leftIsDir && rightIsDir) {
        return sortOrder() != Qt::AscendingOrder;
    }

    return QSortFilterProxyModel::lessThan(left, right);
}

QFileSystemModel *SourceFilterProxyModel::sourceFileModel() const
{
    return qobject_cast<QFileSystemModel*>(sourceModel());
}
