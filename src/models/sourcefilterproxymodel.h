#ifndef SOURCEFILTERPROXYMODEL_H
#define SOURCEFILTERPROXYMODEL_H

#include <QHash>
#include <QSortFilterProxyModel>
#include <QFileSystemModel>
#include <QStringList>

/**
 * Proxy model that customizes QFileSystemModel display for the source tree:
 * - Filters by a search term matched against names and paths; a folder
 *   stays visible while anything below it matches
 * - Shows "Video" as type for media files and the parsed label as tooltip
 * - Sorts directories before files
 */
class SourceFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit SourceFilterProxyModel(QObject *parent = nullptr);

    void setSearchTerm(const QString &term);
    [[nodiscard]] QString searchTerm() const { return searchTerm_; }

    /**
     * @brief Sets the folder shown as tree root.
     *
     * Ancestors of the root are always accepted so the root index
     * stays reachable while filtering.
     */
    void setRootPath(const QString &path);

    void setVideoExtensions(const QStringList &extensions);

    [[nodiscard]] QString filePath(const QModelIndex &proxyIndex) const;
    [[nodiscard]] bool isDir(const QModelIndex &proxyIndex) const;

    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    /**
     * @brief Returns true if a path or anything below it matches the term.
     */
    [[nodiscard]] bool pathMatches(const QString &path, bool isDirectory) const;

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;
    bool lessThan(const QModelIndex &left, const QModelIndex &right) const override;

private:
    QFileSystemModel *sourceFileModel() const;

    QString searchTerm_;
    QString rootPath_;
    QStringList extensions_;
    mutable QHash<QString, bool> folderMatchCache_;
};

#endif // SOURCEFILTERPROXYMODEL_H
