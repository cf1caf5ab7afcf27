#ifndef SOURCEBROWSERWIDGET_H
#define SOURCEBROWSERWIDGET_H

#include <QWidget>
#include <QStringList>

class QFileSystemModel;
class QTreeView;
class QLineEdit;
class QCheckBox;
class QPushButton;
class SourceFilterProxyModel;

/**
 * @brief Source folder tree with search filter and queueing buttons.
 *
 * Emits pathsRequested() for files or folders the user wants queued;
 * the widget itself never touches the transfer queue.
 */
class SourceBrowserWidget : public QWidget
{
    Q_OBJECT

public:
    explicit SourceBrowserWidget(QWidget *parent = nullptr);

    [[nodiscard]] QString sourceFolder() const { return sourceFolder_; }
    [[nodiscard]] QStringList selectedPaths() const;
    [[nodiscard]] bool isMonitorChecked() const;

    void setVideoExtensions(const QStringList &extensions);

public slots:
    void setSourceFolder(const QString &path);
    void setMonitorChecked(bool checked);

signals:
    void pathsRequested(const QStringList &paths);
    void sourceFolderChanged(const QString &path);
    void monitorToggled(bool enabled);

private slots:
    void onBrowse();
    void onRefresh();
    void onAddFile();
    void onAddSelected();
    void onDoubleClicked(const QModelIndex &index);
    void onSearchChanged(const QString &text);

private:
    void setupUi();
    void updateButtons();

    QString sourceFolder_;
    QStringList extensions_;

    QFileSystemModel *fileModel_ = nullptr;
    SourceFilterProxyModel *proxyModel_ = nullptr;

    QLineEdit *folderEdit_ = nullptr;
    QLineEdit *searchEdit_ = nullptr;
    QTreeView *treeView_ = nullptr;
    QCheckBox *monitorCheck_ = nullptr;
    QPushButton *addSelectedButton_ = nullptr;
};

#endif // SOURCEBROWSERWIDGET_H
