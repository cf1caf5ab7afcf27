#include "sourcebrowserwidget.h"
#include "models/sourcefilterproxymodel.h"
#include "services/archiveextractor.h"
#include "services/mediametadataextractor.h"

#include <QCheckBox>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFileSystemModel>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QTreeView>
#include <QVBoxLayout>

SourceBrowserWidget::SourceBrowserWidget(QWidget *parent)
    : QWidget(parent)
    , sourceFolder_(QDir::homePath())
    , extensions_(MediaMetadataExtractor::defaultVideoExtensions())
{
    setupUi();
}

void SourceBrowserWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    auto *label = new QLabel(tr("Source folder contents"));
    label->setStyleSheet("font-weight: bold;");
    layout->addWidget(label);

    // Folder row
    auto *folderLayout = new QHBoxLayout();
    folderLayout->addWidget(new QLabel(tr("Source folder:")));
    folderEdit_ = new QLineEdit(QDir::toNativeSeparators(sourceFolder_));
    connect(folderEdit_, &QLineEdit::editingFinished, this, [this]() {
        const QString path = QDir::fromNativeSeparators(folderEdit_->text().trimmed());
        if (QFileInfo(path).isDir()) {
            setSourceFolder(path);
        } else {
            folderEdit_->setText(QDir::toNativeSeparators(sourceFolder_));
        }
    });
    folderLayout->addWidget(folderEdit_, 1);

    auto *browseButton = new QPushButton(tr("Browse"));
    connect(browseButton, &QPushButton::clicked, this, &SourceBrowserWidget::onBrowse);
    folderLayout->addWidget(browseButton);

    auto *refreshButton = new QPushButton(tr("Refresh tree"));
    connect(refreshButton, &QPushButton::clicked, this, &SourceBrowserWidget::onRefresh);
    folderLayout->addWidget(refreshButton);

    auto *addFileButton = new QPushButton(tr("Add File"));
    connect(addFileButton, &QPushButton::clicked, this, &SourceBrowserWidget::onAddFile);
    folderLayout->addWidget(addFileButton);
    layout->addLayout(folderLayout);

    // Search row
    auto *searchLayout = new QHBoxLayout();
    searchLayout->addWidget(new QLabel(tr("Search:")));
    searchEdit_ = new QLineEdit();
    searchEdit_->setClearButtonEnabled(true);
    searchEdit_->setPlaceholderText(tr("Filter files and folders, including subfolders"));
    connect(searchEdit_, &QLineEdit::textChanged, this, &SourceBrowserWidget::onSearchChanged);
    searchLayout->addWidget(searchEdit_, 1);

    monitorCheck_ = new QCheckBox(tr("Monitor folder (auto-queue)"));
    monitorCheck_->setChecked(false);
    connect(monitorCheck_, &QCheckBox::toggled, this, &SourceBrowserWidget::monitorToggled);
    searchLayout->addWidget(monitorCheck_);
    layout->addLayout(searchLayout);

    // Tree view
    fileModel_ = new QFileSystemModel(this);
    fileModel_->setRootPath(sourceFolder_);
    fileModel_->setFilter(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::AllDirs);

    proxyModel_ = new SourceFilterProxyModel(this);
    proxyModel_->setSourceModel(fileModel_);
    proxyModel_->setRootPath(sourceFolder_);

    treeView_ = new QTreeView();
    treeView_->setModel(proxyModel_);
    treeView_->setAlternatingRowColors(true);
    treeView_->setSelectionMode(QAbstractItemView::ExtendedSelection);
    treeView_->setSortingEnabled(true);
    treeView_->sortByColumn(0, Qt::AscendingOrder);
    treeView_->setRootIndex(proxyModel_->mapFromSource(fileModel_->index(sourceFolder_)));
    treeView_->header()->setSectionResizeMode(0, QHeaderView::Stretch);

    connect(treeView_, &QTreeView::doubleClicked,
            this, &SourceBrowserWidget::onDoubleClicked);
    connect(treeView_->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, &SourceBrowserWidget::updateButtons);
    layout->addWidget(treeView_, 1);

    // Buttons
    auto *buttonLayout = new QHBoxLayout();
    addSelectedButton_ = new QPushButton(tr("Add Selected"));
    addSelectedButton_->setToolTip(tr("Queue the selected files and folders"));
    connect(addSelectedButton_, &QPushButton::clicked, this, &SourceBrowserWidget::onAddSelected);
    buttonLayout->addWidget(addSelectedButton_);
    buttonLayout->addStretch();
    layout->addLayout(buttonLayout);

    updateButtons();
}

QStringList SourceBrowserWidget::selectedPaths() const
{
    QStringList paths;
    const QModelIndexList rows = treeView_->selectionModel()->selectedRows(0);
    for (const QModelIndex &index : rows) {
        const QString path = proxyModel_->filePath(index);
        if (!path.isEmpty()) {
            paths.append(path);
        }
    }
    return paths;
}

bool SourceBrowserWidget::isMonitorChecked() const
{
    return monitorCheck_->isChecked();
}

void SourceBrowserWidget::setVideoExtensions(const QStringList &extensions)
{
    extensions_ = extensions;
    proxyModel_->setVideoExtensions(extensions);
}

void SourceBrowserWidget::setSourceFolder(const QString &path)
{
    const QString cleaned = QDir::cleanPath(path);
    folderEdit_->setText(QDir::toNativeSeparators(cleaned));
    if (cleaned == sourceFolder_) {
        return;
    }

    sourceFolder_ = cleaned;
    fileModel_->setRootPath(sourceFolder_);
    proxyModel_->setRootPath(sourceFolder_);
    treeView_->setRootIndex(proxyModel_->mapFromSource(fileModel_->index(sourceFolder_)));
    updateButtons();

    emit sourceFolderChanged(sourceFolder_);
}

void SourceBrowserWidget::setMonitorChecked(bool checked)
{
    monitorCheck_->setChecked(checked);
}

void SourceBrowserWidget::onBrowse()
{
    const QString path = QFileDialog::getExistingDirectory(this,
        tr("Select Source Folder"), sourceFolder_);
    if (!path.isEmpty()) {
        setSourceFolder(path);
    }
}

void SourceBrowserWidget::onRefresh()
{
    // Re-rooting forces a rescan and rebuilds the filter cache
    fileModel_->setRootPath(QString());
    fileModel_->setRootPath(sourceFolder_);
    proxyModel_->setRootPath(sourceFolder_);
    treeView_->setRootIndex(proxyModel_->mapFromSource(fileModel_->index(sourceFolder_)));
}

void SourceBrowserWidget::onAddFile()
{
    QStringList patterns;
    for (const QString &ext : extensions_) {
        patterns.append(QStringLiteral("*.") + ext);
    }
    for (const QString &ext : ArchiveExtractor::archiveExtensions()) {
        patterns.append(QStringLiteral("*.") + ext);
    }
    const QString filter = tr("Video files and archives (%1);;All files (*)").arg(patterns.join(' '));

    const QStringList files = QFileDialog::getOpenFileNames(this,
        tr("Add File"), sourceFolder_, filter);
    if (!files.isEmpty()) {
        emit pathsRequested(files);
    }
}

void SourceBrowserWidget::onAddSelected()
{
    const QStringList paths = selectedPaths();
    if (!paths.isEmpty()) {
        emit pathsRequested(paths);
    }
}

void SourceBrowserWidget::onDoubleClicked(const QModelIndex &index)
{
    const QString path = proxyModel_->filePath(index.sibling(index.row(), 0));
    if (!path.isEmpty()) {
        emit pathsRequested(QStringList{path});
    }
}

void SourceBrowserWidget::onSearchChanged(const QString &text)
{
    proxyModel_->setSearchTerm(text);
    if (!text.trimmed().isEmpty()) {
        treeView_->expandAll();
    }
}

void SourceBrowserWidget::updateButtons()
{
    addSelectedButton_->setEnabled(treeView_->selectionModel()->hasSelection());
}
