#include "mainwindow.h"
#include "models/transferqueue.h"
#include "services/activitylog.h"
#include "services/butlersettings.h"
#include "services/errorhandler.h"
#include "services/filecopier.h"
#include "services/folderwatcher.h"
#include "services/transferservice.h"
#include "ui/activitylogwidget.h"
#include "ui/destinationwidget.h"
#include "ui/preferencesdialog.h"
#include "ui/sourcebrowserwidget.h"
#include "ui/transferprogresswidget.h"
#include "ui/transferqueuewidget.h"
#include "utils/logging.h"
#include "version.h"

#include <QApplication>
#include <QCloseEvent>
#include <QDir>
#include <QFileInfo>
#include <QLabel>
#include <QMenuBar>
#include <QMessageBox>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , transferQueue_(new TransferQueue(this))
    , fileCopier_(new FileCopier(this))
    , folderWatcher_(new FolderWatcher(this))
    , activityLog_(new ActivityLog(this))
{
    transferQueue_->setFileCopier(fileCopier_);
    transferService_ = new TransferService(transferQueue_, this);
    errorHandler_ = new ErrorHandler(this, this);
    errorHandler_->setActivityLog(activityLog_);

    setWindowTitle(tr("Pendrive Butler"));
    resize(1100, 720);

    setupUi();
    setupMenuBar();
    setupConnections();
    loadSettings();

    activityLog_->append(tr("Pendrive Butler %1 ready").arg(BUTLER_VERSION));
    QTimer::singleShot(0, destinationWidget_, &DestinationWidget::refreshDrives);
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *layout = new QVBoxLayout(central);
    layout->setContentsMargins(6, 6, 6, 6);

    auto *verticalSplitter = new QSplitter(Qt::Vertical);

    // Source tree on the left, queue and progress on the right
    auto *horizontalSplitter = new QSplitter(Qt::Horizontal);

    sourceBrowser_ = new SourceBrowserWidget();
    horizontalSplitter->addWidget(sourceBrowser_);

    auto *rightPanel = new QWidget();
    auto *rightLayout = new QVBoxLayout(rightPanel);
    rightLayout->setContentsMargins(4, 4, 4, 4);

    queueWidget_ = new TransferQueueWidget();
    queueWidget_->setTransferService(transferService_);
    rightLayout->addWidget(queueWidget_, 1);

    progressWidget_ = new TransferProgressWidget();
    progressWidget_->setTransferService(transferService_);
    rightLayout->addWidget(progressWidget_);

    horizontalSplitter->addWidget(rightPanel);
    horizontalSplitter->setStretchFactor(0, 3);
    horizontalSplitter->setStretchFactor(1, 2);

    verticalSplitter->addWidget(horizontalSplitter);

    activityLogWidget_ = new ActivityLogWidget();
    activityLogWidget_->setActivityLog(activityLog_);
    verticalSplitter->addWidget(activityLogWidget_);
    verticalSplitter->setStretchFactor(0, 4);
    verticalSplitter->setStretchFactor(1, 1);

    layout->addWidget(verticalSplitter, 1);

    destinationWidget_ = new DestinationWidget();
    layout->addWidget(destinationWidget_);

    setCentralWidget(central);
    statusBar()->showMessage(tr("Ready"));
}

void MainWindow::setupMenuBar()
{
    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(tr("&Preferences..."), this, &MainWindow::onPreferences);
    fileMenu->addSeparator();
    QAction *quitAction = fileMenu->addAction(tr("&Quit"), this, &QWidget::close);
    quitAction->setShortcut(QKeySequence::Quit);

    QMenu *queueMenu = menuBar()->addMenu(tr("&Queue"));
    queueMenu->addAction(tr("&Start"), this, &MainWindow::onStart);
    queueMenu->addAction(tr("S&top"), this, &MainWindow::onStop);
    queueMenu->addSeparator();
    queueMenu->addAction(tr("Clear &Done"), transferService_, &TransferService::removeFinished);
    queueMenu->addAction(tr("&Clear Queue"), transferService_, &TransferService::clear);

    QMenu *helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(tr("&About"), this, &MainWindow::onAbout);
}

void MainWindow::setupConnections()
{
    // Source selection
    connect(sourceBrowser_, &SourceBrowserWidget::pathsRequested,
            this, &MainWindow::onPathsRequested);
    connect(sourceBrowser_, &SourceBrowserWidget::sourceFolderChanged,
            this, &MainWindow::onSourceFolderChanged);
    connect(sourceBrowser_, &SourceBrowserWidget::monitorToggled,
            this, &MainWindow::onMonitorToggled);
    connect(folderWatcher_, &FolderWatcher::mediaFileDiscovered,
            this, &MainWindow::onMediaFileDiscovered);

    // Destination and controls
    connect(destinationWidget_, &DestinationWidget::destinationSelected,
            this, &MainWindow::onDestinationSelected);
    connect(destinationWidget_, &DestinationWidget::drivesRefreshed,
            this, &MainWindow::onDrivesRefreshed);
    connect(destinationWidget_, &DestinationWidget::startRequested,
            this, &MainWindow::onStart);
    connect(destinationWidget_, &DestinationWidget::stopRequested,
            this, &MainWindow::onStop);

    // Queue results
    connect(transferService_, &TransferService::jobQueued,
            this, &MainWindow::onJobQueued);
    connect(transferService_, &TransferService::jobStarted,
            this, &MainWindow::onJobStarted);
    connect(transferService_, &TransferService::jobCompleted,
            this, &MainWindow::onJobCompleted);
    connect(transferService_, &TransferService::jobFailed,
            this, &MainWindow::onJobFailed);
    connect(transferService_, &TransferService::jobSkipped,
            this, &MainWindow::onJobSkipped);
    connect(transferService_, &TransferService::allJobsCompleted,
            this, &MainWindow::onAllJobsCompleted);
    // Queued so the halt dialog never opens inside the queue's own processing
    connect(transferService_, &TransferService::queueHalted,
            this, &MainWindow::onQueueHalted, Qt::QueuedConnection);
    connect(transferQueue_, &TransferQueue::stateChanged,
            this, &MainWindow::onQueueStateChanged);

    connect(transferService_, &TransferService::pathRejected,
            activityLog_, [this](const QString &, const QString &reason) {
                activityLog_->append(reason);
            });
    connect(transferService_, &TransferService::labelFallback,
            errorHandler_, &ErrorHandler::handleParseFailure);
    connect(transferService_, &TransferService::archiveExtracting,
            activityLog_, [this](const QString &archivePath) {
                activityLog_->append(tr("Extracting %1").arg(QFileInfo(archivePath).fileName()));
            });
    connect(transferService_, &TransferService::archiveExtracted,
            activityLog_, [this](const QString &archivePath, int queued) {
                if (queued > 0) {
                    activityLog_->append(tr("Queued %1 file(s) from %2")
                                             .arg(queued).arg(QFileInfo(archivePath).fileName()));
                }
            });

    // Status bar
    connect(transferService_, &TransferService::statusMessage,
            statusBar(), &QStatusBar::showMessage);
    connect(errorHandler_, &ErrorHandler::statusMessage,
            statusBar(), &QStatusBar::showMessage);
}

void MainWindow::loadSettings()
{
    const ButlerSettings settings = ButlerSettings::load();
    applySettings(settings);

    sourceBrowser_->setSourceFolder(settings.sourceFolder);
    folderWatcher_->setFolder(settings.sourceFolder);

    if (!settings.destination.isEmpty() && QFileInfo(settings.destination).isDir()) {
        destinationWidget_->setDestination(settings.destination);
    }

    // Monitor state is restored last so the first poll sees the final folder
    sourceBrowser_->setMonitorChecked(settings.monitorEnabled);

    // Restore window geometry
    QSettings qsettings;
    restoreGeometry(qsettings.value("window/geometry").toByteArray());
    restoreState(qsettings.value("window/state").toByteArray());
}

void MainWindow::saveSettings()
{
    ButlerSettings settings = ButlerSettings::load();
    settings.sourceFolder = sourceBrowser_->sourceFolder();
    settings.destination = destinationWidget_->destination();
    settings.monitorEnabled = folderWatcher_->isEnabled();
    settings.save();

    QSettings qsettings;
    qsettings.setValue("window/geometry", saveGeometry());
    qsettings.setValue("window/state", saveState());
}

void MainWindow::applySettings(const ButlerSettings &settings)
{
    transferService_->setLayout(settings.layout);
    transferService_->setVideoExtensions(settings.videoExtensions);
    folderWatcher_->setExtensions(transferService_->videoExtensions());
    folderWatcher_->setPollInterval(settings.pollIntervalMs);
    sourceBrowser_->setVideoExtensions(transferService_->videoExtensions());

    LOG_VERBOSE() << "MainWindow: layout" << DestinationResolver::layoutToString(settings.layout)
                  << "extensions" << settings.videoExtensions
                  << "poll" << settings.pollIntervalMs << "ms";
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (transferQueue_->activeCount() > 0) {
        const auto answer = QMessageBox::question(this, tr("Copy in progress"),
            tr("A file is still being copied. Quit anyway? The partial copy will be removed."));
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        transferService_->stop();
        fileCopier_->abort();
    }

    saveSettings();
    event->accept();
}

// Slots

void MainWindow::onPreferences()
{
    if (!preferencesDialog_) {
        preferencesDialog_ = new PreferencesDialog(this);
    }

    if (preferencesDialog_->exec() == QDialog::Accepted) {
        applySettings(ButlerSettings::load());
        activityLog_->append(tr("Preferences updated"));
    }
}

void MainWindow::onAbout()
{
    QMessageBox::about(this, tr("About Pendrive Butler"),
        tr("<h3>Pendrive Butler %1</h3>"
           "<p>Copies movies and episodes to a USB drive, one file at a time, "
           "organised by title.</p>").arg(BUTLER_VERSION));
}

void MainWindow::queueStartupPaths(const QStringList &paths)
{
    if (paths.isEmpty()) {
        return;
    }
    activityLog_->append(tr("Adding %n path(s) from the command line", nullptr, paths.size()));
    onPathsRequested(paths);
}

void MainWindow::onPathsRequested(const QStringList &paths)
{
    const int queued = transferService_->addPaths(paths);
    LOG_VERBOSE() << "MainWindow: queued" << queued << "job(s) from" << paths.size() << "path(s)";
}

void MainWindow::onSourceFolderChanged(const QString &path)
{
    folderWatcher_->setFolder(path);
    activityLog_->append(tr("Source folder: %1").arg(QDir::toNativeSeparators(path)));
}

void MainWindow::onMonitorToggled(bool enabled)
{
    folderWatcher_->setFolder(sourceBrowser_->sourceFolder());
    folderWatcher_->setEnabled(enabled);
    activityLog_->append(enabled ? tr("Folder monitor enabled") : tr("Folder monitor disabled"));
}

void MainWindow::onMediaFileDiscovered(const QString &path)
{
    transferService_->addPath(path);
}

void MainWindow::onDestinationSelected(const QString &path)
{
    transferService_->setDestination(path);
    if (path.isEmpty()) {
        return;
    }
    activityLog_->append(tr("Destination chosen: %1").arg(QDir::toNativeSeparators(path)));

    // Permission bits only; the real write check runs on the copier thread
    if (!QFileInfo(path).isWritable()) {
        errorHandler_->handleDriveError(
            tr("%1 is not writable").arg(QDir::toNativeSeparators(path)));
    }
}

void MainWindow::onDrivesRefreshed(const QStringList &drives)
{
    QStringList names;
    for (const QString &drive : drives) {
        names.append(QDir::toNativeSeparators(drive));
    }
    activityLog_->append(tr("Found drives: %1")
        .arg(names.isEmpty() ? tr("(none)") : names.join(", ")));
}

void MainWindow::onStart()
{
    if (transferService_->isRunning()) {
        activityLog_->append(tr("Already running"));
        return;
    }
    activityLog_->append(tr("Starting service..."));
    transferService_->start();
    onQueueStateChanged();
}

void MainWindow::onStop()
{
    if (!transferService_->isRunning()) {
        activityLog_->append(tr("Not running"));
        return;
    }
    activityLog_->append(tr("Stopping service..."));
    transferService_->stop();
    onQueueStateChanged();
}

void MainWindow::onJobQueued(const QString &sourcePath, const QString &displayName)
{
    activityLog_->append(tr("Queued: %1 as \"%2\"")
        .arg(QDir::toNativeSeparators(sourcePath), displayName));
}

void MainWindow::onJobStarted(const QString &displayName)
{
    activityLog_->append(tr("Copying: %1").arg(displayName));
}

void MainWindow::onJobCompleted(const QString &displayName, const QString &destinationPath)
{
    activityLog_->append(tr("Done: %1 -> %2")
        .arg(displayName, QDir::toNativeSeparators(destinationPath)));
}

void MainWindow::onJobFailed(const QString &displayName, const QString &error)
{
    errorHandler_->handleCopyFailed(displayName, error);
}

void MainWindow::onJobSkipped(const QString &displayName, const QString &destinationPath)
{
    errorHandler_->handleDestinationConflict(displayName, destinationPath);
}

void MainWindow::onAllJobsCompleted()
{
    activityLog_->append(tr("All queued files processed"));
    statusBar()->showMessage(tr("Queue finished"), 5000);
}

void MainWindow::onQueueHalted(const QString &reason)
{
    errorHandler_->handleQueueHalted(reason, [this]() {
        destinationWidget_->refreshDrives();
        onStart();
    });
}

void MainWindow::onQueueStateChanged()
{
    const QueueState state = transferQueue_->state();
    destinationWidget_->setRunning(transferQueue_->isRunning());
    LOG_VERBOSE() << "MainWindow: queue state" << queueStateToString(state);
}
