#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QStringList>

struct ButlerSettings;
class PreferencesDialog;
class TransferQueue;
class TransferService;
class FileCopier;
class FolderWatcher;
class ErrorHandler;
class ActivityLog;
class SourceBrowserWidget;
class TransferQueueWidget;
class TransferProgressWidget;
class DestinationWidget;
class ActivityLogWidget;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Queues files and folders given on the command line.
     */
    void queueStartupPaths(const QStringList &paths);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onPreferences();
    void onAbout();

    // Source selection slots
    void onPathsRequested(const QStringList &paths);
    void onSourceFolderChanged(const QString &path);
    void onMonitorToggled(bool enabled);
    void onMediaFileDiscovered(const QString &path);

    // Destination slots
    void onDestinationSelected(const QString &path);
    void onDrivesRefreshed(const QStringList &drives);

    // Queue control slots
    void onStart();
    void onStop();

    // Queue result slots
    void onJobQueued(const QString &sourcePath, const QString &displayName);
    void onJobStarted(const QString &displayName);
    void onJobCompleted(const QString &displayName, const QString &destinationPath);
    void onJobFailed(const QString &displayName, const QString &error);
    void onJobSkipped(const QString &displayName, const QString &destinationPath);
    void onAllJobsCompleted();
    void onQueueHalted(const QString &reason);
    void onQueueStateChanged();

private:
    void setupUi();
    void setupMenuBar();
    void setupConnections();
    void loadSettings();
    void saveSettings();
    void applySettings(const ButlerSettings &settings);

    // Core
    TransferQueue *transferQueue_ = nullptr;
    FileCopier *fileCopier_ = nullptr;
    TransferService *transferService_ = nullptr;
    FolderWatcher *folderWatcher_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;
    ActivityLog *activityLog_ = nullptr;

    // Widgets
    SourceBrowserWidget *sourceBrowser_ = nullptr;
    TransferQueueWidget *queueWidget_ = nullptr;
    TransferProgressWidget *progressWidget_ = nullptr;
    DestinationWidget *destinationWidget_ = nullptr;
    ActivityLogWidget *activityLogWidget_ = nullptr;
    PreferencesDialog *preferencesDialog_ = nullptr;
};

#endif // MAINWINDOW_H
