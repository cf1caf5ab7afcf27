/**
 * @file folderwatcher.h
 * @brief Polling monitor that reports new media files in a source folder.
 */

#ifndef FOLDERWATCHER_H
#define FOLDERWATCHER_H

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

class QTimer;

/**
 * @brief Polls a folder tree and reports media files it has not seen.
 *
 * Archives are reported alongside media files. Disabled by default.
 * The first poll after enabling reports every file already present,
 * later polls only report new ones. Files that disappear are
 * forgotten, so the seen set never outgrows the folder.
 */
class FolderWatcher : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPollIntervalMs = 2000;

    explicit FolderWatcher(QObject *parent = nullptr);
    ~FolderWatcher() override;

    void setFolder(const QString &folder);
    [[nodiscard]] QString folder() const { return folder_; }

    void setExtensions(const QStringList &extensions);

    void setPollInterval(int ms);
    [[nodiscard]] int pollInterval() const;

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const { return enabled_; }

    /**
     * @brief Scans the folder once.
     * @return Number of newly discovered files.
     */
    int poll();

    /**
     * @brief Forgets every file seen so far.
     */
    void reset();

    [[nodiscard]] int seenCount() const { return seen_.size(); }

signals:
    void mediaFileDiscovered(const QString &path);
    void enabledChanged(bool enabled);

private:
    QTimer *timer_ = nullptr;
    QString folder_;
    QStringList extensions_;
    QSet<QString> seen_;
    bool enabled_ = false;
};

#endif // FOLDERWATCHER_H
