/**
 * @file activitylog.h
 * @brief Bounded, timestamped log of user-visible events.
 */

#ifndef ACTIVITYLOG_H
#define ACTIVITYLOG_H

#include <QObject>
#include <QStringList>

/**
 * @brief Collects "[HH:mm:ss] text" lines for the activity log view.
 *
 * Every entry is also written to qInfo() so it shows up in the
 * console and any installed message handler.
 */
class ActivityLog : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultMaxEntries = 1000;

    explicit ActivityLog(QObject *parent = nullptr);

    void setMaxEntries(int maxEntries);
    [[nodiscard]] int maxEntries() const { return maxEntries_; }

    [[nodiscard]] QStringList entries() const { return entries_; }
    [[nodiscard]] int count() const { return entries_.size(); }

    /**
     * @brief Formats a line with the current local time.
     */
    [[nodiscard]] static QString formatEntry(const QString &text);

public slots:
    void append(const QString &text);
    void clear();

signals:
    void entryAdded(const QString &line);
    void cleared();

private:
    void trim();

    QStringList entries_;
    int maxEntries_ = DefaultMaxEntries;
};

#endif // ACTIVITYLOG_H
