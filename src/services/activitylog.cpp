#include "activitylog.h"

#include <QDebug>
#include <QTime>

ActivityLog::ActivityLog(QObject *parent)
    : QObject(parent)
{
}

void ActivityLog::setMaxEntries(int maxEntries)
{
    maxEntries_ = qMax(1, maxEntries);
    trim();
}

QString ActivityLog::formatEntry(const QString &text)
{
    return QString("[%1] %2").arg(QTime::currentTime().toString("HH:mm:ss"), text);
}

void ActivityLog::append(const QString &text)
{
    const QString line = formatEntry(text);
    entries_.append(line);
    trim();

    qInfo().noquote() << line;
    emit entryAdded(line);
}

void ActivityLog::clear()
{
    entries_.clear();
    emit cleared();
}

void ActivityLog::trim()
{
    while (entries_.size() > maxEntries_) {
        entries_.removeFirst();
    }
}
