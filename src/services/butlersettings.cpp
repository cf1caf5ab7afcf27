#include "butlersettings.h"
#include "mediametadataextractor.h"

#include <QRegularExpression>
#include <QSettings>
#include <QStandardPaths>

namespace {
const char *const KeySourceFolder = "directories/source";
const char *const KeyDestination = "destination/root";
const char *const KeyLayout = "destination/layout";
const char *const KeyExtensions = "media/videoExtensions";
const char *const KeyMonitorEnabled = "monitor/enabled";
const char *const KeyPollInterval = "monitor/pollIntervalMs";
}

ButlerSettings ButlerSettings::load()
{
    QSettings settings;
    return load(settings);
}

ButlerSettings ButlerSettings::load(const QSettings &settings)
{
    ButlerSettings values;
    values.sourceFolder = settings.value(KeySourceFolder, defaultSourceFolder()).toString();
    values.destination = settings.value(KeyDestination).toString();
    values.layout = DestinationResolver::layoutFromString(
        settings.value(KeyLayout, DestinationResolver::layoutToString(DestinationLayout::LabelFolder)).toString());

    values.videoExtensions = settings.value(KeyExtensions).toStringList();
    if (values.videoExtensions.isEmpty()) {
        values.videoExtensions = MediaMetadataExtractor::defaultVideoExtensions();
    }

    values.monitorEnabled = settings.value(KeyMonitorEnabled, false).toBool();

    const int interval = settings.value(KeyPollInterval, 2000).toInt();
    values.pollIntervalMs = interval > 0 ? interval : 2000;
    return values;
}

void ButlerSettings::save() const
{
    QSettings settings;
    save(settings);
}

void ButlerSettings::save(QSettings &settings) const
{
    settings.setValue(KeySourceFolder, sourceFolder);
    settings.setValue(KeyDestination, destination);
    settings.setValue(KeyLayout, DestinationResolver::layoutToString(layout));
    settings.setValue(KeyExtensions, videoExtensions);
    settings.setValue(KeyMonitorEnabled, monitorEnabled);
    settings.setValue(KeyPollInterval, pollIntervalMs);
}

QString ButlerSettings::defaultSourceFolder()
{
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty()) {
        return downloads;
    }
    return QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
}

QStringList ButlerSettings::parseExtensions(const QString &text)
{
    static const QRegularExpression separators(QStringLiteral("[\\s,;]+"));

    QStringList result;
    const QStringList parts = text.split(separators, Qt::SkipEmptyParts);
    for (QString part : parts) {
        part = part.toLower();
        while (part.startsWith('.')) {
            part.remove(0, 1);
        }
        if (!part.isEmpty() && !result.contains(part)) {
            result.append(part);
        }
    }
    return result;
}
