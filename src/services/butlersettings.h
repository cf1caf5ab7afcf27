/**
 * @file butlersettings.h
 * @brief Typed access to the persisted application settings.
 */

#ifndef BUTLERSETTINGS_H
#define BUTLERSETTINGS_H

#include <QString>
#include <QStringList>

#include "destinationresolver.h"

class QSettings;

/**
 * @brief Values stored in QSettings, with their defaults.
 *
 * Uses the organisation and application names set in main(), so
 * tests can redirect it by changing those before calling load().
 */
struct ButlerSettings {
    QString sourceFolder;
    QString destination;
    DestinationLayout layout = DestinationLayout::LabelFolder;
    QStringList videoExtensions;
    bool monitorEnabled = false;
    int pollIntervalMs = 2000;

    /**
     * @brief Reads all values, falling back to defaults for missing keys.
     */
    [[nodiscard]] static ButlerSettings load();

    /**
     * @brief Reads all values from an explicit settings object.
     */
    [[nodiscard]] static ButlerSettings load(const QSettings &settings);

    void save() const;
    void save(QSettings &settings) const;

    [[nodiscard]] static QString defaultSourceFolder();

    /**
     * @brief Splits "mp4, .MKV avi" style input into clean suffixes.
     */
    [[nodiscard]] static QStringList parseExtensions(const QString &text);
};

#endif // BUTLERSETTINGS_H
