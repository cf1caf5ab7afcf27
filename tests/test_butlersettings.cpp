/**
 * @file test_butlersettings.cpp
 * @brief Unit tests for ButlerSettings.
 */

#include <QtTest/QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "services/butlersettings.h"
#include "services/mediametadataextractor.h"

class TestButlerSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *dir_ = nullptr;

    QString settingsPath() const { return dir_->filePath("settings.ini"); }

private slots:
    void init()
    {
        dir_ = new QTemporaryDir();
        QVERIFY(dir_->isValid());
    }

    void cleanup()
    {
        delete dir_;
        dir_ = nullptr;
    }

    void testDefaults()
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        const ButlerSettings values = ButlerSettings::load(settings);

        QCOMPARE(values.sourceFolder, ButlerSettings::defaultSourceFolder());
        QVERIFY(values.destination.isEmpty());
        QCOMPARE(values.layout, DestinationLayout::LabelFolder);
        QCOMPARE(values.videoExtensions, MediaMetadataExtractor::defaultVideoExtensions());
        QVERIFY(!values.monitorEnabled);
        QCOMPARE(values.pollIntervalMs, 2000);
    }

    void testSaveAndLoad()
    {
        ButlerSettings values;
        values.sourceFolder = "/home/user/Videos";
        values.destination = "/media/user/USBSTICK";
        values.layout = DestinationLayout::Library;
        values.videoExtensions = {"mkv", "webm"};
        values.monitorEnabled = true;
        values.pollIntervalMs = 5000;

        {
            QSettings settings(settingsPath(), QSettings::IniFormat);
            values.save(settings);
        }

        QSettings settings(settingsPath(), QSettings::IniFormat);
        const ButlerSettings loaded = ButlerSettings::load(settings);

        QCOMPARE(loaded.sourceFolder, values.sourceFolder);
        QCOMPARE(loaded.destination, values.destination);
        QCOMPARE(loaded.layout, DestinationLayout::Library);
        QCOMPARE(loaded.videoExtensions, values.videoExtensions);
        QVERIFY(loaded.monitorEnabled);
        QCOMPARE(loaded.pollIntervalMs, 5000);
    }

    void testInvalidIntervalFallsBack()
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        settings.setValue("monitor/pollIntervalMs", -5);

        QCOMPARE(ButlerSettings::load(settings).pollIntervalMs, 2000);
    }

    void testParseExtensions()
    {
        QCOMPARE(ButlerSettings::parseExtensions("mp4, .MKV avi;mp4"),
                 QStringList({"mp4", "mkv", "avi"}));
        QVERIFY(ButlerSettings::parseExtensions("  , ; ").isEmpty());
        QCOMPARE(ButlerSettings::parseExtensions("..webm"), QStringList({"webm"}));
    }
};

QTEST_MAIN(TestButlerSettings)
#include "test_butlersettings.moc"
