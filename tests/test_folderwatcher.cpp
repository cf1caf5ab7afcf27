/**
 * @file test_folderwatcher.cpp
 * @brief Unit tests for FolderWatcher.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "services/folderwatcher.h"

class TestFolderWatcher : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *dir_ = nullptr;
    FolderWatcher *watcher_ = nullptr;

    void createFile(const QString &relativePath)
    {
        const QString path = dir_->filePath(relativePath);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write("x");
            file.close();
        }
    }

private slots:
    void init()
    {
        dir_ = new QTemporaryDir();
        QVERIFY(dir_->isValid());
        watcher_ = new FolderWatcher(this);
        watcher_->setFolder(dir_->path());
    }

    void cleanup()
    {
        delete watcher_;
        watcher_ = nullptr;
        delete dir_;
        dir_ = nullptr;
    }

    void testDisabledByDefault()
    {
        QVERIFY(!watcher_->isEnabled());
        QCOMPARE(watcher_->pollInterval(), FolderWatcher::DefaultPollIntervalMs);
    }

    void testFirstPollReportsExistingFiles()
    {
        createFile("b.mkv");
        createFile("a.mp4");
        createFile("notes.txt");

        QSignalSpy spy(watcher_, &FolderWatcher::mediaFileDiscovered);
        QCOMPARE(watcher_->poll(), 2);

        QCOMPARE(spy.count(), 2);
        QCOMPARE(QFileInfo(spy.at(0).at(0).toString()).fileName(), QString("a.mp4"));
        QCOMPARE(QFileInfo(spy.at(1).at(0).toString()).fileName(), QString("b.mkv"));
    }

    void testLaterPollsReportOnlyNewFiles()
    {
        createFile("a.mkv");
        QCOMPARE(watcher_->poll(), 1);
        QCOMPARE(watcher_->poll(), 0);

        createFile("Sub/Folder/c.avi");
        QSignalSpy spy(watcher_, &FolderWatcher::mediaFileDiscovered);
        QCOMPARE(watcher_->poll(), 1);
        QVERIFY(spy.first().at(0).toString().endsWith("Sub/Folder/c.avi"));
        QCOMPARE(watcher_->seenCount(), 2);
    }

    void testChangingFolderResets()
    {
        createFile("a.mkv");
        QCOMPARE(watcher_->poll(), 1);

        watcher_->setFolder(dir_->path() + "/");
        QCOMPARE(watcher_->seenCount(), 1);

        QTemporaryDir other;
        watcher_->setFolder(other.path());
        QCOMPARE(watcher_->seenCount(), 0);
    }

    void testMissingFolderIsIgnored()
    {
        watcher_->setFolder(dir_->filePath("missing"));
        QCOMPARE(watcher_->poll(), 0);
    }

    void testCustomExtensions()
    {
        createFile("a.webm");
        createFile("b.mkv");
        watcher_->setExtensions({"webm"});

        QCOMPARE(watcher_->poll(), 1);
    }

    void testEnablingPollsFromEventLoop()
    {
        createFile("a.mkv");
        watcher_->setPollInterval(60000);

        QSignalSpy enabledSpy(watcher_, &FolderWatcher::enabledChanged);
        QSignalSpy discoveredSpy(watcher_, &FolderWatcher::mediaFileDiscovered);

        watcher_->setEnabled(true);
        QCOMPARE(enabledSpy.count(), 1);
        QVERIFY(enabledSpy.first().at(0).toBool());

        QVERIFY(discoveredSpy.wait(2000));
        QCOMPARE(discoveredSpy.count(), 1);

        watcher_->setEnabled(false);
        QCOMPARE(enabledSpy.count(), 2);
        QVERIFY(!watcher_->isEnabled());
    }

    void testInvalidIntervalFallsBack()
    {
        watcher_->setPollInterval(0);
        QCOMPARE(watcher_->pollInterval(), FolderWatcher::DefaultPollIntervalMs);
        watcher_->setPollInterval(500);
        QCOMPARE(watcher_->pollInterval(), 500);
    }

    void testArchivesAreReported()
    {
        createFile("Downloads/pack.zip");
        createFile("Downloads/pack.rar");

        QSignalSpy spy(watcher_, &FolderWatcher::mediaFileDiscovered);
        QCOMPARE(watcher_->poll(), 1);
        QCOMPARE(QFileInfo(spy.first().at(0).toString()).fileName(), QString("pack.zip"));
    }

    void testRemovedFilesAreForgotten()
    {
        createFile("a.mkv");
        createFile("b.mkv");
        QCOMPARE(watcher_->poll(), 2);
        QCOMPARE(watcher_->seenCount(), 2);

        QVERIFY(QFile::remove(dir_->filePath("a.mkv")));
        QCOMPARE(watcher_->poll(), 0);
        QCOMPARE(watcher_->seenCount(), 1);

        // Same name dropped in again is a new arrival
        createFile("a.mkv");
        QSignalSpy spy(watcher_, &FolderWatcher::mediaFileDiscovered);
        QCOMPARE(watcher_->poll(), 1);
        QCOMPARE(QFileInfo(spy.first().at(0).toString()).fileName(), QString("a.mkv"));
        QCOMPARE(watcher_->seenCount(), 2);
    }
};

QTEST_MAIN(TestFolderWatcher)
#include "test_folderwatcher.moc"
