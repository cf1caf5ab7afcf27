/**
 * @file test_archiveextractor.cpp
 * @brief Unit tests for ArchiveWorker and ArchiveExtractor.
 *
 * Test archives are written with KZip into a temporary folder.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <KZip>

#include "services/archiveextractor.h"
#include "services/archiveworker.h"
#include "services/mediametadataextractor.h"

class TestArchiveExtractor : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *workDir;

    QString writeZip(const QString &name, const QMap<QString, QByteArray> &entries)
    {
        const QString path = workDir->filePath(name);
        KZip zip(path);
        if (!zip.open(QIODevice::WriteOnly)) {
            return QString();
        }
        for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
            if (!zip.writeFile(it.key(), it.value())) {
                return QString();
            }
        }
        return zip.close() ? path : QString();
    }

private slots:
    void init()
    {
        workDir = new QTemporaryDir();
        QVERIFY(workDir->isValid());
    }

    void cleanup()
    {
        delete workDir;
        workDir = nullptr;
    }

    void testIsArchive()
    {
        QVERIFY(ArchiveExtractor::isArchive("/downloads/show.zip"));
        QVERIFY(ArchiveExtractor::isArchive("SHOW.ZIP"));
        QVERIFY(!ArchiveExtractor::isArchive("movie.mkv"));
        QVERIFY(!ArchiveExtractor::isArchive("zip"));
    }

    void testWorkerExtractsOnlyMediaKeepingFolders()
    {
        const QString zipPath = writeZip("pack.zip", {
            {"Alien.1979.mkv", "alien"},
            {"Show/Season 1/Breaking.Bad.S01E01.mkv", "episode"},
            {"readme.txt", "not media"},
            {"Show/cover.jpg", "image"}
        });
        QVERIFY(!zipPath.isEmpty());

        QTemporaryDir target;
        ArchiveWorker worker;
        QStringList files;
        QString error;

        QVERIFY(worker.extractMedia(zipPath, target.path(),
                                    MediaMetadataExtractor::defaultVideoExtensions(),
                                    &files, &error));
        QVERIFY(error.isEmpty());

        const QString root = QDir::cleanPath(target.path());
        QCOMPARE(files, QStringList({root + "/Alien.1979.mkv",
                                     root + "/Show/Season 1/Breaking.Bad.S01E01.mkv"}));

        QFile episode(files.at(1));
        QVERIFY(episode.open(QIODevice::ReadOnly));
        QCOMPARE(episode.readAll(), QByteArray("episode"));
        QVERIFY(!QFile::exists(target.filePath("readme.txt")));
        QVERIFY(!QFile::exists(target.filePath("Show/cover.jpg")));
    }

    void testWorkerRejectsCorruptArchive()
    {
        const QString path = workDir->filePath("broken.zip");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("this is not a zip archive");
        file.close();

        QTemporaryDir target;
        ArchiveWorker worker;
        QStringList files;
        QString error;

        QVERIFY(!worker.extractMedia(path, target.path(), {"mkv"}, &files, &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(files.isEmpty());
    }

    void testExtractorDeliversFilesAndReleasesFolder()
    {
        const QString zipPath = writeZip("movies.zip", {{"Heat.1995.mp4", "heat"}});

        ArchiveExtractor extractor;
        QSignalSpy extractedSpy(&extractor, &ArchiveExtractor::extracted);

        QVERIFY(extractor.extract(zipPath, {"mp4"}));
        QVERIFY(extractor.isExtracting(zipPath));
        QVERIFY(extractor.extractedFolders().isEmpty());

        QVERIFY(extractedSpy.wait(5000));
        QCOMPARE(extractedSpy.first().at(0).toString(), zipPath);
        const QString folder = extractedSpy.first().at(1).toString();
        const QStringList files = extractedSpy.first().at(2).toStringList();

        QCOMPARE(files.size(), 1);
        QVERIFY(QFile::exists(files.first()));
        QVERIFY(!extractor.isExtracting(zipPath));
        QCOMPARE(extractor.extractedFolders(), QStringList({folder}));

        extractor.release(folder);
        QVERIFY(!QDir(folder).exists());
        QVERIFY(extractor.extractedFolders().isEmpty());
    }

    void testSameArchiveIsNotExtractedTwiceAtOnce()
    {
        const QString zipPath = writeZip("once.zip", {{"a.mkv", "a"}});

        ArchiveExtractor extractor;
        QSignalSpy extractedSpy(&extractor, &ArchiveExtractor::extracted);

        QVERIFY(extractor.extract(zipPath, {"mkv"}));
        QVERIFY(!extractor.extract(zipPath, {"mkv"}));
        QCOMPARE(extractor.extractingCount(), 1);

        QVERIFY(extractedSpy.wait(5000));
        QCOMPARE(extractedSpy.count(), 1);
    }

    void testFailureRemovesFolder()
    {
        const QString path = workDir->filePath("bad.zip");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("garbage");
        file.close();

        ArchiveExtractor extractor;
        QSignalSpy failedSpy(&extractor, &ArchiveExtractor::extractionFailed);

        QVERIFY(extractor.extract(path, {"mkv"}));
        QVERIFY(failedSpy.wait(5000));
        QCOMPARE(failedSpy.first().at(0).toString(), path);
        QCOMPARE(extractor.extractingCount(), 0);
        QVERIFY(extractor.extractedFolders().isEmpty());
    }
};

QTEST_MAIN(TestArchiveExtractor)
#include "test_archiveextractor.moc"
