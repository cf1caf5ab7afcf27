/**
 * @file test_mediametadataextractor.cpp
 * @brief Unit tests for MediaMetadataExtractor.
 */

#include <QtTest/QtTest>

#include "services/mediametadataextractor.h"

using MediaInfo = MediaMetadataExtractor::MediaInfo;

class TestMediaMetadataExtractor : public QObject
{
    Q_OBJECT

private slots:
    // Movies
    void testSceneMovieName();
    void testMovieWithoutYear();
    void testNumericTitleKeepsLeadingNumber();
    void testYearOnlyTitle();
    void testLowercaseTitleIsCapitalised();

    // Episodes
    void testSceneEpisodeName();
    void testLowercaseEpisodeMarker();
    void testSeasonEpisodeWords();
    void testCrossFormatMarker();
    void testSeriesYearBeforeMarker();

    // Languages
    void testUppercaseLanguageEndsTitle();
    void testLanguageWordInTitleIsKept();
    void testMultipleLanguages();
    void testAllCapsTitleKeepsWordsThatAreLanguageCodes();
    void testAllCapsTitleStopsAtReleaseLanguage();

    // Fallback
    void testUnparsableNameFallsBack();
    void testPathAndExtensionIgnored();

    // Extensions
    void testIsVideoFile();
};

void TestMediaMetadataExtractor::testSceneMovieName()
{
    const MediaInfo info = MediaMetadataExtractor::parse("The.Matrix.1999.1080p.BluRay.x264.mkv");

    QVERIFY(info.valid);
    QCOMPARE(info.kind, MediaInfo::Kind::Movie);
    QCOMPARE(info.title, QString("The Matrix"));
    QCOMPARE(info.year, 1999);
    QCOMPARE(MediaMetadataExtractor::displayLabel(info, "x"), QString("The Matrix (1999)"));
}

void TestMediaMetadataExtractor::testMovieWithoutYear()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("Big.Buck.Bunny.720p.mp4"), QString("Big Buck Bunny"));
}

void TestMediaMetadataExtractor::testNumericTitleKeepsLeadingNumber()
{
    const MediaInfo info = MediaMetadataExtractor::parse("2001.A.Space.Odyssey.1968.720p.mkv");

    QCOMPARE(info.title, QString("2001 A Space Odyssey"));
    QCOMPARE(info.year, 1968);
}

void TestMediaMetadataExtractor::testYearOnlyTitle()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("1917.2019.mkv"), QString("1917 (2019)"));
}

void TestMediaMetadataExtractor::testLowercaseTitleIsCapitalised()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("the.big.lebowski.1998.mkv"),
             QString("The Big Lebowski (1998)"));
}

void TestMediaMetadataExtractor::testSceneEpisodeName()
{
    const MediaInfo info = MediaMetadataExtractor::parse("Breaking.Bad.S02E05.720p.HDTV.x264.mkv");

    QVERIFY(info.valid);
    QCOMPARE(info.kind, MediaInfo::Kind::Episode);
    QCOMPARE(info.title, QString("Breaking Bad"));
    QCOMPARE(info.season, 2);
    QCOMPARE(info.episode, 5);
    QCOMPARE(MediaMetadataExtractor::displayLabel(info, "x"), QString("Breaking Bad - S02E05"));
}

void TestMediaMetadataExtractor::testLowercaseEpisodeMarker()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("the.office.us.s03e10.mkv"),
             QString("The Office Us - S03E10"));
}

void TestMediaMetadataExtractor::testSeasonEpisodeWords()
{
    const MediaInfo info = MediaMetadataExtractor::parse("Lost Season 1 Episode 4.avi");

    QCOMPARE(info.kind, MediaInfo::Kind::Episode);
    QCOMPARE(info.title, QString("Lost"));
    QCOMPARE(info.season, 1);
    QCOMPARE(info.episode, 4);
}

void TestMediaMetadataExtractor::testCrossFormatMarker()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("Show Name 1x02.avi"), QString("Show Name - S01E02"));
}

void TestMediaMetadataExtractor::testSeriesYearBeforeMarker()
{
    const MediaInfo info = MediaMetadataExtractor::parse("Doctor.Who.2005.S01E01.mkv");

    QCOMPARE(info.title, QString("Doctor Who"));
    QCOMPARE(info.year, 2005);
    QCOMPARE(info.season, 1);
    QCOMPARE(info.episode, 1);
}

void TestMediaMetadataExtractor::testUppercaseLanguageEndsTitle()
{
    const MediaInfo info = MediaMetadataExtractor::parse("Amelie.2001.FRENCH.1080p.mkv");

    QCOMPARE(info.title, QString("Amelie"));
    QCOMPARE(info.year, 2001);
    QCOMPARE(info.languages, QStringList({"fr"}));
}

void TestMediaMetadataExtractor::testLanguageWordInTitleIsKept()
{
    const MediaInfo info = MediaMetadataExtractor::parse("The.English.Patient.1996.mkv");

    QCOMPARE(info.title, QString("The English Patient"));
    QCOMPARE(info.year, 1996);
    QVERIFY(info.languages.isEmpty());
}

void TestMediaMetadataExtractor::testMultipleLanguages()
{
    const MediaInfo info = MediaMetadataExtractor::parse("Movie.Title.2020.MULTI.ENG.GER.2160p.mkv");

    QCOMPARE(info.title, QString("Movie Title"));
    QCOMPARE(info.languages, QStringList({"en", "de"}));
}

void TestMediaMetadataExtractor::testAllCapsTitleKeepsWordsThatAreLanguageCodes()
{
    const MediaInfo info = MediaMetadataExtractor::parse("THE.CAT.IN.THE.HAT.2003.1080p.mkv");

    QCOMPARE(info.kind, MediaInfo::Kind::Movie);
    QCOMPARE(info.title, QString("THE CAT IN THE HAT"));
    QCOMPARE(info.year, 2003);
    QVERIFY(info.languages.isEmpty());
    QCOMPARE(MediaMetadataExtractor::labelFor("THE.CAT.IN.THE.HAT.2003.1080p.mkv"),
             QString("THE CAT IN THE HAT (2003)"));
}

void TestMediaMetadataExtractor::testAllCapsTitleStopsAtReleaseLanguage()
{
    const MediaInfo info = MediaMetadataExtractor::parse("THE.SUN.ALSO.RISES.1957.ENG.720p.mkv");

    QCOMPARE(info.title, QString("THE SUN ALSO RISES"));
    QCOMPARE(info.year, 1957);
    QCOMPARE(info.languages, QStringList({"en"}));
}

void TestMediaMetadataExtractor::testUnparsableNameFallsBack()
{
    const MediaInfo info = MediaMetadataExtractor::parse("[Group].mkv");

    QVERIFY(!info.valid);
    QCOMPARE(info.kind, MediaInfo::Kind::Unknown);
    QVERIFY(info.title.isEmpty());
    QCOMPARE(MediaMetadataExtractor::displayLabel(info, "[Group].mkv"), QString("[Group].mkv"));
    QCOMPARE(MediaMetadataExtractor::labelFor("___.mp4"), QString("___.mp4"));
}

void TestMediaMetadataExtractor::testPathAndExtensionIgnored()
{
    QCOMPARE(MediaMetadataExtractor::labelFor("/home/user/Downloads/Alien.1979.mkv"),
             QString("Alien (1979)"));
    QCOMPARE(MediaMetadataExtractor::labelFor("Mr. Robot"), QString("Mr Robot"));
}

void TestMediaMetadataExtractor::testIsVideoFile()
{
    QVERIFY(MediaMetadataExtractor::isVideoFile("movie.MKV"));
    QVERIFY(MediaMetadataExtractor::isVideoFile("/a/b/clip.mp4"));
    QVERIFY(!MediaMetadataExtractor::isVideoFile("movie.srt"));
    QVERIFY(!MediaMetadataExtractor::isVideoFile("mkv"));
    QVERIFY(MediaMetadataExtractor::isVideoFile("clip.webm", {"webm"}));
    QVERIFY(!MediaMetadataExtractor::isVideoFile("clip.mkv", {"webm"}));
}

QTEST_MAIN(TestMediaMetadataExtractor)
#include "test_mediametadataextractor.moc"
