/**
 * @file test_languagecodes.cpp
 * @brief Unit tests for LanguageCodes.
 */

#include <QtTest/QtTest>

#include "services/languagecodes.h"

class TestLanguageCodes : public QObject
{
    Q_OBJECT

private slots:
    void testThreeLetterCodes()
    {
        QCOMPARE(LanguageCodes::normalize("ENG"), QString("en"));
        QCOMPARE(LanguageCodes::normalize("fre"), QString("fr"));
        QCOMPARE(LanguageCodes::normalize("fra"), QString("fr"));
        QCOMPARE(LanguageCodes::normalize("ger"), QString("de"));
        QCOMPARE(LanguageCodes::normalize("Ita"), QString("it"));
        QCOMPARE(LanguageCodes::normalize("spa"), QString("es"));
    }

    void testNamesAndAliases()
    {
        QCOMPARE(LanguageCodes::normalize("FRENCH"), QString("fr"));
        QCOMPARE(LanguageCodes::normalize("TrueFrench"), QString("fr"));
        QCOMPARE(LanguageCodes::normalize("VOSTFR"), QString("fr"));
        QCOMPARE(LanguageCodes::normalize("German"), QString("de"));
        QCOMPARE(LanguageCodes::normalize("latino"), QString("es"));
        QCOMPARE(LanguageCodes::normalize(" english "), QString("en"));
    }

    void testCodesWithoutTwoLetterFormAreRejected()
    {
        // Waray and Newari have no ISO 639-1 code
        QVERIFY(LanguageCodes::normalize("war").isEmpty());
        QVERIFY(LanguageCodes::normalize("new").isEmpty());
    }

    void testNonLanguageTokens()
    {
        QVERIFY(LanguageCodes::normalize("").isEmpty());
        QVERIFY(LanguageCodes::normalize("x").isEmpty());
        QVERIFY(LanguageCodes::normalize("it").isEmpty());
        QVERIFY(LanguageCodes::normalize("1080p").isEmpty());
        QVERIFY(LanguageCodes::normalize("x264").isEmpty());
        QVERIFY(!LanguageCodes::isLanguageTag("Matrix"));
        QVERIFY(LanguageCodes::isLanguageTag("ENG"));
    }

    void testReleaseTagsExcludeEnglishWords()
    {
        QVERIFY(LanguageCodes::isReleaseTag("ENG"));
        QVERIFY(LanguageCodes::isReleaseTag("GER"));
        QVERIFY(LanguageCodes::isReleaseTag("jpn"));
        QVERIFY(LanguageCodes::isReleaseTag("TRUEFRENCH"));

        // Valid ISO 639-2 codes, but ordinary words in an all-caps title
        QVERIFY(LanguageCodes::isLanguageTag("CAT"));
        QVERIFY(!LanguageCodes::isReleaseTag("CAT"));
        QVERIFY(!LanguageCodes::isReleaseTag("HAT"));
        QVERIFY(!LanguageCodes::isReleaseTag("SUN"));
        QVERIFY(!LanguageCodes::isReleaseTag("HER"));
        QVERIFY(!LanguageCodes::isReleaseTag("Matrix"));
    }

    void testDisplayName()
    {
        QCOMPARE(LanguageCodes::displayName("fr"), QString("French"));
        QCOMPARE(LanguageCodes::displayName("DE"), QString("German"));
        QVERIFY(LanguageCodes::displayName("eng").isEmpty());
        QVERIFY(LanguageCodes::displayName("").isEmpty());
    }
};

QTEST_MAIN(TestLanguageCodes)
#include "test_languagecodes.moc"
