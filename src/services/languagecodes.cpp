#include "languagecodes.h"

#include <QHash>
#include <QLocale>
#include <QSet>

QString LanguageCodes::normalize(const QString &token)
{
    const QString lower = token.trimmed().toLower();
    if (lower.size() < 2) {
        return QString();
    }

    QString code = lookupAlias(lower);
    if (!code.isEmpty()) {
        return code;
    }

    if (lower.size() == 3) {
        return lookupIsoCode(lower);
    }

    return QString();
}

bool LanguageCodes::isReleaseTag(const QString &token)
{
    const QString lower = token.trimmed().toLower();
    return !lookupAlias(lower).isEmpty() || !lookupReleaseCode(lower).isEmpty();
}

QString LanguageCodes::displayName(const QString &code)
{
    if (code.size() != 2) {
        return QString();
    }

    QLocale::Language language = QLocale::codeToLanguage(code.toLower(), QLocale::ISO639Part1);
    if (language == QLocale::AnyLanguage) {
        return QString();
    }
    return QLocale::languageToString(language);
}

QString LanguageCodes::lookupAlias(const QString &lowerToken)
{
    // English names and scene tags that QLocale cannot resolve
    static const QHash<QString, QString> aliases = {
        {"english", "en"},
        {"french", "fr"},
        {"truefrench", "fr"},
        {"vostfr", "fr"},
        {"vff", "fr"},
        {"vfq", "fr"},
        {"vf", "fr"},
        {"german", "de"},
        {"deutsch", "de"},
        {"spanish", "es"},
        {"castellano", "es"},
        {"latino", "es"},
        {"italian", "it"},
        {"portuguese", "pt"},
        {"russian", "ru"},
        {"japanese", "ja"},
        {"korean", "ko"},
        {"chinese", "zh"},
        {"mandarin", "zh"},
        {"cantonese", "zh"},
        {"hindi", "hi"},
        {"dutch", "nl"},
        {"flemish", "nl"},
        {"swedish", "sv"},
        {"danish", "da"},
        {"norwegian", "no"},
        {"finnish", "fi"},
        {"polish", "pl"},
        {"turkish", "tr"},
        {"arabic", "ar"},
        {"greek", "el"},
        {"hebrew", "he"},
        {"czech", "cs"},
        {"hungarian", "hu"},
        {"romanian", "ro"},
        {"ukrainian", "uk"},
        {"thai", "th"},
        {"vietnamese", "vi"}
    };

    return aliases.value(lowerToken);
}

QString LanguageCodes::lookupIsoCode(const QString &lowerToken)
{
    QLocale::Language language = QLocale::codeToLanguage(lowerToken, QLocale::ISO639Part2);
    if (language == QLocale::AnyLanguage || language == QLocale::C) {
        return QString();
    }

    // Languages without a two-letter code are too obscure to be release tags
    return QLocale::languageToCode(language, QLocale::ISO639Part1);
}

QString LanguageCodes::lookupReleaseCode(const QString &lowerToken)
{
    // Both ISO 639-2 variants (bibliographic and terminology) where they differ
    static const QSet<QString> releaseCodes = {
        "eng", "fre", "fra", "ger", "deu", "ita", "spa", "por",
        "rus", "jpn", "kor", "chi", "zho", "hin", "dut", "nld", "swe",
        "dan", "nor", "fin", "pol", "tur", "ara", "gre", "ell", "heb",
        "cze", "ces", "hun", "rum", "ron", "ukr", "tha", "vie"
    };

    if (!releaseCodes.contains(lowerToken)) {
        return QString();
    }
    return lookupIsoCode(lowerToken);
}
