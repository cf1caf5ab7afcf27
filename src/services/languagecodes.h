/**
 * @file languagecodes.h
 * @brief Normalisation of release-name language tags to ISO 639-1 codes.
 */

#ifndef LANGUAGECODES_H
#define LANGUAGECODES_H

#include <QString>

/**
 * @brief Maps language tags found in media file names to ISO 639-1 codes.
 *
 * Release names carry languages in many spellings: ISO 639-2 codes
 * ("ENG", "ger", "fre"), English names ("French") and scene aliases
 * ("VOSTFR", "TRUEFRENCH"). All of them are reduced to the two-letter
 * ISO 639-1 code so they can be compared and displayed consistently.
 *
 * Three-letter codes are looked up through QLocale. Only languages that
 * have a two-letter code are accepted, which keeps rare ISO 639-2 codes
 * that collide with ordinary words ("new", "war") from being reported.
 */
class LanguageCodes
{
public:
    /**
     * @brief Normalises a single token.
     * @param token A word from a file name, any case.
     * @return The ISO 639-1 code ("en", "fr", ...) or an empty string
     *         if the token is not a recognised language tag.
     */
    [[nodiscard]] static QString normalize(const QString &token);

    /**
     * @brief Checks whether a token is a recognised language tag.
     */
    [[nodiscard]] static bool isLanguageTag(const QString &token) { return !normalize(token).isEmpty(); }

    /**
     * @brief Checks whether a token is a language tag as release groups write them.
     *
     * Narrower than isLanguageTag(): besides the named aliases only the
     * three-letter codes commonly used in release names are accepted, so
     * capitalised title words such as "CAT", "SUN" or "HER" are not.
     */
    [[nodiscard]] static bool isReleaseTag(const QString &token);

    /**
     * @brief Returns the English name of a language.
     * @param code ISO 639-1 code.
     * @return Language name, or an empty string for unknown codes.
     */
    [[nodiscard]] static QString displayName(const QString &code);

private:
    LanguageCodes() = default;

    [[nodiscard]] static QString lookupAlias(const QString &lowerToken);
    [[nodiscard]] static QString lookupIsoCode(const QString &lowerToken);
    [[nodiscard]] static QString lookupReleaseCode(const QString &lowerToken);
};

#endif // LANGUAGECODES_H
