/**
 * @file mediametadataextractor.h
 * @brief Derives human-readable labels from media file names.
 *
 * Parses scene-style release names ("Movie.Title.2020.1080p.BluRay.x264.mkv",
 * "Show.Name.S01E02.720p.HDTV.mkv") into title, year and episode numbers.
 */

#ifndef MEDIAMETADATAEXTRACTOR_H
#define MEDIAMETADATAEXTRACTOR_H

#include <QString>
#include <QStringList>

/**
 * @brief Parser for media file names.
 *
 * Parsing is best effort. When no usable title can be found the
 * result is marked invalid and displayLabel() falls back to the
 * original file name, so a file is never held back by its name.
 */
class MediaMetadataExtractor
{
public:
    /**
     * @brief Parsed media information.
     */
    struct MediaInfo {
        enum class Kind {
            Unknown,    ///< Nothing recognised
            Movie,      ///< Feature, optionally with a release year
            Episode     ///< Episode of a series (season/episode known)
        };

        bool valid = false;             ///< True if a title was found
        Kind kind = Kind::Unknown;
        QString title;                  ///< Movie title or series name
        int year = 0;                   ///< Release year, 0 if unknown
        int season = 0;                 ///< Season number (episodes only)
        int episode = 0;                ///< Episode number (episodes only)
        QStringList languages;          ///< ISO 639-1 codes found in the name
    };

    /**
     * @brief Returns the video extensions recognised by default.
     * @return Lower-case extensions without the leading dot.
     */
    [[nodiscard]] static QStringList defaultVideoExtensions();

    /**
     * @brief Checks if a path has one of the given extensions.
     * @param path File path to check.
     * @param extensions Lower-case extensions without dots.
     */
    [[nodiscard]] static bool isVideoFile(const QString &path, const QStringList &extensions);

    /**
     * @brief Checks if a path has a default video extension.
     */
    [[nodiscard]] static bool isVideoFile(const QString &path);

    /**
     * @brief Parses a file name.
     * @param fileName File name, with or without directory and extension.
     * @return Parsed information; check MediaInfo::valid.
     */
    [[nodiscard]] static MediaInfo parse(const QString &fileName);

    /**
     * @brief Formats a label for display and folder naming.
     * @param info Parsed information.
     * @param fileName Returned unmodified when @p info is not valid.
     * @return "Series - S01E02", "Title (2020)" or "Title".
     */
    [[nodiscard]] static QString displayLabel(const MediaInfo &info, const QString &fileName);

    /**
     * @brief Shorthand for displayLabel(parse(fileName), fileName).
     */
    [[nodiscard]] static QString labelFor(const QString &fileName);

private:
    [[nodiscard]] static QString stripExtension(const QString &fileName);
    [[nodiscard]] static QString normalizeSeparators(const QString &name);
    [[nodiscard]] static int titleBoundary(const QStringList &tokens);
    [[nodiscard]] static bool isNoiseToken(const QString &token);
    [[nodiscard]] static bool isYearToken(const QString &token);
    [[nodiscard]] static QString finishTitle(const QString &title);
    [[nodiscard]] static QStringList findLanguages(const QString &text);
};

#endif // MEDIAMETADATAEXTRACTOR_H
