#include "mediametadataextractor.h"
#include "languagecodes.h"
#include "utils/logging.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace {

// Markers are tried in order, the first hit wins
const QList<QRegularExpression> &episodePatterns()
{
    static const QList<QRegularExpression> patterns = {
        // "S01E02", "s1e2", "S01 E02", "S01E02E03" (first episode only)
        QRegularExpression("\\bS(\\d{1,2})\\s?E(\\d{1,3})(?!\\d)",
                           QRegularExpression::CaseInsensitiveOption),
        // "Season 1 Episode 2"
        QRegularExpression("\\bSeason\\s*(\\d{1,2})\\s*Episode\\s*(\\d{1,3})(?!\\d)",
                           QRegularExpression::CaseInsensitiveOption),
        // "1x02"
        QRegularExpression("\\b(\\d{1,2})x(\\d{2,3})(?!\\d)",
                           QRegularExpression::CaseInsensitiveOption)
    };
    return patterns;
}

} // namespace

QStringList MediaMetadataExtractor::defaultVideoExtensions()
{
    return {"mp4", "mkv", "avi", "mov", "wmv", "flv", "ts", "mpeg"};
}

bool MediaMetadataExtractor::isVideoFile(const QString &path, const QStringList &extensions)
{
    return extensions.contains(QFileInfo(path).suffix().toLower());
}

bool MediaMetadataExtractor::isVideoFile(const QString &path)
{
    return isVideoFile(path, defaultVideoExtensions());
}

MediaMetadataExtractor::MediaInfo MediaMetadataExtractor::parse(const QString &fileName)
{
    MediaInfo info;

    const QString text = normalizeSeparators(stripExtension(fileName));
    if (text.isEmpty()) {
        return info;
    }

    QString titlePart;
    QString remainder;

    QRegularExpressionMatch episodeMatch;
    for (const auto &pattern : episodePatterns()) {
        episodeMatch = pattern.match(text);
        if (episodeMatch.hasMatch()) {
            break;
        }
    }

    if (episodeMatch.hasMatch()) {
        info.kind = MediaInfo::Kind::Episode;
        info.season = episodeMatch.captured(1).toInt();
        info.episode = episodeMatch.captured(2).toInt();
        remainder = text.mid(episodeMatch.capturedEnd());

        // A year before the marker belongs to the series ("Doctor Who 2005 S01E01")
        QStringList tokens = text.left(episodeMatch.capturedStart()).split(' ', Qt::SkipEmptyParts);
        if (tokens.size() > 1 && isYearToken(tokens.last())) {
            info.year = tokens.takeLast().toInt();
        }
        titlePart = tokens.join(' ');
    } else {
        info.kind = MediaInfo::Kind::Movie;
        const QStringList tokens = text.split(' ', Qt::SkipEmptyParts);
        const int boundary = titleBoundary(tokens);

        // The last year before the noise wins, so "2001 A Space Odyssey 1968"
        // keeps its leading number in the title
        int yearIndex = -1;
        for (int i = 1; i < boundary; ++i) {
            if (isYearToken(tokens.at(i))) {
                yearIndex = i;
            }
        }

        int titleEnd = boundary;
        if (yearIndex > 0) {
            info.year = tokens.at(yearIndex).toInt();
            titleEnd = yearIndex;
        }
        titlePart = tokens.mid(0, titleEnd).join(' ');
        remainder = tokens.mid(titleEnd).join(' ');
    }

    info.title = finishTitle(titlePart);
    info.languages = findLanguages(remainder);
    info.valid = info.title.contains(QRegularExpression("[\\p{L}\\p{N}]"));

    if (!info.valid) {
        LOG_VERBOSE() << "MediaMetadataExtractor: no title in" << fileName;
        info.kind = MediaInfo::Kind::Unknown;
        info.title.clear();
    }

    return info;
}

QString MediaMetadataExtractor::displayLabel(const MediaInfo &info, const QString &fileName)
{
    if (!info.valid) {
        return fileName;
    }

    switch (info.kind) {
    case MediaInfo::Kind::Episode:
        return QString("%1 - S%2E%3")
            .arg(info.title)
            .arg(info.season, 2, 10, QChar('0'))
            .arg(info.episode, 2, 10, QChar('0'));
    case MediaInfo::Kind::Movie:
        if (info.year > 0) {
            return QString("%1 (%2)").arg(info.title).arg(info.year);
        }
        return info.title;
    case MediaInfo::Kind::Unknown:
        break;
    }
    return fileName;
}

QString MediaMetadataExtractor::labelFor(const QString &fileName)
{
    return displayLabel(parse(fileName), fileName);
}

QString MediaMetadataExtractor::stripExtension(const QString &fileName)
{
    QFileInfo fileInfo(fileName);
    QString name = fileInfo.fileName();
    const QString suffix = fileInfo.suffix();

    // "Mr. Robot" has no extension, "movie.mkv" does
    static const QRegularExpression extensionRx("^[A-Za-z0-9]{1,5}$");
    if (!suffix.isEmpty() && extensionRx.match(suffix).hasMatch()) {
        name.chop(suffix.size() + 1);
    }
    return name;
}

QString MediaMetadataExtractor::normalizeSeparators(const QString &name)
{
    QString text = name;

    // Leading release group: "[Group] Title ..."
    static const QRegularExpression leadingGroupRx("^\\s*\\[[^\\]]*\\]\\s*");
    text.remove(leadingGroupRx);

    static const QRegularExpression separatorRx("[._\\[\\]\\(\\)\\{\\}]");
    text.replace(separatorRx, " ");

    return text.simplified();
}

int MediaMetadataExtractor::titleBoundary(const QStringList &tokens)
{
    for (int i = 1; i < tokens.size(); ++i) {
        const QString &token = tokens.at(i);
        if (isNoiseToken(token)) {
            return i;
        }
        // Scene names write languages in capitals ("Movie.FRENCH.1080p"),
        // lower-case words stay part of the title ("The English Patient").
        // All-caps names ("THE.CAT.IN.THE.HAT") only stop at release tags.
        if (token == token.toUpper() && LanguageCodes::isReleaseTag(token)) {
            return i;
        }
    }
    return tokens.size();
}

bool MediaMetadataExtractor::isNoiseToken(const QString &token)
{
    static const QRegularExpression noiseRx(
        "^(\\d{3,4}[pi]|4k|8k|uhd|hdr|hdr10|dv|"
        "bluray|blu-ray|bdrip|brrip|dvdrip|dvdscr|dvd|webrip|web-dl|webdl|web|"
        "hdtv|hdrip|camrip|cam|telesync|"
        "x264|x265|h264|h265|hevc|avc|xvid|divx|10bit|"
        "aac|ac3|eac3|dts|dts-hd|truehd|atmos|ddp5|dd5|ddp|"
        "remux|proper|repack|extended|unrated|internal|limited|multi|complete|subbed|dubbed)$",
        QRegularExpression::CaseInsensitiveOption);
    return noiseRx.match(token).hasMatch();
}

bool MediaMetadataExtractor::isYearToken(const QString &token)
{
    static const QRegularExpression yearRx("^(19|20)\\d{2}$");
    return yearRx.match(token).hasMatch();
}

QString MediaMetadataExtractor::finishTitle(const QString &title)
{
    static const QRegularExpression edgeRx("^[\\s\\-]+|[\\s\\-]+$");
    QString result = title;
    result.remove(edgeRx);
    result = result.simplified();

    // "the.matrix.1999" reads better as "The Matrix"
    if (result == result.toLower()) {
        bool startOfWord = true;
        for (QChar &ch : result) {
            if (startOfWord && ch.isLetter()) {
                ch = ch.toUpper();
            }
            startOfWord = ch.isSpace() || ch == '-';
        }
    }
    return result;
}

QStringList MediaMetadataExtractor::findLanguages(const QString &text)
{
    static const QRegularExpression splitRx("[\\s\\-+,]+");

    QStringList languages;
    const QStringList tokens = text.split(splitRx, Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        const QString code = LanguageCodes::normalize(token);
        if (!code.isEmpty() && !languages.contains(code)) {
            languages.append(code);
        }
    }
    return languages;
}
