module;
#include <QDebug>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMap>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <algorithm>
#include <optional>

module baran.services.ytdlp_formats;

import baran.core.types;
import baran.utils.download_utils;

namespace baran::utils {

namespace {

std::optional<qint64> optionalInt(const QJsonValue& value)
{
    if (!value.isDouble()) return std::nullopt;
    const qint64 v = qint64(value.toDouble());
    if (v <= 0) return std::nullopt;
    return v;
}

std::optional<double> optionalDouble(const QJsonValue& value)
{
    if (!value.isDouble()) return std::nullopt;
    const double v = value.toDouble();
    if (v <= 0.0) return std::nullopt;
    return v;
}

QString stringOrNumber(const QJsonValue& value)
{
    if (value.isString()) return value.toString();
    if (value.isDouble() && value.toDouble() != 0.0) return QString::number(value.toDouble());
    return QString();
}

FormatInfo parseFormat(const QJsonObject& f)
{
    FormatInfo format;
    format.formatId = f.value(QStringLiteral("format_id")).toString();
    format.extension = f.value(QStringLiteral("ext")).toString();
    format.resolution = f.value(QStringLiteral("resolution")).toString();
    format.quality = stringOrNumber(f.value(QStringLiteral("quality")));
    format.filesize = optionalInt(f.value(QStringLiteral("filesize")));
    format.filesizeApprox = optionalInt(f.value(QStringLiteral("filesize_approx")));
    format.fps = optionalDouble(f.value(QStringLiteral("fps")));
    format.tbr = optionalDouble(f.value(QStringLiteral("tbr")));
    format.vcodec = f.value(QStringLiteral("vcodec")).toString();
    format.acodec = f.value(QStringLiteral("acodec")).toString();
    format.hasVideo = format.vcodec != QStringLiteral("none");
    format.hasAudio = format.acodec != QStringLiteral("none");
    format.protocol = f.value(QStringLiteral("protocol")).toString();
    return format;
}

bool isHls(const QString& protocol)
{
    return protocol.toLower().contains(QStringLiteral("m3u8"));
}

int audioScore(const FormatInfo& f)
{
    const QString ext = f.extension.toLower();
    if (ext == QStringLiteral("webm")) return 3;
    if (ext == QStringLiteral("m4a")) return 2;
    return 1;
}

int codecScore(const FormatInfo& f)
{
    const QString vcodec = f.vcodec.toLower();
    if (vcodec.contains(QStringLiteral("av01"))) return 3;
    if (vcodec.contains(QStringLiteral("vp9")) || vcodec.contains(QStringLiteral("vp09"))) return 2;
    if (vcodec.contains(QStringLiteral("avc")) || vcodec.contains(QStringLiteral("h264"))) return 1;
    return 0;
}

const QualityOption* findOption(const std::optional<VideoInfo>& info, const QString& key)
{
    if (!info || key.isEmpty()) return nullptr;
    for (const QualityOption& option : info->qualityOptions) {
        if (option.key == key) return &option;
    }
    return nullptr;
}

bool hasNonAscii(const QString& text)
{
    for (const QChar c : text) {
        if (c.unicode() > 0x7F) return true;
    }
    return false;
}

QString presetSelector(const QString& quality)
{
    static const QHash<QString, int> heights = {
        { QStringLiteral("2160p"), 2160 }, { QStringLiteral("4k"), 2160 },
        { QStringLiteral("1440p"), 1440 }, { QStringLiteral("1080p"), 1080 },
        { QStringLiteral("720p"), 720 }, { QStringLiteral("480p"), 480 },
        { QStringLiteral("360p"), 360 },
    };
    const QString key = quality.toLower();
    if (key == QStringLiteral("best"))
        return QStringLiteral("bestvideo[vcodec^=avc1]+bestaudio/bestvideo+bestaudio/best");
    if (key == QStringLiteral("audio") || key == QStringLiteral("bestaudio"))
        return QStringLiteral("bestaudio");
    if (heights.contains(key)) {
        const int h = heights.value(key);
        return QStringLiteral("bestvideo[vcodec^=avc1][height<=%1]+bestaudio/bestvideo[height<=%1]+bestaudio/best[height<=%1]/best").arg(h);
    }
    return quality;
}

// Exact ids first, then the best stream within the option's height, then anything.
QString videoSelector(const FormatInfo& video, const std::optional<FormatInfo>& audio)
{
    QString ids = video.formatId;
    if (audio) ids += QLatin1Char('+') + audio->formatId;
    else if (!video.hasAudio) ids += QStringLiteral("+bestaudio");

    if (const auto h = heightFromFormat(video)) {
        return QStringLiteral("%1/bestvideo[vcodec^=avc1][height<=%2]+bestaudio/bestvideo[height<=%2]+bestaudio/best[height<=%2]/best")
            .arg(ids).arg(*h);
    }
    return QStringLiteral("%1/bestvideo[vcodec^=avc1]+bestaudio/bestvideo+bestaudio/best").arg(ids);
}

} // namespace

std::optional<int> heightFromFormat(const FormatInfo& format)
{
    static const QRegularExpression pRx(QStringLiteral("(\\d+)p"));
    static const QRegularExpression xRx(QStringLiteral("x(\\d+)"));

    if (!format.resolution.isEmpty()) {
        if (auto m = pRx.match(format.resolution); m.hasMatch()) return m.captured(1).toInt();
        if (auto m = xRx.match(format.resolution); m.hasMatch()) return m.captured(1).toInt();
    }
    if (!format.quality.isEmpty()) {
        if (auto m = pRx.match(format.quality); m.hasMatch()) return m.captured(1).toInt();
    }
    return std::nullopt;
}

std::optional<qint64> estimateFormatSize(const FormatInfo& format, std::optional<double> duration)
{
    if (format.filesize) return format.filesize;
    if (format.filesizeApprox) return format.filesizeApprox;
    if (format.tbr && duration) return qRound64(*format.tbr * 1024.0 * *duration / 8.0);
    return std::nullopt;
}

QString qualityLabel(int height)
{
    if (height >= 2160) return QStringLiteral("4K (2160p)");
    if (height >= 1440) return QStringLiteral("2K (1440p)");
    if (height >= 1080) return QStringLiteral("Full HD (1080p)");
    if (height >= 720) return QStringLiteral("HD (720p)");
    if (height >= 480) return QStringLiteral("SD (480p)");
    if (height >= 360) return QStringLiteral("Low (360p)");
    return QStringLiteral("%1p").arg(height);
}

bool isExcludedProtocol(const QString& protocol, bool hlsOnly)
{
    static const QStringList unreliable = {
        QStringLiteral("f4m"), QStringLiteral("ism"), QStringLiteral("rtmp"),
        QStringLiteral("rtsp"), QStringLiteral("mms"),
    };
    const QString p = protocol.toLower();
    for (const QString& bad : unreliable) {
        if (p.contains(bad)) return true;
    }
    return isHls(p) && !hlsOnly;
}

QVector<QualityOption> buildQualityOptions(const QVector<FormatInfo>& all, std::optional<double> duration)
{
    bool hlsOnly = !all.isEmpty();
    for (const FormatInfo& f : all) {
        if (isExcludedProtocol(f.protocol, true)) continue;
        if (!isHls(f.protocol)) { hlsOnly = false; break; }
    }

    QVector<FormatInfo> videoFormats;
    QVector<FormatInfo> audioOnly;
    for (const FormatInfo& f : all) {
        if (isExcludedProtocol(f.protocol, hlsOnly)) continue;
        if (f.hasVideo) videoFormats.append(f);
        else if (f.hasAudio) audioOnly.append(f);
    }

    std::optional<FormatInfo> bestAudio;
    if (!audioOnly.isEmpty()) {
        std::stable_sort(audioOnly.begin(), audioOnly.end(), [](const FormatInfo& a, const FormatInfo& b) {
            const int sa = audioScore(a), sb = audioScore(b);
            if (sa != sb) return sa > sb;
            return a.tbr.value_or(0.0) > b.tbr.value_or(0.0);
        });
        bestAudio = audioOnly.first();
    }
    const qint64 audioSize = bestAudio ? estimateFormatSize(*bestAudio, duration).value_or(0) : 0;

    QMap<int, QVector<FormatInfo>> groups;
    for (const FormatInfo& f : std::as_const(videoFormats)) {
        const auto height = heightFromFormat(f);
        if (!height || *height <= 0) continue;
        groups[*height].append(f);
    }

    QVector<QualityOption> options;
    for (auto it = groups.constBegin(); it != groups.constEnd(); ++it) {
        QVector<FormatInfo> combined;
        QVector<FormatInfo> videoOnly;
        for (const FormatInfo& f : it.value()) (f.hasAudio ? combined : videoOnly).append(f);

        QVector<FormatInfo> candidates = combined.isEmpty() ? videoOnly : combined;
        std::stable_sort(candidates.begin(), candidates.end(), [](const FormatInfo& a, const FormatInfo& b) {
            const int sa = codecScore(a), sb = codecScore(b);
            if (sa != sb) return sa > sb;
            const double fa = a.fps.value_or(0.0), fb = b.fps.value_or(0.0);
            if (fa != fb) return fa > fb;
            return a.tbr.value_or(0.0) > b.tbr.value_or(0.0);
        });
        const FormatInfo& best = candidates.first();

        const qint64 videoSize = estimateFormatSize(best, duration).value_or(0);
        const qint64 total = best.hasAudio ? videoSize : videoSize + audioSize;

        QualityOption option;
        option.key = QStringLiteral("%1p").arg(it.key());
        option.label = qualityLabel(it.key());
        option.quality = option.key;
        option.resolution = best.resolution.isEmpty() ? option.key : best.resolution;
        if (total > 0) option.totalSize = total;
        option.videoFormat = best;
        if (!best.hasAudio) option.audioFormat = bestAudio;
        options.append(option);
    }

    std::stable_sort(options.begin(), options.end(), [](const QualityOption& a, const QualityOption& b) {
        return a.key.chopped(1).toInt() > b.key.chopped(1).toInt();
    });

    if (bestAudio) {
        QualityOption audio;
        audio.key = QStringLiteral("bestaudio");
        audio.label = QStringLiteral("Audio Only");
        audio.quality = QStringLiteral("audio");
        audio.resolution = QStringLiteral("audio");
        if (audioSize > 0) audio.totalSize = audioSize;
        audio.audioFormat = bestAudio;
        options.append(audio);
    }
    return options;
}

VideoInfo parseVideoInfo(const QJsonObject& root)
{
    VideoInfo info;
    info.id = root.value(QStringLiteral("id")).toString();
    info.title = root.value(QStringLiteral("title")).toString();
    info.description = root.value(QStringLiteral("description")).toString();
    info.duration = optionalDouble(root.value(QStringLiteral("duration")));
    info.uploader = root.value(QStringLiteral("uploader")).toString();
    info.uploaderUrl = root.value(QStringLiteral("uploader_url")).toString();
    info.thumbnail = root.value(QStringLiteral("thumbnail")).toString();
    info.webpageUrl = root.value(QStringLiteral("webpage_url")).toString();
    info.extractor = root.value(QStringLiteral("extractor")).toString();
    info.extractorKey = root.value(QStringLiteral("extractor_key")).toString();
    info.isLive = root.value(QStringLiteral("is_live")).toBool(false);
    info.isPlaylist = root.value(QStringLiteral("_type")).toString() == QStringLiteral("playlist");

    for (const QJsonValue& t : root.value(QStringLiteral("thumbnails")).toArray()) {
        const QJsonObject obj = t.toObject();
        ThumbnailInfo thumb;
        thumb.url = obj.value(QStringLiteral("url")).toString();
        thumb.width = obj.value(QStringLiteral("width")).toInt();
        thumb.height = obj.value(QStringLiteral("height")).toInt();
        if (!thumb.url.isEmpty()) info.thumbnails.append(thumb);
    }

    for (const QJsonValue& f : root.value(QStringLiteral("formats")).toArray())
        info.formats.append(parseFormat(f.toObject()));

    info.subtitleLanguages = root.value(QStringLiteral("subtitles")).toObject().keys();
    info.qualityOptions = buildQualityOptions(info.formats, info.duration);

    const QJsonArray entries = root.value(QStringLiteral("entries")).toArray();
    if (info.isPlaylist && root.contains(QStringLiteral("entries"))) {
        PlaylistInfo playlist;
        playlist.id = info.id;
        playlist.title = info.title;
        playlist.uploader = info.uploader;
        playlist.thumbnail = info.thumbnail;
        playlist.videoCount = entries.size();
        const int kept = qMin(int(entries.size()), kMaxPlaylistEntries);
        for (int i = 0; i < kept; ++i) {
            const QJsonObject e = entries.at(i).toObject();
            PlaylistEntry entry;
            entry.id = e.value(QStringLiteral("id")).toString();
            entry.title = e.value(QStringLiteral("title")).toString();
            entry.duration = optionalDouble(e.value(QStringLiteral("duration")));
            entry.thumbnail = e.value(QStringLiteral("thumbnail")).toString();
            entry.url = e.value(QStringLiteral("url")).toString();
            if (entry.url.isEmpty()) entry.url = e.value(QStringLiteral("webpage_url")).toString();
            entry.index = i + 1;
            playlist.videos.append(entry);
        }
        if (entries.size() > kept) qWarning() << "Playlist truncated to" << kept << "entries";
        info.playlist = playlist;
    }
    return info;
}

QString formatSelector(const DownloadOptions& options, const std::optional<VideoInfo>& info)
{
    if (options.audioOnly) return QStringLiteral("bestaudio");

    if (!options.quality.isEmpty()) {
        if (const QualityOption* option = findOption(info, options.quality)) {
            if (option->key == QStringLiteral("bestaudio")) return QStringLiteral("bestaudio");
            if (option->videoFormat) return videoSelector(*option->videoFormat, option->audioFormat);
        }
        return presetSelector(options.quality);
    }

    if (info && !info->qualityOptions.isEmpty()) {
        const QualityOption& first = info->qualityOptions.first();
        if (first.videoFormat) return videoSelector(*first.videoFormat, first.audioFormat);
    }
    return QStringLiteral("bestvideo[ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best");
}

QStringList buildDownloadArgs(const DownloadOptions& options, const QString& outputTemplate,
                              const std::optional<VideoInfo>& info, const QString& ffmpegPath)
{
    QStringList args = {
        QStringLiteral("--no-warnings"),
        QStringLiteral("--newline"),
        QStringLiteral("-o"), outputTemplate,
    };

    const QString selector = formatSelector(options, info);
    args << QStringLiteral("-f") << selector;

    if (options.audioOnly) {
        args << QStringLiteral("-x");
        if (!options.format.isEmpty()) args << QStringLiteral("--audio-format") << options.format;
        if (!ffmpegPath.isEmpty()) args << QStringLiteral("--ffmpeg-location") << ffmpegPath;
    } else if (selector.contains(QLatin1Char('+'))) {
        if (ffmpegPath.isEmpty()) {
            qWarning() << "ffmpeg not available, separate streams cannot be merged";
        } else {
            const QString container = options.format.isEmpty() ? QStringLiteral("mp4") : options.format;
            args << QStringLiteral("--ffmpeg-location") << ffmpegPath;
            args << QStringLiteral("--merge-output-format") << container;
            args << QStringLiteral("--no-keep-video");

            QString acodec;
            if (const QualityOption* option = findOption(info, options.quality); option && option->audioFormat)
                acodec = option->audioFormat->acodec.toLower();
            const bool needsAac = container == QStringLiteral("mp4")
                                  && (acodec.contains(QStringLiteral("opus")) || acodec.contains(QStringLiteral("vorbis")));
            args << QStringLiteral("--postprocessor-args")
                 << (needsAac ? QStringLiteral("ffmpeg:-c:v copy -c:a aac") : QStringLiteral("ffmpeg:-c copy"));
        }
    }

    if (options.downloadSubtitles) {
        args << QStringLiteral("--write-subs");
        args << QStringLiteral("--sub-langs")
             << (options.subtitleLanguages.isEmpty() ? QStringLiteral("all") : options.subtitleLanguages.join(QLatin1Char(',')));
        if (options.embedSubtitles) args << QStringLiteral("--embed-subs");
    }
    if (options.downloadThumbnail) {
        args << QStringLiteral("--write-thumbnail");
        if (options.embedThumbnail) args << QStringLiteral("--embed-thumbnail");
    }
    if (options.embedMetadata) args << QStringLiteral("--embed-metadata");
    if (!options.rateLimit.isEmpty()) args << QStringLiteral("-r") << options.rateLimit;
    if (!options.proxy.isEmpty()) args << QStringLiteral("--proxy") << options.proxy;
    if (!options.cookiesFile.isEmpty()) args << QStringLiteral("--cookies") << options.cookiesFile;
    if (options.verbose) args << QStringLiteral("--verbose");

    args << options.url;
    return args;
}

QStringList metadataArgs(const QString& url)
{
    return {
        url,
        QStringLiteral("--dump-single-json"),
        QStringLiteral("--no-warnings"),
        QStringLiteral("--no-check-certificates"),
        QStringLiteral("--flat-playlist"),
    };
}

QString qualityLabelForFilename(const std::optional<VideoInfo>& info, const QString& quality)
{
    const QualityOption* option = findOption(info, quality);
    if (!option) return QString();
    if (!option->quality.isEmpty()) return option->quality;
    if (option->key != QStringLiteral("bestaudio")) return option->key;
    return QString();
}

QString filenameTemplate(const DownloadOptions& options, const std::optional<VideoInfo>& info, const QString& qualitySuffix)
{
    if (!options.filename.isEmpty() && !options.filename.contains(QLatin1Char('%'))) {
        if (!qualitySuffix.isEmpty()) {
            const QString ext = QFileInfo(options.filename).suffix();
            const QString base = ext.isEmpty() ? options.filename : options.filename.chopped(ext.size() + 1);
            const QString named = ext.isEmpty() ? QStringLiteral("%1.%2").arg(base, qualitySuffix)
                                                : QStringLiteral("%1.%2.%3").arg(base, qualitySuffix, ext);
            return sanitizeFilename(named, 200);
        }
        return sanitizeFilename(options.filename, 200);
    }

    if (!options.filename.isEmpty()) {
        if (qualitySuffix.isEmpty()) return options.filename;
        QString templ = options.filename;
        static const QRegularExpression extRx(QStringLiteral("\\.%\\(ext\\)s$"));
        return templ.replace(extRx, QStringLiteral(".%1.%(ext)s").arg(qualitySuffix));
    }

    QString title = QStringLiteral("%(title).100s");
    if (info && hasNonAscii(info->title)) {
        title = sanitizeFilename(info->title, 100);
        static const QRegularExpression trailingExt(QStringLiteral("\\.[^/.]+$"));
        title.remove(trailingExt);
    }
    return qualitySuffix.isEmpty() ? QStringLiteral("%1.%(ext)s").arg(title)
                                   : QStringLiteral("%1.%2.%(ext)s").arg(title, qualitySuffix);
}

std::optional<qint64> initialTotalBytes(const std::optional<VideoInfo>& info, const QString& quality)
{
    if (!info) return std::nullopt;

    if (const QualityOption* option = findOption(info, quality); option && option->totalSize)
        return option->totalSize;

    if (!info->qualityOptions.isEmpty()) {
        const QualityOption* chosen = &info->qualityOptions.first();
        for (const QualityOption& option : info->qualityOptions) {
            if (option.totalSize && option.key != QStringLiteral("bestaudio")) {
                chosen = &option;
                break;
            }
        }
        if (chosen->totalSize) return chosen->totalSize;
    }

    qint64 maxVideo = 0;
    qint64 maxAudio = 0;
    for (const FormatInfo& f : info->formats) {
        const qint64 size = f.filesize.value_or(f.filesizeApprox.value_or(0));
        if (f.hasVideo) maxVideo = qMax(maxVideo, size);
        else if (f.hasAudio) maxAudio = qMax(maxAudio, size);
    }
    if (maxVideo > 0 && maxAudio > 0) return maxVideo + maxAudio;
    if (maxVideo > 0) return maxVideo;

    for (const FormatInfo& f : info->formats) {
        if (f.filesize) return f.filesize;
        if (f.filesizeApprox) return f.filesizeApprox;
    }
    return std::nullopt;
}

} // namespace baran::utils
