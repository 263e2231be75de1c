module;
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <cmath>
#include <optional>

module baran.services.ytdlp_output;

import baran.core.types;
import baran.utils.format_utils;

namespace utils = baran::utils;

OutputEvent OutputLineClassifier::classify(const QString& rawLine)
{
    static const QRegularExpression destinationRx(QStringLiteral("^\\[(?:download|ExtractAudio)\\]\\s+Destination:\\s+(.+)$"));
    static const QRegularExpression alreadyRx(QStringLiteral("^\\[download\\]\\s+(.+)\\s+has already been downloaded"));
    static const QRegularExpression mergerRx(QStringLiteral("^\\[Merger\\]\\s+Merging formats into\\s+\"?(.+?)\"?$"));
    static const QRegularExpression percentRx(QStringLiteral("(\\d+(?:\\.\\d+)?)%"));
    static const QRegularExpression totalRx(QStringLiteral("of\\s+~?\\s*(\\S+)"));
    static const QRegularExpression speedRx(QStringLiteral("at\\s+(\\S+)"));
    static const QRegularExpression etaRx(QStringLiteral("ETA\\s+(\\S+)"));
    static const QRegularExpression errorRx(QStringLiteral("ERROR:\\s*(.*)$"));
    static const QRegularExpression warningRx(QStringLiteral("WARNING:\\s*(.*)$"));

    OutputEvent ev;
    const QString line = rawLine.trimmed();
    if (line.isEmpty()) return ev;

    if (auto m = errorRx.match(line); m.hasMatch()) {
        ev.kind = OutputEvent::Kind::Error;
        ev.message = m.captured(1).trimmed();
        return ev;
    }
    if (auto m = warningRx.match(line); m.hasMatch()) {
        ev.kind = OutputEvent::Kind::Warning;
        ev.message = m.captured(1).trimmed();
        return ev;
    }
    if (auto m = destinationRx.match(line); m.hasMatch()) {
        ev.kind = OutputEvent::Kind::Destination;
        ev.path = m.captured(1).trimmed();
        return ev;
    }
    if (auto m = alreadyRx.match(line); m.hasMatch()) {
        ev.kind = OutputEvent::Kind::AlreadyDownloaded;
        ev.path = m.captured(1).trimmed();
        return ev;
    }
    if (auto m = mergerRx.match(line); m.hasMatch()) {
        ev.kind = OutputEvent::Kind::Merging;
        ev.path = m.captured(1).trimmed();
        return ev;
    }

    if (line.startsWith(QStringLiteral("[download]")) && line.contains(QLatin1Char('%'))) {
        const auto pm = percentRx.match(line);
        if (!pm.hasMatch()) return ev;
        bool ok = false;
        const double pct = pm.captured(1).toDouble(&ok);
        if (!ok) return ev;

        ev.kind = OutputEvent::Kind::Progress;
        ev.percent = pct;
        if (auto m = totalRx.match(line); m.hasMatch()) ev.totalBytes = utils::parseBytes(m.captured(1));
        if (auto m = speedRx.match(line); m.hasMatch()) ev.speedText = m.captured(1);
        if (auto m = etaRx.match(line); m.hasMatch()) ev.etaText = m.captured(1);
    }
    return ev;
}

ProgressTracker::ProgressTracker(std::optional<qint64> initialTotal)
    : m_initialTotal(initialTotal)
{
}

bool ProgressTracker::apply(const OutputEvent& event, DownloadProgress& progress)
{
    if (event.kind != OutputEvent::Kind::Progress) return false;

    const bool first = !m_seen;
    m_seen = true;
    if (first) {
        progress.downloadedBytes = 0;
        if (!progress.totalBytes && m_initialTotal) progress.totalBytes = m_initialTotal;
    }

    const double pct = qBound(0.0, event.percent, 100.0);
    progress.progress = pct;
    m_lastPercent = pct;

    if (event.totalBytes && *event.totalBytes > 0) progress.totalBytes = event.totalBytes;

    if (progress.totalBytes && *progress.totalBytes > 0) {
        const qint64 total = *progress.totalBytes;
        const qint64 calculated = qRound64(pct / 100.0 * double(total));
        if (calculated > progress.downloadedBytes) {
            if (first && calculated >= total / 2)
                progress.downloadedBytes = 0;
            else
                progress.downloadedBytes = calculated;
        }
    }

    progress.speedString = event.speedText;
    progress.etaString = event.etaText;
    progress.speed = utils::parseSpeed(event.speedText).value_or(0);
    progress.eta = utils::parseEta(event.etaText);
    return true;
}

namespace baran::utils {

QString mapExtractorError(const QStringList& stderrLines, std::optional<int> exitCode)
{
    const QString combined = stderrLines.join(QLatin1Char('\n'));

    if (combined.contains(QStringLiteral("Unable to parse data")) || combined.contains(QStringLiteral("Could not parse JSON")))
        return QStringLiteral("Critical Error: Cannot parse video data from provider. Try again later.");
    if (combined.contains(QStringLiteral("Video unavailable")) || combined.contains(QStringLiteral("Join this channel to get access")))
        return QStringLiteral("Video unavailable: This video might be private or region-restricted.");
    if (combined.contains(QStringLiteral("Sign in to confirm your age")))
        return QStringLiteral("Age restricted: This content requires age verification/cookies.");
    if (combined.contains(QStringLiteral("Empty file")))
        return QStringLiteral("Provider error: Received empty file from server.");
    if (combined.contains(QStringLiteral("No such file or directory")))
        return QStringLiteral("Filesystem error: Could not write to output directory.");
    if (combined.contains(QStringLiteral("WinError 183")))
        return QStringLiteral("File already exists: Cannot overwrite or rename the existing file. "
                              "Try changing the filename or enabling 'Overwrite' in settings.");

    if (exitCode && *exitCode != 0) {
        const QString last = stderrLines.isEmpty() ? QString() : stderrLines.last().trimmed();
        return QStringLiteral("Download failed (Exit code: %1). %2").arg(*exitCode).arg(last).trimmed();
    }

    for (const QString& line : stderrLines) {
        if (line.contains(QStringLiteral("ERROR:"))) {
            const QString text = QString(line).remove(QStringLiteral("ERROR:")).trimmed();
            if (!text.isEmpty()) return text;
        }
    }
    return QStringLiteral("Unknown download error occurred");
}

QString mapMetadataError(const QString& error)
{
    if (error.contains(QStringLiteral("Cannot parse data")) || error.contains(QStringLiteral("Unsupported URL")))
        return QStringLiteral("Unable to parse video data. This may be due to an outdated yt-dlp version. "
                              "Please update yt-dlp and try again. Original error: %1").arg(error);
    if (error.contains(QStringLiteral("Video unavailable")) || error.contains(QStringLiteral("Private video")))
        return QStringLiteral("This video is unavailable or private.");
    if (error.contains(QStringLiteral("Sign in")))
        return QStringLiteral("This video requires authentication. Please check if the video is accessible.");
    return error.isEmpty() ? QStringLiteral("Failed to fetch metadata") : error;
}

} // namespace baran::utils
