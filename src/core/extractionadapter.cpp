module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QPointer>
#include <QProcess>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUuid>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

module baran.core.extractionadapter;

import baran.core.types;
import baran.core.backend;
import baran.core.jobtable;
import baran.core.filereaper;
import baran.services.engine_settings;
import baran.services.ytdlp_output;
import baran.services.ytdlp_formats;
import baran.utils.download_utils;

namespace utils = baran::utils;

static constexpr int kMetadataTimeoutMs = 120000;
static constexpr int kKillGraceMs = 2000;
static constexpr int kCleanupDelayMs = 1000;
static constexpr qint64 kMinResolvedFileSize = 1024;
#if defined(Q_OS_WIN)
static constexpr int kCleanupRetries = 15;
static constexpr int kCleanupRetryDelayMs = 2000;
#else
static constexpr int kCleanupRetries = 10;
static constexpr int kCleanupRetryDelayMs = 3000;
#endif

namespace {

QStringList takeLines(QByteArray& buffer, bool flush)
{
    buffer.replace('\r', '\n');
    QStringList lines;
    qsizetype start = 0;
    qsizetype nl = buffer.indexOf('\n', start);
    while (nl >= 0) {
        const QString line = QString::fromUtf8(buffer.constData() + start, nl - start).trimmed();
        if (!line.isEmpty()) lines.append(line);
        start = nl + 1;
        nl = buffer.indexOf('\n', start);
    }
    buffer.remove(0, start);
    if (flush && !buffer.isEmpty()) {
        const QString rest = QString::fromUtf8(buffer).trimmed();
        if (!rest.isEmpty()) lines.append(rest);
        buffer.clear();
    }
    return lines;
}

} // namespace

ExtractionAdapter::ExtractionAdapter(EngineSettings* settings, FileReaper* reaper, QObject* parent)
    : DownloadBackend(parent),
    m_settings(settings),
    m_reaper(reaper),
    m_scheduler([settings]() { return settings ? settings->maxConcurrentDownloads() : 1; })
{
    if (m_settings) {
        connect(m_settings, &EngineSettings::maxConcurrentDownloadsChanged, this, &ExtractionAdapter::processQueue);
    }
}

ExtractionAdapter::~ExtractionAdapter()
{
    for (auto it = m_runs.begin(); it != m_runs.end(); ++it) {
        QProcess* proc = it->process.data();
        if (!proc) continue;
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
    }
    m_runs.clear();
}

QString ExtractionAdapter::program() const
{
    return EngineSettings::resolveExecutable(m_settings ? m_settings->ytDlpPath() : QString(), QStringLiteral("yt-dlp"));
}

void ExtractionAdapter::fetchMetadata(const QString& url, MetadataCallback done)
{
    const QString exe = program();
    if (exe.isEmpty()) {
        qCritical() << "yt-dlp executable not found";
        QTimer::singleShot(0, this, [done = std::move(done)]() {
            if (done) done(std::nullopt, QStringLiteral("yt-dlp is not available"));
        });
        return;
    }

    auto* proc = new QProcess(this);
    auto timedOut = std::make_shared<bool>(false);
    auto callback = std::make_shared<MetadataCallback>(std::move(done));

    const auto settle = [callback](const std::optional<VideoInfo>& info, const QString& error) {
        if (!*callback) return;
        MetadataCallback cb = std::move(*callback);
        *callback = nullptr;
        cb(info, error);
    };

    QTimer::singleShot(kMetadataTimeoutMs, proc, [proc, timedOut]() {
        if (proc->state() == QProcess::NotRunning) return;
        qWarning() << "Metadata request timed out, killing yt-dlp";
        *timedOut = true;
        proc->kill();
    });

    connect(proc, &QProcess::errorOccurred, this, [proc, settle](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        qWarning() << "yt-dlp failed to start:" << proc->errorString();
        settle(std::nullopt, utils::mapMetadataError(proc->errorString()));
        proc->deleteLater();
    });

    connect(proc, &QProcess::finished, this, [proc, settle, timedOut, url](int exitCode, QProcess::ExitStatus exitStatus) {
        proc->deleteLater();
        const QByteArray out = proc->readAllStandardOutput();
        const QString err = QString::fromUtf8(proc->readAllStandardError()).trimmed();

        if (*timedOut) {
            settle(std::nullopt, QStringLiteral("Metadata request timed out"));
            return;
        }
        if (exitStatus != QProcess::NormalExit || exitCode != 0) {
            qWarning() << "Metadata fetch failed for" << url << "exit code" << exitCode;
            const QString message = err.isEmpty() ? QStringLiteral("yt-dlp exited with code %1").arg(exitCode) : err;
            settle(std::nullopt, utils::mapMetadataError(message));
            return;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(out, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "Metadata output is not valid JSON:" << parseError.errorString();
            settle(std::nullopt, utils::mapMetadataError(QStringLiteral("Cannot parse data: %1").arg(parseError.errorString())));
            return;
        }
        settle(utils::parseVideoInfo(doc.object()), QString());
    });

    qDebug() << "Fetching metadata for" << url;
    proc->start(exe, utils::metadataArgs(url));
}

SubmitResult ExtractionAdapter::startDownload(const std::optional<VideoInfo>& info, const DownloadOptions& options)
{
    SubmitResult result;
    if (program().isEmpty()) {
        qCritical() << "yt-dlp executable not found";
        result.error = QStringLiteral("yt-dlp is not available");
        return result;
    }

    DownloadOptions opts = options;
    if (m_settings) {
        if (opts.proxy.isEmpty()) opts.proxy = m_settings->proxy();
        if (opts.cookiesFile.isEmpty()) opts.cookiesFile = m_settings->cookiesFile();
        if (opts.rateLimit.isEmpty()) opts.rateLimit = m_settings->rateLimit();
    }

    QString outputDir = opts.outputPath;
    if (outputDir.isEmpty()) {
        const QString root = m_settings ? m_settings->downloadDirectory() : QDir::homePath();
        outputDir = utils::downloadSubPath(root, QStringLiteral("videos"));
    } else if (!QDir().mkpath(outputDir)) {
        qWarning() << "Failed to create output directory" << outputDir;
    }

    const QString qualitySuffix = utils::qualityLabelForFilename(info, opts.quality);

    DownloadItem item;
    item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    item.url = opts.url;
    item.options = opts;
    item.backend = Backend::Extraction;
    item.status = DownloadStatus::Pending;
    item.outputPath = outputDir;
    item.filename = utils::filenameTemplate(opts, info, qualitySuffix);
    item.createdAt = QDateTime::currentDateTime();
    item.videoInfo = info;
    item.progress.downloadId = item.id;
    item.progress.status = DownloadStatus::Pending;
    item.progress.totalBytes = utils::initialTotalBytes(info, opts.quality);

    m_table.insert(item);
    qInfo() << "Queued extraction job" << item.id << "for" << item.url;
    emit statusChanged(item);
    processQueue();

    if (const DownloadItem* stored = m_table.find(item.id)) item = *stored;
    result.success = true;
    result.items.append(item);
    return result;
}

void ExtractionAdapter::processQueue()
{
    const QStringList admitted = m_scheduler.admit(m_table);
    for (const QString& id : admitted) execute(id);
}

void ExtractionAdapter::execute(const QString& id)
{
    DownloadItem* item = m_table.find(id);
    if (!item) return;

    const QString exe = program();
    if (exe.isEmpty()) {
        qCritical() << "yt-dlp executable not found";
        markFailed(id, QStringLiteral("yt-dlp is not available"));
        return;
    }

    m_table.applyStatus(id, DownloadStatus::Downloading);
    item->progress.progress = 0.0;
    item->progress.downloadedBytes = 0;

    const QString name = item->filename.isEmpty() ? QStringLiteral("%(title)s.%(ext)s") : item->filename;
    const QString outputFile = QDir(item->outputPath).filePath(name);
    const QString ffmpeg = EngineSettings::resolveExecutable(m_settings ? m_settings->ffmpegPath() : QString(), QStringLiteral("ffmpeg"));
    const QStringList args = utils::buildDownloadArgs(item->options, outputFile, item->videoInfo, ffmpeg);

    auto* proc = new QProcess(this);
    Run run;
    run.process = proc;
    run.tracker = ProgressTracker(item->progress.totalBytes);
    m_runs.insert(id, run);

    connect(proc, &QProcess::readyReadStandardOutput, this, [this, id, proc]() { readOutput(id, proc, false); });
    connect(proc, &QProcess::readyReadStandardError, this, [this, id, proc]() { readOutput(id, proc, false); });
    connect(proc, &QProcess::finished, this, [this, id, proc](int exitCode, QProcess::ExitStatus exitStatus) {
        handleFinished(id, proc, exitCode, exitStatus);
    });
    connect(proc, &QProcess::errorOccurred, this, [this, id, proc](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) handleStartFailure(id, proc);
    });

    emit statusChanged(*item);
    qInfo() << "Starting extraction job" << id;
    qDebug() << exe << args;
    proc->start(exe, args);
}

void ExtractionAdapter::readOutput(const QString& id, QProcess* process, bool flush)
{
    auto it = m_runs.find(id);
    if (it == m_runs.end() || it->process != process) return;

    it->stdoutBuffer.append(process->readAllStandardOutput());
    it->stderrBuffer.append(process->readAllStandardError());
    const QStringList outLines = takeLines(it->stdoutBuffer, flush);
    const QStringList errLines = takeLines(it->stderrBuffer, flush);

    for (const QString& line : outLines) handleLine(id, line, false);
    for (const QString& line : errLines) handleLine(id, line, true);
}

void ExtractionAdapter::handleLine(const QString& id, const QString& line, bool fromStderr)
{
    DownloadItem* item = m_table.find(id);
    auto run = m_runs.find(id);
    if (!item || run == m_runs.end()) return;

    const DownloadStatus st = item->status;
    if (st != DownloadStatus::Downloading && st != DownloadStatus::Pending && st != DownloadStatus::Merging) return;

    const OutputEvent event = OutputLineClassifier::classify(line);
    if (fromStderr || event.kind == OutputEvent::Kind::Error) run->errorLines.append(line);

    switch (event.kind) {
    case OutputEvent::Kind::Progress: {
        if (st == DownloadStatus::Merging) return;
        DownloadProgress sample = item->progress;
        if (run->tracker.apply(event, sample) && m_table.applyProgress(id, sample))
            emit progressChanged(item->progress);
        break;
    }
    case OutputEvent::Kind::Destination:
    case OutputEvent::Kind::AlreadyDownloaded: {
        DownloadProgress sample = item->progress;
        sample.filename = QFileInfo(event.path).fileName();
        if (m_table.applyProgress(id, sample)) emit progressChanged(item->progress);
        break;
    }
    case OutputEvent::Kind::Merging: {
        if (!event.path.isEmpty()) {
            DownloadProgress sample = item->progress;
            sample.filename = QFileInfo(event.path).fileName();
            m_table.applyProgress(id, sample);
        }
        run->reachedCompletion = true;
        if (m_table.applyStatus(id, DownloadStatus::Merging)) {
            qInfo() << "Extraction job" << id << "merging formats";
            emit statusChanged(*item);
        }
        break;
    }
    case OutputEvent::Kind::Warning:
        qDebug() << "yt-dlp:" << event.message;
        break;
    case OutputEvent::Kind::Error:
        qWarning() << "yt-dlp error for" << id << ":" << event.message;
        break;
    case OutputEvent::Kind::None:
        break;
    }
}

void ExtractionAdapter::handleFinished(const QString& id, QProcess* process, int exitCode, QProcess::ExitStatus exitStatus)
{
    readOutput(id, process, true);
    process->deleteLater();

    auto it = m_runs.find(id);
    if (it == m_runs.end() || it->process != process) {
        processQueue();
        return;
    }
    const Run run = *it;
    m_runs.erase(it);

    DownloadItem* item = m_table.find(id);
    if (!item || item->status == DownloadStatus::Paused || item->status == DownloadStatus::Cancelled) {
        processQueue();
        return;
    }

    const bool reachedCompletion = run.reachedCompletion || item->progress.progress >= 100.0;
    const bool cleanExit = exitStatus == QProcess::NormalExit && exitCode == 0;

    if (cleanExit || reachedCompletion) {
        if (!cleanExit) qInfo() << "yt-dlp exited with code" << exitCode << "after a complete transfer, treating as success";
        finalizeCompleted(*item);
        m_table.applyStatus(id, DownloadStatus::Completed);
        qInfo() << "Extraction job" << id << "completed:" << item->filename;
        emit downloadCompleted(*item);
        emit statusChanged(*item);
    } else {
        markFailed(id, utils::mapExtractorError(run.errorLines, exitCode));
    }
    processQueue();
}

void ExtractionAdapter::handleStartFailure(const QString& id, QProcess* process)
{
    auto it = m_runs.find(id);
    if (it == m_runs.end() || it->process != process) return;
    m_runs.erase(it);

    const QString reason = process->errorString();
    process->deleteLater();
    qWarning() << "yt-dlp failed to start for" << id << ":" << reason;
    markFailed(id, QStringLiteral("Failed to start yt-dlp: %1").arg(reason));
    processQueue();
}

void ExtractionAdapter::finalizeCompleted(DownloadItem& item)
{
    DownloadProgress& progress = item.progress;
    const QString current = progress.filename.isEmpty() ? item.filename : progress.filename;

    if (current.contains(QLatin1Char('%'))) {
        const QString resolved = resolveTemplatedFilename(item.outputPath, current);
        if (!resolved.isEmpty()) {
            qDebug() << "Resolved filename from disk:" << resolved;
            item.filename = resolved;
            progress.filename = resolved;
        }
    }

    const QString name = progress.filename.isEmpty() ? item.filename : progress.filename;
    if (!progress.totalBytes || progress.downloadedBytes == 0 || name.contains(QLatin1Char('%'))) {
        if (!name.isEmpty() && !name.contains(QLatin1Char('%'))) {
            const QFileInfo file(QDir(item.outputPath).filePath(name));
            if (file.exists() && file.size() > 0) {
                progress.totalBytes = file.size();
                progress.downloadedBytes = file.size();
            }
        }
        if (!progress.totalBytes || progress.downloadedBytes == 0) {
            const QFileInfoList files = QDir(item.outputPath).entryInfoList(QDir::Files, QDir::Time);
            for (const QFileInfo& file : files) {
                if (file.size() <= kMinResolvedFileSize) continue;
                progress.totalBytes = file.size();
                progress.downloadedBytes = file.size();
                break;
            }
        }
    }
    if (progress.totalBytes && progress.downloadedBytes == 0) progress.downloadedBytes = *progress.totalBytes;
}

bool ExtractionAdapter::isIntermediateFile(const QString& name)
{
    // Separate format streams are named "<title>.f137.mp4" and similar.
    static const QRegularExpression streamRx(QStringLiteral("\\.f\\d+\\."));
    return name.endsWith(QStringLiteral(".part")) || name.endsWith(QStringLiteral(".ytdl"))
        || name.endsWith(QStringLiteral(".temp")) || name.contains(QStringLiteral(".temp."))
        || streamRx.match(name).hasMatch();
}

QString ExtractionAdapter::resolveTemplatedFilename(const QString& directory, const QString& templ)
{
    const QString base = templ.section(QStringLiteral(".%"), 0, 0);
    if (base.isEmpty() || base.contains(QLatin1Char('%'))) return QString();

    const QFileInfoList files = QDir(directory).entryInfoList(QDir::Files, QDir::Time);
    for (const QFileInfo& file : files) {
        const QString name = file.fileName();
        if (!name.startsWith(base) || isIntermediateFile(name)) continue;
        return name;
    }
    return QString();
}

void ExtractionAdapter::markFailed(const QString& id, const QString& message)
{
    DownloadItem* item = m_table.find(id);
    if (!item) return;
    item->error = message;
    m_table.applyStatus(id, DownloadStatus::Failed);
    qWarning() << "Extraction job" << id << "failed:" << message;
    emit downloadFailed(*item, message);
    emit statusChanged(*item);
    cleanupFiles(*item, false);
}

bool ExtractionAdapter::pause(const QString& id)
{
    DownloadItem* item = m_table.find(id);
    auto it = m_runs.find(id);
    if (!item || it == m_runs.end()) return false;

    m_table.applyStatus(id, DownloadStatus::Paused);
    QProcess* proc = it->process.data();
    m_runs.erase(it);
    detachProcess(proc);

    qInfo() << "Paused extraction job" << id;
    emit statusChanged(*item);
    processQueue();
    return true;
}

bool ExtractionAdapter::resume(const QString& id)
{
    DownloadItem* item = m_table.find(id);
    if (!item || item->status != DownloadStatus::Paused) return false;

    m_table.applyStatus(id, DownloadStatus::Pending);
    qInfo() << "Resumed extraction job" << id;
    emit statusChanged(*item);
    processQueue();
    return true;
}

bool ExtractionAdapter::cancel(const QString& id)
{
    const DownloadItem* found = m_table.find(id);
    if (!found) return false;

    DownloadItem item = *found;
    item.status = DownloadStatus::Cancelled;
    item.progress.status = DownloadStatus::Cancelled;

    QProcess* proc = nullptr;
    if (auto it = m_runs.find(id); it != m_runs.end()) {
        proc = it->process.data();
        m_runs.erase(it);
    }
    m_table.remove(id);

    qInfo() << "Cancelled extraction job" << id;
    emit statusChanged(item);
    emit itemRemoved(id);

    detachProcess(proc);
    QPointer<ExtractionAdapter> self(this);
    QTimer::singleShot(proc ? kCleanupDelayMs : 0, this, [self, item]() {
        if (self) self->cleanupFiles(item, true);
    });

    processQueue();
    return true;
}

std::optional<DownloadItem> ExtractionAdapter::status(const QString& id) const
{
    if (const DownloadItem* item = m_table.find(id)) return *item;
    return std::nullopt;
}

QVector<DownloadItem> ExtractionAdapter::listAll() const
{
    return m_table.snapshot();
}

int ExtractionAdapter::clearCompleted()
{
    const QStringList removed = m_table.removeIf([](const DownloadItem& item) {
        return item.status == DownloadStatus::Completed || item.status == DownloadStatus::Cancelled;
    });
    return removed.size();
}

void ExtractionAdapter::detachProcess(QProcess* process)
{
    if (!process) return;
    process->disconnect(this);
    if (process->state() == QProcess::NotRunning) {
        process->deleteLater();
        return;
    }
    connect(process, &QProcess::finished, process, &QObject::deleteLater);

#if defined(Q_OS_WIN)
    const qint64 pid = process->processId();
    if (pid > 0) {
        QProcess::startDetached(QStringLiteral("taskkill"),
                                { QStringLiteral("/F"), QStringLiteral("/T"), QStringLiteral("/PID"), QString::number(pid) });
    }
#endif
    process->terminate();

    QPointer<QProcess> guard(process);
    QTimer::singleShot(kKillGraceMs, this, [guard]() {
        if (!guard || guard->state() == QProcess::NotRunning) return;
        qWarning() << "yt-dlp did not exit, killing";
        guard->kill();
    });
}

void ExtractionAdapter::cleanupFiles(const DownloadItem& item, bool removePrimary)
{
    if (!m_reaper || item.outputPath.isEmpty()) return;
    const QDir dir(item.outputPath);
    if (!dir.exists()) return;

    const QString name = item.progress.filename.isEmpty() ? item.filename : item.progress.filename;
    if (!name.isEmpty() && !name.contains(QLatin1Char('%'))) {
        const QString path = dir.filePath(name);
        const QStringList suffixes = {
            QStringLiteral(".part"), QStringLiteral(".ytdl"), QStringLiteral(".temp"),
            QStringLiteral(".temp.mp4"), QStringLiteral(".temp.mkv"), QStringLiteral(".temp.webm"),
        };
        if (removePrimary) {
            m_reaper->removeWithVariants(path, suffixes, kCleanupRetries, kCleanupRetryDelayMs);
        } else {
            for (const QString& suffix : suffixes) {
                if (QFileInfo::exists(path + suffix)) m_reaper->removeWithRetry(path + suffix, kCleanupRetries, kCleanupRetryDelayMs);
            }
        }
    }

    const QString base = name.section(QLatin1Char('.'), 0, 0);
    if (base.size() <= 3 || base.contains(QLatin1Char('%'))) return;

    const QStringList files = dir.entryList(QDir::Files);
    for (const QString& file : files) {
        if (!file.contains(base) || file == name) continue;
        if (isIntermediateFile(file)) m_reaper->removeWithRetry(dir.filePath(file), kCleanupRetries, kCleanupRetryDelayMs);
    }
}
