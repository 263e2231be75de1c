#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QHash>
#include <QLoggingCategory>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

#include <memory>
#include <optional>

import baran.core.types;
import baran.core.downloadengine;
import baran.services.engine_settings;
import baran.utils.format_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = baran::utils;

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printInfo(const VideoInfo& info)
{
    out() << "Title:     " << info.title << Qt::endl;
    if (!info.uploader.isEmpty()) out() << "Uploader:  " << info.uploader << Qt::endl;
    if (info.duration) out() << "Duration:  " << utils::formatEta(qint64(*info.duration)) << Qt::endl;
    out() << "Extractor: " << info.extractor << (info.isLive ? " (live)" : "") << Qt::endl;

    if (info.isPlaylist && info.playlist) {
        out() << "Playlist:  " << info.playlist->videoCount << " entries" << Qt::endl;
        for (const PlaylistEntry& entry : info.playlist->videos)
            out() << QStringLiteral("  %1. %2").arg(entry.index, 3).arg(entry.title) << Qt::endl;
        return;
    }

    out() << "Qualities:" << Qt::endl;
    for (const QualityOption& option : info.qualityOptions) {
        const QString size = option.totalSize ? utils::formatBytes(*option.totalSize) : QStringLiteral("?");
        out() << QStringLiteral("  %1  %2  %3").arg(option.key, -10).arg(option.label, -20).arg(size) << Qt::endl;
    }
    if (!info.subtitleLanguages.isEmpty())
        out() << "Subtitles: " << info.subtitleLanguages.join(QStringLiteral(", ")) << Qt::endl;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Baran"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} [%{type}] %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Baran download engine"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("URLs to download."), QStringLiteral("<url>..."));

    const QCommandLineOption classifyOption(QStringLiteral("classify"), QStringLiteral("Only classify the URLs."));
    const QCommandLineOption infoOption(QStringLiteral("info"), QStringLiteral("Print media metadata and exit."));
    const QCommandLineOption modeOption(QStringLiteral("mode"), QStringLiteral("Classifier mode: auto, direct or video."),
                                        QStringLiteral("mode"), QStringLiteral("auto"));
    const QCommandLineOption qualityOption({QStringLiteral("q"), QStringLiteral("quality")},
                                           QStringLiteral("Quality key such as 1080p, or a format selector."),
                                           QStringLiteral("quality"));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Output directory."), QStringLiteral("dir"));
    const QCommandLineOption audioOption(QStringLiteral("audio-only"), QStringLiteral("Extract audio only."));
    const QCommandLineOption concurrentOption(QStringLiteral("max-concurrent"),
                                              QStringLiteral("Concurrent downloads per backend."), QStringLiteral("n"));
    const QCommandLineOption conflictOption(QStringLiteral("on-conflict"),
                                            QStringLiteral("skip, overwrite or rename."), QStringLiteral("policy"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Verbose logging."));
    parser.addOptions({classifyOption, infoOption, modeOption, qualityOption, outputOption, audioOption,
                       concurrentOption, conflictOption, verboseOption});
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption);
    if (!verbose) QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));

    const QStringList urls = parser.positionalArguments();
    if (urls.isEmpty()) parser.showHelp(1);

    EngineSettings settings;
    if (parser.isSet(concurrentOption)) settings.setMaxConcurrentDownloads(parser.value(concurrentOption).toInt());
    if (parser.isSet(conflictOption)) settings.setOnFileExistsName(parser.value(conflictOption));

    DownloadEngine engine(&settings);
    const ClassifyMode mode = utils::classifyModeFromString(parser.value(modeOption));

    if (parser.isSet(classifyOption)) {
        // Started from the loop so a synchronous verdict still reaches exit().
        QTimer::singleShot(0, &app, [&engine, urls, mode]() {
            engine.classifyMany(urls, mode, [urls](const QHash<QString, LinkTypeResult>& results) {
                for (const QString& url : urls) {
                    const LinkTypeResult verdict = results.value(url);
                    out() << (verdict.isDirect ? "direct " : "extract") << "  " << url << "  " << verdict.reason << Qt::endl;
                }
                QCoreApplication::exit(0);
            });
        });
        return app.exec();
    }

    if (parser.isSet(infoOption)) {
        QTimer::singleShot(0, &app, [&engine, url = urls.first()]() {
            engine.fetchMetadata(url, [](const std::optional<VideoInfo>& info, const QString& error) {
                if (!info) {
                    qCritical().noquote() << error;
                    QCoreApplication::exit(1);
                    return;
                }
                printInfo(*info);
                QCoreApplication::exit(0);
            });
        });
        return app.exec();
    }

    DownloadOptions options;
    options.quality = parser.value(qualityOption);
    options.outputPath = parser.value(outputOption);
    options.audioOnly = parser.isSet(audioOption);
    options.verbose = verbose;

    auto failures = std::make_shared<int>(0);
    auto outstanding = std::make_shared<int>(urls.size());

    const auto finishIfIdle = [&engine, outstanding, failures]() {
        if (*outstanding > 0 || !engine.allTerminal()) return;
        engine.shutdown();
        QCoreApplication::exit(*failures > 0 ? 1 : 0);
    };

    QObject::connect(&engine, &DownloadEngine::progressChanged, &app, [](const DownloadProgress& progress) {
        out() << QStringLiteral("\r%1  %2%  %3  ETA %4")
                     .arg(progress.filename.isEmpty() ? progress.downloadId : progress.filename)
                     .arg(progress.progress, 0, 'f', 1)
                     .arg(progress.speedString)
                     .arg(progress.etaString.isEmpty() ? QStringLiteral("-") : progress.etaString)
              << Qt::flush;
    });
    QObject::connect(&engine, &DownloadEngine::downloadCompleted, &app, [](const DownloadItem& item) {
        out() << Qt::endl << "Completed: " << item.outputPath << '/' << item.filename << Qt::endl;
    });
    QObject::connect(&engine, &DownloadEngine::downloadFailed, &app, [failures](const DownloadItem& item, const QString& message) {
        ++*failures;
        out() << Qt::endl << "Failed: " << item.url << ": " << message << Qt::endl;
    });
    QObject::connect(&engine, &DownloadEngine::statusChanged, &app, [finishIfIdle](const DownloadItem&) {
        QTimer::singleShot(0, finishIfIdle);
    });
    QObject::connect(&engine, &DownloadEngine::configurationError, &app, [](const QString& message) {
        qCritical().noquote() << message;
    });

    engine.start();
    for (const QString& url : urls) {
        engine.submit(url, options, mode, [url, outstanding, failures, finishIfIdle](const SubmitResult& result) {
            --*outstanding;
            if (!result.success) {
                ++*failures;
                qCritical().noquote() << url << ":" << result.error;
            } else if (!result.error.isEmpty()) {
                qInfo().noquote() << url << ":" << result.error;
            } else {
                qInfo().noquote() << "Queued" << result.items.size() << "job(s) for" << url;
            }
            QTimer::singleShot(0, finishIfIdle);
        });
    }

    const int code = app.exec();
    engine.shutdown();
    return code;
}
