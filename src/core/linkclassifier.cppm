/*!
 * @file        linkclassifier.cppm
 * @brief       Decides whether a URL is a direct file or a media page.
 * @details     Verdicts are produced by a short-circuiting chain:
 *              forced mode, protocol check, SSRF guard, known media platform
 *              list, a HEAD probe with a browser identity, and finally an
 *              extension based fallback.
 *
 *              Every branch yields a stable reason string. Network failures
 *              while probing are never fatal; they fall through to the
 *              fallback verdict.
 *
 *              Redirects are followed manually (at most five) so that each
 *              hop can be re-validated against the SSRF guard.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module baran.core.linkclassifier;
import baran.core.types;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

//!< @brief Headers captured by a successful HEAD probe.
BARAN_MODULE_EXPORT struct HeadProbeResult {
    QString contentType;
    std::optional<qint64> contentLength;
    QString contentDisposition;
    QUrl finalUrl;
};

/**
 * @brief URL classifier.
 *
 * The instance owns its QNetworkAccessManager. All completion callbacks are
 * invoked exactly once on the event loop.
 */
BARAN_MODULE_EXPORT class LinkClassifier : public QObject {

    Q_OBJECT

public:
    using Callback = std::function<void(const LinkTypeResult&)>;
    using BatchCallback = std::function<void(const QHash<QString, LinkTypeResult>&)>;

    /**
     * @brief Construct a classifier.
     * @param parent Optional parent QObject.
     */
    explicit LinkClassifier(QObject* parent = nullptr);

    /**
     * @brief Classify a URL.
     * @param url URL to inspect.
     * @param mode Auto, Direct or Video.
     * @param done Completion callback.
     */
    void classify(const QString& url, ClassifyMode mode, Callback done);

    /**
     * @brief Classify several URLs, probing at most five at a time.
     * @param urls URLs to inspect.
     * @param mode Mode applied to every URL.
     * @param done Receives one verdict per distinct URL.
     */
    void classifyMany(const QStringList& urls, ClassifyMode mode, BatchCallback done);

    /**
     * @brief Synchronous part of the chain.
     *
     * Handles forced video mode, protocol validation, literal private hosts
     * and known platform pages. Returns nothing when DNS and a HEAD probe
     * are required to decide.
     *
     * @param url URL to inspect.
     * @param mode Classifier mode.
     * @return Verdict, if one could be reached without network access.
     */
    static std::optional<LinkTypeResult> preflight(const QUrl& url, ClassifyMode mode);

    /**
     * @brief Verdict from HEAD probe headers.
     * @param url Original URL.
     * @param mode Classifier mode.
     * @param head Probe result.
     * @return Verdict, or nothing when the headers are inconclusive.
     */
    static std::optional<LinkTypeResult> verdictFromHeaders(const QUrl& url, ClassifyMode mode, const HeadProbeResult& head);

    /**
     * @brief Extension fallback followed by the mode default.
     * @param url URL to inspect.
     * @param mode Classifier mode.
     * @return Final verdict.
     */
    static LinkTypeResult fallbackVerdict(const QUrl& url, ClassifyMode mode);

    //!< @brief Returns true if the host is a known media platform or a subdomain of one.
    static bool isKnownPlatform(const QString& host);

    //!< @brief Returns true if ext (lower case, with dot) is a direct file extension.
    static bool isDirectExtension(const QString& ext);

    //!< @brief Returns true for archive, binary, document and media MIME types.
    static bool isDirectContentType(const QString& contentType);

    //!< @brief Returns true for HTML and XML MIME types.
    static bool isWebPageContentType(const QString& contentType);

    //!< @brief User agent used for probing, also suggested to the transfer daemon.
    static QString browserUserAgent();

    //!< @brief Reason reported for a blocked private target.
    static QString ssrfReason();

    //!< @brief Reason reported for an unsupported scheme.
    static QString protocolReason();

signals:
    /**
     * @brief Emitted for every completed classification.
     * @param url Classified URL.
     * @param result Verdict.
     */
    void classified(const QString& url, const LinkTypeResult& result);

private:
    using PrivateCheck = std::function<void(bool isPrivate)>;
    using ProbeCallback = std::function<void(std::optional<HeadProbeResult> result, const QString& error)>;

    void resolvesToPrivate(const QUrl& url, PrivateCheck done);
    void probe(const QUrl& origin, const QUrl& url, int redirectsLeft, bool retried, ProbeCallback done);
    void finish(const QString& url, const LinkTypeResult& result, const Callback& done);

    QNetworkAccessManager m_network;    //!< Shared manager for HEAD probes.
};

#include "linkclassifier.moc"
