/*!
 * @file        network_utils.cppm
 * @brief       Address and host helpers used by the link classifier.
 * @details     Implements the address-range checks behind the SSRF guard
 *              (loopback, RFC 1918, link-local, unique-local and unspecified
 *              ranges) and the host matching used for the media platform list.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/baran/blob/main/LICENSE.md
 */

module;
#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <QUrl>

#ifndef Q_MOC_RUN
export module baran.utils.network_utils;
#endif

#ifdef Q_MOC_RUN
#define BARAN_MODULE_EXPORT
#else
#define BARAN_MODULE_EXPORT export
#endif

BARAN_MODULE_EXPORT namespace baran::utils {

/**
 * @brief Checks whether an address belongs to a private or internal range.
 *
 * Blocks 0.0.0.0/8, 10/8, 127/8, 169.254/16, 172.16/12, 192.168/16, ::, ::1,
 * fe80::/10, fc00::/7 and IPv4-mapped forms of the IPv4 ranges.
 *
 * @param address Address to inspect.
 * @return true if the address must not be contacted.
 */
bool isPrivateAddress(const QHostAddress& address);

/**
 * @brief Checks a host name without DNS resolution.
 *
 * Literal IPv4/IPv6 hosts are checked with isPrivateAddress(); the names
 * "localhost" and "*.localhost" are always private.
 *
 * @param host Host part of a URL.
 * @return true if the host is known to be private.
 */
bool isPrivateHostLiteral(const QString& host);

//!< @brief Returns true for http and https URLs with a host.
bool isHttpUrl(const QUrl& url);

/**
 * @brief Matches a host against a domain list.
 *
 * A host matches when it equals a listed domain or is a subdomain of it.
 * A leading "www." on the host is ignored.
 *
 * @param host Host to test.
 * @param domains Domain list.
 * @return true if any domain matches.
 */
bool hostMatchesAny(const QString& host, const QStringList& domains);

} // namespace baran::utils
