/** \brief Validation of outbound URLs against server-side request forgery.
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <string>
#include <vector>
#include "ContentAcquisitionConfig.h"
#include "DnsUtil.h"


namespace ContentAcquisition {


enum RejectionReason {
    MALFORMED_URL,
    DISALLOWED_SCHEME,
    CREDENTIALS_PRESENT,
    LOCALHOST,
    DOMAIN_NOT_ALLOWED,
    UNRESOLVABLE_HOST,
    BLOCKED_ADDRESS
};


std::string RejectionReasonToString(const RejectionReason reason);


struct Rejection {
    RejectionReason reason_;
    std::string message_;
public:
    Rejection(): reason_(MALFORMED_URL) { }
    Rejection(const RejectionReason reason, const std::string &message): reason_(reason), message_(message) { }

    inline std::string toString() const { return RejectionReasonToString(reason_) + ": " + message_; }
};


// A URL that passed all checks.
struct ValidatedUrl {
    std::string url_; // Verbatim, apart from surrounding whitespace.
    std::string host_;
    unsigned short port_;

    // The addresses "host_" resolved to.  Empty if private address blocking is disabled.
    std::vector<std::string> addresses_;
public:
    ValidatedUrl(): port_(0) { }
};


/** \class  UrlValidator
 *  \brief  Decides whether a URL may be requested at all.
 *
 *  The checks are applied in this order and the first failing one determines the rejection: parsing (a scheme and a
 *  host are required), the scheme allowlist, embedded credentials, "localhost", the optional domain allowlist, DNS
 *  resolution and finally the blocked address ranges.  The host is resolved anew on every call, IP address literals
 *  are checked without a lookup.
 */
class UrlValidator {
    const Config &config_;
    const DnsUtil::Resolver &resolver_;
public:
    UrlValidator(const Config &config, const DnsUtil::Resolver &resolver): config_(config), resolver_(resolver) { }

    /** \return True if "url" was accepted, else false and "rejection" describes the first failed check. */
    bool validate(const std::string &url, const Purpose purpose, ValidatedUrl * const validated_url, Rejection * const rejection) const;

    // \return True if "host" equals an allowlisted domain or is one of its subdomains, or if there is no allowlist.
    bool isAllowlistedHost(const std::string &host) const;
};


} // namespace ContentAcquisition
