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
#include "ContentAcquisitionUrlValidator.h"
#include <stdexcept>
#include "NetUtil.h"
#include "StringUtil.h"
#include "Url.h"
#include "UrlUtil.h"
#include "util.h"


namespace ContentAcquisition {


std::string RejectionReasonToString(const RejectionReason reason) {
    switch (reason) {
    case MALFORMED_URL:
        return "MALFORMED_URL";
    case DISALLOWED_SCHEME:
        return "DISALLOWED_SCHEME";
    case CREDENTIALS_PRESENT:
        return "CREDENTIALS_PRESENT";
    case LOCALHOST:
        return "LOCALHOST";
    case DOMAIN_NOT_ALLOWED:
        return "DOMAIN_NOT_ALLOWED";
    case UNRESOLVABLE_HOST:
        return "UNRESOLVABLE_HOST";
    case BLOCKED_ADDRESS:
        return "BLOCKED_ADDRESS";
    }

    throw std::runtime_error("in ContentAcquisition::RejectionReasonToString: unknown reason " + std::to_string(reason) + "!");
}


namespace {


inline bool Reject(const RejectionReason reason, const std::string &message, Rejection * const rejection) {
    *rejection = Rejection(reason, message);
    return false;
}


} // unnamed namespace


bool UrlValidator::isAllowlistedHost(const std::string &host) const {
    if (config_.allowlist_domains_.empty())
        return true;

    for (const auto &domain : config_.allowlist_domains_) {
        if (UrlUtil::HostMatchesDomain(host, domain))
            return true;
    }

    return false;
}


bool UrlValidator::validate(const std::string &url, const Purpose purpose, ValidatedUrl * const validated_url,
                            Rejection * const rejection) const
{
    const std::string trimmed_url(StringUtil::TrimWhite(url));
    if (trimmed_url.empty())
        return Reject(MALFORMED_URL, "empty URL", rejection);

    const Url parsed_url(trimmed_url);
    if (not parsed_url.isAbsolute() or not parsed_url.hasAuthority() or parsed_url.getAuthority().empty())
        return Reject(MALFORMED_URL, "a scheme and a host are required", rejection);

    if (config_.allowed_schemes_.find(parsed_url.getScheme()) == config_.allowed_schemes_.cend())
        return Reject(DISALLOWED_SCHEME, "scheme \"" + parsed_url.getScheme() + "\" is not allowed", rejection);

    if (parsed_url.hasUsernamePassword())
        return Reject(CREDENTIALS_PRESENT, "URLs with embedded credentials are not allowed", rejection);

    const std::string host(UrlUtil::NormalizeDomainName(parsed_url.getHost()));
    if (host.empty())
        return Reject(MALFORMED_URL, "the host is empty", rejection);
    if (host == "localhost")
        return Reject(LOCALHOST, "localhost is not allowed", rejection);

    if (not isAllowlistedHost(host))
        return Reject(DOMAIN_NOT_ALLOWED, "\"" + host + "\" is not on the domain allowlist", rejection);

    std::vector<std::string> addresses;
    if (config_.block_private_ips_) {
        std::string error_message;
        NetUtil::IPAddress ip_address;
        if (NetUtil::IPAddress::Parse(host, &ip_address))
            addresses.emplace_back(host);
        else if (not resolver_.resolve(host, &addresses, &error_message) or addresses.empty())
            return Reject(UNRESOLVABLE_HOST,
                          "can't resolve \"" + host + "\"" + (error_message.empty() ? std::string() : " (" + error_message + ")"),
                          rejection);

        for (const auto &address : addresses) {
            std::string range_name;
            if (NetUtil::IsBlockedAddress(address, &range_name))
                return Reject(BLOCKED_ADDRESS, "\"" + host + "\" resolves to the blocked address " + address + " (" + range_name + ")",
                              rejection);
        }
    }

    LOG_DEBUG("accepted " + PurposeToString(purpose) + " URL " + UrlUtil::SanitizeUrlForLogging(trimmed_url));
    validated_url->url_ = trimmed_url;
    validated_url->host_ = parsed_url.getHost();
    validated_url->port_ = parsed_url.getPortNumber();
    validated_url->addresses_.swap(addresses);

    return true;
}


} // namespace ContentAcquisition
