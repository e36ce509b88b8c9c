/** \brief Decides which feed-supplied links may be fetched.
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
#include "ContentAcquisitionLinkPolicy.h"
#include "Url.h"
#include "UrlUtil.h"


namespace ContentAcquisition {


namespace {


inline LinkDecision Decide(const LinkDecision decision, const std::string &explanation, std::string * const reason) {
    if (reason != nullptr)
        *reason = explanation;
    return decision;
}


} // unnamed namespace


LinkDecision LinkScopingPolicy::decide(const std::string &item_link, const std::string &feed_url, const LinkPolicyMode mode,
                                       const std::vector<std::string> &allowlist_domains, std::string * const reason) const
{
    if (mode == LINK_POLICY_B)
        return Decide(ALLOW, "mode B allows all links", reason);

    const Url feed(feed_url), item(item_link);
    const std::string feed_host(feed.isValid() ? UrlUtil::NormalizeDomainName(feed.getHost()) : "");
    const std::string item_host(item.isValid() ? UrlUtil::NormalizeDomainName(item.getHost()) : "");
    if (not feed_host.empty() and not item_host.empty() and UrlUtil::HostMatchesDomain(item_host, feed_host))
        return Decide(ALLOW, "same host as the feed", reason);

    if (not allowlist_domains.empty())
        return Decide(ALLOW, "foreign host, left to the domain allowlist", reason);

    return Decide(DENY, "\"" + item_host + "\" is not the feed host \"" + feed_host + "\" and there is no domain allowlist", reason);
}


} // namespace ContentAcquisition
