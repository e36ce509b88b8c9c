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
#pragma once


#include <string>
#include <vector>
#include "ContentAcquisitionConfig.h"


namespace ContentAcquisition {


enum LinkDecision { ALLOW, DENY };


/** \class  LinkScopingPolicy
 *  \brief  Restricts feed item links to the host of their feed, independently of the URL validator.
 *
 *  Under mode A a link is allowed if its host equals the feed host or is one of its subdomains.  Links to other hosts
 *  are only allowed if a domain allowlist has been configured, which the URL validator enforces later.  Mode B allows
 *  every link.
 */
class LinkScopingPolicy {
public:
    /** \param reason  If non-NULL, a short explanation of the decision will be stored here. */
    LinkDecision decide(const std::string &item_link, const std::string &feed_url, const LinkPolicyMode mode,
                        const std::vector<std::string> &allowlist_domains, std::string * const reason = nullptr) const;
};


} // namespace ContentAcquisition
