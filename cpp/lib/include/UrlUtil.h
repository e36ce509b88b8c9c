/** \file    UrlUtil.h
 *  \brief   URL-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
 *  Copyright 2024 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#ifndef URL_UTIL_H
#define URL_UTIL_H


#include <string>


namespace UrlUtil {


/** \brief  Lowercases a domain name and removes surrounding whitespace and trailing periods. */
std::string NormalizeDomainName(const std::string &domain_name);


/** \brief  Tests whether a host is a domain or one of its subdomains.
 *  \param  host            A host name, e.g. "news.example.com".
 *  \param  domain_pattern  A domain name, e.g. "example.com".  A leading "*." label is treated as the domain itself.
 *  \return True if "host" equals the domain or ends in "." followed by the domain.  Comparisons are case-insensitive and
 *          ignore trailing periods.  An empty host or domain never matches.
 */
bool HostMatchesDomain(const std::string &host, const std::string &domain_pattern);


/** \brief  Makes a URL safe for inclusion in log messages.
 *  \param  url         The URL, typically supplied by a user or a third party.
 *  \param  max_length  The maximum number of bytes that will be returned, not counting the trailing ellipsis.
 *  \return The URL with any query replaced by an ellipsis, without fragment and control whitespace, and truncated to
 *          "max_length" followed by an ellipsis, if necessary.
 */
std::string SanitizeUrlForLogging(const std::string &url, const size_t max_length = 200);


} // namespace UrlUtil


#endif // ifndef URL_UTIL_H
