/** \file    UrlUtil.cc
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

#include "UrlUtil.h"
#include "StringUtil.h"
#include "Url.h"


namespace UrlUtil {


std::string NormalizeDomainName(const std::string &domain_name) {
    std::string normalized_domain_name(StringUtil::ToLower(StringUtil::TrimWhite(domain_name)));
    StringUtil::RightTrim('.', &normalized_domain_name);
    return normalized_domain_name;
}


bool HostMatchesDomain(const std::string &host, const std::string &domain_pattern) {
    const std::string normalized_host(NormalizeDomainName(host));
    if (normalized_host.empty())
        return false;

    std::string domain(NormalizeDomainName(domain_pattern));
    if (StringUtil::StartsWith(domain, "*."))
        domain = domain.substr(2);
    if (domain.empty())
        return false;

    return normalized_host == domain or StringUtil::EndsWith(normalized_host, "." + domain);
}


namespace {


const std::string ELLIPSIS("\xE2\x80\xA6"); // U+2026


// Replaces runs of whitespace by single spaces and removes leading and trailing whitespace.
std::string CollapseWhitespace(const std::string &s) {
    std::string collapsed;
    bool last_was_space(false);
    for (const char ch : s) {
        if (StringUtil::IsWhitespace(ch)) {
            if (not last_was_space and not collapsed.empty())
                collapsed += ' ';
            last_was_space = true;
        } else {
            collapsed += ch;
            last_was_space = false;
        }
    }

    if (not collapsed.empty() and collapsed.back() == ' ')
        collapsed.resize(collapsed.size() - 1);

    return collapsed;
}


inline bool IsUTF8ContinuationByte(const char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0u) == 0x80u;
}


} // unnamed namespace


std::string SanitizeUrlForLogging(const std::string &url, const size_t max_length) {
    std::string sanitized_url(CollapseWhitespace(url));

    const Url parsed_url(sanitized_url);
    if (parsed_url.isAbsolute() and not parsed_url.getAuthority().empty())
        sanitized_url = Url::MakeUrl(parsed_url.getScheme(), parsed_url.getAuthority(), parsed_url.getPath(),
                                     parsed_url.hasQuery() ? ELLIPSIS : "", /* fragment = */ "");

    if (sanitized_url.length() <= max_length)
        return sanitized_url;

    // Never cut a multibyte UTF-8 sequence in half:
    size_t cut_pos(max_length);
    while (cut_pos > 0 and IsUTF8ContinuationByte(sanitized_url[cut_pos]))
        --cut_pos;
    sanitized_url.resize(cut_pos);
    StringUtil::RightTrim(' ', &sanitized_url);

    return sanitized_url + ELLIPSIS;
}


} // namespace UrlUtil
