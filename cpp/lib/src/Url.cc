/** \file    Url.cc
 *  \brief   Implementation of class Url.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2008 Project iVia.
 *  Copyright 2003-2008 The Regents of The University of California.
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

#include "Url.h"
#include <cctype>
#include "Compiler.h"
#include "StringUtil.h"


Url::Url(const std::string &url)
    : url_(url), is_valid_(false), has_authority_(false), has_username_password_(false), has_query_(false), has_fragment_(false),
      host_is_ipv6_literal_(false)
{
    is_valid_ = parse();
}


namespace {


bool IsSchemeChar(const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) or ch == '+' or ch == '-' or ch == '.';
}


bool ContainsControlCharsOrBlanks(const std::string &s) {
    for (const char ch : s) {
        const unsigned char uch(static_cast<unsigned char>(ch));
        if (uch <= 0x20u or uch == 0x7Fu)
            return true;
    }

    return false;
}


} // unnamed namespace


bool Url::parse() {
    if (unlikely(url_.empty() or ContainsControlCharsOrBlanks(url_)))
        return false;

    // Scheme:
    std::string::size_type pos(0);
    if (std::isalpha(static_cast<unsigned char>(url_[0]))) {
        while (pos < url_.length() and IsSchemeChar(url_[pos]))
            ++pos;
        if (pos < url_.length() and url_[pos] == ':') {
            scheme_ = StringUtil::ToLower(url_.substr(0, pos));
            ++pos;
        } else
            pos = 0;
    }

    // Authority:
    if (url_.compare(pos, 2, "//") == 0) {
        has_authority_ = true;
        const std::string::size_type authority_start(pos + 2);
        const std::string::size_type authority_end(url_.find_first_of("/?#", authority_start));
        authority_ = url_.substr(authority_start, authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);
        pos = authority_end == std::string::npos ? url_.length() : authority_end;

        std::string host_and_port(authority_);
        const std::string::size_type at_sign_pos(authority_.rfind('@'));
        if (at_sign_pos != std::string::npos) {
            has_username_password_ = true;
            username_password_ = authority_.substr(0, at_sign_pos);
            host_and_port = authority_.substr(at_sign_pos + 1);
        }

        std::string::size_type port_colon_pos;
        if (not host_and_port.empty() and host_and_port[0] == '[') {
            const std::string::size_type closing_bracket_pos(host_and_port.find(']'));
            if (closing_bracket_pos == std::string::npos)
                return false;
            host_ = host_and_port.substr(1, closing_bracket_pos - 1);
            host_is_ipv6_literal_ = true;
            if (closing_bracket_pos + 1 < host_and_port.length() and host_and_port[closing_bracket_pos + 1] != ':')
                return false;
            port_colon_pos = closing_bracket_pos + 1 < host_and_port.length() ? closing_bracket_pos + 1 : std::string::npos;
        } else {
            port_colon_pos = host_and_port.rfind(':');
            host_ = host_and_port.substr(0, port_colon_pos);
        }

        if (port_colon_pos != std::string::npos) {
            port_ = host_and_port.substr(port_colon_pos + 1);
            unsigned port_number;
            if (not port_.empty()
                and (not StringUtil::IsDigit(port_[0]) or not StringUtil::ToUnsigned(port_, &port_number) or port_number > 65535))
                return false;
        }

        StringUtil::ToLower(&host_);
    }

    // Path, query and fragment:
    const std::string::size_type path_end(url_.find_first_of("?#", pos));
    path_ = url_.substr(pos, path_end == std::string::npos ? std::string::npos : path_end - pos);
    if (path_end == std::string::npos)
        return true;

    pos = path_end;
    if (url_[pos] == '?') {
        has_query_ = true;
        const std::string::size_type hash_pos(url_.find('#', pos + 1));
        query_ = url_.substr(pos + 1, hash_pos == std::string::npos ? std::string::npos : hash_pos - pos - 1);
        if (hash_pos == std::string::npos)
            return true;
        pos = hash_pos;
    }

    has_fragment_ = true;
    fragment_ = url_.substr(pos + 1);

    return true;
}


unsigned short Url::getPortNumber() const {
    unsigned port_number;
    if (not port_.empty() and StringUtil::ToUnsigned(port_, &port_number))
        return static_cast<unsigned short>(port_number);

    if (scheme_ == "https")
        return 443;
    if (scheme_ == "http")
        return 80;
    return 0;
}


namespace {


void RemoveLastSegment(std::string * const output) {
    const std::string::size_type last_slash_pos(output->rfind('/'));
    output->resize(last_slash_pos == std::string::npos ? 0 : last_slash_pos);
}


// See RFC 3986, section 5.2.4.
std::string RemoveDotSegments(std::string input) {
    std::string output;
    while (not input.empty()) {
        if (StringUtil::StartsWith(input, "../"))
            input.erase(0, 3);
        else if (StringUtil::StartsWith(input, "./"))
            input.erase(0, 2);
        else if (StringUtil::StartsWith(input, "/./"))
            input.replace(0, 3, "/");
        else if (input == "/.")
            input = "/";
        else if (StringUtil::StartsWith(input, "/../")) {
            input.replace(0, 4, "/");
            RemoveLastSegment(&output);
        } else if (input == "/..") {
            input = "/";
            RemoveLastSegment(&output);
        } else if (input == "." or input == "..")
            input.clear();
        else {
            const std::string::size_type next_slash_pos(input.find('/', input[0] == '/' ? 1 : 0));
            if (next_slash_pos == std::string::npos) {
                output += input;
                input.clear();
            } else {
                output += input.substr(0, next_slash_pos);
                input.erase(0, next_slash_pos);
            }
        }
    }

    return output;
}


// See RFC 3986, section 5.2.3.
std::string MergePaths(const Url &base_url, const std::string &relative_path) {
    if (base_url.hasAuthority() and base_url.getPath().empty())
        return "/" + relative_path;

    const std::string::size_type last_slash_pos(base_url.getPath().rfind('/'));
    if (last_slash_pos == std::string::npos)
        return relative_path;
    return base_url.getPath().substr(0, last_slash_pos + 1) + relative_path;
}


} // unnamed namespace


bool Url::makeAbsolute(const std::string &reference, std::string * const absolute_url) const {
    if (unlikely(not isAbsolute()))
        return false;

    const Url reference_url(reference);
    if (not reference_url.isValid())
        return false;

    if (reference_url.isAbsolute()) {
        *absolute_url = reference;
        return true;
    }

    if (reference_url.hasAuthority()) {
        *absolute_url = scheme_ + ":" + reference;
        return true;
    }

    std::string path, query;
    if (reference_url.getPath().empty()) {
        path = path_;
        query = reference_url.hasQuery() ? reference_url.getQuery() : query_;
    } else {
        if (reference_url.getPath()[0] == '/')
            path = RemoveDotSegments(reference_url.getPath());
        else
            path = RemoveDotSegments(MergePaths(*this, reference_url.getPath()));
        query = reference_url.getQuery();
    }

    *absolute_url = (has_authority_ ? scheme_ + "://" + authority_ : scheme_ + ":") + path;
    if (not query.empty())
        *absolute_url += "?" + query;
    if (reference_url.hasFragment())
        *absolute_url += "#" + reference_url.getFragment();

    return true;
}


std::string Url::MakeUrl(const std::string &scheme, const std::string &authority, const std::string &path, const std::string &query,
                         const std::string &fragment)
{
    std::string url;
    if (not scheme.empty())
        url += scheme + ":";
    if (not authority.empty())
        url += "//" + authority;
    url += path;
    if (not query.empty())
        url += "?" + query;
    if (not fragment.empty())
        url += "#" + fragment;

    return url;
}
