/** \file    HttpHeader.cc
 *  \brief   Implementation of class HttpHeader.
 *  \author  Artur Kedzierski
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2024 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "HttpHeader.h"
#include <algorithm>
#include <list>
#include <cstdio>
#include <strings.h>
#include "StringUtil.h"


namespace {


// a Boolean predicate class
class StartsWith {
    std::string prefix_;
public:
    explicit StartsWith(const std::string &prefix): prefix_(prefix) { }
    bool operator()(const std::string &s) const { return ::strncasecmp(prefix_.c_str(), s.c_str(), prefix_.length()) == 0; }
};


// \return The trimmed value of the first header line starting with "name" (which includes the colon) or the empty string.
std::string GetFieldValue(const std::list<std::string> &lines, const std::string &name) {
    const auto line(std::find_if(lines.cbegin(), lines.cend(), StartsWith(name)));
    if (line == lines.cend())
        return "";
    return StringUtil::TrimWhite(line->substr(name.length()));
}


} // unnamed namespace


HttpHeader::HttpHeader(const std::string &header): status_code_(0), content_length_(0), has_content_length_(false), is_valid_(false) {
    // Some Web servers incorrectly use '\n' instead of '\r\n' so we split on either and drop the empty lines:
    std::list<std::string> lines;
    StringUtil::SplitThenTrim(header, "\r\n", "", &lines);
    if (lines.empty())
        return;

    // Read the status code from the first line (e.g. HTTP/1.1 200 OK):
    if (not StringUtil::StartsWith(lines.front(), "HTTP/"))
        return;
    if (std::sscanf(lines.front().c_str(), "HTTP/%*s %u", &status_code_) != 1)
        return;
    is_valid_ = true;

    const std::string::size_type first_space_pos(lines.front().find(' '));
    const std::string::size_type second_space_pos(lines.front().find(' ', first_space_pos + 1));
    if (second_space_pos != std::string::npos)
        status_line_ = lines.front().substr(second_space_pos + 1);

    const std::string content_length(GetFieldValue(lines, "Content-Length:"));
    unsigned long content_length_as_number;
    if (not content_length.empty() and StringUtil::IsDigit(content_length[0])
        and StringUtil::ToUnsignedLong(content_length, &content_length_as_number))
    {
        has_content_length_ = true;
        content_length_ = content_length_as_number;
    }

    content_type_ = GetFieldValue(lines, "Content-Type:");
    location_ = GetFieldValue(lines, "Location:");
}


bool HttpHeader::isRedirect() const {
    return status_code_ == 301 or status_code_ == 302 or status_code_ == 303 or status_code_ == 307 or status_code_ == 308;
}


std::string HttpHeader::SimplifyContentType(const std::string &content_type) {
    const std::string::size_type semicolon_pos(content_type.find(';'));
    return StringUtil::ToLower(StringUtil::TrimWhite(content_type.substr(0, semicolon_pos)));
}
