/** \file    HttpHeader.h
 *  \brief   Definition of class HttpHeader.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
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
#pragma once


#include <string>


/** \class  HttpHeader
 *  \brief  The status line and selected fields of a single HTTP response header.
 */
class HttpHeader {
    unsigned status_code_;
    size_t content_length_;
    bool has_content_length_;
    std::string content_type_, location_, status_line_;
    bool is_valid_;
public:
    HttpHeader(): status_code_(0), content_length_(0), has_content_length_(false), is_valid_(false) { }

    /** \brief  Parses a header block, i.e. a status line followed by "Name: value" lines.
     *  \note   Header names are matched case-insensitively and lines may end in "\r\n" or "\n".
     */
    explicit HttpHeader(const std::string &header);

    bool isValid() const { return is_valid_; }

    inline unsigned getStatusCode() const { return status_code_; }
    const std::string &getStatusLine() const { return status_line_; }

    /** \return True for the statuses 301, 302, 303, 307 and 308. */
    bool isRedirect() const;

    /** \return True for the statuses 200 to 299. */
    bool isSuccess() const { return status_code_ >= 200 and status_code_ <= 299; }

    /** \return False if there was no Content-Length header or its value was not a number. */
    bool hasContentLength() const { return has_content_length_; }
    size_t getContentLength() const { return content_length_; }

    /** \return The verbatim (trimmed) Content-Type, which may include parameters like "charset". */
    const std::string &getContentType() const { return content_type_; }

    /** \brief   Get the media type (a.k.a. mime type) of the body from the Content-Type header.
     *  \return  The lowercased part of the Content-Type before any parameters, or an empty string if there was none.
     */
    std::string getMediaType() const { return SimplifyContentType(content_type_); }

    const std::string &getLocation() const { return location_; }

    /** \brief Strips parameters and whitespace from a Content-Type value and lowercases what remains. */
    static std::string SimplifyContentType(const std::string &content_type);
};
