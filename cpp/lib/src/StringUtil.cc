/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 *  \author  Paul Vander Griend
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2002-2005 Dr. Johannes Ruscheinski.
 *  Copyright 2017-2024 Universitätsbibliothek Tübingen
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

#include "StringUtil.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include "Compiler.h"


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    return *s;
}


std::string ToUpper(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    return *s;
}


bool IsWhitespace(const std::string &s) {
    for (const char ch : s) {
        if (not IsWhitespace(ch))
            return false;
    }

    return true;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    const std::string::size_type first_pos(s->find_first_not_of(trim_set));
    if (first_pos == std::string::npos) {
        s->clear();
        return *s;
    }

    const std::string::size_type last_pos(s->find_last_not_of(trim_set));
    *s = s->substr(first_pos, last_pos - first_pos + 1);
    return *s;
}


std::string RightTrim(const char trim_char, std::string * const s) {
    std::string::size_type new_length(s->length());
    while (new_length > 0 and (*s)[new_length - 1] == trim_char)
        --new_length;
    s->resize(new_length);

    return *s;
}


// ToUnsignedLong -- convert a string to an unsigned long number.
//
bool ToUnsignedLong(const std::string &s, unsigned long * const n, const unsigned base) {
    if (unlikely(s.empty() or not std::isalnum(static_cast<unsigned char>(s[0]))))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, base));
    if (*end_ptr != '\0' or errno != 0)
        return false;

    *n = ul;
    return true;
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    unsigned long ul;
    if (not ToUnsignedLong(s, &ul, base) or ul > UINT_MAX)
        return false;

    *n = static_cast<unsigned>(ul);
    return true;
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0 or value == "1")
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0 or value == "0")
    {
        *b = false;
        return true;
    }

    return false;
}


} // namespace StringUtil
