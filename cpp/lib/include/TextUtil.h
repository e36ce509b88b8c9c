/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen.
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
#include <vector>
#include <cstdint>


namespace TextUtil {


/** Converts UTF-32 a.k.a. UCS-4 to UTF-8. */
std::string UTF32ToUTF8(const uint32_t code_point);
std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points);


/** \brief Attempts to convert "utf8_string" to a sequence of UTF32 code points.
 *  \return True if the conversion succeeded and false if "utf8_string" was an invalid UTF8 sequence.
 *  \note   Overlong encodings, surrogates and code points above U+10FFFF are invalid.
 */
bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * utf32_chars);


/** \brief Converts a UTF8 string to lowercase.
 *  \return True if no character set conversion error occurred, o/w false.
 *  \note   Non-ASCII code points are lowercased according to the current C locale (LC_CTYPE).
 */
bool UTF8ToLower(const std::string &utf8_string, std::string * const lowercase_utf8_string);


/** \brief Converts a UTF8 string to lowercase.
 *  \return The converted string.
 *  \note   Throws an exception if an error occurred.
 */
std::string UTF8ToLower(std::string * const utf8_string);


/** \return The number of Unicode code points in "utf8_string" or the number of bytes if it is not valid UTF-8. */
size_t CodePointCount(const std::string &utf8_string);


/** \brief Unicode whitespace test. */
bool IsWhitespace(const uint32_t code_point);


/** \brief Returns true for CJK ideographs, kana, hangul and CJK punctuation/full-width forms. */
bool IsCJKCodePoint(const uint32_t code_point);


/** \brief Returns true if any code point of "utf8_string" satisfies IsCJKCodePoint(). */
bool ContainsCJK(const std::string &utf8_string);


/** \brief Replaces runs of whitespace with a single space and removes leading and trailing whitespace.
 *  \return A reference to the modified string "*utf8_string".
 *  \note   If "*utf8_string" is not valid UTF-8 it is assumed to be Latin-1 encoded and will be converted to UTF-8.
 */
std::string &CollapseAndTrimWhitespace(std::string * const utf8_string);


inline std::string CollapseAndTrimWhitespace(const std::string &utf8_string) {
    std::string temp_utf8_string(utf8_string);
    return CollapseAndTrimWhitespace(&temp_utf8_string);
}


} // namespace TextUtil
