/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
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
#include "TextUtil.h"
#include <stdexcept>
#include <clocale>
#include <cstdlib>
#include <cstring>
#include <cwctype>
#include <initializer_list>
#include <unistd.h>
#include "Compiler.h"
#include "StringUtil.h"


namespace {


// UTF8ToLower() relies on towlower(3) which only knows about non-ASCII letters in a UTF-8 LC_CTYPE.
__attribute__((constructor)) void InitializeLocale() {
    for (const char * const locale : { "en_US.UTF-8", "C.UTF-8" }) {
        if (std::setlocale(LC_CTYPE, locale) != nullptr)
            return;
    }

    const char * const error_message("in InitializeLocale: setlocale(3) failed for both en_US.UTF-8 and C.UTF-8!\n");
    const ssize_t dummy = ::write(STDERR_FILENO, error_message, std::strlen(error_message));
    (void)dummy;
    ::_exit(EXIT_FAILURE);
}


} // unnamed namespace


namespace TextUtil {


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFF) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFF) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points) {
    std::string utf8;
    for (const auto code_point : code_points)
        utf8 += UTF32ToUTF8(code_point);

    return utf8;
}


bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * utf32_chars) {
    utf32_chars->clear();
    utf32_chars->reserve(utf8_string.size());

    // The smallest code point that needs 1, 2 or 3 continuation bytes.  Anything less is an overlong encoding.
    static const uint32_t MIN_CODE_POINTS[] = { 0, 0x80u, 0x800u, 0x10000u };

    uint32_t utf32_char(0);
    int required_count(0), sequence_length(0);
    for (const char ch : utf8_string) {
        const unsigned char uch(static_cast<unsigned char>(ch));
        if (required_count == 0) {
            if ((uch & 0b10000000) == 0b00000000) {
                utf32_chars->emplace_back(uch);
                continue;
            } else if ((uch & 0b11100000) == 0b11000000) {
                utf32_char = uch & 0b11111;
                required_count = 1;
            } else if ((uch & 0b11110000) == 0b11100000) {
                utf32_char = uch & 0b1111;
                required_count = 2;
            } else if ((uch & 0b11111000) == 0b11110000) {
                utf32_char = uch & 0b111;
                required_count = 3;
            } else
                return false;
            sequence_length = required_count;
        } else {
            if (unlikely((uch & 0b11000000) != 0b10000000))
                return false;
            utf32_char = (utf32_char << 6u) | (uch & 0b00111111u);
            if (--required_count == 0) {
                if (unlikely(utf32_char < MIN_CODE_POINTS[sequence_length] or utf32_char > 0x10FFFFu
                             or (utf32_char >= 0xD800u and utf32_char <= 0xDFFFu)))
                    return false;
                utf32_chars->emplace_back(utf32_char);
            }
        }
    }

    return required_count == 0;
}


bool UTF8ToLower(const std::string &utf8_string, std::string * const lowercase_utf8_string) {
    std::vector<uint32_t> utf32_chars;
    if (not UTF8ToUTF32(utf8_string, &utf32_chars))
        return false;

    for (auto &utf32_char : utf32_chars) {
        if (utf32_char < 0x80u)
            utf32_char = static_cast<uint32_t>(std::tolower(static_cast<int>(utf32_char)));
        else
            utf32_char = static_cast<uint32_t>(std::towlower(static_cast<wint_t>(utf32_char)));
    }

    *lowercase_utf8_string = UTF32ToUTF8(utf32_chars);
    return true;
}


std::string UTF8ToLower(std::string * const utf8_string) {
    std::string converted_string;
    if (unlikely(not UTF8ToLower(*utf8_string, &converted_string)))
        throw std::runtime_error("in TextUtil::UTF8ToLower: failed to convert a string to lowercase!");

    utf8_string->swap(converted_string);
    return *utf8_string;
}


size_t CodePointCount(const std::string &utf8_string) {
    std::vector<uint32_t> utf32_chars;
    if (not UTF8ToUTF32(utf8_string, &utf32_chars))
        return utf8_string.size();
    return utf32_chars.size();
}


bool IsWhitespace(const uint32_t code_point) {
    switch (code_point) {
    case 0x0009: // CHARACTER TABULATION
    case 0x000A: // LINE FEED
    case 0x000B: // LINE TABULATION
    case 0x000C: // FORM FEED
    case 0x000D: // CARRIAGE RETURN
    case 0x0020: // SPACE
    case 0x0085: // NEXT LINE
    case 0x00A0: // NO-BREAK SPACE
    case 0x1680: // OGHAM SPACE MARK
    case 0x2028: // LINE SEPARATOR
    case 0x2029: // PARAGRAPH SEPARATOR
    case 0x202F: // NARROW NO-BREAK SPACE
    case 0x205F: // MEDIUM MATHEMATICAL SPACE
    case 0x3000: // IDEOGRAPHIC SPACE
        return true;
    default:
        return code_point >= 0x2000 and code_point <= 0x200A; // EN QUAD .. HAIR SPACE
    }
}


bool IsCJKCodePoint(const uint32_t code_point) {
    return (code_point >= 0x3000 and code_point <= 0x303F)     // CJK Symbols and Punctuation
           or (code_point >= 0x3040 and code_point <= 0x30FF)  // Hiragana and Katakana
           or (code_point >= 0x31F0 and code_point <= 0x31FF)  // Katakana Phonetic Extensions
           or (code_point >= 0x3400 and code_point <= 0x4DBF)  // CJK Unified Ideographs Extension A
           or (code_point >= 0x4E00 and code_point <= 0x9FFF)  // CJK Unified Ideographs
           or (code_point >= 0xAC00 and code_point <= 0xD7AF)  // Hangul Syllables
           or (code_point >= 0xF900 and code_point <= 0xFAFF)  // CJK Compatibility Ideographs
           or (code_point >= 0xFF00 and code_point <= 0xFFEF)  // Halfwidth and Fullwidth Forms
           or (code_point >= 0x20000 and code_point <= 0x2FA1F); // Supplementary Ideographic Plane
}


bool ContainsCJK(const std::string &utf8_string) {
    std::vector<uint32_t> utf32_chars;
    if (not UTF8ToUTF32(utf8_string, &utf32_chars))
        return false;

    for (const auto utf32_char : utf32_chars) {
        if (IsCJKCodePoint(utf32_char))
            return true;
    }

    return false;
}


std::string &CollapseAndTrimWhitespace(std::string * const utf8_string) {
    std::vector<uint32_t> utf32_chars;
    if (unlikely(not UTF8ToUTF32(*utf8_string, &utf32_chars))) {
        // Not valid UTF-8 => treat it as Latin-1.
        utf32_chars.clear();
        for (const char ch : *utf8_string)
            utf32_chars.emplace_back(static_cast<unsigned char>(ch));
    }

    std::string collapsed_string;
    bool last_char_was_whitespace(true);
    for (const auto utf32_char : utf32_chars) {
        if (IsWhitespace(utf32_char)) {
            if (not last_char_was_whitespace)
                collapsed_string += ' ';
            last_char_was_whitespace = true;
        } else {
            collapsed_string += UTF32ToUTF8(utf32_char);
            last_char_was_whitespace = false;
        }
    }

    // String ends with a space? => Remove it!
    if (not collapsed_string.empty() and collapsed_string.back() == ' ')
        collapsed_string.resize(collapsed_string.size() - 1);

    utf8_string->swap(collapsed_string);
    return *utf8_string;
}


} // namespace TextUtil
