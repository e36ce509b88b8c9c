/** \file    HtmlUtil.cc
 *  \brief   Implementation of HTML-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2016-2024 Universitätsbibliothek Tübingen.
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

#include "HtmlUtil.h"
#include <unordered_map>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include "Compiler.h"
#include "RegexMatcher.h"
#include "TextUtil.h"


namespace HtmlUtil {


namespace {


const std::unordered_map<std::string, uint32_t> entity_name_to_code_point_map{
    { "quot",   0x0022 },
    { "amp",    0x0026 },
    { "apos",   0x0027 },
    { "lt",     0x003C },
    { "gt",     0x003E },
    { "nbsp",   0x00A0 },
    { "iexcl",  0x00A1 },
    { "cent",   0x00A2 },
    { "pound",  0x00A3 },
    { "copy",   0x00A9 },
    { "laquo",  0x00AB },
    { "reg",    0x00AE },
    { "deg",    0x00B0 },
    { "middot", 0x00B7 },
    { "raquo",  0x00BB },
    { "iquest", 0x00BF },
    { "auml",   0x00E4 },
    { "ouml",   0x00F6 },
    { "uuml",   0x00FC },
    { "Auml",   0x00C4 },
    { "Ouml",   0x00D6 },
    { "Uuml",   0x00DC },
    { "szlig",  0x00DF },
    { "eacute", 0x00E9 },
    { "times",  0x00D7 },
    { "ndash",  0x2013 },
    { "mdash",  0x2014 },
    { "lsquo",  0x2018 },
    { "rsquo",  0x2019 },
    { "sbquo",  0x201A },
    { "ldquo",  0x201C },
    { "rdquo",  0x201D },
    { "bdquo",  0x201E },
    { "bull",   0x2022 },
    { "hellip", 0x2026 },
    { "euro",   0x20AC },
    { "trade",  0x2122 },
};


inline bool IsValidCodePoint(const unsigned long code_point) {
    return code_point != 0 and code_point <= 0x10FFFFul and (code_point < 0xD800ul or code_point > 0xDFFFul);
}


} // unnamed namespace


bool DecodeEntity(const std::string &entity, std::string * const utf8) {
    if (unlikely(entity.empty()))
        return false;

    // numeric entity?
    if (entity[0] == '#') { // Yes!
        const bool is_hex(entity.length() > 1 and (entity[1] == 'x' or entity[1] == 'X'));
        const std::string digits(entity.substr(is_hex ? 2 : 1));
        if (digits.empty())
            return false;

        for (const char ch : digits) {
            if (not (is_hex ? std::isxdigit(static_cast<unsigned char>(ch)) : std::isdigit(static_cast<unsigned char>(ch))))
                return false;
        }

        errno = 0;
        const unsigned long code_point(std::strtoul(digits.c_str(), nullptr, is_hex ? 16 : 10));
        if (errno != 0 or not IsValidCodePoint(code_point))
            return false;

        *utf8 = TextUtil::UTF32ToUTF8(static_cast<uint32_t>(code_point));
        return true;
    }

    const auto entity_name_and_code_point(entity_name_to_code_point_map.find(entity));
    if (entity_name_and_code_point == entity_name_to_code_point_map.cend())
        return false;

    *utf8 = TextUtil::UTF32ToUTF8(entity_name_and_code_point->second);
    return true;
}


std::string &ReplaceEntities(std::string * const s) {
    std::string result;
    result.reserve(s->size());

    std::string::size_type pos(0);
    while (pos < s->length()) {
        const char ch((*s)[pos]);
        if (ch != '&') {
            // A non-entity character:
            result += ch;
            ++pos;
            continue;
        }

        // The start of a possible entity:
        std::string::size_type entity_end(pos + 1);
        while (entity_end < s->length() and (std::isalnum(static_cast<unsigned char>((*s)[entity_end])) or (*s)[entity_end] == '#'))
            ++entity_end;

        std::string decoded_entity;
        if (entity_end < s->length() and (*s)[entity_end] == ';'
            and DecodeEntity(s->substr(pos + 1, entity_end - pos - 1), &decoded_entity))
        {
            result += decoded_entity;
            pos = entity_end + 1;
        } else {
            result += ch;
            ++pos;
        }
    }

    return *s = result;
}


std::string ExtractTitle(const std::string &html_document) {
    static const ThreadSafeRegexMatcher title_matcher("<title\\b[^>]*>(.*?)</title\\s*>",
                                                      ThreadSafeRegexMatcher::CASE_INSENSITIVE
                                                      | ThreadSafeRegexMatcher::DOT_MATCHES_NEWLINE);
    const auto match_result(title_matcher.match(html_document));
    if (not match_result)
        return "";

    std::string title(match_result[1]);
    return TextUtil::CollapseAndTrimWhitespace(&ReplaceEntities(&title));
}


std::string ExtractText(const std::string &html_document) {
    static const unsigned MATCHER_OPTIONS(ThreadSafeRegexMatcher::CASE_INSENSITIVE | ThreadSafeRegexMatcher::DOT_MATCHES_NEWLINE);
    static const ThreadSafeRegexMatcher comment_matcher("<!--.*?-->", MATCHER_OPTIONS);
    static const ThreadSafeRegexMatcher script_matcher("<script\\b[^>]*>.*?</script\\s*>", MATCHER_OPTIONS);
    static const ThreadSafeRegexMatcher style_matcher("<style\\b[^>]*>.*?</style\\s*>", MATCHER_OPTIONS);
    static const ThreadSafeRegexMatcher noscript_matcher("<noscript\\b[^>]*>.*?</noscript\\s*>", MATCHER_OPTIONS);
    static const ThreadSafeRegexMatcher tag_matcher("<[^>]*>", MATCHER_OPTIONS);

    std::string text(comment_matcher.replaceAll(html_document, " "));
    text = script_matcher.replaceAll(text, " ");
    text = style_matcher.replaceAll(text, " ");
    text = noscript_matcher.replaceAll(text, " ");
    text = tag_matcher.replaceAll(text, " ");

    return TextUtil::CollapseAndTrimWhitespace(&ReplaceEntities(&text));
}


} // namespace HtmlUtil
