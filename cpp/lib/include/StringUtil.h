/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
 *  \author  Wagner Truppel
 *  \author  Walt Howard
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen
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

#ifndef STRING_UTIL_H
#define STRING_UTIL_H


#include <string>
#include <cctype>
#include <cstring>
#include <strings.h>


namespace StringUtil {


const std::string EmptyString;
// ASCII whitespace only.  In UTF-8 text a 0xA0 byte is a continuation byte, not a hard space.
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert a string to lowercase (modifies its argument).
 *  \note   Only ASCII letters are converted.  Use TextUtil::UTF8ToLower() for arbitrary UTF-8 text.
 */
std::string ToLower(std::string * const s);


/** \brief  Convert a string to lowercase (does not modify its agrument). */
inline std::string ToLower(const std::string &s)
{
        std::string temp_s(s);
        return ToLower(&temp_s);
}


/** \brief  Convert a string to uppercase (modifies its argument).  Only ASCII letters are converted. */
std::string ToUpper(std::string * const s);


/** \brief  Convert a string to uppercase (does not modify its agrument). */
inline std::string ToUpper(const std::string &s)
{
        std::string temp_s(s);
        return ToUpper(&temp_s);
}


/** \brief  Returns true if "ch" is an ASCII whitespace character.
 *  \note   Use TextUtil::IsWhitespace() for Unicode whitespace like the hard space U+00A0.
 */
inline bool IsWhitespace(const char ch)
{
        return std::isspace(static_cast<unsigned char>(ch));
}


/** \brief  Returns true if every character in "s" is a whitespace character. */
bool IsWhitespace(const std::string &s);


inline bool IsDigit(const char ch)
{
        return ch >= '0' and ch <= '9';
}


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &trim_set, const std::string &s)
{
        std::string temp_s(s);
        return Trim(trim_set, &temp_s);
}


/** \brief   Remove all occurences of a character from the end of a string. */
std::string RightTrim(const char trim_char, std::string * const s);


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(std::string * const s)
{
        return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s)
{
        std::string temp_s(s);
        return TrimWhite(&temp_s);
}


/** \brief   Convert a string into an unsigned number.
 *  \param   s     The string to convert.
 *  \param   n     Number that will hold the result.
 *  \param   base  The base of the string representation.
 *  \return  true if the conversion was successful, false otherwise.
 *  \note    Leading or trailing garbage, a leading sign and overflow all result in a failed conversion.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief   Convert a string into an unsigned long number.  Same rules as for ToUnsigned(). */
bool ToUnsignedLong(const std::string &s, unsigned long * const n, const unsigned base = 10);


/** \brief   Converts "true", "yes", "on" and "1" to true and "false", "no", "off" and "0" to false (case-insensitive).
 *  \return  False if "value" is not one of the recognised spellings, else true.
 */
bool ToBool(const std::string &value, bool * const b);


/** \brief  Split a string around any of a set of delimiter characters, then trim the component substrings.
 *  \param  s                     The string to split.
 *  \param  field_separators      A set of delimiter characters to split around.
 *  \param  trim_chars            The characters to trim from either end of each extracted word.
 *  \param  container             A string container to hold the parts (e.g. std::vector<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> unsigned SplitThenTrim(const std::string &s, const std::string &field_separators,
                                                              const std::string &trim_chars, InsertableContainer * const container,
                                                              const bool suppress_empty_words = true)
{
        container->clear();
        if (s.empty())
                return 0;

        unsigned count(0);
        std::string::size_type word_start(0);
        for (;;) {
                const std::string::size_type separator_pos(s.find_first_of(field_separators, word_start));
                std::string new_word(s.substr(word_start, separator_pos == std::string::npos ? std::string::npos : separator_pos - word_start));
                Trim(trim_chars, &new_word);
                if (not new_word.empty() or not suppress_empty_words) {
                        container->insert(container->end(), new_word);
                        ++count;
                }

                if (separator_pos == std::string::npos)
                        return count;
                word_start = separator_pos + 1;
        }
}


/** \brief  Split a string, then trim the component substrings' whitespace.
 *  \param  s                     The string to split.
 *  \param  field_separators      A set of delimiter characters to split around.
 *  \param  container             A string container to hold the parts (e.g. std::list<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const std::string &field_separators,
                                                                          InsertableContainer * const container, const bool suppress_empty_words = true)
{
        return SplitThenTrim(s, field_separators, WHITE_SPACE, container, suppress_empty_words);
}


template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                          InsertableContainer * const container, const bool suppress_empty_words = true)
{
        return SplitThenTrim(s, std::string(1, field_separator), WHITE_SPACE, container, suppress_empty_words);
}


/** \brief  Join a "list" of words to form a single string, typically a line.
 *  \param  source     The container of strings that are to be joined.
 *  \param  separator  The text to insert between the "source" elements.
 *  \return The joined string.
 */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator)
{
        std::string dest;
        for (auto entry(source.begin()); entry != source.end(); ++entry) {
                if (entry != source.begin())
                        dest += separator;
                dest += *entry;
        }

        return dest;
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false)
{
        return prefix.empty()
                or (s.length() >= prefix.length()
                    and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                         : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief   Does the given string end with the suggested suffix?
 *  \param   s            The string to test.
 *  \param   suffix       The suffix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or ends with the suffix "suffix."
 */
inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false)
{
        return suffix.empty() or (s.length() >= suffix.length()
               and (ignore_case
                    ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                    : (std::strncmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)));
}


/** Returns true if "s" ends with "possible_last_char", else returns false. */
inline bool EndsWith(const std::string &s, const char possible_last_char)
{
        return not s.empty() and s[s.length() - 1] == possible_last_char;
}


} // namespace StringUtil


#endif // ifndef STRING_UTIL_H
