/** \file    HtmlUtil.h
 *  \brief   Declarations of HTML-related utility functions.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
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

#ifndef HTML_UTIL_H
#define HTML_UTIL_H


#include <string>


namespace HtmlUtil {


/** \brief  Decodes an HTML entity.
 *  \param  entity  The entity without the leading ampersand and the trailing semicolon, e.g. "amp" or "#x263A".
 *  \param  utf8    Where to store the UTF-8 encoded replacement text.
 *  \return True if "entity" was a numeric entity or a named entity that we know about, else false.
 */
bool DecodeEntity(const std::string &entity, std::string * const utf8);


/** \brief  Replaces all HTML entities in "s" with their UTF-8 equivalents.
 *  \note   Unknown or unterminated entities are left alone.
 */
std::string &ReplaceEntities(std::string * const s);


inline std::string ReplaceEntities(const std::string &s) {
    std::string temp_s(s);
    return ReplaceEntities(&temp_s);
}


/** \return The decoded and whitespace-normalised contents of the first <title> element or the empty string. */
std::string ExtractTitle(const std::string &html_document);


/** \brief  Converts an HTML document to plain text.
 *  \note   Comments as well as <script>, <style> and <noscript> elements are dropped, all other tags are replaced with
 *          spaces, entities are decoded and runs of whitespace are collapsed.
 */
std::string ExtractText(const std::string &html_document);


} // namespace HtmlUtil


#endif // ifndef HTML_UTIL_H
