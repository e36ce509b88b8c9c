/** \file   XMLParser.h
 *  \brief  Wrapper class for Xerces XML parser
 *  \author Mario Trojan (mario.trojan@uni-tuebingen.de)
 *
 *  \copyright 2018-2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <deque>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/framework/XMLPScanToken.hpp>
#include <xercesc/parsers/SAXParser.hpp>
#include <xercesc/sax/HandlerBase.hpp>
#include <xercesc/util/SecurityManager.hpp>
#include "util.h"


/** \class  XMLParser
 *  \brief  Progressive SAX parsing of an in-memory XML document.
 *
 *  External entities and DTDs are never loaded and entity expansion is limited so that untrusted documents can be parsed.
 */
class XMLParser final {
public:
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &message): std::runtime_error(message) { }
    };
    typedef std::map<std::string, std::string> Attributes;

    struct Options {
        /** \brief Defines if CHARACTERS that only contain whitespaces will be skipped (default true). */
        bool ignore_whitespace_;
        /** \brief Reduces element names like "atom:link" to their local part, here "link" (default true). */
        bool strip_namespace_prefixes_;
        /** \brief The maximum number of entity expansions in a document (default 1000). */
        unsigned entity_expansion_limit_;
    };

    static const Options DEFAULT_OPTIONS;

    struct XMLPart {
        enum Type { UNINITIALISED, OPENING_TAG, CLOSING_TAG, CHARACTERS };
        Type type_ = UNINITIALISED;
        std::string data_;
        Attributes attributes_;

        inline bool isOpeningTag() const { return type_ == OPENING_TAG; }
        inline bool isOpeningTag(const std::string &tag) const { return type_ == OPENING_TAG and data_ == tag; }
        inline bool isClosingTag() const { return type_ == CLOSING_TAG; }
        inline bool isClosingTag(const std::string &tag) const { return type_ == CLOSING_TAG and data_ == tag; }
        inline bool isCharacters() const { return type_ == CHARACTERS; }
    };

private:
    static void ConvertAndThrowException(const xercesc::SAXParseException &exc);
    static void ConvertAndThrowException(const xercesc::XMLException &exc);

    class Handler : public xercesc::HandlerBase {
        friend class XMLParser;
        XMLParser *parser_;
    public:
        void characters(const XMLCh * const chars, const XMLSize_t length) override;
        void endElement(const XMLCh * const name) override;
        void ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) override;
        void startElement(const XMLCh * const name, xercesc::AttributeList &attributes) override;
        xercesc::InputSource *resolveEntity(const XMLCh * const public_id, const XMLCh * const system_id) override;
    };

    class ErrorHandler : public xercesc::ErrorHandler {
    public:
        void warning(const xercesc::SAXParseException &exc) override { LOG_DEBUG(XMLParser::ToStdString(exc.getMessage())); }
        void error(const xercesc::SAXParseException &exc) override { LOG_DEBUG(XMLParser::ToStdString(exc.getMessage())); }
        void fatalError(const xercesc::SAXParseException &exc) override { XMLParser::ConvertAndThrowException(exc); }
        void resetErrors() override { }
    };

    const std::string xml_string_;
    const Options options_;
    xercesc::SAXParser *parser_;
    xercesc::SecurityManager *security_manager_;
    xercesc::MemBufInputSource *input_source_;
    xercesc::XMLPScanToken token_;
    Handler *handler_;
    ErrorHandler *error_handler_;
    bool prolog_parsing_done_;
    bool body_has_more_contents_;
    std::deque<XMLPart> buffer_;

    inline void appendToBuffer(const XMLPart &xml_part) { buffer_.emplace_back(xml_part); }
    std::string toElementName(const XMLCh * const name) const;

    friend class Handler;
public:
    /** \brief  Converts Xerces' internal string type to UTF-8. */
    static std::string ToStdString(const XMLCh * const xmlch);
    static std::string ToStdString(const XMLCh * const xmlch, const XMLSize_t length);

    /** \note  "xml_string" is copied, it need not outlive the parser. */
    explicit XMLParser(const std::string &xml_string, const Options &options = DEFAULT_OPTIONS);
    XMLParser(const XMLParser &) = delete;
    XMLParser &operator=(const XMLParser &) = delete;
    ~XMLParser();

    bool peek(XMLPart * const xml_part);

    /** \return true if there are more elements to parse, o/w false.
     *  \note   parsing is done in progressive mode, meaning that the document is
     *          still being parsed during consecutive getNext() calls.
     *  \throws XMLParser::Error
     */
    bool getNext(XMLPart * const next, const bool combine_consecutive_characters = true);

    /** \brief Skip forward until we encounter a certain opening or closing tag.
     *  \param expected_type  OPENING_TAG or CLOSING_TAG.
     *  \param expected_tags  The tag names we're looking for.  If empty, we return on any tag of "expected_type".
     *  \param part           If not NULL, the found XMLPart will be returned here.
     *  \return False if we encountered the end of the document before finding what we're looking for, else true.
     */
    bool skipTo(const XMLPart::Type expected_type, const std::set<std::string> &expected_tags = {}, XMLPart * const part = nullptr);
};
