/** \file   XMLParser.cc
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
#include "XMLParser.h"
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/TransService.hpp>
#include <xercesc/util/XMLString.hpp>
#include "Compiler.h"
#include "StringUtil.h"


const XMLParser::Options XMLParser::DEFAULT_OPTIONS{
    /* ignore_whitespace_ = */ true,
    /* strip_namespace_prefixes_ = */ true,
    /* entity_expansion_limit_ = */ 1000,
};


void XMLParser::ConvertAndThrowException(const xercesc::SAXParseException &exc) {
    throw XMLParser::Error("Xerces SAXParseException on line " + std::to_string(exc.getLineNumber()) + ": "
                           + ToStdString(exc.getMessage()));
}


void XMLParser::ConvertAndThrowException(const xercesc::XMLException &exc) {
    throw XMLParser::Error("Xerces XMLException on line " + std::to_string(exc.getSrcLine()) + ": " + ToStdString(exc.getMessage()));
}


std::string XMLParser::ToStdString(const XMLCh * const xmlch) {
    return ToStdString(xmlch, xercesc::XMLString::stringLen(xmlch));
}


std::string XMLParser::ToStdString(const XMLCh * const xmlch, const XMLSize_t length) {
    if (xmlch == nullptr or length == 0)
        return "";

    const xercesc::TranscodeToStr utf8(xmlch, length, "UTF-8");
    return std::string(reinterpret_cast<const char *>(utf8.str()), utf8.length());
}


std::string XMLParser::toElementName(const XMLCh * const name) const {
    const std::string qualified_name(ToStdString(name));
    if (not options_.strip_namespace_prefixes_)
        return qualified_name;

    const std::string::size_type colon_pos(qualified_name.rfind(':'));
    return colon_pos == std::string::npos ? qualified_name : qualified_name.substr(colon_pos + 1);
}


void XMLParser::Handler::startElement(const XMLCh * const name, xercesc::AttributeList &attributes) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::OPENING_TAG;
    xml_part.data_ = parser_->toElementName(name);
    for (XMLSize_t i(0); i < attributes.getLength(); ++i)
        xml_part.attributes_[XMLParser::ToStdString(attributes.getName(i))] = XMLParser::ToStdString(attributes.getValue(i));

    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::endElement(const XMLCh * const name) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CLOSING_TAG;
    xml_part.data_ = parser_->toElementName(name);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::characters(const XMLCh * const chars, const XMLSize_t length) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CHARACTERS;
    xml_part.data_ = XMLParser::ToStdString(chars, length);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) {
    characters(chars, length);
}


// Every external entity, including the external DTD subset, resolves to an empty document.
xercesc::InputSource *XMLParser::Handler::resolveEntity(const XMLCh * const /*public_id*/, const XMLCh * const system_id) {
    LOG_DEBUG("refusing to load external entity \"" + XMLParser::ToStdString(system_id) + "\"");
    return new xercesc::MemBufInputSource(reinterpret_cast<const XMLByte *>(""), 0, "external entity (suppressed)");
}


XMLParser::XMLParser(const std::string &xml_string, const Options &options)
    : xml_string_(xml_string), options_(options), prolog_parsing_done_(false), body_has_more_contents_(false)
{
    // Reference counted by Xerces, so every parser can do its own setup and teardown.
    xercesc::XMLPlatformUtils::Initialize();

    parser_ = new xercesc::SAXParser();

    handler_ = new XMLParser::Handler();
    handler_->parser_ = this;
    parser_->setDocumentHandler(handler_);
    parser_->setEntityResolver(handler_);

    error_handler_ = new XMLParser::ErrorHandler();
    parser_->setErrorHandler(error_handler_);

    security_manager_ = new xercesc::SecurityManager();
    security_manager_->setEntityExpansionLimit(options_.entity_expansion_limit_);
    parser_->setSecurityManager(security_manager_);

    parser_->setValidationScheme(xercesc::SAXParser::Val_Never);
    parser_->setDoNamespaces(false);
    parser_->setDoSchema(false);
    parser_->setLoadExternalDTD(false);

    input_source_ = new xercesc::MemBufInputSource(reinterpret_cast<const XMLByte *>(xml_string_.data()), xml_string_.size(),
                                                   "xml_string (in memory)");
}


XMLParser::~XMLParser() {
    delete parser_;
    delete input_source_;
    delete security_manager_;
    delete handler_;
    delete error_handler_;

    xercesc::XMLPlatformUtils::Terminate();
}


bool XMLParser::peek(XMLPart * const xml_part) {
    if (getNext(xml_part)) {
        buffer_.emplace_front(*xml_part);
        return true;
    } else
        return false;
}


bool XMLParser::getNext(XMLPart * const next, const bool combine_consecutive_characters) {
    try {
        if (not prolog_parsing_done_) {
            body_has_more_contents_ = parser_->parseFirst(*input_source_, token_);
            if (not body_has_more_contents_)
                throw XMLParser::Error("error parsing document header!");
            prolog_parsing_done_ = true;
        }

        while (buffer_.empty() and body_has_more_contents_)
            body_has_more_contents_ = parser_->parseNext(token_);

        if (not buffer_.empty()) {
            if (next != nullptr)
                *next = buffer_.front();
            buffer_.pop_front();
            if (next != nullptr and next->type_ == XMLPart::CHARACTERS and combine_consecutive_characters) {
                XMLPart peek;
                while (getNext(&peek, /* combine_consecutive_characters = */ false) and peek.type_ == XMLPart::CHARACTERS)
                    next->data_ += peek.data_;
                if (peek.type_ != XMLPart::CHARACTERS and peek.type_ != XMLPart::UNINITIALISED)
                    buffer_.emplace_front(peek);
            }

            if (options_.ignore_whitespace_ and combine_consecutive_characters and next != nullptr
                and next->type_ == XMLPart::CHARACTERS and StringUtil::IsWhitespace(next->data_))
                return getNext(next, combine_consecutive_characters);

            return true;
        }
    } catch (const xercesc::XMLException &exc) {
        ConvertAndThrowException(exc);
    }

    return false;
}


bool XMLParser::skipTo(const XMLPart::Type expected_type, const std::set<std::string> &expected_tags, XMLPart * const part) {
    if (unlikely(expected_type != XMLPart::OPENING_TAG and expected_type != XMLPart::CLOSING_TAG))
        throw XMLParser::Error("in XMLParser::skipTo: expected_type must be OPENING_TAG or CLOSING_TAG!");

    XMLPart xml_part;
    while (getNext(&xml_part)) {
        if (xml_part.type_ == expected_type
            and (expected_tags.empty() or expected_tags.find(xml_part.data_) != expected_tags.cend()))
        {
            if (part != nullptr)
                *part = xml_part;
            return true;
        }
    }

    return false;
}
