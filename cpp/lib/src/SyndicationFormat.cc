/** \brief Interface of the SyndicationFormat class and descendents thereof.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
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

#include "SyndicationFormat.h"
#include <stdexcept>
#include "Compiler.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


SyndicationFormat::Item::Item(const std::string &title, const std::string &summary, const std::string &link,
                              const std::string &published)
    : title_(title), summary_(StringUtil::TrimWhite(summary)), link_(link), published_(StringUtil::TrimWhite(published))
{
    TextUtil::CollapseAndTrimWhitespace(&title_);
    TextUtil::CollapseAndTrimWhitespace(&link_);
}


void SyndicationFormat::iterator::operator++() {
    item_ = syndication_format_->getNextItem();
}


void SyndicationFormat::finish() {
    exhausted_ = true;
    while (xml_parser_->getNext(nullptr))
        /* Intentionally empty! */;
}


namespace {


// Consumes everything up to and including the closing tag that matches the opening tag "tag" which must just have been read.
// \return The concatenated character data of all descendants.
std::string ExtractText(XMLParser * const parser, const std::string &tag) {
    std::string extracted_text;
    unsigned depth(1);
    XMLParser::XMLPart part;
    while (parser->getNext(&part)) {
        if (part.isOpeningTag())
            ++depth;
        else if (part.isClosingTag()) {
            if (--depth == 0)
                return extracted_text;
        } else if (part.isCharacters())
            extracted_text += part.data_;
    }

    throw std::runtime_error("in ExtractText(SyndicationFormat.cc): closing \"" + tag + "\" tag not found!");
}


inline void SkipElement(XMLParser * const parser, const std::string &tag) {
    ExtractText(parser, tag);
}


// Handles the "item" elements of RSS 2.0 and RDF.  The opening "item" tag must just have been read.
std::unique_ptr<SyndicationFormat::Item> ParseRSSItem(XMLParser * const parser) {
    std::string title, description, link, pub_date, date;
    bool seen_title(false), seen_description(false), seen_link(false), seen_pub_date(false), seen_date(false);

    XMLParser::XMLPart part;
    while (parser->getNext(&part)) {
        if (part.isClosingTag())
            return std::unique_ptr<SyndicationFormat::Item>(
                new SyndicationFormat::Item(title, description, link, pub_date.empty() ? date : pub_date));
        if (not part.isOpeningTag())
            continue;

        // Only the first child element of each name counts:
        if (part.data_ == "title" and not seen_title) {
            title = ExtractText(parser, part.data_);
            seen_title = true;
        } else if (part.data_ == "description" and not seen_description) {
            description = ExtractText(parser, part.data_);
            seen_description = true;
        } else if (part.data_ == "link" and not seen_link) {
            link = ExtractText(parser, part.data_);
            seen_link = true;
        } else if (part.data_ == "pubDate" and not seen_pub_date) {
            pub_date = StringUtil::TrimWhite(ExtractText(parser, part.data_));
            seen_pub_date = true;
        } else if (part.data_ == "date" and not seen_date) {
            date = ExtractText(parser, part.data_);
            seen_date = true;
        } else
            SkipElement(parser, part.data_);
    }

    throw std::runtime_error("in ParseRSSItem(SyndicationFormat.cc): closing item tag not found!");
}


// The opening "entry" tag must just have been read.
std::unique_ptr<SyndicationFormat::Item> ParseAtomEntry(XMLParser * const parser) {
    std::string title, summary, content, link, updated, published;
    bool seen_title(false), seen_summary(false), seen_content(false), seen_updated(false), seen_published(false);

    XMLParser::XMLPart part;
    while (parser->getNext(&part)) {
        if (part.isClosingTag())
            return std::unique_ptr<SyndicationFormat::Item>(
                new SyndicationFormat::Item(title, summary.empty() ? content : summary, link, updated.empty() ? published : updated));
        if (not part.isOpeningTag())
            continue;

        if (part.data_ == "link") {
            // The first link with either a non-empty "href" attribute or non-empty text wins:
            const std::string text(StringUtil::TrimWhite(ExtractText(parser, part.data_)));
            if (link.empty()) {
                const auto href(part.attributes_.find("href"));
                if (href != part.attributes_.cend() and not StringUtil::TrimWhite(href->second).empty())
                    link = href->second;
                else
                    link = text;
            }
        } else if (part.data_ == "title" and not seen_title) {
            title = ExtractText(parser, part.data_);
            seen_title = true;
        } else if (part.data_ == "summary" and not seen_summary) {
            summary = StringUtil::TrimWhite(ExtractText(parser, part.data_));
            seen_summary = true;
        } else if (part.data_ == "content" and not seen_content) {
            content = ExtractText(parser, part.data_);
            seen_content = true;
        } else if (part.data_ == "updated" and not seen_updated) {
            updated = StringUtil::TrimWhite(ExtractText(parser, part.data_));
            seen_updated = true;
        } else if (part.data_ == "published" and not seen_published) {
            published = ExtractText(parser, part.data_);
            seen_published = true;
        } else
            SkipElement(parser, part.data_);
    }

    throw std::runtime_error("in ParseAtomEntry(SyndicationFormat.cc): closing entry tag not found!");
}


} // unnamed namespace


std::unique_ptr<SyndicationFormat> SyndicationFormat::Factory(const std::string &xml_document, std::string * const err_msg) {
    try {
        std::unique_ptr<XMLParser> xml_parser(new XMLParser(xml_document));
        XMLParser::XMLPart document_element;
        if (not xml_parser->skipTo(XMLParser::XMLPart::OPENING_TAG, {}, &document_element)) {
            *err_msg = "no document element found!";
            return nullptr;
        }

        const std::string root_name(StringUtil::ToLower(document_element.data_));
        if (root_name == "rss")
            return std::unique_ptr<SyndicationFormat>(new RSS20(std::move(xml_parser)));
        if (root_name == "feed")
            return std::unique_ptr<SyndicationFormat>(new Atom(std::move(xml_parser)));
        if (root_name == "rdf")
            return std::unique_ptr<SyndicationFormat>(new RDF(std::move(xml_parser)));

        *err_msg = "can't determine syndication format from document element \"" + document_element.data_ + "\"!";
        return nullptr;
    } catch (const std::runtime_error &x) {
        *err_msg = "Error while parsing syndication format: " + std::string(x.what());
        return nullptr;
    }
}


RSS20::RSS20(std::unique_ptr<XMLParser> xml_parser): SyndicationFormat(std::move(xml_parser)), in_channel_(false) {
    XMLParser::XMLPart part;
    while (xml_parser_->getNext(&part)) {
        if (part.isOpeningTag("channel")) {
            in_channel_ = true;
            return;
        }
        if (part.isOpeningTag())
            SkipElement(xml_parser_.get(), part.data_);
    }

    // A document without a channel simply has no items.
    exhausted_ = true;
}


std::unique_ptr<SyndicationFormat::Item> RSS20::getNextItem() {
    if (exhausted_)
        return nullptr;

    XMLParser::XMLPart part;
    while (xml_parser_->getNext(&part)) {
        if (part.isClosingTag("channel"))
            break;
        if (not part.isOpeningTag())
            continue;

        if (part.data_ == "item") {
            std::unique_ptr<Item> item(ParseRSSItem(xml_parser_.get()));
            if (not item->getLink().empty())
                return item;
            LOG_DEBUG("skipping RSS item \"" + item->getTitle() + "\" without a link");
        } else if (part.data_ == "title" and title_.empty())
            title_ = TextUtil::CollapseAndTrimWhitespace(ExtractText(xml_parser_.get(), part.data_));
        else if (part.data_ == "link" and link_.empty())
            link_ = StringUtil::TrimWhite(ExtractText(xml_parser_.get(), part.data_));
        else if (part.data_ == "description" and description_.empty())
            description_ = StringUtil::TrimWhite(ExtractText(xml_parser_.get(), part.data_));
        else
            SkipElement(xml_parser_.get(), part.data_);
    }

    in_channel_ = false;
    exhausted_ = true;
    return nullptr;
}


std::unique_ptr<SyndicationFormat::Item> Atom::getNextItem() {
    if (exhausted_)
        return nullptr;

    XMLParser::XMLPart part;
    while (xml_parser_->getNext(&part)) {
        if (part.isClosingTag())
            break;
        if (not part.isOpeningTag())
            continue;

        if (part.data_ == "entry") {
            std::unique_ptr<Item> item(ParseAtomEntry(xml_parser_.get()));
            if (not item->getLink().empty())
                return item;
            LOG_DEBUG("skipping Atom entry \"" + item->getTitle() + "\" without a link");
        } else if (part.data_ == "title" and title_.empty())
            title_ = TextUtil::CollapseAndTrimWhitespace(ExtractText(xml_parser_.get(), part.data_));
        else if (part.data_ == "link" and link_.empty()) {
            const auto href(part.attributes_.find("href"));
            if (href != part.attributes_.cend())
                link_ = href->second;
            SkipElement(xml_parser_.get(), part.data_);
        } else if (part.data_ == "subtitle" and description_.empty())
            description_ = StringUtil::TrimWhite(ExtractText(xml_parser_.get(), part.data_));
        else
            SkipElement(xml_parser_.get(), part.data_);
    }

    exhausted_ = true;
    return nullptr;
}


std::unique_ptr<SyndicationFormat::Item> RDF::getNextItem() {
    if (exhausted_)
        return nullptr;

    XMLParser::XMLPart part;
    while (xml_parser_->getNext(&part)) {
        if (part.isClosingTag())
            break;
        if (not part.isOpeningTag())
            continue;

        if (part.data_ == "item") {
            std::unique_ptr<Item> item(ParseRSSItem(xml_parser_.get()));
            if (not item->getLink().empty())
                return item;
            LOG_DEBUG("skipping RDF item \"" + item->getTitle() + "\" without a link");
        } else if (part.data_ == "channel" and title_.empty()) {
            const std::unique_ptr<Item> channel(ParseRSSItem(xml_parser_.get()));
            title_ = channel->getTitle();
            link_ = channel->getLink();
            description_ = channel->getSummary();
        } else
            SkipElement(xml_parser_.get(), part.data_);
    }

    exhausted_ = true;
    return nullptr;
}
