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
#pragma once


#include <memory>
#include <string>
#include "XMLParser.h"


/** \class  SyndicationFormat
 *  \brief  Base class for the supported feed formats.  Items are parsed lazily while iterating.
 *
 *  Element names are compared without namespace prefixes.  Items without a link are skipped.
 */
class SyndicationFormat {
public:
    class Item {
        std::string title_;
        std::string summary_;
        std::string link_;
        std::string published_;
    public:
        Item(const std::string &title, const std::string &summary, const std::string &link, const std::string &published);

        inline const std::string &getTitle() const { return title_; }
        inline const std::string &getSummary() const { return summary_; }
        inline const std::string &getLink() const { return link_; }

        /** \return The publication or update timestamp as found in the feed, e.g. an RFC 822 or RFC 3339 string. */
        inline const std::string &getPublished() const { return published_; }
    };

    class iterator final {
        friend class SyndicationFormat;
        SyndicationFormat *syndication_format_;
        std::unique_ptr<Item> item_;
    private:
        explicit iterator(SyndicationFormat *syndication_format)
            : syndication_format_(syndication_format), item_(syndication_format_->getNextItem()) { }
        iterator(): syndication_format_(nullptr) { }
    public:
        iterator(iterator &&rhs): syndication_format_(rhs.syndication_format_), item_(rhs.item_.release())
            { rhs.syndication_format_ = nullptr; }

        /** \throws XMLParser::Error or std::runtime_error if the rest of the document is malformed. */
        void operator++();
        inline const Item &operator*() const { return *item_; }
        inline const Item *operator->() const { return item_.get(); }

        // Only the end of the item sequence compares equal to an end iterator.
        inline bool operator==(const iterator &rhs) const { return item_ == nullptr and rhs.item_ == nullptr; }
        inline bool operator!=(const iterator &rhs) const { return not operator==(rhs); }
    };

protected:
    std::unique_ptr<XMLParser> xml_parser_;
    std::string title_, link_, description_;
    bool exhausted_;
protected:
    // \note "xml_parser" must be positioned directly after the opening tag of the document element.
    explicit SyndicationFormat(std::unique_ptr<XMLParser> xml_parser): xml_parser_(std::move(xml_parser)), exhausted_(false) { }
public:
    virtual ~SyndicationFormat() = default;

    virtual std::string getFormatName() const = 0;

    /** \note The channel metadata is only complete once all items have been read. */
    inline const std::string &getTitle() const { return title_; }
    inline const std::string &getLink() const { return link_; }
    inline const std::string &getDescription() const { return description_; }

    inline iterator begin() { return iterator(this); }
    inline iterator end() { return iterator(); }

    /** \brief  Parses whatever follows the last item up to the end of the document.
     *  \throws XMLParser::Error if the document is truncated or anything but comments and processing instructions follow
     *          the document element.
     */
    void finish();

    /** \brief Detects the format from the name of the document element: "rss", "feed" (Atom) or "RDF" (RSS 1.0).
     *  \return An instance of a subclass of SyndicationFormat on success or a nullptr upon failure.
     */
    static std::unique_ptr<SyndicationFormat> Factory(const std::string &xml_document, std::string * const err_msg);
protected:
    // \return The next item that has a link, or nullptr at the end of the document.
    virtual std::unique_ptr<Item> getNextItem() = 0;
};


class RSS20 final : public SyndicationFormat {
    bool in_channel_;
public:
    explicit RSS20(std::unique_ptr<XMLParser> xml_parser);
    virtual ~RSS20() final { }

    virtual std::string getFormatName() const override { return "RSS"; }
protected:
    virtual std::unique_ptr<Item> getNextItem() override;
};


class Atom final : public SyndicationFormat {
public:
    explicit Atom(std::unique_ptr<XMLParser> xml_parser): SyndicationFormat(std::move(xml_parser)) { }
    virtual ~Atom() final { }

    virtual std::string getFormatName() const override { return "Atom"; }
protected:
    virtual std::unique_ptr<Item> getNextItem() override;
};


class RDF final : public SyndicationFormat {
public:
    explicit RDF(std::unique_ptr<XMLParser> xml_parser): SyndicationFormat(std::move(xml_parser)) { }
    virtual ~RDF() final { }

    virtual std::string getFormatName() const override { return "RDF"; }
protected:
    virtual std::unique_ptr<Item> getNextItem() override;
};
