/** \brief Test cases for SyndicationFormat
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include <vector>
#include "UnitTest.h"


namespace {


std::vector<SyndicationFormat::Item> ReadItems(const std::string &xml_document, std::string * const format_name = nullptr) {
    std::string err_msg;
    std::unique_ptr<SyndicationFormat> syndication_format(SyndicationFormat::Factory(xml_document, &err_msg));
    if (syndication_format == nullptr)
        throw std::runtime_error(err_msg);
    if (format_name != nullptr)
        *format_name = syndication_format->getFormatName();

    std::vector<SyndicationFormat::Item> items;
    for (const auto &item : *syndication_format)
        items.emplace_back(item);
    return items;
}


} // unnamed namespace


TEST(RSS20) {
    const std::string rss_document(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<rss version=\"2.0\" xmlns:dc=\"http://purl.org/dc/elements/1.1/\"><channel>"
        "<title>Example News</title><link>https://news.example.com/</link><description>All the news</description>"
        "<item><title>  Rust\n 1.80   released </title><link> https://news.example.com/rust </link>"
        "<description>The &lt;b&gt;new&lt;/b&gt; release</description><pubDate>Mon, 01 Jul 2024 10:00:00 GMT</pubDate></item>"
        "<item><title>No link</title><description>dropped</description></item>"
        "<item><title>Second</title><link>https://news.example.com/second</link><link>https://ignored.example.com/</link>"
        "<dc:date>2024-07-02T08:00:00Z</dc:date></item>"
        "</channel></rss>");

    std::string format_name;
    const auto items(ReadItems(rss_document, &format_name));
    CHECK_EQ(format_name, "RSS");
    CHECK_EQ(items.size(), 2u);

    CHECK_EQ(items[0].getTitle(), "Rust 1.80 released");
    CHECK_EQ(items[0].getLink(), "https://news.example.com/rust");
    CHECK_EQ(items[0].getSummary(), "The <b>new</b> release");
    CHECK_EQ(items[0].getPublished(), "Mon, 01 Jul 2024 10:00:00 GMT");

    CHECK_EQ(items[1].getTitle(), "Second");
    CHECK_EQ(items[1].getLink(), "https://news.example.com/second");
    CHECK_EQ(items[1].getSummary(), "");
    CHECK_EQ(items[1].getPublished(), "2024-07-02T08:00:00Z");
}


TEST(RSS20ChannelMetadata) {
    std::string err_msg;
    std::unique_ptr<SyndicationFormat> syndication_format(SyndicationFormat::Factory(
        "<rss><channel><title>  Example\tNews </title><link>https://news.example.com/</link>"
        "<description> About things </description><item><link>https://news.example.com/1</link></item></channel></rss>",
        &err_msg));
    CHECK_TRUE(syndication_format != nullptr);

    unsigned item_count(0);
    for (const auto &item : *syndication_format) {
        CHECK_EQ(item.getLink(), "https://news.example.com/1");
        ++item_count;
    }
    CHECK_EQ(item_count, 1u);
    CHECK_EQ(syndication_format->getTitle(), "Example News");
    CHECK_EQ(syndication_format->getLink(), "https://news.example.com/");
    CHECK_EQ(syndication_format->getDescription(), "About things");
}


TEST(Atom) {
    const std::string atom_document(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<feed xmlns=\"http://www.w3.org/2005/Atom\"><title>Example Blog</title>"
        "<link href=\"https://blog.example.com/\"/>"
        "<entry><title type=\"html\">First post</title><link rel=\"alternate\" href=\"https://blog.example.com/first\"/>"
        "<link rel=\"self\" href=\"https://blog.example.com/first.atom\"/>"
        "<summary> Short summary </summary><content>Long content</content>"
        "<published>2024-01-01T00:00:00Z</published><updated>2024-01-02T00:00:00Z</updated></entry>"
        "<entry><title>Second post</title><link href=\"\">https://blog.example.com/second</link>"
        "<content type=\"xhtml\"><div>Content <em>only</em></div></content>"
        "<published>2024-02-01T00:00:00Z</published></entry>"
        "<entry><title>No link at all</title><summary>dropped</summary></entry>"
        "</feed>");

    std::string format_name;
    const auto items(ReadItems(atom_document, &format_name));
    CHECK_EQ(format_name, "Atom");
    CHECK_EQ(items.size(), 2u);

    CHECK_EQ(items[0].getTitle(), "First post");
    CHECK_EQ(items[0].getLink(), "https://blog.example.com/first");
    CHECK_EQ(items[0].getSummary(), "Short summary");
    CHECK_EQ(items[0].getPublished(), "2024-01-02T00:00:00Z");

    CHECK_EQ(items[1].getTitle(), "Second post");
    CHECK_EQ(items[1].getLink(), "https://blog.example.com/second");
    CHECK_EQ(items[1].getSummary(), "Content only");
    CHECK_EQ(items[1].getPublished(), "2024-02-01T00:00:00Z");
}


TEST(RDF) {
    const std::string rdf_document(
        "<?xml version=\"1.0\"?>\n"
        "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\" xmlns=\"http://purl.org/rss/1.0/\""
        " xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
        "<channel rdf:about=\"https://journal.example.org/\"><title>Journal</title><link>https://journal.example.org/</link>"
        "<description>Articles</description></channel>"
        "<item rdf:about=\"https://journal.example.org/a1\"><title>Article One</title>"
        "<link>https://journal.example.org/a1</link><description>Abstract</description>"
        "<dc:date>2023-05-05</dc:date></item>"
        "</rdf:RDF>");

    std::string err_msg;
    std::unique_ptr<SyndicationFormat> syndication_format(SyndicationFormat::Factory(rdf_document, &err_msg));
    CHECK_TRUE(syndication_format != nullptr);
    CHECK_EQ(syndication_format->getFormatName(), "RDF");

    std::vector<SyndicationFormat::Item> items;
    for (const auto &item : *syndication_format)
        items.emplace_back(item);
    CHECK_EQ(items.size(), 1u);
    CHECK_EQ(items[0].getTitle(), "Article One");
    CHECK_EQ(items[0].getLink(), "https://journal.example.org/a1");
    CHECK_EQ(items[0].getSummary(), "Abstract");
    CHECK_EQ(items[0].getPublished(), "2023-05-05");
    CHECK_EQ(syndication_format->getTitle(), "Journal");
}


TEST(UnknownDocumentElement) {
    std::string err_msg;
    CHECK_TRUE(SyndicationFormat::Factory("<html><body>Not a feed</body></html>", &err_msg) == nullptr);
    CHECK_FALSE(err_msg.empty());
}


TEST(MalformedDocument) {
    bool caught_error(false);
    try {
        ReadItems("<rss><channel><item><title>Broken</title><link>https://example.com/</link></channel></rss>");
    } catch (const std::runtime_error &) {
        caught_error = true;
    }
    CHECK_TRUE(caught_error);
}


namespace {


// \return True if all items could be read and finish() accepted the rest of the document.
bool ReadsCompletely(const std::string &xml_document) {
    std::string err_msg;
    std::unique_ptr<SyndicationFormat> syndication_format(SyndicationFormat::Factory(xml_document, &err_msg));
    if (syndication_format == nullptr)
        return false;

    try {
        for (auto item(syndication_format->begin()); item != syndication_format->end(); ++item)
            /* Intentionally empty! */;
        syndication_format->finish();
    } catch (const std::runtime_error &) {
        return false;
    }

    return true;
}


} // unnamed namespace


TEST(FinishChecksTheRestOfTheDocument) {
    CHECK_TRUE(ReadsCompletely("<rss><channel><item><link>https://a.example.com/</link></item></channel></rss>"));
    CHECK_TRUE(ReadsCompletely("<feed><entry><link href=\"https://a.example.com/\"/></entry></feed><!-- end -->"));

    CHECK_FALSE(ReadsCompletely("<rss><channel><item><link>https://a.example.com/</link></item></channel>"));
    CHECK_FALSE(ReadsCompletely("<rss><channel><item><link>https://a.example.com/</link></item></channel></rss><junk"));
    CHECK_FALSE(ReadsCompletely("<feed><entry><link href=\"https://a.example.com/\"/></entry></feed><feed/>"));
}


TEST_MAIN(SyndicationFormat)
