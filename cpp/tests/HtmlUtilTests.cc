/** \brief Test cases for HtmlUtil
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
#include "HtmlUtil.h"
#include "UnitTest.h"


TEST(DecodeEntity) {
    std::string utf8;
    CHECK_TRUE(HtmlUtil::DecodeEntity("amp", &utf8));
    CHECK_EQ(utf8, "&");
    CHECK_TRUE(HtmlUtil::DecodeEntity("#228", &utf8));
    CHECK_EQ(utf8, "\xC3\xA4");
    CHECK_TRUE(HtmlUtil::DecodeEntity("#x65E5", &utf8));
    CHECK_EQ(utf8, "\xE6\x97\xA5");

    CHECK_FALSE(HtmlUtil::DecodeEntity("", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#0", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#xD800", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#x110000", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("nosuchentity", &utf8));
}


TEST(ReplaceEntities) {
    CHECK_EQ(HtmlUtil::ReplaceEntities("Fish &amp; Chips &lt;3"), "Fish & Chips <3");
    CHECK_EQ(HtmlUtil::ReplaceEntities("AT&T &bogus; &amp"), "AT&T &bogus; &amp");
}


TEST(ExtractTitle) {
    CHECK_EQ(HtmlUtil::ExtractTitle("<html><HEAD><Title lang=\"en\">\n  Rust &amp; C++\n</TITLE></head></html>"), "Rust & C++");
    CHECK_EQ(HtmlUtil::ExtractTitle("<html><body>No title here</body></html>"), "");
}


TEST(ExtractText) {
    const std::string html_document(
        "<html><head><title>T</title><style>body { color: red; }</style>"
        "<script type=\"text/javascript\">var secret = 1;</script></head>"
        "<body><!-- a comment --><h1>Headline</h1>\n<p>First&nbsp;paragraph.</p>"
        "<noscript>Enable scripts</noscript><p>Second <b>bold</b> one.</p></body></html>");
    const std::string text(HtmlUtil::ExtractText(html_document));
    CHECK_EQ(text, "T Headline First paragraph. Second bold one.");
}


TEST_MAIN(HtmlUtil)
