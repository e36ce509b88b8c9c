/** \brief Test cases for UrlUtil
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
#include "UrlUtil.h"
#include "UnitTest.h"


TEST(NormalizeDomainName) {
    CHECK_EQ(UrlUtil::NormalizeDomainName(" Example.COM. "), "example.com");
    CHECK_EQ(UrlUtil::NormalizeDomainName("localhost.."), "localhost");
    CHECK_EQ(UrlUtil::NormalizeDomainName(""), "");
}


TEST(HostMatchesDomain) {
    CHECK_TRUE(UrlUtil::HostMatchesDomain("example.com", "example.com"));
    CHECK_TRUE(UrlUtil::HostMatchesDomain("news.example.com", "example.com"));
    CHECK_TRUE(UrlUtil::HostMatchesDomain("a.b.example.com.", "EXAMPLE.com"));
    CHECK_TRUE(UrlUtil::HostMatchesDomain("news.example.com", "*.example.com"));
    CHECK_TRUE(UrlUtil::HostMatchesDomain("example.com", "*.example.com"));

    CHECK_FALSE(UrlUtil::HostMatchesDomain("badexample.com", "example.com"));
    CHECK_FALSE(UrlUtil::HostMatchesDomain("example.com.evil.net", "example.com"));
    CHECK_FALSE(UrlUtil::HostMatchesDomain("example.com", "news.example.com"));
    CHECK_FALSE(UrlUtil::HostMatchesDomain("", "example.com"));
    CHECK_FALSE(UrlUtil::HostMatchesDomain("example.com", ""));
    CHECK_FALSE(UrlUtil::HostMatchesDomain("example.com", "*."));
}


TEST(SanitizeMasksQueryAndDropsFragment) {
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("https://example.com/a?token=secret#frag"), "https://example.com/a?\xE2\x80\xA6");
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("https://example.com/a#frag"), "https://example.com/a");
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("https://example.com/a"), "https://example.com/a");
}


TEST(SanitizeRemovesLineBreaks) {
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("https://example.com/a\r\nInjected: yes"), "https://example.com/a Injected: yes");
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("  not\ta url  "), "not a url");
}


TEST(SanitizeTruncates) {
    const std::string long_url("https://example.com/" + std::string(300, 'x'));
    const std::string sanitized_url(UrlUtil::SanitizeUrlForLogging(long_url));
    CHECK_EQ(sanitized_url, long_url.substr(0, 200) + "\xE2\x80\xA6");

    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("https://example.com/abcdef", 20), "https://example.com/\xE2\x80\xA6");

    // Must not cut the two-byte sequence of "ä" in half.
    CHECK_EQ(UrlUtil::SanitizeUrlForLogging("abc\xC3\xA4zzz", 4), "abc\xE2\x80\xA6");
}


TEST_MAIN(UrlUtil)
