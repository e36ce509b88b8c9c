/** \brief Test cases for TextUtil
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
#include "TextUtil.h"
#include "UnitTest.h"


TEST(UTF8RoundTrip) {
    std::vector<uint32_t> utf32_chars;
    CHECK_TRUE(TextUtil::UTF8ToUTF32("a\xC3\xA4\xE6\x97\xA5\xF0\x9F\x98\x80", &utf32_chars));
    CHECK_EQ(utf32_chars.size(), 4u);
    CHECK_EQ(utf32_chars[1], 0xE4u);
    CHECK_EQ(utf32_chars[2], 0x65E5u);
    CHECK_EQ(utf32_chars[3], 0x1F600u);
    CHECK_EQ(TextUtil::UTF32ToUTF8(utf32_chars), "a\xC3\xA4\xE6\x97\xA5\xF0\x9F\x98\x80");

    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xC3", &utf32_chars));
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xC0\xAF", &utf32_chars)); // Overlong encoding of '/'.
}


TEST(UTF8ToUTF32RejectsInvalidCodePoints) {
    std::vector<uint32_t> utf32_chars;
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xE0\x80\xAF", &utf32_chars));     // Overlong, 3 bytes.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xF0\x80\x80\xAF", &utf32_chars)); // Overlong, 4 bytes.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xED\xA0\x80", &utf32_chars));     // U+D800, a surrogate.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xF4\x90\x80\x80", &utf32_chars)); // U+110000
    CHECK_FALSE(TextUtil::UTF8ToUTF32("x \xF7\xBF\xBF\xBF", &utf32_chars));

    CHECK_TRUE(TextUtil::UTF8ToUTF32("\xF4\x8F\xBF\xBF", &utf32_chars));  // U+10FFFF
    CHECK_EQ(utf32_chars.size(), 1u);
    CHECK_EQ(utf32_chars[0], 0x10FFFFu);
    CHECK_TRUE(TextUtil::UTF8ToUTF32("\xEF\xBF\xBD", &utf32_chars));      // U+FFFD
    CHECK_EQ(utf32_chars[0], 0xFFFDu);

    std::string lowercase;
    CHECK_FALSE(TextUtil::UTF8ToLower("x \xF7\xBF\xBF\xBF", &lowercase));
}


TEST(UTF8ToLower) {
    std::string lowercase;
    CHECK_TRUE(TextUtil::UTF8ToLower("Apfel UND Birnen \xC3\xA4", &lowercase));
    CHECK_EQ(lowercase, "apfel und birnen \xC3\xA4");

    CHECK_TRUE(TextUtil::UTF8ToLower("\xC3\x84pfel \xC3\x9C" "BER", &lowercase)); // "Äpfel ÜBER"
    CHECK_EQ(lowercase, "\xC3\xA4pfel \xC3\xBC" "ber");
    CHECK_TRUE(TextUtil::UTF8ToLower("\xD0\x9C\xD0\x9E\xD0\xA1\xD0\x9A\xD0\x92\xD0\x90", &lowercase)); // "МОСКВА"
    CHECK_EQ(lowercase, "\xD0\xBC\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0");                      // "москва"

    // CJK text has no case.
    CHECK_TRUE(TextUtil::UTF8ToLower("\xE6\x97\xA5\xE6\x9C\xAC", &lowercase));
    CHECK_EQ(lowercase, "\xE6\x97\xA5\xE6\x9C\xAC");
}


TEST(CodePointCount) {
    CHECK_EQ(TextUtil::CodePointCount("abc"), 3u);
    CHECK_EQ(TextUtil::CodePointCount("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E"), 3u);
    CHECK_EQ(TextUtil::CodePointCount(""), 0u);
}


TEST(ContainsCJK) {
    CHECK_TRUE(TextUtil::ContainsCJK("\xE6\x97\xA5\xE6\x9C\xAC"));                 // Kanji
    CHECK_TRUE(TextUtil::ContainsCJK("abc \xE3\x81\x82"));                        // Hiragana
    CHECK_TRUE(TextUtil::ContainsCJK("\xE3\x80\x82"));                            // Ideographic full stop
    CHECK_FALSE(TextUtil::ContainsCJK("Stra\xC3\x9F" "e"));
    CHECK_FALSE(TextUtil::ContainsCJK(""));
}


TEST(CollapseAndTrimWhitespace) {
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("  a \t\n b  "), "a b");
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("a\xC2\xA0\xC2\xA0" "b"), "a b"); // No-break spaces.
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("\xE3\x80\x80\xE6\x97\xA5"), "\xE6\x97\xA5"); // Ideographic space.
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("d\xC3\xA0 "), "d\xC3\xA0");
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace(" \n "), "");

    // Invalid UTF-8 is read as Latin-1.
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("article \xF7\xBF\xBF\xBF body"),
             "article \xC3\xB7\xC2\xBF\xC2\xBF\xC2\xBF body");
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("\xED\xA0\x80"), "\xC3\xAD \xC2\x80"); // 0xA0 is a no-break space.
}


TEST_MAIN(TextUtil)
