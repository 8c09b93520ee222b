/* test_utils.cpp - string and hashing helper tests.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

TEST(Sha1HexTest, MatchesKnownDigest) {
	EXPECT_EQ(sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
	EXPECT_EQ(sha1_hex("Intro|1|5"), "3f5f89e30087b12b185b9cd0c41ebf12016245ae");
}

TEST(Sha1HexTest, EmptyInputStillHashes) {
	EXPECT_EQ(sha1_hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
	EXPECT_EQ(sha1_hex(std::string("a\0b", 3)).size(), 40U);
}

TEST(TrimStringTest, StripsAsciiAndNonBreakingSpace) {
	EXPECT_EQ(trim_string("  hello \t"), "hello");
	EXPECT_EQ(trim_string("\xC2\xA0 hello \xC2\xA0"), "hello");
	EXPECT_EQ(trim_string("   "), "");
	EXPECT_EQ(rtrim_string("  keep left  \n"), "  keep left");
}

TEST(CollapseWhitespaceTest, FoldsRuns) {
	EXPECT_EQ(collapse_whitespace("a \t\n b"), "a b");
	EXPECT_EQ(collapse_whitespace("x\xC2\xA0\xC2\xA0y"), "x y");
}

TEST(RemoveSoftHyphensTest, DropsEverySoftHyphen) {
	EXPECT_EQ(remove_soft_hyphens("co\xC2\xADoper\xC2\xAD" "ate"), "cooperate");
}

TEST(ConvertToUtf8Test, HandlesBomAndLatin1) {
	EXPECT_EQ(convert_to_utf8("\xEF\xBB\xBFhi"), "hi");
	EXPECT_EQ(convert_to_utf8("caf\xC3\xA9"), "caf\xC3\xA9");
	EXPECT_EQ(convert_to_utf8("caf\xE9"), "caf\xC3\xA9");
	EXPECT_EQ(convert_to_utf8(""), "");
}

TEST(CaseHelpersTest, LowerAndTitleCase) {
	EXPECT_EQ(to_lower_ascii("Table Of CONTENTS"), "table of contents");
	EXPECT_EQ(to_title_case("EXECUTIVE SUMMARY"), "Executive Summary");
	EXPECT_EQ(to_title_case("CLIMATE-RELATED RISKS"), "Climate-Related Risks");
	EXPECT_EQ(to_title_case("SCOPE 3 EMISSIONS"), "Scope 3 Emissions");
}

TEST(CaseHelpersTest, TitleCaseMapsAccentedLetters) {
	EXPECT_EQ(to_title_case("\xC3\x89NERGIE RENOUVELABLE"), "\xC3\x89nergie Renouvelable");
	EXPECT_EQ(to_title_case("CAF\xC3\x89S AND SUPPLY"), "Caf\xC3\xA9s And Supply");
	EXPECT_EQ(to_title_case("\xC3\xA9T\xC3\x89"), "\xC3\x89t\xC3\xA9");
	// Invalid UTF-8 keeps its bytes and still maps ASCII letters.
	EXPECT_EQ(to_title_case("BAD \xFF BYTE"), "Bad \xFF Byte");
	EXPECT_EQ(to_title_case(""), "");
}

TEST(IsUpperLineTest, NeedsCasedCharacters) {
	EXPECT_TRUE(is_upper_line("EXECUTIVE SUMMARY 2024"));
	EXPECT_FALSE(is_upper_line("Executive Summary"));
	EXPECT_FALSE(is_upper_line("2024 - 2025"));
	EXPECT_TRUE(is_upper_line("CAF\xC3\x89S"));
	EXPECT_TRUE(is_upper_line("\xC3\x89T\xC3\x89"));
	EXPECT_FALSE(is_upper_line("Caf\xC3\xA9s"));
	EXPECT_FALSE(is_upper_line("CAF\xC3\xA9"));
	EXPECT_TRUE(has_ascii_letter("page 4"));
	EXPECT_FALSE(has_ascii_letter("12 .... 4"));
}

TEST(SplitLinesTest, RecognizesEveryLineBreak) {
	EXPECT_EQ(split_lines("a\r\nb\rc\fd\n"), (std::vector<std::string>{"a", "b", "c", "d"}));
	EXPECT_EQ(split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
	EXPECT_TRUE(split_lines("").empty());
}

TEST(JoinStringsTest, InsertsSeparatorBetweenParts) {
	EXPECT_EQ(join_strings({"Intro", "Sub A"}, " > "), "Intro > Sub A");
	EXPECT_EQ(join_strings({"solo"}, ", "), "solo");
	EXPECT_EQ(join_strings({}, ", "), "");
}

TEST(CountWordsTest, SplitsOnWhitespace) {
	EXPECT_EQ(count_words("  two  words\n"), 2U);
	EXPECT_EQ(count_words(""), 0U);
	EXPECT_EQ(count_words("net-zero by 2050."), 3U);
}

TEST(NormalizePageTextTest, UnifiesBreaksAndStripsLineEndSpace) {
	EXPECT_EQ(normalize_page_text("a  \r\nb\xC2\xA0" "c\t\nd"), "a\nb c\nd");
	EXPECT_EQ(normalize_page_text("one\rtwo"), "one\ntwo");
	EXPECT_EQ(normalize_page_text("inner  gap"), "inner  gap");
}
