/* test_report_parser.cpp - end-to-end pipeline tests over in-memory pages and files.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "outliner_error.hpp"
#include "page_source.hpp"
#include "report_parser.hpp"
#include "test_helpers.hpp"
#include "text_source.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

namespace {
std::vector<std::string> contents_report() {
	return {
		"Contents\nIntro ..... 2\nClimate Strategy ..... 3\n1.1 Targets ..... 3\nGovernance ..... 5",
		"Intro text.",
		"Strategy text.",
		"More strategy text.",
		"Governance text.",
	};
}

error_code parse_error(const wxString& path, wxString* reported_path = nullptr) {
	try {
		static_cast<void>(parse_file(path));
	} catch (const outliner_error& e) {
		if (reported_path != nullptr) {
			*reported_path = e.get_file_path();
		}
		return e.get_code();
	}
	ADD_FAILURE() << "parsing was expected to fail";
	return error_code::invalid_input;
}

class report_parser_test : public temp_dir_test {};
} // namespace

TEST(ParsePagesTest, EmptyDocumentIsInvalid) {
	try {
		static_cast<void>(parse_pages({}, std::nullopt));
		FAIL() << "expected outliner_error";
	} catch (const outliner_error& e) {
		EXPECT_EQ(e.get_code(), error_code::invalid_input);
	}
}

TEST(ParsePagesTest, UsesBookmarksWhenPresent) {
	const std::vector<outline_entry> bookmarks{{1, "Intro", 1}, {2, "Sub A", 2}, {2, "Sub B", 4}, {1, "Conclusion", 6}};
	const auto result = parse_pages(std::vector<std::string>(8, "body"), bookmarks);
	EXPECT_EQ(result.strategy_used, strategy::outline);
	EXPECT_EQ(result.page_count, 8);
	ASSERT_EQ(result.sections.size(), 4U);
	EXPECT_EQ(result.sections[0].id, "3f5f89e30087");
	EXPECT_EQ(result.sections[3].id, "6df708c61e6a");
	ASSERT_TRUE(result.tree);
	EXPECT_EQ(*result.tree->end_page, 8);
	EXPECT_EQ(result.pages_text.size(), 8U);
	EXPECT_FALSE(result.tree_markdown.empty());
}

TEST(ParsePagesTest, BuildsTreeFromContentsPage) {
	const auto result = parse_pages(contents_report(), std::nullopt);
	EXPECT_EQ(result.strategy_used, strategy::toc);
	ASSERT_EQ(result.sections.size(), 4U);
	const auto& intro = result.sections[0];
	EXPECT_EQ(intro.title, "Intro");
	EXPECT_EQ(intro.start_page, 2);
	EXPECT_EQ(intro.end_page, 2);
	EXPECT_EQ(intro.text, "Intro text.");
	const auto& strategy_section = result.sections[1];
	EXPECT_EQ(strategy_section.title, "Climate Strategy");
	EXPECT_EQ(strategy_section.start_page, 3);
	EXPECT_EQ(strategy_section.end_page, 4);
	EXPECT_EQ(strategy_section.text, "Strategy text.\nMore strategy text.");
	const auto& targets = result.sections[2];
	EXPECT_EQ(targets.title, "Targets");
	EXPECT_EQ(targets.level, 2);
	EXPECT_EQ(targets.start_page, 3);
	EXPECT_EQ(targets.end_page, 4);
	EXPECT_EQ(targets.joined_path(), "Climate Strategy > Targets");
	const auto& governance = result.sections[3];
	EXPECT_EQ(governance.start_page, 5);
	EXPECT_EQ(governance.end_page, 5);
}

TEST(ParsePagesTest, ForcedStrategyIsHonored) {
	parse_options options;
	options.mode = strategy::headings;
	auto pages = contents_report();
	pages[1] = "EXECUTIVE SUMMARY\nIntro text.";
	const auto result = parse_pages(pages, std::nullopt, options);
	EXPECT_EQ(result.strategy_used, strategy::headings);
	ASSERT_FALSE(result.sections.empty());
	EXPECT_EQ(result.sections[0].title, "Executive Summary");
}

TEST(ParsePagesTest, NoStructureIsReported) {
	try {
		static_cast<void>(parse_pages({"just some prose.", "and more prose."}, std::nullopt));
		FAIL() << "expected outliner_error";
	} catch (const outliner_error& e) {
		EXPECT_EQ(e.get_code(), error_code::no_structure_detected);
	}
}

TEST(SplitPagesTest, SplitsOnFormFeeds) {
	EXPECT_EQ(text_source::split_pages("one\ftwo\fthree"), (std::vector<std::string>{"one", "two", "three"}));
	EXPECT_EQ(text_source::split_pages("one\ftwo\f"), (std::vector<std::string>{"one", "two"}));
	EXPECT_EQ(text_source::split_pages("one\f\fthree"), (std::vector<std::string>{"one", "", "three"}));
	EXPECT_EQ(text_source::split_pages("single  \r\npage"), (std::vector<std::string>{"single\npage"}));
}

TEST(PageSourceRegistryTest, FindsSourcesByExtension) {
	const page_source* text = find_page_source_by_extension("TXT");
	ASSERT_NE(text, nullptr);
	EXPECT_EQ(text->name(), "Text Files");
	const page_source* pdf = find_page_source_by_extension("pdf");
	ASSERT_NE(pdf, nullptr);
	EXPECT_EQ(pdf->name(), "PDF Documents");
	EXPECT_EQ(find_page_source_by_extension("docx"), nullptr);
	EXPECT_EQ(find_page_source_by_extension(""), nullptr);
	EXPECT_TRUE(get_supported_extensions().Contains("pdf"));
}

TEST_F(report_parser_test, ParsesFormFeedTextFile) {
	const wxString path = path_in("report.txt");
	std::string content;
	for (const auto& page : contents_report()) {
		if (!content.empty()) {
			content += '\f';
		}
		content += page;
	}
	write_file(path, content);
	const auto result = parse_file(path);
	EXPECT_EQ(result.source_path, path);
	EXPECT_EQ(result.title, "report");
	EXPECT_EQ(result.page_count, 5);
	EXPECT_EQ(result.strategy_used, strategy::toc);
	ASSERT_EQ(result.sections.size(), 4U);
	EXPECT_EQ(result.sections[3].title, "Governance");
}

TEST_F(report_parser_test, MissingFileFailsToLoad) {
	wxString reported;
	const wxString path = path_in("absent.pdf");
	EXPECT_EQ(parse_error(path, &reported), error_code::load_failed);
	EXPECT_EQ(reported, path);
}

TEST_F(report_parser_test, UnknownExtensionIsUnsupported) {
	const wxString path = path_in("report.docx");
	write_file(path, "not really a document");
	EXPECT_EQ(parse_error(path), error_code::unsupported_format);
}

TEST_F(report_parser_test, EmptyTextFileFailsToLoad) {
	const wxString path = path_in("empty.txt");
	write_file(path, "");
	EXPECT_EQ(parse_error(path), error_code::load_failed);
}

TEST_F(report_parser_test, CorruptPdfFailsToLoad) {
	const wxString path = path_in("broken.pdf");
	write_file(path, "this is not a PDF file");
	EXPECT_EQ(parse_error(path), error_code::load_failed);
}

TEST_F(report_parser_test, NoStructureCarriesThePath) {
	const wxString path = path_in("prose.txt");
	write_file(path, "only lowercase prose here.\fand another page of it.");
	wxString reported;
	EXPECT_EQ(parse_error(path, &reported), error_code::no_structure_detected);
	EXPECT_EQ(reported, path);
}
