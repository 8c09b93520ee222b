/* test_exporter.cpp - output artifact tests.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "exporter.hpp"
#include "outliner_error.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
parse_result sample_result() {
	const std::vector<outline_entry> bookmarks{{1, "Intro", 1}, {2, "Sub A", 2}, {2, "Sub B", 4}, {1, "Conclusion", 6}};
	std::vector<std::string> pages;
	for (int i = 1; i <= 8; ++i) {
		pages.push_back("page " + std::to_string(i) + " text  ");
	}
	return parse_pages(std::move(pages), bookmarks);
}

class exporter_test : public temp_dir_test {};
} // namespace

TEST(FormatRawTextTest, MarksEveryPage) {
	EXPECT_EQ(format_raw_text({"first  \n", "second"}), "\n\n===== PAGE 1 =====\n\nfirst\n\n\n===== PAGE 2 =====\n\nsecond\n");
	EXPECT_EQ(format_raw_text({""}), "\n\n===== PAGE 1 =====\n\n\n");
}

TEST(FormatSectionsJsonlTest, OneRecordPerLine) {
	const auto result = sample_result();
	const std::string jsonl = format_sections_jsonl(result.sections);
	std::istringstream lines(jsonl);
	std::string line;
	std::vector<nlohmann::json> records;
	while (std::getline(lines, line)) {
		records.push_back(nlohmann::json::parse(line));
	}
	ASSERT_EQ(records.size(), 4U);
	EXPECT_EQ(records[0]["id"], "3f5f89e30087");
	EXPECT_EQ(records[0]["title"], "Intro");
	EXPECT_EQ(records[1]["path"], nlohmann::json::array({"Intro", "Sub A"}));
	EXPECT_EQ(records[1]["start_page"], 2);
	EXPECT_EQ(records[1]["end_page"], 3);
	EXPECT_EQ(records[1]["text"], "page 2 text  \npage 3 text");
	EXPECT_EQ(records[3]["level"], 1);
}

TEST(FormatSectionsJsonlTest, ReplacesInvalidUtf8) {
	section sec;
	sec.id = "000000000000";
	sec.title = "Bad \xFF byte";
	const std::string jsonl = format_sections_jsonl({sec});
	EXPECT_NO_THROW(static_cast<void>(nlohmann::json::parse(jsonl)));
}

TEST_F(exporter_test, WritesAllArtifactsIntoNewDirectory) {
	const auto result = sample_result();
	const wxString out_dir = path_in("nested/out");
	export_result(result, out_dir);
	for (const auto& name : {RAW_TEXT_FILE, TREE_JSON_FILE, TREE_MARKDOWN_FILE, SECTIONS_FILE}) {
		EXPECT_TRUE(wxFileName::FileExists(wxFileName(out_dir, name).GetFullPath())) << name;
	}
	const std::string raw = read_file(wxFileName(out_dir, RAW_TEXT_FILE).GetFullPath());
	EXPECT_EQ(raw, format_raw_text(result.pages_text));
	const auto tree = nlohmann::json::parse(read_file(wxFileName(out_dir, TREE_JSON_FILE).GetFullPath()));
	EXPECT_EQ(tree["title"], "ROOT");
	EXPECT_EQ(tree["children"].size(), 2U);
	EXPECT_EQ(read_file(wxFileName(out_dir, TREE_MARKDOWN_FILE).GetFullPath()), result.tree_markdown);
	EXPECT_EQ(read_file(wxFileName(out_dir, SECTIONS_FILE).GetFullPath()), format_sections_jsonl(result.sections));
}

TEST_F(exporter_test, OverwritesExistingArtifacts) {
	const auto result = sample_result();
	const wxString out_dir = path_in("out");
	write_tree_markdown(out_dir, "stale\n");
	export_result(result, out_dir);
	EXPECT_EQ(read_file(wxFileName(out_dir, TREE_MARKDOWN_FILE).GetFullPath()), result.tree_markdown);
}

TEST_F(exporter_test, UnwritableTargetFails) {
	const wxString blocker = path_in("blocker");
	write_file(blocker, "a file, not a directory");
	try {
		write_raw_text(wxFileName(blocker, "sub").GetFullPath(), {"page"});
		FAIL() << "expected outliner_error";
	} catch (const outliner_error& e) {
		EXPECT_EQ(e.get_code(), error_code::export_failed);
	}
}

TEST(ExportResultTest, EmptyResultFails) {
	const parse_result empty{};
	EXPECT_THROW(export_result(empty, "unused"), outliner_error);
}
