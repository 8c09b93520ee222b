/* outline.hpp - outline entries, the section tree, and flattened sections.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <compare>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// One (level, title, page) candidate produced by a detection strategy.
struct outline_entry {
	int level{1};
	std::string title;
	int page{1};

	// Document order: page, then level, then title.
	[[nodiscard]] auto operator<=>(const outline_entry& other) const noexcept {
		if (const auto cmp = page <=> other.page; cmp != 0) {
			return cmp;
		}
		if (const auto cmp = level <=> other.level; cmp != 0) {
			return cmp;
		}
		return title <=> other.title;
	}

	[[nodiscard]] bool operator==(const outline_entry& other) const noexcept = default;
};

struct outline_node {
	std::string title;
	int level{0};
	std::optional<int> start_page;
	std::optional<int> end_page;
	std::vector<std::unique_ptr<outline_node>> children;
	bool is_root{false};

	outline_node() = default;
	outline_node(std::string node_title, int node_level, std::optional<int> start) : title{std::move(node_title)}, level{node_level}, start_page{start} {
	}
	~outline_node() = default;
	outline_node(const outline_node&) = delete;
	outline_node& operator=(const outline_node&) = delete;
	outline_node(outline_node&&) = default;
	outline_node& operator=(outline_node&&) = default;

	[[nodiscard]] static std::unique_ptr<outline_node> make_root();
	[[nodiscard]] size_t descendant_count() const noexcept;
};

struct section {
	std::string id;
	std::string title;
	int level{1};
	int start_page{1};
	int end_page{1};
	std::vector<std::string> path;
	std::string text;

	[[nodiscard]] size_t char_count() const noexcept {
		return text.size();
	}

	[[nodiscard]] size_t word_count() const noexcept;
	[[nodiscard]] std::string joined_path() const;
};

[[nodiscard]] std::unique_ptr<outline_node> build_tree(const std::vector<outline_entry>& entries);
void finalize_tree(outline_node& root, int page_count);
[[nodiscard]] std::vector<section> flatten_sections(const outline_node& root, const std::vector<std::string>& pages);
[[nodiscard]] std::string make_section_id(const std::vector<std::string>& path, int start_page, int end_page);
[[nodiscard]] std::string render_markdown(const outline_node& root);
[[nodiscard]] nlohmann::json tree_to_json(const outline_node& node);
[[nodiscard]] nlohmann::json section_to_json(const section& sec);
