/* outline.cpp - builds, finalizes, flattens and renders the section tree.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "outline.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using nlohmann::json;

std::unique_ptr<outline_node> outline_node::make_root() {
	auto root = std::make_unique<outline_node>(std::string(ROOT_TITLE), 0, std::nullopt);
	root->is_root = true;
	return root;
}

size_t outline_node::descendant_count() const noexcept {
	size_t count = children.size();
	for (const auto& child : children) {
		count += child->descendant_count();
	}
	return count;
}

size_t section::word_count() const noexcept {
	return count_words(text);
}

std::string section::joined_path() const {
	return join_strings(path, PATH_SEPARATOR);
}

std::unique_ptr<outline_node> build_tree(const std::vector<outline_entry>& entries) {
	auto root = outline_node::make_root();
	std::vector<outline_node*> stack{root.get()};
	for (const auto& entry : entries) {
		if (entry.level <= root->level) {
			continue;
		}
		while (!stack.empty() && stack.back()->level >= entry.level) {
			stack.pop_back();
		}
		outline_node* parent = stack.empty() ? root.get() : stack.back();
		parent->children.push_back(std::make_unique<outline_node>(trim_string(entry.title), entry.level, entry.page));
		stack.push_back(parent->children.back().get());
	}
	return root;
}

namespace {
int clamp_page(int page, int first, int last) noexcept {
	return std::max(first, std::min(page, last));
}

// Children start inside their parent's range, so every end computed below stays inside it too.
void assign_end_pages(outline_node& node) {
	const int parent_start = node.start_page.value_or(1);
	const int parent_end = std::max(parent_start, node.end_page.value_or(parent_start));
	auto& children = node.children;
	for (auto& child : children) {
		child->start_page = clamp_page(child->start_page.value_or(parent_start), parent_start, parent_end);
	}
	for (size_t i = 0; i < children.size(); ++i) {
		auto& child = *children[i];
		const int start = *child.start_page;
		if (i + 1 < children.size()) {
			child.end_page = std::max(start, *children[i + 1]->start_page - 1);
		} else {
			child.end_page = parent_end;
		}
		assign_end_pages(child);
	}
}

void render_markdown_lines(const outline_node& node, int indent, std::vector<std::string>& lines) {
	for (const auto& child : node.children) {
		const std::string start = child->start_page ? std::to_string(*child->start_page) : "?";
		const std::string end = child->end_page ? std::to_string(*child->end_page) : "?";
		std::ostringstream line;
		for (int i = 0; i < indent; ++i) {
			line << "  ";
		}
		line << "- " << child->title << "  *(pp. " << start << "\xE2\x80\x93" << end << ")*";
		lines.push_back(line.str());
		render_markdown_lines(*child, indent + 1, lines);
	}
}

json optional_page(const std::optional<int>& page) {
	return page ? json(*page) : json(nullptr);
}
} // namespace

void finalize_tree(outline_node& root, int page_count) {
	root.start_page = 1;
	root.end_page = std::max(1, page_count);
	assign_end_pages(root);
}

std::string make_section_id(const std::vector<std::string>& path, int start_page, int end_page) {
	const std::string key = join_strings(path, PATH_SEPARATOR) + "|" + std::to_string(start_page) + "|" + std::to_string(end_page);
	return sha1_hex(key).substr(0, SECTION_ID_LENGTH);
}

std::vector<section> flatten_sections(const outline_node& root, const std::vector<std::string>& pages) {
	std::vector<section> sections;
	sections.reserve(root.descendant_count());
	const int page_count = static_cast<int>(pages.size());
	const int last_page = std::max(1, page_count);
	std::function<void(const outline_node&, const std::vector<std::string>&)> walk = [&](const outline_node& node, const std::vector<std::string>& path) {
		for (const auto& child : node.children) {
			auto child_path = path;
			child_path.push_back(child->title);
			const int sp = clamp_page(child->start_page.value_or(1), 1, last_page);
			const int ep = clamp_page(child->end_page.value_or(sp), sp, last_page);
			std::vector<std::string> slice;
			for (int page = sp; page <= std::min(ep, page_count); ++page) {
				slice.push_back(pages[static_cast<size_t>(page - 1)]);
			}
			section sec;
			sec.id = make_section_id(child_path, sp, ep);
			sec.title = child->title;
			sec.level = child->level;
			sec.start_page = sp;
			sec.end_page = ep;
			sec.path = child_path;
			sec.text = trim_string(join_strings(slice, "\n"));
			sections.push_back(std::move(sec));
			walk(*child, child_path);
		}
	};
	walk(root, {});
	return sections;
}

std::string render_markdown(const outline_node& root) {
	std::vector<std::string> lines;
	render_markdown_lines(root, 0, lines);
	return trim_string(join_strings(lines, "\n")) + "\n";
}

json tree_to_json(const outline_node& node) {
	json children = json::array();
	for (const auto& child : node.children) {
		children.push_back(tree_to_json(*child));
	}
	return {
		{"title", node.is_root ? std::string(ROOT_TITLE) : node.title},
		{"level", node.level},
		{"start_page", optional_page(node.start_page)},
		{"end_page", optional_page(node.end_page)},
		{"children", std::move(children)},
	};
}

json section_to_json(const section& sec) {
	return {
		{"id", sec.id},
		{"title", sec.title},
		{"level", sec.level},
		{"start_page", sec.start_page},
		{"end_page", sec.end_page},
		{"path", sec.path},
		{"text", sec.text},
	};
}
