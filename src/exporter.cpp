/* exporter.cpp - exports raw text, the tree and the sections of a parsed report.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "exporter.hpp"
#include "outliner_error.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>
#include <wx/filename.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>

namespace {
void ensure_dir(const wxString& out_dir) {
	if (wxFileName::DirExists(out_dir)) {
		return;
	}
	if (!wxFileName::Mkdir(out_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		throw outliner_error(_("Failed to create output directory"), out_dir, error_code::export_failed);
	}
}

wxString write_file(const wxString& out_dir, const wxString& name, const std::string& content) {
	ensure_dir(out_dir);
	const wxString path = wxFileName(out_dir, name).GetFullPath();
	wxFileOutputStream out(path);
	if (!out.IsOk()) {
		throw outliner_error(_("Failed to open file for writing"), path, error_code::export_failed);
	}
	out.Write(content.data(), content.size());
	if (!out.IsOk() || out.LastWrite() != content.size() || !out.Close()) {
		throw outliner_error(_("Failed to write file"), path, error_code::export_failed);
	}
	return path;
}
} // namespace

std::string format_raw_text(const std::vector<std::string>& pages) {
	std::ostringstream out;
	for (size_t i = 0; i < pages.size(); ++i) {
		out << "\n\n===== PAGE " << (i + 1) << " =====\n\n";
		out << rtrim_string(pages[i]) << "\n";
	}
	return out.str();
}

std::string format_sections_jsonl(const std::vector<section>& sections) {
	std::string out;
	for (const auto& sec : sections) {
		out += section_to_json(sec).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		out += "\n";
	}
	return out;
}

wxString write_raw_text(const wxString& out_dir, const std::vector<std::string>& pages) {
	return write_file(out_dir, RAW_TEXT_FILE, format_raw_text(pages));
}

wxString write_tree_json(const wxString& out_dir, const outline_node& root) {
	return write_file(out_dir, TREE_JSON_FILE, tree_to_json(root).dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

wxString write_tree_markdown(const wxString& out_dir, const std::string& markdown) {
	return write_file(out_dir, TREE_MARKDOWN_FILE, markdown);
}

wxString write_sections_jsonl(const wxString& out_dir, const std::vector<section>& sections) {
	return write_file(out_dir, SECTIONS_FILE, format_sections_jsonl(sections));
}

void export_result(const parse_result& result, const wxString& out_dir) {
	if (!result.tree) {
		throw outliner_error(_("Nothing to export"), out_dir, error_code::export_failed);
	}
	write_raw_text(out_dir, result.pages_text);
	write_tree_json(out_dir, *result.tree);
	write_tree_markdown(out_dir, result.tree_markdown);
	write_sections_jsonl(out_dir, result.sections);
}
