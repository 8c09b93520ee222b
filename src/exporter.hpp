/* exporter.hpp - writes parse results to an output directory.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "report_parser.hpp"
#include <string>
#include <vector>
#include <wx/string.h>

inline const wxString RAW_TEXT_FILE = "raw_text.txt";
inline const wxString TREE_JSON_FILE = "tree.json";
inline const wxString TREE_MARKDOWN_FILE = "tree.md";
inline const wxString SECTIONS_FILE = "sections.jsonl";

[[nodiscard]] std::string format_raw_text(const std::vector<std::string>& pages);
[[nodiscard]] std::string format_sections_jsonl(const std::vector<section>& sections);

wxString write_raw_text(const wxString& out_dir, const std::vector<std::string>& pages);
wxString write_tree_json(const wxString& out_dir, const outline_node& root);
wxString write_tree_markdown(const wxString& out_dir, const std::string& markdown);
wxString write_sections_jsonl(const wxString& out_dir, const std::vector<section>& sections);
// Writes all four artifacts; throws outliner_error(export_failed) on the first failure.
void export_result(const parse_result& result, const wxString& out_dir);
