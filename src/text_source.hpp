/* text_source.hpp - plain text page source header file.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "page_source.hpp"
#include <span>
#include <string>
#include <vector>

// Plain text with pages separated by form feeds, as written by pdftotext and similar tools.
class text_source : public page_source {
public:
	text_source() = default;
	~text_source() override = default;
	text_source(const text_source&) = delete;
	text_source& operator=(const text_source&) = delete;
	text_source(text_source&&) = delete;
	text_source& operator=(text_source&&) = delete;
	[[nodiscard]] wxString name() const override { return "Text Files"; }
	[[nodiscard]] std::span<const wxString> extensions() const override {
		static const wxString exts[] = {"txt", "text"};
		return exts;
	}
	[[nodiscard]] loaded_document load(const wxString& path) const override;
	[[nodiscard]] static std::vector<std::string> split_pages(const std::string& content);
};
