/* pdf_source.hpp - PDF page source header file.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "page_source.hpp"
#include <fpdf_doc.h>
#include <fpdf_text.h>
#include <fpdfview.h>
#include <span>
#include <string>
#include <vector>

class pdf_source : public page_source {
public:
	pdf_source() = default;
	~pdf_source() override = default;
	pdf_source(const pdf_source&) = delete;
	pdf_source& operator=(const pdf_source&) = delete;
	pdf_source(pdf_source&&) = delete;
	pdf_source& operator=(pdf_source&&) = delete;
	[[nodiscard]] wxString name() const override { return "PDF Documents"; }
	[[nodiscard]] std::span<const wxString> extensions() const override {
		static const wxString exts[] = {"pdf"};
		return exts;
	}
	[[nodiscard]] loaded_document load(const wxString& path) const override;

private:
	struct pdf_context {
		FPDF_DOCUMENT doc{nullptr};
		int page_count{0};

		pdf_context();
		~pdf_context();
		pdf_context(const pdf_context&) = delete;
		pdf_context& operator=(const pdf_context&) = delete;
		void open_document(const wxString& path);
	};

	static std::vector<std::string> extract_pages_text(const pdf_context& ctx);
	static wxString extract_title(const pdf_context& ctx, const wxString& path);
	static std::vector<outline_entry> extract_bookmarks(const pdf_context& ctx);
	static void extract_outline_items(const pdf_context& ctx, FPDF_BOOKMARK bookmark, int depth, std::vector<outline_entry>& entries);
};
