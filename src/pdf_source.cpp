/* pdf_source.cpp - reads page text and bookmarks from PDF documents.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pdf_source.hpp"
#include "outliner_error.hpp"
#include "utils.hpp"
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/strconv.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
// pdfium hands out UTF-16LE buffers whose reported length includes the terminator.
std::string utf16_buffer_to_utf8(const std::vector<unsigned short>& buffer, size_t units) {
	if (units == 0) {
		return {};
	}
	const wxString text(reinterpret_cast<const char*>(buffer.data()), wxMBConvUTF16LE(), units * sizeof(unsigned short));
	return std::string(text.ToUTF8());
}

constexpr int MAX_BOOKMARK_DEPTH = 32;
} // namespace

pdf_source::pdf_context::pdf_context() {
	FPDF_InitLibrary();
}

pdf_source::pdf_context::~pdf_context() {
	if (doc != nullptr) {
		FPDF_CloseDocument(doc);
	}
	FPDF_DestroyLibrary();
}

void pdf_source::pdf_context::open_document(const wxString& path) {
	doc = FPDF_LoadDocument(path.ToUTF8().data(), nullptr);
	if (doc == nullptr) {
		const unsigned long error = FPDF_GetLastError();
		if (error == FPDF_ERR_PASSWORD) {
			throw outliner_error(_("Password protected PDF documents are not supported"), path, error_code::load_failed);
		}
		throw outliner_error(_("Failed to open PDF document"), path, error_code::load_failed);
	}
	page_count = FPDF_GetPageCount(doc);
}

loaded_document pdf_source::load(const wxString& path) const {
	try {
		pdf_context ctx;
		ctx.open_document(path);
		loaded_document result;
		result.pages = extract_pages_text(ctx);
		result.title = extract_title(ctx, path);
		auto bookmarks = extract_bookmarks(ctx);
		if (!bookmarks.empty()) {
			result.bookmarks = std::move(bookmarks);
		}
		return result;
	} catch (const outliner_error&) {
		throw;
	} catch (const std::exception& e) {
		throw outliner_error(wxString::FromUTF8(e.what()), path, error_code::load_failed);
	}
}

std::vector<std::string> pdf_source::extract_pages_text(const pdf_context& ctx) {
	std::vector<std::string> pages;
	pages.reserve(static_cast<size_t>(ctx.page_count));
	for (int page_num = 0; page_num < ctx.page_count; ++page_num) {
		std::string page_text;
		FPDF_PAGE page = FPDF_LoadPage(ctx.doc, page_num);
		if (page != nullptr) {
			FPDF_TEXTPAGE text_page = FPDFText_LoadPage(page);
			if (text_page != nullptr) {
				const int char_count = FPDFText_CountChars(text_page);
				if (char_count > 0) {
					std::vector<unsigned short> text_buffer(static_cast<size_t>(char_count) + 1);
					const int chars_written = FPDFText_GetText(text_page, 0, char_count, text_buffer.data());
					if (chars_written > 1) {
						page_text = normalize_page_text(utf16_buffer_to_utf8(text_buffer, static_cast<size_t>(chars_written - 1)));
					}
				}
				FPDFText_ClosePage(text_page);
			}
			FPDF_ClosePage(page);
		} else {
			wxLogWarning(_("Could not read page %d"), page_num + 1);
		}
		// Unreadable pages stay in place as empty text so page numbers line up.
		pages.push_back(std::move(page_text));
	}
	return pages;
}

wxString pdf_source::extract_title(const pdf_context& ctx, const wxString& path) {
	const unsigned long length = FPDF_GetMetaText(ctx.doc, "Title", nullptr, 0);
	if (length > 2) {
		std::vector<unsigned short> buffer(length / sizeof(unsigned short) + 1);
		FPDF_GetMetaText(ctx.doc, "Title", buffer.data(), length);
		const std::string title = trim_string(utf16_buffer_to_utf8(buffer, length / sizeof(unsigned short) - 1));
		if (!title.empty()) {
			return wxString::FromUTF8(title);
		}
	}
	return wxFileName(path).GetName();
}

std::vector<outline_entry> pdf_source::extract_bookmarks(const pdf_context& ctx) {
	std::vector<outline_entry> entries;
	FPDF_BOOKMARK bookmark = FPDFBookmark_GetFirstChild(ctx.doc, nullptr);
	if (bookmark != nullptr) {
		extract_outline_items(ctx, bookmark, 0, entries);
	}
	return entries;
}

void pdf_source::extract_outline_items(const pdf_context& ctx, FPDF_BOOKMARK bookmark, int depth, std::vector<outline_entry>& entries) {
	if (depth >= MAX_BOOKMARK_DEPTH) {
		return;
	}
	while (bookmark != nullptr) {
		std::string title;
		const unsigned long title_length = FPDFBookmark_GetTitle(bookmark, nullptr, 0);
		if (title_length > 2) {
			std::vector<unsigned short> title_buffer(title_length / sizeof(unsigned short) + 1);
			FPDFBookmark_GetTitle(bookmark, title_buffer.data(), title_length);
			title = trim_string(utf16_buffer_to_utf8(title_buffer, title_length / sizeof(unsigned short) - 1));
		}
		FPDF_DEST dest = FPDFBookmark_GetDest(ctx.doc, bookmark);
		if (dest == nullptr) {
			FPDF_ACTION action = FPDFBookmark_GetAction(bookmark);
			if (action != nullptr && FPDFAction_GetType(action) == PDFACTION_GOTO) {
				dest = FPDFAction_GetDest(ctx.doc, action);
			}
		}
		const int page_index = dest != nullptr ? FPDFDest_GetDestPageIndex(ctx.doc, dest) : -1;
		if (page_index >= 0 && !title.empty()) {
			entries.push_back(outline_entry{depth + 1, std::move(title), page_index + 1});
		}
		FPDF_BOOKMARK child = FPDFBookmark_GetFirstChild(ctx.doc, bookmark);
		if (child != nullptr) {
			extract_outline_items(ctx, child, depth + 1, entries);
		}
		bookmark = FPDFBookmark_GetNextSibling(ctx.doc, bookmark);
	}
}
