/* app.cpp - command line entry point.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "exporter.hpp"
#include "page_source.hpp"
#include "utils.hpp"
#include <algorithm>
#include <wx/crt.h>
#include <wx/filename.h>
#include <wx/translation.h>

namespace {
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_OPTION, "o", "out", "output directory", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "s", "strategy", "auto|outline|toc|headings", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, "m", "max-toc-pages", "search for a contents page within the first N pages", wxCMD_LINE_VAL_NUMBER, 0},
	{wxCMD_LINE_OPTION, "c", "config", "configuration file", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_SWITCH, nullptr, "no-export", "do not write output files", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log every pipeline step", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "input document", wxCMD_LINE_VAL_STRING, wxCMD_LINE_OPTION_MANDATORY},
	wxCMD_LINE_DESC_END,
};

wxString ellipsize(const std::string& text, size_t max_length) {
	const wxString value = wxString::FromUTF8(text);
	if (value.length() <= max_length) {
		return value;
	}
	return value.Left(max_length - 1) + wxString::FromUTF8("\xE2\x80\xA6");
}
} // namespace

bool app::OnInit() {
	wxLog::DisableTimestamp();
	delete wxLog::SetActiveTarget(new wxLogStderr());
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	wxLog::SetVerbose(verbose);
	if (!use_unicode_ctype()) {
		wxLogWarning(_("No UTF-8 locale available; heading case will only be mapped for ASCII letters."));
	}
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration at %s"), config_path);
		return false;
	}
	wxLogVerbose("Using configuration %s", config_mgr.get_path());
	return true;
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	parser.SetDesc(command_line_desc);
	parser.SetSwitchChars("-");
	parser.SetLogo(wxString::Format("%s %s - infers the section outline of long reports.\n%s", APP_NAME, APP_VERSION, APP_COPYRIGHT));
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	input_path = parser.GetParam(0);
	parser.Found("out", &out_dir);
	parser.Found("strategy", &strategy_arg);
	parser.Found("config", &config_path);
	long toc_pages = 0;
	if (parser.Found("max-toc-pages", &toc_pages)) {
		max_toc_pages = toc_pages;
	}
	skip_export = parser.Found("no-export");
	verbose = parser.Found("verbose");
	return true;
}

parse_options app::resolve_options() const {
	parse_options options;
	const wxString strategy_value = strategy_arg.IsEmpty() ? config_mgr.get(config_manager::default_strategy) : strategy_arg;
	options.mode = parse_strategy(strategy_value);
	options.max_toc_pages = checked_toc_window(max_toc_pages.value_or(config_mgr.get(config_manager::max_toc_pages)));
	return options;
}

int app::OnRun() {
	wxFileName file_path{input_path};
	file_path.Normalize(wxPATH_NORM_ABSOLUTE | wxPATH_NORM_DOTS | wxPATH_NORM_TILDE);
	const wxString path = file_path.GetFullPath();
	try {
		const parse_options options = resolve_options();
		wxLogMessage(_("Reading %s"), path);
		const parse_result result = parse_file(path, options);
		wxLogMessage(_("Extracted %d pages of text."), result.page_count);
		wxLogMessage(_("Using strategy: %s"), strategy_name(result.strategy_used));
		print_summary(result);
		if (!skip_export) {
			const wxString target = out_dir.IsEmpty() ? config_mgr.get(config_manager::output_dir) : out_dir;
			export_result(result, target);
			wxLogMessage(_("Outputs written to: %s"), target);
		}
	} catch (const outliner_error& e) {
		wxLogError("%s", e.get_display_message());
		return exit_code_for(e);
	}
	return static_cast<int>(exit_status::ok);
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

void app::print_summary(const parse_result& result) const {
	wxPrintf("%5s  %-60s  %9s  %7s\n", "Level", "Title", "Pages", "Words");
	const size_t rows = std::min(result.sections.size(), ENTRY_PREVIEW_ROWS);
	for (size_t i = 0; i < rows; ++i) {
		const auto& sec = result.sections[i];
		const wxString pages = wxString::Format("%d-%d", sec.start_page, sec.end_page);
		wxPrintf("%5d  %-60s  %9s  %7lu\n", sec.level, ellipsize(sec.title, 60), pages, static_cast<unsigned long>(sec.word_count()));
	}
	if (result.sections.size() > rows) {
		wxPrintf("%5s  (+%lu more)\n", "...", static_cast<unsigned long>(result.sections.size() - rows));
	}
	wxPrintf("Sections produced: %lu (strategy=%s)\n", static_cast<unsigned long>(result.sections.size()), strategy_name(result.strategy_used));
}

int app::exit_code_for(const outliner_error& e) noexcept {
	switch (e.get_code()) {
		case error_code::invalid_input:
		case error_code::unsupported_format:
			return static_cast<int>(exit_status::invalid_input);
		case error_code::no_structure_detected:
			return static_cast<int>(exit_status::no_structure);
		case error_code::load_failed:
		case error_code::export_failed:
		case error_code::hash_failed:
			return static_cast<int>(exit_status::io_error);
	}
	return static_cast<int>(exit_status::io_error);
}

wxIMPLEMENT_APP_CONSOLE(app);
