/* app.hpp - command line application header file.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "outliner_error.hpp"
#include "report_parser.hpp"
#include <optional>
#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/log.h>

enum class exit_status : int {
	ok = 0,
	invalid_input = 1,
	no_structure = 2,
	io_error = 3,
};

class app : public wxAppConsole {
public:
	app() = default;
	~app() override = default;
	app(const app&) = delete;
	app& operator=(const app&) = delete;
	app(app&&) = delete;
	app& operator=(app&&) = delete;
	bool OnInit() override;
	int OnRun() override;
	int OnExit() override;
	void OnInitCmdLine(wxCmdLineParser& parser) override;
	bool OnCmdLineParsed(wxCmdLineParser& parser) override;

private:
	config_manager config_mgr;
	wxString input_path;
	wxString out_dir;
	wxString strategy_arg;
	wxString config_path;
	std::optional<long> max_toc_pages;
	bool skip_export{false};
	bool verbose{false};

	[[nodiscard]] parse_options resolve_options() const;
	void print_summary(const parse_result& result) const;
	[[nodiscard]] static int exit_code_for(const outliner_error& e) noexcept;
};

wxDECLARE_APP(app);
