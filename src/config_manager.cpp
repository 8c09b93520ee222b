/* config_manager.cpp - the INI file holding command line defaults.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
const wxString APP_GROUP = "/app";

int read_value(const wxFileConfig& cfg, const wxString& key, int fallback) {
	long value = fallback;
	cfg.Read(key, &value, fallback);
	return static_cast<int>(value);
}

wxString read_value(const wxFileConfig& cfg, const wxString& key, const wxString& fallback) {
	return cfg.Read(key, fallback);
}
} // namespace

config_manager::~config_manager() {
	shutdown();
}

bool config_manager::initialize(const wxString& path) {
	shutdown();
	config_path = path.IsEmpty() ? get_default_config_path() : path;
	const wxString dir = wxFileName(config_path).GetPath();
	if (!dir.IsEmpty() && !wxFileName::DirExists(dir) && !wxFileName::Mkdir(dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		return false;
	}
	config = std::make_unique<wxFileConfig>(APP_NAME, wxEmptyString, config_path, wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
	load_defaults();
	repair_invalid_values();
	return true;
}

void config_manager::shutdown() {
	if (config) {
		config->Flush();
		config.reset();
	}
}

wxString config_manager::app_key(const wxString& key) {
	return APP_GROUP + "/" + key;
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	if (!config) {
		return default_value;
	}
	return read_value(*config, app_key(key), default_value);
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	if (config) {
		config->Write(app_key(key), value);
	}
}

wxString config_manager::get_default_config_path() {
	const wxString file_name = APP_NAME.Lower() + ".ini";
	const wxFileName beside_exe(wxFileName(wxStandardPaths::Get().GetExecutablePath()).GetPath(), file_name);
	if (beside_exe.IsDirWritable()) {
		return beside_exe.GetFullPath();
	}
	return wxFileName(wxStandardPaths::Get().GetUserDataDir(), file_name).GetFullPath();
}

template <typename T>
void config_manager::write_if_missing(const app_setting<T>& setting) {
	const wxString key = app_key(setting.key);
	if (!config->HasEntry(key)) {
		config->Write(key, setting.default_value);
	}
}

void config_manager::load_defaults() {
	write_if_missing(default_strategy);
	write_if_missing(max_toc_pages);
	write_if_missing(output_dir);
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, CONFIG_VERSION_CURRENT);
	}
}

void config_manager::repair_invalid_values() {
	if (get(max_toc_pages) < 1) {
		wxLogWarning(_("Ignoring invalid %s in %s"), max_toc_pages.key, config_path);
		set(max_toc_pages, max_toc_pages.default_value);
	}
	if (get(output_dir).IsEmpty()) {
		wxLogWarning(_("Ignoring empty %s in %s"), output_dir.key, config_path);
		set(output_dir, output_dir.default_value);
	}
}

template int config_manager::get_app_setting<int>(const wxString&, const int&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void config_manager::set_app_setting<int>(const wxString&, const int&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&);
