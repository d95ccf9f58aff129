/* config_manager.cpp - persistent settings.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "utils.hpp"
#include <algorithm>
#include <functional>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	wxFileName config_file{path.IsEmpty() ? get_config_path() : path};
	config_file.Normalize(wxPATH_NORM_ABSOLUTE | wxPATH_NORM_DOTS | wxPATH_NORM_TILDE);
	config = std::make_unique<wxFileConfig>(APP_NAME, "", config_file.GetFullPath(), wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
	if (!config) {
		return false;
	}
	config->SetExpandEnvVars(false);
	if (wxConfigBase::Get(false) == nullptr) {
		wxConfigBase::Set(config.get());
		owns_global_config = true;
	}
	load_defaults();
	return true;
}

void config_manager::flush() {
	if (!config) {
		return;
	}
	config->Flush();
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	if (owns_global_config) {
		wxConfigBase::Set(nullptr);
		owns_global_config = false;
	}
	config.reset();
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	T result = default_value;
	with_app_section([this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	with_app_section([this, &key, &value]() {
		config->Write(key, value);
	});
}

std::vector<std::string> config_manager::get_list(const app_setting<wxString>& setting) const {
	return split_list(get(setting).utf8_string());
}

extractor_options config_manager::get_extractor_options() const {
	extractor_options options;
	options.max_depth = std::max(1, get(max_depth));
	options.deduplicate_images = get(deduplicate_images);
	const auto name = get(platform_name).utf8_string();
	if (!name.empty()) {
		options.platform_name = name;
	}
	options.platform_link_tokens = get_list(platform_link_tokens);
	options.storefront_tokens = get_list(storefront_tokens);
	options.countdown_tokens = get_list(countdown_tokens);
	options.caption_styles = get_list(caption_styles);
	options.skipped_classes = get_list(skipped_classes);
	return options;
}

bool config_manager::validate() const {
	return !get(forum_base_url).IsEmpty() && get(check_interval) > 0 && get(max_posts_per_check) > 0;
}

wxString config_manager::get_config_path() {
	const wxString exe_path = wxStandardPaths::Get().GetExecutablePath();
	const wxString exe_dir = wxFileName(exe_path).GetPath();
	if (is_directory_writable(exe_dir)) {
		return exe_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
	}
	const wxString appdata_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(appdata_dir)) {
		wxFileName::Mkdir(appdata_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return appdata_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
}

bool config_manager::is_directory_writable(const wxString& dir) {
	const wxFileName fn(dir, wxEmptyString);
	return fn.IsDirWritable();
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(forum_base_url);
	set_default_if_missing(check_interval);
	set_default_if_missing(max_posts_per_check);
	set_default_if_missing(max_depth);
	set_default_if_missing(deduplicate_images);
	set_default_if_missing(platform_name);
	set_default_if_missing(platform_link_tokens);
	set_default_if_missing(storefront_tokens);
	set_default_if_missing(countdown_tokens);
	set_default_if_missing(caption_styles);
	set_default_if_missing(skipped_classes);
}

void config_manager::with_app_section(const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/app");
	func();
	config->SetPath("/");
}

template bool config_manager::get_app_setting<bool>(const wxString&, const bool&) const;
template int config_manager::get_app_setting<int>(const wxString&, const int&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void config_manager::set_app_setting<bool>(const wxString&, const bool&);
template void config_manager::set_app_setting<int>(const wxString&, const int&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&);
