/* config_manager.hpp - persistent settings.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "post_extractor.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;

	constexpr app_setting(const char* k, const T& def) : key{k}, default_value{def} {
	}
};

class config_manager {
public:
	static constexpr app_setting<int> check_interval{"check_interval", DEFAULT_CHECK_INTERVAL};
	static constexpr app_setting<int> max_posts_per_check{"max_posts_per_check", DEFAULT_MAX_POSTS_PER_CHECK};
	static constexpr app_setting<int> max_depth{"max_depth", DEFAULT_MAX_DEPTH};
	static constexpr app_setting<bool> deduplicate_images{"deduplicate_images", false};
	static inline const app_setting<wxString> forum_base_url{"forum_base_url", wxString("")};
	static inline const app_setting<wxString> platform_name{"platform_name", wxString("Steam")};
	// List settings hold ';'-separated values.
	static inline const app_setting<wxString> platform_link_tokens{"platform_link_tokens", wxString("steam")};
	static inline const app_setting<wxString> storefront_tokens{"storefront_tokens", wxString("steam")};
	static inline const app_setting<wxString> countdown_tokens{"countdown_tokens", wxString("countdown")};
	static inline const app_setting<wxString> caption_styles{"caption_styles", wxString("font-size: 10px;overflow: visible")};
	static inline const app_setting<wxString> skipped_classes{"skipped_classes", wxString("swi-block;steam-info-wrapper;tip;steam-info-loading;original_text_style1")};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// An empty path selects Forumcast.ini next to the executable, or in the user data directory.
	bool initialize(const wxString& path = wxEmptyString);
	void flush();
	void shutdown();

	bool is_initialized() const {
		return config != nullptr;
	}

	template <typename T>
	T get(const app_setting<T>& setting) const {
		return get_app_setting(wxString(setting.key), setting.default_value);
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		set_app_setting(wxString(setting.key), value);
	}

	[[nodiscard]] std::vector<std::string> get_list(const app_setting<wxString>& setting) const;
	[[nodiscard]] extractor_options get_extractor_options() const;
	// The forum base URL is the one setting without a usable default.
	[[nodiscard]] bool validate() const;

private:
	std::unique_ptr<wxFileConfig> config;
	bool owns_global_config{false};

	template <typename T>
	T get_app_setting(const wxString& key, const T& default_value) const;
	template <typename T>
	void set_app_setting(const wxString& key, const T& value);
	static wxString get_config_path();
	static bool is_directory_writable(const wxString& dir);
	void load_defaults();
	void with_app_section(const std::function<void()>& func) const;
};
