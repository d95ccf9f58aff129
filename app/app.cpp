/* app.cpp - command-line front end for Forumcast.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "forum_page.hpp"
#include "forum_post.hpp"
#include "html_document.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <wx/file.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/translation.h>

wxIMPLEMENT_APP_CONSOLE(app);

namespace {
void print_list(const char* label, const std::vector<std::string>& items) {
	for (const auto& item : items) {
		std::cout << label << ": " << item << '\n';
	}
}
} // namespace

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	static const wxCmdLineEntryDesc cmd_line_desc[] = {
		{wxCMD_LINE_SWITCH, "h", "help", "show this help", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
		{wxCMD_LINE_OPTION, "c", "config", "configuration file", wxCMD_LINE_VAL_STRING, 0},
		{wxCMD_LINE_OPTION, "b", "base-url", "forum base URL used to resolve relative links", wxCMD_LINE_VAL_STRING, 0},
		{wxCMD_LINE_OPTION, "u", "url", "URL the page was saved from", wxCMD_LINE_VAL_STRING, 0},
		{wxCMD_LINE_SWITCH, "l", "list", "print the threads of a saved new-threads page", wxCMD_LINE_VAL_NONE, 0},
		{wxCMD_LINE_SWITCH, "v", "verbose", "log progress to stderr", wxCMD_LINE_VAL_NONE, 0},
		{wxCMD_LINE_PARAM, nullptr, nullptr, "html file", wxCMD_LINE_VAL_STRING, 0},
		{wxCMD_LINE_NONE},
	};
	parser.SetDesc(cmd_line_desc);
	parser.SetLogo(APP_NAME + " " + APP_VERSION);
	parser.SetSwitchChars("-");
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	parser.Found("config", &config_path);
	parser.Found("base-url", &base_url);
	parser.Found("url", &page_url);
	list_threads = parser.Found("list");
	verbose = parser.Found("verbose");
	input_path = parser.GetParam(0);
	return true;
}

bool app::OnInit() {
	SetAppName(APP_NAME);
	delete wxLog::SetActiveTarget(new wxLogStderr());
	if (!wxAppConsole::OnInit()) {
		return false;
	}
	wxLog::SetVerbose(verbose);
	wxLog::SetLogLevel(verbose ? wxLOG_Info : wxLOG_Warning);
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration"));
		return false;
	}
	return true;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

int app::OnRun() {
	std::string html;
	if (!read_input(html)) {
		return 1;
	}
	const auto forum_url = get_base_url();
	if (!config_mgr.validate()) {
		wxLogWarning(_("Configuration is incomplete: forum_base_url must be set and check intervals must be positive"));
	}
	if (list_threads) {
		return print_thread_list(html, forum_url);
	}
	const post_extractor extractor{config_mgr.get_extractor_options()};
	return print_post(html, forum_url, extractor);
}

bool app::read_input(std::string& html) const {
	wxFileName file_path{input_path};
	file_path.Normalize(wxPATH_NORM_ABSOLUTE | wxPATH_NORM_DOTS | wxPATH_NORM_TILDE);
	const wxString path = file_path.GetFullPath();
	if (!wxFileName::FileExists(path)) {
		wxLogError(_("File not found: %s"), path);
		return false;
	}
	wxFile file(path);
	if (!file.IsOpened()) {
		wxLogError(_("Failed to open %s"), path);
		return false;
	}
	const auto length = file.Length();
	if (length < 0) {
		wxLogError(_("Failed to read %s"), path);
		return false;
	}
	html.assign(static_cast<size_t>(length), '\0');
	if (length > 0 && file.Read(html.data(), html.size()) != static_cast<ssize_t>(html.size())) {
		wxLogError(_("Failed to read %s"), path);
		return false;
	}
	return true;
}

std::string app::get_base_url() const {
	auto url = base_url.IsEmpty() ? config_mgr.get(config_manager::forum_base_url) : base_url;
	while (url.EndsWith("/")) {
		url.RemoveLast();
	}
	return url.utf8_string();
}

int app::print_thread_list(const std::string& html, const std::string& forum_url) {
	try {
		const auto threads = parse_thread_list(html, forum_url, config_mgr.get(config_manager::max_posts_per_check));
		for (const auto& thread : threads) {
			std::cout << thread.id << '\t' << thread.title << '\t' << thread.author << '\t' << thread.url << '\n';
		}
	} catch (const page_exception& e) {
		wxLogError("%s", e.get_display_message());
		return 1;
	}
	return 0;
}

int app::print_post(const std::string& html, const std::string& forum_url, const post_extractor& extractor) {
	const std::string url = page_url.IsEmpty() ? input_path.utf8_string() : page_url.utf8_string();
	post_summary summary;
	try {
		summary = parse_post_summary(html, url);
	} catch (const page_exception& e) {
		wxLogInfo("%s, treating the file as a message fragment", e.get_display_message());
		return print_fragment(html, forum_url, extractor);
	}
	html_post_loader loader{[&html](const std::string&) -> std::optional<std::string> { return html; }, forum_url, extractor};
	forum_post post{summary.id, summary.title, summary.url, summary.author, &loader};
	std::cout << post.to_message() << '\n';
	print_list("图片", post.images());
	return 0;
}

int app::print_fragment(const std::string& html, const std::string& forum_url, const post_extractor& extractor) {
	const auto body = parse_markup_fragment(html, extractor.get_options().max_depth);
	const auto result = extractor.extract(body ? &*body : nullptr, forum_url);
	std::cout << result.text << '\n';
	print_list("图片", result.images);
	print_list("标签", result.tags);
	return 0;
}
