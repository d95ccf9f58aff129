/* forum_page.hpp - thread list and post page parsing.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "forum_post.hpp"
#include "post_extractor.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <wx/datetime.h>
#include <wx/string.h>

enum class error_severity {
	error,
	warning
};

class page_exception : public std::runtime_error {
public:
	page_exception(const wxString& msg, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, severity{sev} {
	}
	page_exception(const wxString& msg, const wxString& page_url, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, url{page_url}, severity{sev} {
	}

	[[nodiscard]] error_severity get_severity() const noexcept {
		return severity;
	}

	[[nodiscard]] const wxString& get_url() const noexcept {
		return url;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (url.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", url, message);
	}

private:
	wxString message;
	wxString url;
	error_severity severity;
};

// Identity of a thread as listed on the forum's "new threads" page.
struct post_summary {
	long long id{0};
	std::string title;
	std::string url;
	std::string author;
};

// Reads the first post of a thread page. Throws page_exception when the page lacks the expected post markup.
[[nodiscard]] post_details parse_post_page(const std::string& html, std::string_view base_url, const post_extractor& extractor);
// Title and author of a thread page; the id comes from the page's own url.
[[nodiscard]] post_summary parse_post_summary(const std::string& html, const std::string& page_url);
[[nodiscard]] std::vector<post_summary> parse_thread_list(const std::string& html, std::string_view base_url, int limit = 0);
[[nodiscard]] wxDateTime parse_post_time(const std::string& text);
[[nodiscard]] std::optional<long long> extract_thread_id(std::string_view url);

using page_fetcher = std::function<std::optional<std::string>(const std::string& url)>;

// Loads post details by fetching the thread page and running it through the extractor.
class html_post_loader : public post_loader {
public:
	html_post_loader(page_fetcher fetcher, std::string forum_base_url, post_extractor text_extractor = {});
	[[nodiscard]] std::optional<post_details> load_post_details(const std::string& url) override;

private:
	page_fetcher fetch;
	std::string base_url;
	post_extractor extractor;
};
