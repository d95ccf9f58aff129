/* forum_post.hpp - lazily loaded forum post.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <wx/datetime.h>

struct post_details {
	std::string content;
	wxDateTime publish_time;
	std::vector<std::string> images;
	std::vector<std::string> tags;
};

// Supplies the heavy fields of a post. Returning nothing, or throwing, means the post could not be loaded.
class post_loader {
public:
	virtual ~post_loader() = default;
	[[nodiscard]] virtual std::optional<post_details> load_post_details(const std::string& url) = 0;
};

// A post whose identity is known up front and whose body is loaded once, on first use.
// Not thread-safe: callers reading the same post from several threads must serialize the first read.
class forum_post {
public:
	forum_post(long long post_id, std::string post_title, std::string post_url, std::string post_author, post_loader* details_loader = nullptr);
	~forum_post() = default;
	forum_post(const forum_post&) = default;
	forum_post& operator=(const forum_post&) = default;
	forum_post(forum_post&&) = default;
	forum_post& operator=(forum_post&&) = default;

	[[nodiscard]] long long get_id() const noexcept {
		return id;
	}

	[[nodiscard]] const std::string& get_title() const noexcept {
		return title;
	}

	[[nodiscard]] const std::string& get_url() const noexcept {
		return url;
	}

	[[nodiscard]] const std::string& get_author() const noexcept {
		return author;
	}

	[[nodiscard]] const std::string& content();
	[[nodiscard]] wxDateTime publish_time();
	[[nodiscard]] const std::vector<std::string>& images();
	[[nodiscard]] const std::vector<std::string>& tags();

	[[nodiscard]] bool is_loaded() const noexcept {
		return loaded;
	}

	void ensure_loaded();
	[[nodiscard]] std::string to_message();

private:
	long long id;
	std::string title;
	std::string url;
	std::string author;
	post_loader* loader{nullptr};
	std::optional<post_details> details;
	bool loaded{false};

	void use_fallback();
};
