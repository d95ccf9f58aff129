/* forum_post.cpp - lazily loaded forum post.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "forum_post.hpp"
#include "constants.hpp"
#include <exception>
#include <sstream>
#include <utility>
#include <wx/log.h>
#include <wx/string.h>

namespace {
const std::string empty_text;
const std::vector<std::string> empty_list;
} // namespace

forum_post::forum_post(long long post_id, std::string post_title, std::string post_url, std::string post_author, post_loader* details_loader) : id{post_id}, title{std::move(post_title)}, url{std::move(post_url)}, author{std::move(post_author)}, loader{details_loader} {
}

void forum_post::ensure_loaded() {
	if (loaded || loader == nullptr) {
		return;
	}
	try {
		details = loader->load_post_details(url);
	} catch (const std::exception& e) {
		wxLogError("Failed to load post %lld: %s", id, e.what());
		details.reset();
	}
	if (!details) {
		use_fallback();
	}
	loaded = true;
}

void forum_post::use_fallback() {
	details = post_details{
		.content = CONTENT_LOAD_FAILED_TEXT,
		.publish_time = wxDateTime::Now(),
		.images = {},
		.tags = {},
	};
}

const std::string& forum_post::content() {
	ensure_loaded();
	return details ? details->content : empty_text;
}

wxDateTime forum_post::publish_time() {
	ensure_loaded();
	if (details && details->publish_time.IsValid()) {
		return details->publish_time;
	}
	return wxDateTime::Now();
}

const std::vector<std::string>& forum_post::images() {
	ensure_loaded();
	return details ? details->images : empty_list;
}

const std::vector<std::string>& forum_post::tags() {
	ensure_loaded();
	return details ? details->tags : empty_list;
}

std::string forum_post::to_message() {
	std::ostringstream message;
	message << "**" << title << "**\n";
	message << author << " \\ " << publish_time().Format(POST_TIME_SHORT_FORMAT).utf8_string() << "\n";
	const auto& post_tags = tags();
	if (!post_tags.empty()) {
		message << "标签: ";
		for (size_t i = 0; i < post_tags.size(); ++i) {
			if (i > 0) {
				message << ", ";
			}
			message << post_tags[i];
		}
		message << "\n";
	}
	message << content() << "\n";
	message << "\n[查看原帖](" << url << ")";
	return message.str();
}
