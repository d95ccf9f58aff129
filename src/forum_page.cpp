/* forum_page.cpp - thread list and post page parsing.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "forum_page.hpp"
#include "constants.hpp"
#include "html_document.hpp"
#include "utils.hpp"
#include <charconv>
#include <regex>
#include <string>
#include <utility>
#include <wx/log.h>
#include <wx/translation.h>

namespace {
constexpr std::string_view POSTED_AT_PREFIX = "发表于";

markup_node load_page(const std::string& html, int max_depth) {
	html_document document;
	if (!document.parse(html)) {
		throw page_exception(_("Failed to parse page"));
	}
	auto page = document.to_markup(max_depth);
	if (!page) {
		throw page_exception(_("Page has no document element"));
	}
	return std::move(*page);
}

const markup_node* first_child(const markup_node& parent, const node_predicate& pred) {
	for (const auto& child : parent.children) {
		if (pred(child)) {
			return &child;
		}
	}
	return nullptr;
}

std::string read_post_time_text(const markup_node& post, const std::string& post_id) {
	const auto* posted_at = find_by_id(post, "authorposton" + post_id);
	if (!posted_at) {
		return {};
	}
	// Recent posts carry the exact time in a span title; older ones print it after a prefix.
	const auto* exact = first_child(*posted_at, [](const markup_node& node) {
		return node.tag == "span" && node.has_attribute("title");
	});
	if (exact) {
		return trim_string(exact->get_attribute("title"));
	}
	auto text = flatten_text(*posted_at);
	if (text.starts_with(POSTED_AT_PREFIX)) {
		text.erase(0, POSTED_AT_PREFIX.size());
	}
	return trim_string(text);
}
} // namespace

wxDateTime parse_post_time(const std::string& text) {
	const wxString value = wxString::FromUTF8(text);
	for (const char* format : {POST_TIME_FORMAT, POST_TIME_SHORT_FORMAT}) {
		wxDateTime parsed;
		wxString::const_iterator end;
		if (parsed.ParseFormat(value, format, &end) && end == value.end()) {
			return parsed;
		}
	}
	wxLogWarning("Could not parse post time '%s', using the current time", value);
	return wxDateTime::Now();
}

post_details parse_post_page(const std::string& html, std::string_view base_url, const post_extractor& extractor) {
	const auto page = load_page(html, extractor.get_options().max_depth);
	const auto* post_list = find_by_id(page, "postlist");
	if (!post_list) {
		throw page_exception(_("Post list not found"));
	}
	const auto* post = first_child(*post_list, [](const markup_node& node) {
		return node.tag == "div" && node.get_attribute("id").find("post_") != std::string::npos;
	});
	if (!post) {
		throw page_exception(_("No post found in post list"));
	}
	const auto post_element_id = post->get_attribute("id");
	const auto post_id = post_element_id.substr(post_element_id.rfind('_') + 1);
	if (post_id.empty()) {
		throw page_exception(wxString::Format(_("Malformed post id '%s'"), wxString::FromUTF8(post_element_id)));
	}
	const auto* message = find_by_id(*post, "postmessage_" + post_id);
	if (!message) {
		throw page_exception(wxString::Format(_("Message body of post %s not found"), wxString::FromUTF8(post_id)));
	}
	auto extraction = extractor.extract(*message, base_url);
	return post_details{
		.content = std::move(extraction.text),
		.publish_time = parse_post_time(read_post_time_text(*post, post_id)),
		.images = std::move(extraction.images),
		.tags = std::move(extraction.tags),
	};
}

post_summary parse_post_summary(const std::string& html, const std::string& page_url) {
	const auto page = load_page(html, DEFAULT_MAX_DEPTH);
	const auto* post_list = find_by_id(page, "postlist");
	if (!post_list) {
		throw page_exception(_("Post list not found"), wxString::FromUTF8(page_url));
	}
	post_summary summary;
	summary.url = page_url;
	summary.id = extract_thread_id(page_url).value_or(0);
	if (const auto* subject = find_by_id(page, "thread_subject")) {
		summary.title = flatten_text(*subject);
	}
	const auto* author_link = find_first(*post_list, [](const markup_node& node) {
		return node.tag == "a" && has_class(node, "xw1");
	});
	if (author_link) {
		summary.author = flatten_text(*author_link);
	}
	return summary;
}

std::optional<long long> extract_thread_id(std::string_view url) {
	static const std::regex id_pattern(R"((?:tid=|thread-|t)(\d+))");
	const std::string subject(url);
	std::optional<long long> result;
	for (auto it = std::sregex_iterator(subject.begin(), subject.end(), id_pattern); it != std::sregex_iterator(); ++it) {
		const auto digits = (*it)[1].str();
		long long value = 0;
		const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
		if (ec == std::errc{} && ptr == digits.data() + digits.size()) {
			result = value;
		}
	}
	return result;
}

std::vector<post_summary> parse_thread_list(const std::string& html, std::string_view base_url, int limit) {
	std::vector<post_summary> threads;
	const auto page = load_page(html, DEFAULT_MAX_DEPTH);
	const auto* container = find_first(page, [](const markup_node& node) {
		return first_child(node, [](const markup_node& child) {
			return child.get_attribute("id") == "forumnew";
		}) != nullptr;
	});
	if (!container) {
		throw page_exception(_("Thread list not found"));
	}
	const markup_node* table = nullptr;
	for (size_t i = 0; i + 1 < container->children.size(); ++i) {
		if (container->children[i].get_attribute("id") == "forumnew") {
			table = &container->children[i + 1];
			break;
		}
	}
	if (!table) {
		return threads;
	}
	for (const auto& row : table->children) {
		if (row.tag != "tbody") {
			continue;
		}
		if (limit > 0 && static_cast<int>(threads.size()) >= limit) {
			break;
		}
		const auto* heading = find_first(row, [](const markup_node& node) {
			return node.tag == "th" && node.get_attribute("class") == "common";
		});
		const auto* link = heading ? first_child(*heading, [](const markup_node& node) { return node.tag == "a"; }) : nullptr;
		const auto* by_cell = find_first(row, [](const markup_node& node) {
			return node.tag == "td" && node.get_attribute("class") == "by";
		});
		const auto* cite = by_cell ? first_child(*by_cell, [](const markup_node& node) { return node.tag == "cite"; }) : nullptr;
		const auto* author_link = cite ? first_child(*cite, [](const markup_node& node) { return node.tag == "a"; }) : nullptr;
		if (!link || !author_link) {
			wxLogWarning("Skipping thread row without title or author");
			continue;
		}
		post_summary summary;
		summary.title = flatten_text(*link);
		summary.url = resolve_url(base_url, trim_string(link->get_attribute("href")));
		summary.author = flatten_text(*author_link);
		const auto thread_id = extract_thread_id(summary.url);
		if (!thread_id) {
			wxLogWarning("Skipping thread with unrecognized url %s", wxString::FromUTF8(summary.url));
			continue;
		}
		summary.id = *thread_id;
		threads.push_back(std::move(summary));
	}
	return threads;
}

html_post_loader::html_post_loader(page_fetcher fetcher, std::string forum_base_url, post_extractor text_extractor) : fetch{std::move(fetcher)}, base_url{std::move(forum_base_url)}, extractor{std::move(text_extractor)} {
}

std::optional<post_details> html_post_loader::load_post_details(const std::string& url) {
	wxLogMessage("Loading post details: %s", wxString::FromUTF8(url));
	std::optional<std::string> html;
	if (fetch) {
		html = fetch(url);
	}
	if (!html) {
		wxLogError("Could not fetch post page %s", wxString::FromUTF8(url));
		return std::nullopt;
	}
	try {
		return parse_post_page(*html, base_url, extractor);
	} catch (const page_exception& e) {
		wxLogError("%s", page_exception(e.get_message(), wxString::FromUTF8(url), e.get_severity()).get_display_message());
		return std::nullopt;
	}
}
