/* post_extractor.cpp - turns a post body into annotated plain text.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "post_extractor.hpp"
#include "text_assembler.hpp"
#include "utils.hpp"
#include <algorithm>
#include <charconv>
#include <ctime>
#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <wx/datetime.h>
#include <wx/log.h>
#include <wx/string.h>

post_extractor::post_extractor(extractor_options opts) : options{std::move(opts)} {
}

extraction_result post_extractor::extract(const markup_node* root, std::string_view base_url) const {
	if (!root) {
		wxLogError("No message body to extract content from");
		return {CONTENT_PARSE_FAILED_TEXT, {}, {}};
	}
	try {
		extraction_state state{.base_url = base_url};
		process_node(*root, state, 0);
		extraction_result result;
		result.text = assemble_fragments(state.fragments);
		result.images = std::move(state.images);
		result.tags = collect_tags(*root);
		return result;
	} catch (const std::exception& e) {
		wxLogError("Failed to extract post content: %s", e.what());
		return {CONTENT_PARSE_FAILED_TEXT, {}, {}};
	}
}

std::vector<std::string> post_extractor::collect_tags(const markup_node& root) const {
	std::vector<std::string> tags;
	const auto tag_nodes = find_all(root, [](const markup_node& node) {
		if (node.tag == "span") {
			return node.get_attribute("class") == "tag";
		}
		return node.tag == "a" && node.get_attribute("class").find("tag") != std::string::npos;
	});
	for (const auto* node : tag_nodes) {
		auto text = trim_string(node->text);
		if (!text.empty()) {
			tags.push_back(std::move(text));
		}
	}
	return tags;
}

void post_extractor::process_node(const markup_node& node, extraction_state& state, int depth) const {
	if (depth > options.max_depth) {
		wxLogDebug("Skipping <%s> nested deeper than %d levels", wxString::FromUTF8(node.tag), options.max_depth);
		return;
	}
	add_text(state, node.text);
	for (const auto& child : node.children) {
		process_child(child, state, depth);
	}
}

void post_extractor::process_child(const markup_node& child, extraction_state& state, int depth) const {
	const auto rule = classify_node(child);
	try {
		apply_rule(rule, child, state, depth);
	} catch (const std::exception& e) {
		wxLogDebug("Handling <%s> as %s failed (%s), extracting it as plain content", wxString::FromUTF8(child.tag), node_rule_name(rule), e.what());
		process_node(child, state, depth + 1);
	}
	add_text(state, child.tail);
}

void post_extractor::apply_rule(node_rule rule, const markup_node& child, extraction_state& state, int depth) const {
	switch (rule) {
		case node_rule::image:
			handle_image(child, state);
			break;
		case node_rule::link:
			handle_link(child, state);
			break;
		case node_rule::embedded_frame:
			handle_frame(child, state);
			break;
		case node_rule::heading: {
			const auto title_text = flatten_text(child);
			if (!title_text.empty()) {
				state.fragments.push_back("\n**" + title_text + "**\n");
			}
			break;
		}
		case node_rule::quotation: {
			const auto quote_text = flatten_text(child);
			if (!quote_text.empty()) {
				state.fragments.push_back(quote_block(quote_text));
			}
			break;
		}
		case node_rule::line_break:
			state.fragments.emplace_back("\n");
			break;
		case node_rule::inline_container:
			handle_inline_container(child, state, depth);
			break;
		case node_rule::block_container:
			if (!has_skipped_class(child)) {
				process_node(child, state, depth + 1);
			}
			break;
		case node_rule::bold: {
			const auto bold_text = flatten_text(child);
			if (!bold_text.empty()) {
				state.fragments.push_back("**" + bold_text + "**");
			}
			break;
		}
		case node_rule::italic: {
			const auto italic_text = flatten_text(child);
			if (!italic_text.empty()) {
				state.fragments.push_back("*" + italic_text + "*");
			}
			break;
		}
		case node_rule::paragraph: {
			const auto para_text = flatten_text(child);
			if (!para_text.empty()) {
				state.fragments.push_back("\n" + para_text + "\n");
			}
			break;
		}
		case node_rule::skipped:
			break;
		case node_rule::transparent:
			process_node(child, state, depth + 1);
			break;
	}
}

void post_extractor::handle_image(const markup_node& image, extraction_state& state) const {
	const auto src = image.get_attribute("file");
	if (src.empty() || is_data_uri(src)) {
		return;
	}
	auto url = resolve_url(state.base_url, src);
	if (options.deduplicate_images && std::ranges::find(state.images, url) != state.images.end()) {
		return;
	}
	state.images.push_back(std::move(url));
}

void post_extractor::handle_link(const markup_node& link, extraction_state& state) const {
	const auto href = link.get_attribute("href");
	const auto link_text = flatten_text(link);
	if (contains_any_ignore_case(href, options.platform_link_tokens)) {
		state.fragments.push_back("[" + options.platform_name + "链接: " + (link_text.empty() ? href : link_text) + "]");
	} else if (href.starts_with('#')) {
		if (!link_text.empty()) {
			state.fragments.push_back(link_text);
		}
	} else if (contains_ignore_case(href, "javascript:")) {
		return;
	} else if (!href.empty() && !link_text.empty()) {
		state.fragments.push_back("[链接: " + link_text + " - " + resolve_url(state.base_url, href) + "]");
	} else if (!link_text.empty()) {
		state.fragments.push_back(link_text);
	}
}

void post_extractor::handle_frame(const markup_node& frame, extraction_state& state) const {
	const auto src = frame.get_attribute("src");
	if (contains_any_ignore_case(src, options.storefront_tokens)) {
		auto widget_src = src.find("widget") != std::string::npos ? replace_all(src, "widget", "app") : src;
		widget_src = widget_src.substr(0, widget_src.find('?'));
		state.fragments.push_back("[" + options.platform_name + "小部件: " + widget_src + "]");
		state.suppress_storefront_caption = true;
	} else if (contains_any_ignore_case(src, options.countdown_tokens)) {
		auto countdown = format_countdown(src);
		if (!countdown.empty()) {
			state.fragments.push_back("[倒计时: " + countdown + "]");
		}
	} else {
		state.fragments.emplace_back("[嵌入内容]");
	}
}

void post_extractor::handle_inline_container(const markup_node& span, extraction_state& state, int depth) const {
	if (state.suppress_storefront_caption && is_storefront_caption(span)) {
		state.suppress_storefront_caption = false;
		return;
	}
	if (has_skipped_class(span)) {
		return;
	}
	process_node(span, state, depth + 1);
}

bool post_extractor::is_storefront_caption(const markup_node& span) const {
	if (!contains_any(span.get_attribute("style"), options.caption_styles)) {
		return false;
	}
	const auto span_text = flatten_text(span);
	const bool names_platform = !options.platform_name.empty() && contains_ignore_case(span_text, options.platform_name);
	if (names_platform || contains_any_ignore_case(span_text, options.storefront_tokens)) {
		return true;
	}
	const auto* store_link = find_first(span, [this](const markup_node& node) {
		if (node.tag != "a") {
			return false;
		}
		const auto href = node.get_attribute("href");
		return contains_any_ignore_case(href, options.storefront_tokens) || contains_any_ignore_case(href, options.platform_link_tokens);
	});
	return store_link != nullptr;
}

bool post_extractor::has_skipped_class(const markup_node& node) const {
	return contains_any(node.get_attribute("class"), options.skipped_classes);
}

void post_extractor::add_text(extraction_state& state, const std::string& raw) {
	auto text = trim_string(raw);
	if (!text.empty()) {
		state.fragments.push_back(std::move(text));
	}
}

std::string post_extractor::quote_block(const std::string& text) {
	std::istringstream lines(text);
	std::string line;
	std::string quoted;
	while (std::getline(lines, line)) {
		if (trim_string(line).empty()) {
			continue;
		}
		if (!quoted.empty()) {
			quoted += '\n';
		}
		quoted += "> " + line;
	}
	return "\n" + quoted + "\n";
}

std::string post_extractor::format_countdown(std::string_view src) {
	const auto stamp = get_query_parameter(src, "t");
	if (stamp.empty() || !std::ranges::all_of(stamp, [](char c) { return c >= '0' && c <= '9'; })) {
		return {};
	}
	long long seconds = 0;
	const auto [ptr, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), seconds);
	if (ec != std::errc{} || ptr != stamp.data() + stamp.size() || seconds > MAX_COUNTDOWN_SECONDS) {
		return {};
	}
	const wxDateTime local_time(static_cast<time_t>(seconds));
	if (!local_time.IsValid()) {
		return {};
	}
	return local_time.Format(POST_TIME_FORMAT).utf8_string();
}
