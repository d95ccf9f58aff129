/* node_classifier.cpp - maps elements to extraction rules.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "node_classifier.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace {
constexpr std::array skipped_tags = {
	std::string_view{"script"},
	std::string_view{"style"},
	std::string_view{"noscript"},
};
} // namespace

node_rule classify_node(const markup_node& node) {
	const std::string tag_name = to_lower(node.tag);
	if (tag_name == "img") {
		return node_rule::image;
	}
	if (tag_name == "a") {
		return node_rule::link;
	}
	if (tag_name == "iframe") {
		return node_rule::embedded_frame;
	}
	if (is_heading_tag(tag_name)) {
		return node_rule::heading;
	}
	if (tag_name == "blockquote") {
		return node_rule::quotation;
	}
	if (tag_name == "br") {
		return node_rule::line_break;
	}
	if (tag_name == "span") {
		return node_rule::inline_container;
	}
	if (tag_name == "div") {
		return node_rule::block_container;
	}
	if (tag_name == "strong" || tag_name == "b") {
		return node_rule::bold;
	}
	if (tag_name == "em" || tag_name == "i") {
		return node_rule::italic;
	}
	if (tag_name == "p" && !node.text.empty()) {
		return node_rule::paragraph;
	}
	if (std::ranges::find(skipped_tags, std::string_view{tag_name}) != skipped_tags.end()) {
		return node_rule::skipped;
	}
	return node_rule::transparent;
}

const char* node_rule_name(node_rule rule) noexcept {
	switch (rule) {
		case node_rule::image:
			return "image";
		case node_rule::link:
			return "link";
		case node_rule::embedded_frame:
			return "embedded_frame";
		case node_rule::heading:
			return "heading";
		case node_rule::quotation:
			return "quotation";
		case node_rule::line_break:
			return "line_break";
		case node_rule::inline_container:
			return "inline_container";
		case node_rule::block_container:
			return "block_container";
		case node_rule::bold:
			return "bold";
		case node_rule::italic:
			return "italic";
		case node_rule::paragraph:
			return "paragraph";
		case node_rule::skipped:
			return "skipped";
		case node_rule::transparent:
			return "transparent";
	}
	return "unknown";
}
