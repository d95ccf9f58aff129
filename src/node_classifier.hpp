/* node_classifier.hpp - maps elements to extraction rules.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "markup_node.hpp"
#include <string_view>

// How the extractor treats one child node. Order matches the priority in which rules are tried.
enum class node_rule {
	image,
	link,
	embedded_frame,
	heading,
	quotation,
	line_break,
	inline_container,
	block_container,
	bold,
	italic,
	paragraph,
	skipped,
	transparent,
};

[[nodiscard]] node_rule classify_node(const markup_node& node);
[[nodiscard]] const char* node_rule_name(node_rule rule) noexcept;
[[nodiscard]] constexpr bool is_heading_tag(std::string_view tag_name) noexcept {
	return tag_name.length() == 2 && tag_name[0] == 'h' && tag_name[1] >= '1' && tag_name[1] <= '6';
}
