/* markup_node.hpp - element tree read by the content extractor.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// One element of a parsed post. Text that sits between a child and its next sibling is kept on the child as its tail.
struct markup_node {
	std::string tag;
	std::map<std::string, std::string> attributes;
	std::string text;
	std::string tail;
	std::vector<markup_node> children;

	markup_node() = default;
	explicit markup_node(std::string tag_name, std::map<std::string, std::string> attrs = {}, std::string own_text = {}, std::string tail_text = {});

	[[nodiscard]] bool has_attribute(std::string_view name) const;
	[[nodiscard]] std::string get_attribute(std::string_view name) const;
	markup_node& append_child(markup_node child);
	markup_node& append_child(std::string tag_name, std::map<std::string, std::string> attrs = {}, std::string own_text = {}, std::string tail_text = {});
};

using node_predicate = std::function<bool(const markup_node&)>;

// All descendant texts and tails, each trimmed, blanks dropped, joined by single spaces.
[[nodiscard]] std::string flatten_text(const markup_node& node);
[[nodiscard]] const markup_node* find_by_id(const markup_node& root, std::string_view id);
[[nodiscard]] const markup_node* find_first(const markup_node& root, const node_predicate& pred);
// Descendants of root (root excluded) matching pred, in document order.
[[nodiscard]] std::vector<const markup_node*> find_all(const markup_node& root, const node_predicate& pred);
[[nodiscard]] bool has_class(const markup_node& node, std::string_view class_name);
