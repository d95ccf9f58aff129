/* markup_node.cpp - element tree read by the content extractor.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markup_node.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

markup_node::markup_node(std::string tag_name, std::map<std::string, std::string> attrs, std::string own_text, std::string tail_text) : tag{to_lower(tag_name)}, attributes{std::move(attrs)}, text{std::move(own_text)}, tail{std::move(tail_text)} {
}

bool markup_node::has_attribute(std::string_view name) const {
	return attributes.find(std::string(name)) != attributes.end();
}

std::string markup_node::get_attribute(std::string_view name) const {
	const auto it = attributes.find(std::string(name));
	return it == attributes.end() ? std::string{} : it->second;
}

markup_node& markup_node::append_child(markup_node child) {
	children.push_back(std::move(child));
	return children.back();
}

markup_node& markup_node::append_child(std::string tag_name, std::map<std::string, std::string> attrs, std::string own_text, std::string tail_text) {
	return append_child(markup_node{std::move(tag_name), std::move(attrs), std::move(own_text), std::move(tail_text)});
}

namespace {
void collect_text(const markup_node& node, std::vector<std::string>& parts) {
	auto add = [&parts](const std::string& raw) {
		auto trimmed = trim_string(raw);
		if (!trimmed.empty()) {
			parts.push_back(std::move(trimmed));
		}
	};
	add(node.text);
	for (const auto& child : node.children) {
		collect_text(child, parts);
		add(child.tail);
	}
}

void collect_matches(const markup_node& node, const node_predicate& pred, std::vector<const markup_node*>& out) {
	for (const auto& child : node.children) {
		if (pred(child)) {
			out.push_back(&child);
		}
		collect_matches(child, pred, out);
	}
}
} // namespace

std::string flatten_text(const markup_node& node) {
	std::vector<std::string> parts;
	collect_text(node, parts);
	std::ostringstream oss;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i > 0) {
			oss << ' ';
		}
		oss << parts[i];
	}
	return oss.str();
}

const markup_node* find_first(const markup_node& root, const node_predicate& pred) {
	if (pred(root)) {
		return &root;
	}
	for (const auto& child : root.children) {
		if (const auto* found = find_first(child, pred)) {
			return found;
		}
	}
	return nullptr;
}

const markup_node* find_by_id(const markup_node& root, std::string_view id) {
	return find_first(root, [id](const markup_node& node) {
		const auto it = node.attributes.find("id");
		return it != node.attributes.end() && it->second == id;
	});
}

std::vector<const markup_node*> find_all(const markup_node& root, const node_predicate& pred) {
	std::vector<const markup_node*> result;
	collect_matches(root, pred, result);
	return result;
}

bool has_class(const markup_node& node, std::string_view class_name) {
	std::istringstream classes(node.get_attribute("class"));
	std::string cls;
	while (classes >> cls) {
		if (cls == class_name) {
			return true;
		}
	}
	return false;
}
