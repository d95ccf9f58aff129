/* html_document.cpp - lexbor-backed HTML parsing into markup_node trees.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_document.hpp"
#include "utils.hpp"
#include <lexbor/dom/interfaces/attr.h>
#include <lexbor/dom/interfaces/character_data.h>
#include <lexbor/dom/interfaces/document.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/html/parser.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <wx/log.h>

html_document::html_document() : doc(lxb_html_document_create()) {
	if (!doc) {
		throw std::runtime_error("Failed to create Lexbor HTML document");
	}
}

bool html_document::parse(const std::string& html_content) {
	parsed = false;
	const auto status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html_content.data()), html_content.length());
	if (status != LXB_STATUS_OK) {
		wxLogWarning("lexbor failed to parse document (status %d)", static_cast<int>(status));
		return false;
	}
	parsed = true;
	return true;
}

std::optional<markup_node> html_document::to_markup(int max_depth) const {
	if (!parsed) {
		return std::nullopt;
	}
	auto* root = lxb_dom_document_element(lxb_dom_interface_document(doc.get()));
	if (!root) {
		return std::nullopt;
	}
	markup_node result;
	convert_element(root, result, 0, max_depth);
	return result;
}

std::optional<markup_node> html_document::body_markup(int max_depth) const {
	if (!parsed) {
		return std::nullopt;
	}
	auto* body = lxb_html_document_body_element(doc.get());
	if (!body) {
		return std::nullopt;
	}
	markup_node result;
	convert_element(lxb_dom_interface_element(body), result, 0, max_depth);
	return result;
}

void html_document::convert_element(lxb_dom_element_t* element, markup_node& out, int depth, int max_depth) {
	out.tag = to_lower(get_tag_name(element));
	for (auto* attr = lxb_dom_element_first_attribute(element); attr; attr = lxb_dom_element_next_attribute(attr)) {
		size_t name_len = 0;
		const auto* name = lxb_dom_attr_local_name(attr, &name_len);
		if (!name || name_len == 0) {
			continue;
		}
		size_t value_len = 0;
		const auto* value = lxb_dom_attr_value(attr, &value_len);
		std::string key{reinterpret_cast<const char*>(name), name_len};
		std::string val = value ? std::string{reinterpret_cast<const char*>(value), value_len} : std::string{};
		out.attributes.emplace(std::move(key), std::move(val));
	}
	if (depth >= max_depth) {
		wxLogDebug("Markup nested deeper than %d levels under <%s>, dropping children", max_depth, wxString::FromUTF8(out.tag));
		return;
	}
	for (auto* child = lxb_dom_interface_node(element)->first_child; child; child = child->next) {
		switch (child->type) {
			case LXB_DOM_NODE_TYPE_ELEMENT:
				out.children.emplace_back();
				convert_element(lxb_dom_interface_element(child), out.children.back(), depth + 1, max_depth);
				break;
			case LXB_DOM_NODE_TYPE_TEXT:
			case LXB_DOM_NODE_TYPE_CDATA_SECTION: {
				auto& target = out.children.empty() ? out.text : out.children.back().tail;
				target += remove_soft_hyphens(get_node_text(child));
				break;
			}
			default:
				break;
		}
	}
}

std::string_view html_document::get_tag_name(lxb_dom_element_t* element) noexcept {
	if (!element) {
		return {};
	}
	size_t len;
	const auto* name = lxb_dom_element_local_name(element, &len);
	return name ? std::string_view{reinterpret_cast<const char*>(name), len} : std::string_view{};
}

std::string html_document::get_node_text(lxb_dom_node_t* node) {
	const auto* char_data = lxb_dom_interface_character_data(node);
	if (!char_data || !char_data->data.data || char_data->data.length == 0) {
		return {};
	}
	return std::string{reinterpret_cast<const char*>(char_data->data.data), char_data->data.length};
}

std::optional<markup_node> parse_markup_fragment(const std::string& html_content, int max_depth) {
	html_document document;
	if (!document.parse(html_content)) {
		return std::nullopt;
	}
	return document.body_markup(max_depth);
}
