/* html_document.hpp - lexbor-backed HTML parsing into markup_node trees.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "markup_node.hpp"
#include <lexbor/html/html.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Owns one lexbor document and hands out markup_node copies of it.
class html_document {
public:
	html_document();
	~html_document() = default;
	html_document(const html_document&) = delete;
	html_document& operator=(const html_document&) = delete;
	html_document(html_document&&) = default;
	html_document& operator=(html_document&&) = default;
	[[nodiscard]] bool parse(const std::string& html_content);
	[[nodiscard]] std::optional<markup_node> to_markup(int max_depth = DEFAULT_MAX_DEPTH) const;
	[[nodiscard]] std::optional<markup_node> body_markup(int max_depth = DEFAULT_MAX_DEPTH) const;

private:
	struct DocumentDeleter {
		void operator()(lxb_html_document_t* doc) const noexcept {
			if (doc) {
				lxb_html_document_destroy(doc);
			}
		}
	};
	using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

	DocumentPtr doc;
	bool parsed{false};

	static void convert_element(lxb_dom_element_t* element, markup_node& out, int depth, int max_depth);
	[[nodiscard]] static std::string_view get_tag_name(lxb_dom_element_t* element) noexcept;
	[[nodiscard]] static std::string get_node_text(lxb_dom_node_t* node);
};

// Parses a snippet of HTML and returns its body element, or nothing if lexbor rejects it.
[[nodiscard]] std::optional<markup_node> parse_markup_fragment(const std::string& html_content, int max_depth = DEFAULT_MAX_DEPTH);
