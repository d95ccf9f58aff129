/* post_extractor.hpp - turns a post body into annotated plain text.
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
#include "node_classifier.hpp"
#include <string>
#include <string_view>
#include <vector>

struct extractor_options {
	int max_depth{DEFAULT_MAX_DEPTH};
	bool deduplicate_images{false};
	std::string platform_name{"Steam"};
	// Substrings of a link's href that mark it as pointing at the external platform.
	std::vector<std::string> platform_link_tokens{"steam"};
	// Substrings of an iframe src that mark a store widget.
	std::vector<std::string> storefront_tokens{"steam"};
	std::vector<std::string> countdown_tokens{"countdown"};
	// Style fragments of the caption the forum renders under a store widget.
	std::vector<std::string> caption_styles{"font-size: 10px", "overflow: visible"};
	std::vector<std::string> skipped_classes{"swi-block", "steam-info-wrapper", "tip", "steam-info-loading", "original_text_style1"};
};

struct extraction_result {
	std::string text;
	std::vector<std::string> images;
	std::vector<std::string> tags;
};

class post_extractor {
public:
	post_extractor() = default;
	explicit post_extractor(extractor_options opts);
	~post_extractor() = default;
	post_extractor(const post_extractor&) = default;
	post_extractor& operator=(const post_extractor&) = default;
	post_extractor(post_extractor&&) = default;
	post_extractor& operator=(post_extractor&&) = default;

	// Never throws. A missing root or an unexpected failure yields the parse-failure text and empty lists.
	[[nodiscard]] extraction_result extract(const markup_node* root, std::string_view base_url) const;
	[[nodiscard]] extraction_result extract(const markup_node& root, std::string_view base_url) const {
		return extract(&root, base_url);
	}
	[[nodiscard]] std::vector<std::string> collect_tags(const markup_node& root) const;

	[[nodiscard]] const extractor_options& get_options() const noexcept {
		return options;
	}

private:
	struct extraction_state {
		std::string_view base_url;
		std::vector<std::string> fragments;
		std::vector<std::string> images;
		// Armed after a store widget; the next matching caption span is dropped and disarms it.
		bool suppress_storefront_caption{false};
	};

	extractor_options options;

	void process_node(const markup_node& node, extraction_state& state, int depth) const;
	void process_child(const markup_node& child, extraction_state& state, int depth) const;
	void apply_rule(node_rule rule, const markup_node& child, extraction_state& state, int depth) const;
	void handle_image(const markup_node& image, extraction_state& state) const;
	void handle_link(const markup_node& link, extraction_state& state) const;
	void handle_frame(const markup_node& frame, extraction_state& state) const;
	void handle_inline_container(const markup_node& span, extraction_state& state, int depth) const;
	[[nodiscard]] bool is_storefront_caption(const markup_node& span) const;
	[[nodiscard]] bool has_skipped_class(const markup_node& node) const;
	static void add_text(extraction_state& state, const std::string& raw);
	[[nodiscard]] static std::string quote_block(const std::string& text);
	[[nodiscard]] static std::string format_countdown(std::string_view src);
};
