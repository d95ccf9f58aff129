/* utils.hpp - miscellaneous helpers shared across Forumcast.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>

[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string remove_soft_hyphens(std::string_view input);
[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string to_lower(std::string_view input);
[[nodiscard]] bool contains_ignore_case(std::string_view haystack, std::string_view needle);
[[nodiscard]] bool contains_any(std::string_view haystack, const std::vector<std::string>& needles);
[[nodiscard]] bool contains_any_ignore_case(std::string_view haystack, const std::vector<std::string>& needles);
[[nodiscard]] std::vector<std::string> split_list(std::string_view input, char separator = ';');
[[nodiscard]] std::string replace_all(std::string input, std::string_view from, std::string_view to);

// Turns a possibly relative reference into an absolute URL rooted at base.
[[nodiscard]] std::string resolve_url(std::string_view base, std::string_view ref);
[[nodiscard]] bool is_data_uri(std::string_view ref) noexcept;
[[nodiscard]] std::string get_query_parameter(std::string_view url, std::string_view name);
