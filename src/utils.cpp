/* utils.cpp - miscellaneous helpers shared across Forumcast.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
} // namespace

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		char c = encoded[i];
		if (c == '%') {
			if (i + 2 < encoded.size()) {
				int hi = hex(encoded[i + 1]);
				int lo = hex(encoded[i + 2]);
				if (hi >= 0 && lo >= 0) {
					out.push_back(static_cast<char>((hi << 4) | lo));
					i += 2;
					continue;
				}
			}
			out.push_back('%');
		} else if (c == '+') {
			out.push_back(' ');
		} else {
			out.push_back(c);
		}
	}
	return out;
}

std::string to_lower(std::string_view input) {
	std::string result(input);
	std::ranges::transform(result, result.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
	if (needle.empty()) {
		return true;
	}
	return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool contains_any(std::string_view haystack, const std::vector<std::string>& needles) {
	return std::ranges::any_of(needles, [haystack](const std::string& needle) {
		return !needle.empty() && haystack.find(needle) != std::string_view::npos;
	});
}

bool contains_any_ignore_case(std::string_view haystack, const std::vector<std::string>& needles) {
	const std::string lowered = to_lower(haystack);
	return std::ranges::any_of(needles, [&lowered](const std::string& needle) {
		return !needle.empty() && lowered.find(to_lower(needle)) != std::string::npos;
	});
}

std::vector<std::string> split_list(std::string_view input, char separator) {
	std::vector<std::string> items;
	size_t pos = 0;
	while (pos <= input.size()) {
		size_t next = input.find(separator, pos);
		if (next == std::string_view::npos) {
			next = input.size();
		}
		auto item = trim_string(std::string(input.substr(pos, next - pos)));
		if (!item.empty()) {
			items.push_back(std::move(item));
		}
		pos = next + 1;
	}
	return items;
}

std::string replace_all(std::string input, std::string_view from, std::string_view to) {
	if (from.empty()) {
		return input;
	}
	size_t pos = 0;
	while ((pos = input.find(from, pos)) != std::string::npos) {
		input.replace(pos, from.size(), to);
		pos += to.size();
	}
	return input;
}

std::string resolve_url(std::string_view base, std::string_view ref) {
	if (ref.starts_with("http")) {
		return std::string(ref);
	}
	std::string result(base);
	if (!ref.starts_with('/')) {
		result += '/';
	}
	result += ref;
	return result;
}

bool is_data_uri(std::string_view ref) noexcept {
	constexpr std::string_view prefix = "data:";
	if (ref.size() < prefix.size()) {
		return false;
	}
	for (size_t i = 0; i < prefix.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(ref[i])) != prefix[i]) {
			return false;
		}
	}
	return true;
}

std::string get_query_parameter(std::string_view url, std::string_view name) {
	const auto query_start = url.find('?');
	if (query_start == std::string_view::npos) {
		return {};
	}
	auto query = url.substr(query_start + 1);
	const auto fragment_start = query.find('#');
	if (fragment_start != std::string_view::npos) {
		query = query.substr(0, fragment_start);
	}
	size_t pos = 0;
	while (pos <= query.size()) {
		size_t next = query.find('&', pos);
		if (next == std::string_view::npos) {
			next = query.size();
		}
		const auto pair = query.substr(pos, next - pos);
		const auto eq = pair.find('=');
		const auto key = pair.substr(0, eq);
		if (key == name) {
			return eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
		}
		pos = next + 1;
	}
	return {};
}
