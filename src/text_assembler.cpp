/* text_assembler.cpp - joins and normalizes extracted text fragments.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_assembler.hpp"
#include "utils.hpp"
#include <cctype>
#include <string>
#include <string_view>

namespace {
bool is_horizontal_space(char ch) noexcept {
	return ch == ' ' || ch == '\t';
}
} // namespace

std::string collapse_blank_lines(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	size_t i = 0;
	while (i < input.size()) {
		if (input[i] != '\n') {
			result += input[i++];
			continue;
		}
		// Find the last newline in the whitespace run that starts here.
		size_t last_newline = i;
		for (size_t j = i + 1; j < input.size() && std::isspace(static_cast<unsigned char>(input[j])) != 0; ++j) {
			if (input[j] == '\n') {
				last_newline = j;
			}
		}
		if (last_newline > i) {
			result += "\n\n";
			i = last_newline + 1;
		} else {
			result += '\n';
			++i;
		}
	}
	return result;
}

std::string collapse_horizontal_space(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	size_t i = 0;
	while (i < input.size()) {
		if (!is_horizontal_space(input[i])) {
			result += input[i++];
			continue;
		}
		size_t run_end = i;
		while (run_end < input.size() && is_horizontal_space(input[run_end])) {
			++run_end;
		}
		if (run_end - i > 1) {
			result += ' ';
		} else {
			result += input[i];
		}
		i = run_end;
	}
	return result;
}

std::string assemble_fragments(const std::vector<std::string>& fragments) {
	std::string joined;
	for (size_t i = 0; i < fragments.size(); ++i) {
		if (i > 0) {
			joined += ' ';
		}
		joined += fragments[i];
	}
	return trim_string(collapse_horizontal_space(collapse_blank_lines(joined)));
}
