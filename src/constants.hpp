/* constants.hpp - application-wide constants.
 *
 * Forumcast.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <wx/string.h>

inline const wxString APP_NAME = "Forumcast";
inline const wxString APP_VERSION = "0.3";

// Fallback texts handed to the renderer when a post cannot be turned into content.
inline const char* const CONTENT_PARSE_FAILED_TEXT = "内容解析失败";
inline const char* const CONTENT_LOAD_FAILED_TEXT = "内容加载失败";

inline constexpr int DEFAULT_MAX_DEPTH = 256;
inline constexpr int DEFAULT_CHECK_INTERVAL = 300;
inline constexpr int DEFAULT_MAX_POSTS_PER_CHECK = 10;
// 9999-12-31 23:59:59 UTC; later countdown stamps are rejected.
inline constexpr long long MAX_COUNTDOWN_SECONDS = 253402300799LL;

inline const char* const POST_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";
inline const char* const POST_TIME_SHORT_FORMAT = "%Y-%m-%d %H:%M";
