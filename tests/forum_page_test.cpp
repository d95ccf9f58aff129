#include "forum_page.hpp"
#include "forum_post.hpp"
#include <gtest/gtest.h>
#include <string>
#include <wx/log.h>

namespace {
const std::string base_url = "https://forum.test";

std::string post_page(const std::string& posted_at, const std::string& message) {
	return "<html><head><title>thread</title></head><body>"
		   "<span id=\"thread_subject\">New game released</span>"
		   "<div id=\"postlist\">"
		   "<div id=\"post_987\"><table><tbody><tr>"
		   "<td class=\"pls\"><div class=\"authi\"><a class=\"xw1\" href=\"space-uid-1.html\">alice</a></div></td>"
		   "<td class=\"plc\"><div class=\"pi\"><em id=\"authorposton987\">" +
		posted_at +
		"</em></div>"
		"<table><tbody><tr><td class=\"t_f\" id=\"postmessage_987\">" +
		message +
		"</td></tr></tbody></table>"
		"</td></tr></tbody></table></div>"
		"<div id=\"post_988\"><table><tbody><tr><td id=\"postmessage_988\">reply</td></tr></tbody></table></div>"
		"</div></body></html>";
}

const std::string sample_message = "Hello <strong>world</strong><br><img file=\"data/a.jpg\" src=\"static/image/common/none.gif\"><span class=\"tag\">RPG</span>";

const std::string thread_list_page =
	"<html><body><div class=\"bm_c\">"
	"<div id=\"forumnew\" style=\"display: none\"></div>"
	"<table summary=\"forum_2\">"
	"<tbody id=\"separatorline\"><tr><th>threads</th></tr></tbody>"
	"<tbody id=\"normalthread_123\"><tr>"
	"<th class=\"common\"><a href=\"thread-123-1-1.html\" class=\"s xst\">First thread</a></th>"
	"<td class=\"by\"><cite><a href=\"space-uid-1.html\">alice</a></cite></td>"
	"</tr></tbody>"
	"<tbody id=\"normalthread_456\"><tr>"
	"<th class=\"common\"><a href=\"forum.php?mod=viewthread&amp;tid=456\">Second thread</a></th>"
	"<td class=\"by\"><cite><a href=\"space-uid-2.html\">bob</a></cite></td>"
	"</tr></tbody>"
	"</table></div></body></html>";
} // namespace

TEST(ForumPageTest, ParsesFirstPost) {
	const auto page = post_page("发表于 <span title=\"2024-03-05 14:30:00\">3 天前</span>", sample_message);
	const auto details = parse_post_page(page, base_url, post_extractor{});
	EXPECT_EQ(details.content, "Hello **world** \n RPG");
	ASSERT_EQ(details.images.size(), 1u);
	EXPECT_EQ(details.images[0], "https://forum.test/data/a.jpg");
	ASSERT_EQ(details.tags.size(), 1u);
	EXPECT_EQ(details.tags[0], "RPG");
	ASSERT_TRUE(details.publish_time.IsValid());
	EXPECT_EQ(details.publish_time.GetYear(), 2024);
	EXPECT_EQ(details.publish_time.GetMonth(), wxDateTime::Mar);
	EXPECT_EQ(details.publish_time.GetDay(), 5);
	EXPECT_EQ(details.publish_time.GetHour(), 14);
	EXPECT_EQ(details.publish_time.GetMinute(), 30);
}

TEST(ForumPageTest, ReadsTimeAfterPrefixWhenNoTitleSpan) {
	const auto page = post_page("发表于 2023-12-31 08:05", "text");
	const auto details = parse_post_page(page, base_url, post_extractor{});
	EXPECT_EQ(details.content, "text");
	EXPECT_EQ(details.publish_time.GetYear(), 2023);
	EXPECT_EQ(details.publish_time.GetMonth(), wxDateTime::Dec);
	EXPECT_EQ(details.publish_time.GetDay(), 31);
	EXPECT_EQ(details.publish_time.GetHour(), 8);
	EXPECT_EQ(details.publish_time.GetMinute(), 5);
}

TEST(ForumPageTest, UnreadableTimeFallsBackToNow) {
	wxLogNull no_log;
	const auto before = wxDateTime::Now();
	const auto details = parse_post_page(post_page("yesterday", "text"), base_url, post_extractor{});
	EXPECT_TRUE(details.publish_time.IsValid());
	EXPECT_FALSE(details.publish_time.IsEarlierThan(before - wxTimeSpan::Minute()));
}

TEST(ForumPageTest, MissingPostListThrows) {
	EXPECT_THROW(static_cast<void>(parse_post_page("<html><body><p>no posts</p></body></html>", base_url, post_extractor{})), page_exception);
}

TEST(ForumPageTest, MissingMessageBodyThrows) {
	const std::string page = "<html><body><div id=\"postlist\"><div id=\"post_5\"><p>gone</p></div></div></body></html>";
	try {
		static_cast<void>(parse_post_page(page, base_url, post_extractor{}));
		FAIL() << "expected page_exception";
	} catch (const page_exception& e) {
		EXPECT_EQ(e.get_severity(), error_severity::error);
		EXPECT_TRUE(e.get_url().IsEmpty());
	}
}

TEST(ForumPageTest, DisplayMessageIncludesUrl) {
	const page_exception error("Post list not found", "https://forum.test/thread-1-1-1.html", error_severity::warning);
	EXPECT_EQ(error.get_display_message(), "https://forum.test/thread-1-1-1.html: Post list not found");
	EXPECT_EQ(error.get_severity(), error_severity::warning);
	EXPECT_STREQ(error.what(), "Post list not found");
}

TEST(ForumPageTest, ParsesPostSummary) {
	const auto summary = parse_post_summary(post_page("", "text"), "https://forum.test/thread-555-1-1.html");
	EXPECT_EQ(summary.id, 555);
	EXPECT_EQ(summary.title, "New game released");
	EXPECT_EQ(summary.author, "alice");
	EXPECT_EQ(summary.url, "https://forum.test/thread-555-1-1.html");
}

TEST(ForumPageTest, PostSummaryWithoutPostListThrows) {
	EXPECT_THROW(static_cast<void>(parse_post_summary("<html><body></body></html>", "https://forum.test/x")), page_exception);
}

TEST(ForumPageTest, ParsesThreadList) {
	wxLogNull no_log;
	const auto threads = parse_thread_list(thread_list_page, base_url);
	ASSERT_EQ(threads.size(), 2u);
	EXPECT_EQ(threads[0].id, 123);
	EXPECT_EQ(threads[0].title, "First thread");
	EXPECT_EQ(threads[0].url, "https://forum.test/thread-123-1-1.html");
	EXPECT_EQ(threads[0].author, "alice");
	EXPECT_EQ(threads[1].id, 456);
	EXPECT_EQ(threads[1].title, "Second thread");
	EXPECT_EQ(threads[1].url, "https://forum.test/forum.php?mod=viewthread&tid=456");
	EXPECT_EQ(threads[1].author, "bob");
}

TEST(ForumPageTest, ThreadListHonoursLimit) {
	wxLogNull no_log;
	const auto threads = parse_thread_list(thread_list_page, base_url, 1);
	ASSERT_EQ(threads.size(), 1u);
	EXPECT_EQ(threads[0].id, 123);
}

TEST(ForumPageTest, ThreadListWithoutMarkerThrows) {
	EXPECT_THROW(static_cast<void>(parse_thread_list("<html><body><table></table></body></html>", base_url)), page_exception);
}

TEST(ForumPageTest, ExtractsThreadIds) {
	EXPECT_EQ(extract_thread_id("https://forum.test/thread-77-1-1.html"), 77);
	EXPECT_EQ(extract_thread_id("https://forum.test/forum.php?mod=viewthread&tid=42&extra=page%3D1"), 42);
	EXPECT_EQ(extract_thread_id("https://forum.test/t9001-1-1.html"), 9001);
	EXPECT_FALSE(extract_thread_id("https://forum.test/forum-2-1.html").has_value());
}

TEST(ForumPageTest, ParsesPostTimeFormats) {
	const auto full = parse_post_time("2024-01-02 03:04:05");
	EXPECT_EQ(full.GetSecond(), 5);
	const auto short_form = parse_post_time("2024-01-02 03:04");
	EXPECT_EQ(short_form.GetMinute(), 4);
	EXPECT_EQ(short_form.GetSecond(), 0);
}

TEST(ForumPageTest, LoaderFetchesAndExtracts) {
	const std::string url = "https://forum.test/thread-987-1-1.html";
	const auto page = post_page("发表于 <span title=\"2024-03-05 14:30:00\">3 天前</span>", sample_message);
	int fetches = 0;
	html_post_loader loader(
		[&](const std::string& requested) -> std::optional<std::string> {
			++fetches;
			if (requested == url) {
				return page;
			}
			return std::nullopt;
		},
		base_url);
	forum_post post(987, "New game released", url, "alice", &loader);
	EXPECT_EQ(post.content(), "Hello **world** \n RPG");
	EXPECT_EQ(post.tags().size(), 1u);
	EXPECT_EQ(post.images().size(), 1u);
	EXPECT_EQ(post.publish_time().GetDay(), 5);
	EXPECT_EQ(fetches, 1);
}

TEST(ForumPageTest, LoaderReportsFetchAndParseFailures) {
	wxLogNull no_log;
	html_post_loader loader([](const std::string& requested) -> std::optional<std::string> {
		if (requested.ends_with("broken")) {
			return std::string("<html><body>maintenance</body></html>");
		}
		return std::nullopt;
	},
		base_url);
	EXPECT_FALSE(loader.load_post_details("https://forum.test/missing").has_value());
	EXPECT_FALSE(loader.load_post_details("https://forum.test/broken").has_value());
}
