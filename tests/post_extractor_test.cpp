#include "constants.hpp"
#include "post_extractor.hpp"
#include <ctime>
#include <gtest/gtest.h>
#include <string>
#include <wx/log.h>

namespace {
constexpr const char* BASE_URL = "https://forum.test";

std::string local_time_string(time_t seconds) {
	const std::tm* local = std::localtime(&seconds);
	char buffer[32];
	std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", local);
	return buffer;
}

extraction_result extract(const markup_node& root, const extractor_options& options = {}) {
	return post_extractor{options}.extract(root, BASE_URL);
}
} // namespace

TEST(PostExtractorTest, PlainTextIsTrimmedAndCollapsed) {
	markup_node root{"td", {}, "  Hello   world  "};
	root.append_child("font", {}, "nested", "  tail   text ");
	const auto result = extract(root);
	EXPECT_EQ(result.text, "Hello world nested tail text");
	EXPECT_TRUE(result.images.empty());
	EXPECT_TRUE(result.tags.empty());
}

TEST(PostExtractorTest, AbsoluteLinkBecomesAnnotatedFragment) {
	markup_node root{"td"};
	root.append_child("a", {{"href", "https://example.com/x"}}, "click");
	EXPECT_EQ(extract(root).text, "[链接: click - https://example.com/x]");
}

TEST(PostExtractorTest, RelativeLinkIsResolved) {
	markup_node root{"td"};
	root.append_child("a", {{"href", "/thread-1-1-1.html"}}, "thread");
	EXPECT_EQ(extract(root).text, "[链接: thread - https://forum.test/thread-1-1-1.html]");
}

TEST(PostExtractorTest, AnchorLinkKeepsOnlyText) {
	markup_node root{"td"};
	root.append_child("a", {{"href", "#top"}}, "Top");
	EXPECT_EQ(extract(root).text, "Top");
}

TEST(PostExtractorTest, ScriptLinkIsDropped) {
	markup_node root{"td", {}, "before"};
	root.append_child("a", {{"href", "javascript:void(0)"}}, "menu", "after");
	EXPECT_EQ(extract(root).text, "before after");
}

TEST(PostExtractorTest, PlatformLinkPrefersTextOverHref) {
	markup_node root{"td"};
	root.append_child("a", {{"href", "https://store.steampowered.com/app/570/"}}, "Dota 2");
	root.append_child("a", {{"href", "https://steamdb.info/app/570/"}});
	EXPECT_EQ(extract(root).text, "[Steam链接: Dota 2] [Steam链接: https://steamdb.info/app/570/]");
}

TEST(PostExtractorTest, LinkWithoutHrefKeepsText) {
	markup_node root{"td"};
	root.append_child("a", {}, "just text");
	EXPECT_EQ(extract(root).text, "just text");
}

TEST(PostExtractorTest, ImageSourceIsCollectedWithoutText) {
	markup_node root{"td", {}, "see"};
	root.append_child("img", {{"file", "/img/pic.png"}, {"src", "static/image/common/none.gif"}});
	const auto result = extract(root);
	EXPECT_EQ(result.text, "see");
	ASSERT_EQ(result.images.size(), 1u);
	EXPECT_EQ(result.images[0], "https://forum.test/img/pic.png");
}

TEST(PostExtractorTest, DataUrisAndMissingSourcesAreIgnored) {
	markup_node root{"td"};
	root.append_child("img", {{"file", "data:image/png;base64,AAAA"}});
	root.append_child("img", {{"src", "/only/display.png"}});
	EXPECT_TRUE(extract(root).images.empty());
}

TEST(PostExtractorTest, DuplicateImagesAreKeptUnlessConfigured) {
	markup_node root{"td"};
	root.append_child("img", {{"file", "a.png"}});
	root.append_child("img", {{"file", "/a.png"}});
	EXPECT_EQ(extract(root).images.size(), 2u);
	extractor_options options;
	options.deduplicate_images = true;
	const auto result = extract(root, options);
	ASSERT_EQ(result.images.size(), 1u);
	EXPECT_EQ(result.images[0], "https://forum.test/a.png");
}

TEST(PostExtractorTest, StoreWidgetIsRewrittenAndSwallowsItsCaption) {
	extractor_options options;
	options.storefront_tokens = {"store.example.com"};
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://store.example.com/widget/123/?x=1"}});
	markup_node caption{"span", {{"style", "font-size: 10px; color: gray"}}};
	caption.append_child("a", {{"href", "https://store.example.com/app/123/"}}, "View on store");
	root.append_child(std::move(caption));
	root.append_child("span", {{"style", "font-size: 10px"}}, "store.example.com again");
	EXPECT_EQ(extract(root, options).text, "[Steam小部件: https://store.example.com/app/123/] store.example.com again");
}

TEST(PostExtractorTest, CaptionWithoutPlatformMentionKeepsSuppressionArmed) {
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://store.steampowered.com/widget/570/"}});
	root.append_child("span", {{"style", "overflow: visible"}}, "Unrelated");
	root.append_child("span", {{"style", "font-size: 10px"}}, "Steam page");
	EXPECT_EQ(extract(root).text, "[Steam小部件: https://store.steampowered.com/app/570/] Unrelated");
}

TEST(PostExtractorTest, SuppressedCaptionKeepsItsTail) {
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://store.steampowered.com/widget/570/"}});
	root.append_child("span", {{"style", "font-size: 10px"}}, "Steam page", " following text");
	EXPECT_EQ(extract(root).text, "[Steam小部件: https://store.steampowered.com/app/570/] following text");
}

TEST(PostExtractorTest, EmptyPlatformNameDoesNotMatchEveryCaption) {
	extractor_options options;
	options.platform_name.clear();
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://store.steampowered.com/widget/570/"}});
	root.append_child("span", {{"style", "font-size: 10px"}}, "Unrelated note");
	root.append_child("span", {{"style", "font-size: 10px"}}, "store.steampowered.com");
	EXPECT_EQ(extract(root, options).text, "[小部件: https://store.steampowered.com/app/570/] Unrelated note");
}

TEST(PostExtractorTest, CaptionIsKeptWhenNoWidgetPreceded) {
	markup_node root{"td"};
	root.append_child("span", {{"style", "font-size: 10px"}}, "Steam page");
	EXPECT_EQ(extract(root).text, "Steam page");
}

TEST(PostExtractorTest, SuppressionDoesNotLeakBetweenCalls) {
	const post_extractor extractor;
	markup_node widget_only{"td"};
	widget_only.append_child("iframe", {{"src", "https://store.steampowered.com/widget/10/"}});
	markup_node caption_only{"td"};
	caption_only.append_child("span", {{"style", "font-size: 10px"}}, "Steam caption");
	EXPECT_EQ(extractor.extract(widget_only, BASE_URL).text, "[Steam小部件: https://store.steampowered.com/app/10/]");
	EXPECT_EQ(extractor.extract(caption_only, BASE_URL).text, "Steam caption");
}

TEST(PostExtractorTest, CountdownFrameShowsLocalTime) {
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://countdown.example/embed?t=1700000000&theme=dark"}});
	EXPECT_EQ(extract(root).text, "[倒计时: " + local_time_string(1700000000) + "]");
}

TEST(PostExtractorTest, CountdownWithoutNumericStampIsSilent) {
	markup_node root{"td", {}, "before"};
	root.append_child("iframe", {{"src", "https://countdown.example/embed?t=soon"}}, "after");
	root.append_child("iframe", {{"src", "https://countdown.example/embed"}});
	EXPECT_EQ(extract(root).text, "before after");
}

TEST(PostExtractorTest, CountdownWithOutOfRangeStampIsSilent) {
	markup_node root{"td", {}, "before"};
	root.append_child("iframe", {{"src", "https://countdown.example/embed?t=99999999999999999"}}, "after");
	root.append_child("iframe", {{"src", "https://countdown.example/embed?t=253402300800"}});
	root.append_child("iframe", {{"src", "https://countdown.example/embed?t=99999999999999999999999"}});
	EXPECT_EQ(extract(root).text, "before after");
}

TEST(PostExtractorTest, UnknownFrameGetsGenericMarker) {
	markup_node root{"td"};
	root.append_child("iframe", {{"src", "https://video.test/player/1"}});
	root.append_child("iframe");
	EXPECT_EQ(extract(root).text, "[嵌入内容] [嵌入内容]");
}

TEST(PostExtractorTest, HeadingIsFlattenedAndBolded) {
	markup_node root{"td", {}, "Intro"};
	markup_node heading{"h2", {}, "Title", "After"};
	heading.append_child("b", {}, "bold");
	root.append_child(std::move(heading));
	EXPECT_EQ(extract(root).text, "Intro \n**Title bold**\n After");
}

TEST(PostExtractorTest, QuotationLinesArePrefixed) {
	markup_node root{"td"};
	root.append_child("blockquote", {}, "line one\n\nline two");
	EXPECT_EQ(extract(root).text, "> line one\n> line two");
}

TEST(PostExtractorTest, EmptyQuotationContributesNothing) {
	markup_node root{"td", {}, "text"};
	root.append_child("blockquote", {}, "   ");
	EXPECT_EQ(extract(root).text, "text");
}

TEST(PostExtractorTest, LineBreaksBecomeNewlines) {
	markup_node root{"td", {}, "a"};
	root.append_child("br", {}, {}, "b");
	EXPECT_EQ(extract(root).text, "a \n b");
}

TEST(PostExtractorTest, ConsecutiveBlankLinesCollapse) {
	markup_node root{"td", {}, "a"};
	root.append_child("br");
	root.append_child("br");
	root.append_child("br");
	root.append_child("br", {}, {}, "b");
	EXPECT_EQ(extract(root).text, "a \n\n b");
}

TEST(PostExtractorTest, PresentationalContainersAreSkipped) {
	markup_node root{"td", {}, "keep"};
	root.append_child("span", {{"class", "steam-info-wrapper"}}, "loading", "tail1");
	root.append_child("div", {{"class", "swi-block big"}}, "widget");
	root.append_child("div", {{"class", "content"}}, "body");
	EXPECT_EQ(extract(root).text, "keep tail1 body");
}

TEST(PostExtractorTest, EmphasisIsMarked) {
	markup_node root{"td"};
	root.append_child("strong", {}, "loud");
	root.append_child("i", {}, "soft");
	root.append_child("em", {}, "  ");
	EXPECT_EQ(extract(root).text, "**loud** *soft*");
}

TEST(PostExtractorTest, ParagraphWithOwnTextIsSetApart) {
	markup_node root{"td"};
	root.append_child("p", {}, "Para");
	markup_node wrapper{"p"};
	wrapper.append_child("span", {}, "inside");
	root.append_child(std::move(wrapper));
	EXPECT_EQ(extract(root).text, "Para\n inside");
}

TEST(PostExtractorTest, ScriptsAndStylesNeverContributeText) {
	markup_node root{"td", {}, "visible"};
	root.append_child("script", {}, "var hidden = 1;");
	root.append_child("style", {}, ".x { color: red }");
	root.append_child("noscript", {}, "enable js");
	EXPECT_EQ(extract(root).text, "visible");
}

TEST(PostExtractorTest, TagsAreCollectedInDocumentOrder) {
	markup_node root{"td"};
	root.append_child("span", {{"class", "tag"}}, "RPG");
	root.append_child("a", {{"class", "xi2 tag"}, {"href", "misc.php?mod=tag&id=1"}}, " Indie ");
	root.append_child("span", {{"class", "tags"}}, "ignored");
	root.append_child("span", {{"class", "tag"}}, "   ");
	const auto result = extract(root);
	ASSERT_EQ(result.tags.size(), 2u);
	EXPECT_EQ(result.tags[0], "RPG");
	EXPECT_EQ(result.tags[1], "Indie");
}

TEST(PostExtractorTest, DepthLimitStopsDescent) {
	extractor_options options;
	options.max_depth = 2;
	markup_node level3{"font", {}, "three"};
	markup_node level2{"font", {}, "two"};
	level2.append_child(std::move(level3));
	markup_node level1{"font", {}, "one"};
	level1.append_child(std::move(level2));
	markup_node root{"td", {}, "top"};
	root.append_child(std::move(level1));
	EXPECT_EQ(extract(root, options).text, "top one two");
}

TEST(PostExtractorTest, MissingRootYieldsSentinel) {
	wxLogNull no_log;
	const auto result = post_extractor{}.extract(nullptr, BASE_URL);
	EXPECT_EQ(result.text, CONTENT_PARSE_FAILED_TEXT);
	EXPECT_TRUE(result.images.empty());
	EXPECT_TRUE(result.tags.empty());
}
