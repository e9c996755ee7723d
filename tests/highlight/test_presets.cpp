// Preset rule set tests

#include <hilite/highlight/engine.hpp>
#include <hilite/highlight/presets.hpp>

#include <gtest/gtest.h>

using namespace hilite;
using namespace hilite::highlight;

namespace {

const presets::PresetTheme THEME = presets::PresetTheme::light();

StyledText markdown(std::string_view text) {
    return highlight::highlight(text, presets::markdown(), THEME.base_attributes());
}

StyledText pretty(std::string_view text) {
    return highlight::highlight(text, presets::pretty_markdown(), THEME.base_attributes());
}

FontTraits traits_at(const StyledText& styled, TextOffset offset) {
    const auto* traits = styled.get_at<FontTraits>(offset, AttributeKey::FontTraits);
    return traits ? *traits : FontTraits::None;
}

} // namespace

TEST(PresetsTest, BuiltInPresetsBuild) {
    EXPECT_EQ(presets::markdown().size(), 18u);
    EXPECT_EQ(presets::pretty_markdown().size(), 25u);
    EXPECT_EQ(presets::url().size(), 1u);

    EXPECT_EQ(presets::markdown().name(), "markdown");
    EXPECT_EQ(presets::pretty_markdown().name(), "pretty-markdown");

    // Accessors hand out the same shared rules every time
    EXPECT_TRUE(presets::markdown().same_rules(presets::markdown()));
}

TEST(PresetsTest, ThemedBuildsSucceed) {
    EXPECT_TRUE(presets::make_markdown(presets::PresetTheme::dark()).has_value());
    EXPECT_TRUE(presets::make_pretty_markdown(presets::PresetTheme::dark()).has_value());
    EXPECT_TRUE(presets::make_url().has_value());
}

TEST(PresetsTest, HeadingPointSize) {
    EXPECT_DOUBLE_EQ(presets::heading_point_size(1, 15.0), 27.5);
    EXPECT_DOUBLE_EQ(presets::heading_point_size(2, 15.0), 25.0);
    EXPECT_DOUBLE_EQ(presets::heading_point_size(6, 15.0), 15.0);
    // Levels beyond six are capped
    EXPECT_DOUBLE_EQ(presets::heading_point_size(9, 15.0), 15.0);
}

TEST(PresetsTest, ThemeForAppearance) {
    auto dark = presets::PresetTheme::for_appearance(Appearance::Dark);
    auto light = presets::PresetTheme::for_appearance(Appearance::Light);

    EXPECT_EQ(dark.text_color, Color::rgb(0xff, 0xff, 0xff));
    EXPECT_NE(dark.text_color, light.text_color);
    EXPECT_EQ(light.background, Color::rgb(0xff, 0xff, 0xff));
    EXPECT_EQ(dark.background, Color::rgb(0x1e, 0x1e, 0x1e));

    AttributeSet base = light.base_attributes();
    EXPECT_EQ(*base.get<FontSpec>(AttributeKey::Font), light.body_font);
    EXPECT_EQ(*base.get<Color>(AttributeKey::ForegroundColor), light.text_color);
}

TEST(MarkdownPresetTest, Heading) {
    StyledText styled = markdown("## Hi\nbody");

    const auto* font = styled.get_at<FontSpec>(0, AttributeKey::Font);
    ASSERT_NE(font, nullptr);
    EXPECT_DOUBLE_EQ(font->point_size, 25.0);
    EXPECT_EQ(traits_at(styled, 3), FontTraits::Bold | FontTraits::Expanded);
    EXPECT_DOUBLE_EQ(*styled.get_at<double>(3, AttributeKey::Kern), 0.5);

    // Body line keeps the base font
    EXPECT_EQ(*styled.get_at<FontSpec>(7, AttributeKey::Font), THEME.body_font);
}

TEST(MarkdownPresetTest, EmphasisAndBold) {
    StyledText styled = markdown("a *em* and **strong** and ***both***");

    EXPECT_EQ(traits_at(styled, 3), FontTraits::Italic);
    EXPECT_EQ(traits_at(styled, 14), FontTraits::Bold);
    EXPECT_EQ(traits_at(styled, 30), FontTraits::Bold | FontTraits::Italic);
    EXPECT_EQ(traits_at(styled, 0), FontTraits::None);
}

TEST(MarkdownPresetTest, InlineCode) {
    StyledText styled = markdown("run `make` now");

    EXPECT_EQ(*styled.get_at<FontSpec>(5, AttributeKey::Font), THEME.code_font);
    EXPECT_EQ(*styled.get_at<FontSpec>(0, AttributeKey::Font), THEME.body_font);
}

TEST(MarkdownPresetTest, SingleTildeStrikethrough) {
    StyledText styled = markdown("~gone~ kept");

    EXPECT_NE(styled.get_at<LineStyle>(2, AttributeKey::StrikethroughStyle), nullptr);
    EXPECT_EQ(*styled.get_at<Color>(2, AttributeKey::StrikethroughColor), THEME.text_color);
    EXPECT_EQ(styled.get_at<LineStyle>(8, AttributeKey::StrikethroughStyle), nullptr);
}

TEST(MarkdownPresetTest, LinksAreUnderlined) {
    StyledText styled = markdown("see [docs](https://example.com)");

    EXPECT_EQ(*styled.get_at<LineStyle>(5, AttributeKey::UnderlineStyle), LineStyle::Single);
    EXPECT_EQ(styled.get_at<LineStyle>(0, AttributeKey::UnderlineStyle), nullptr);
}

TEST(MarkdownPresetTest, ListMarkersAreDimmed) {
    StyledText styled = markdown("- item\n1. first");

    EXPECT_EQ(*styled.get_at<Color>(0, AttributeKey::ForegroundColor), THEME.lighter_color);
    EXPECT_EQ(*styled.get_at<Color>(3, AttributeKey::ForegroundColor), THEME.text_color);
    EXPECT_EQ(*styled.get_at<Color>(7, AttributeKey::ForegroundColor), THEME.lighter_color);
}

TEST(PrettyMarkdownPresetTest, DoubleTildeStrikethrough) {
    EXPECT_EQ(pretty("~gone~").get_at<LineStyle>(2, AttributeKey::StrikethroughStyle), nullptr);
    EXPECT_NE(pretty("~~gone~~").get_at<LineStyle>(3, AttributeKey::StrikethroughStyle), nullptr);
}

TEST(PrettyMarkdownPresetTest, HeadingMarkersAreDimmed) {
    StyledText styled = pretty("# Title");

    const auto* marker_font = styled.get_at<FontSpec>(0, AttributeKey::Font);
    ASSERT_NE(marker_font, nullptr);
    EXPECT_DOUBLE_EQ(marker_font->point_size, 14.0);
    EXPECT_EQ(*styled.get_at<Color>(0, AttributeKey::ForegroundColor), THEME.lighter_color);

    const auto* title_font = styled.get_at<FontSpec>(2, AttributeKey::Font);
    ASSERT_NE(title_font, nullptr);
    EXPECT_DOUBLE_EQ(title_font->point_size, 25.5);
    EXPECT_EQ(title_font->traits, FontTraits::Bold);

    const auto* paragraph = styled.get_at<ParagraphStyle>(2, AttributeKey::ParagraphStyle);
    ASSERT_NE(paragraph, nullptr);
    EXPECT_DOUBLE_EQ(paragraph->paragraph_spacing, 10.0);
}

TEST(PrettyMarkdownPresetTest, Highlight) {
    StyledText styled = pretty("a ==hi== b");

    EXPECT_EQ(*styled.get_at<Color>(4, AttributeKey::BackgroundColor), THEME.text_highlight);
    EXPECT_EQ(*styled.get_at<Color>(4, AttributeKey::ForegroundColor), THEME.text_color);
    EXPECT_EQ(*styled.get_at<Color>(2, AttributeKey::ForegroundColor), THEME.lighter_color);
    EXPECT_EQ(*styled.get_at<Color>(6, AttributeKey::ForegroundColor), THEME.lighter_color);
    EXPECT_EQ(styled.get_at<Color>(0, AttributeKey::BackgroundColor), nullptr);
}

TEST(PrettyMarkdownPresetTest, UncheckedCheckbox) {
    StyledText styled = pretty("[ ] task\ndone");

    EXPECT_EQ(*styled.get_at<Color>(5, AttributeKey::BackgroundColor), THEME.checkbox_background);
    EXPECT_EQ(styled.get_at<Color>(10, AttributeKey::BackgroundColor), nullptr);
}

TEST(PrettyMarkdownPresetTest, ListParagraphStyle) {
    StyledText styled = pretty("- item");

    const auto* paragraph = styled.get_at<ParagraphStyle>(0, AttributeKey::ParagraphStyle);
    ASSERT_NE(paragraph, nullptr);
    EXPECT_DOUBLE_EQ(paragraph->first_line_head_indent, 15.0);
    EXPECT_DOUBLE_EQ(paragraph->head_indent, 15.0);
    EXPECT_DOUBLE_EQ(paragraph->paragraph_spacing, 12.0);
}

TEST(UrlPresetTest, LinksUrls) {
    const std::string text = "see https://example.com now";
    StyledText styled = highlight::highlight(text, presets::url());

    const auto* link = styled.get_at<Link>(4, AttributeKey::Link);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->target, "https://example.com");
    EXPECT_EQ(*styled.get_at<LineStyle>(10, AttributeKey::UnderlineStyle), LineStyle::Single);
    EXPECT_EQ(styled.get_at<Link>(1, AttributeKey::Link), nullptr);
    EXPECT_EQ(styled.get_at<Link>(24, AttributeKey::Link), nullptr);
}

TEST(UrlPresetTest, PatternDetectsBareDomains) {
    EXPECT_TRUE(presets::url_pattern().matches_anywhere("visit www.example.org today"));
    EXPECT_FALSE(presets::url_pattern().matches_anywhere("no links here"));
}

TEST(UrlPresetTest, CombinesWithMarkdown) {
    RuleSet rules = presets::markdown() + presets::url();
    StyledText styled = highlight::highlight("**bold** example.com", rules, THEME.base_attributes());

    EXPECT_EQ(traits_at(styled, 3), FontTraits::Bold);
    EXPECT_NE(styled.get_at<Link>(12, AttributeKey::Link), nullptr);
}
