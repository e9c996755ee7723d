// Rule set construction tests

#include <hilite/highlight/rule.hpp>

#include <gtest/gtest.h>

using namespace hilite;
using namespace hilite::highlight;

namespace {

Result<RuleSet> finish(RuleSetBuilder& builder) {
    return std::move(builder).build();
}

StyleMutation red() {
    return StyleMutation::fixed(AttributeKey::ForegroundColor, Color::rgb(255, 0, 0));
}

} // namespace

TEST(RuleSetTest, DefaultIsEmpty) {
    RuleSet rules;

    EXPECT_TRUE(rules.empty());
    EXPECT_EQ(rules.size(), 0u);
    EXPECT_TRUE(rules.name().empty());
}

TEST(RuleSetTest, BuilderKeepsOrder) {
    RuleSetBuilder builder("ordered");
    builder
        .rule("a", red())
        .rule("b", PatternOptions::CaseInsensitive, red())
        .rule("c", {red(), red().on_group(0)});
    auto rules = finish(builder);

    ASSERT_TRUE(rules.has_value());
    ASSERT_EQ(rules->size(), 3u);
    EXPECT_EQ(rules->name(), "ordered");
    EXPECT_EQ((*rules)[0].pattern.source(), "a");
    EXPECT_EQ((*rules)[1].pattern.options(), PatternOptions::CaseInsensitive);
    EXPECT_EQ((*rules)[2].mutations.size(), 2u);
}

TEST(RuleSetTest, InvalidPatternFailsBuild) {
    RuleSetBuilder builder("broken");
    builder
        .rule("fine", red())
        .rule("[unterminated", red())
        .rule("also(bad", red());

    EXPECT_TRUE(builder.has_error());
    EXPECT_EQ(builder.size(), 1u);

    auto rules = std::move(builder).build();
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().category(), ErrorCategory::Pattern);
    // First failure is reported, with its position in the set
    EXPECT_NE(rules.error().message().find("rule set 'broken', rule #1"), std::string_view::npos);
}

TEST(RuleSetTest, PrecompiledPattern) {
    auto pattern = Pattern::compile("x+");
    ASSERT_TRUE(pattern.has_value());

    RuleSetBuilder builder("precompiled");
    auto rules = finish(builder.rule(*pattern, {red()}));
    ASSERT_TRUE(rules.has_value());
    EXPECT_EQ((*rules)[0].pattern.source(), "x+");
}

TEST(RuleSetTest, MissingCaptureGroupFailsBuild) {
    RuleSetBuilder builder("groups");
    builder
        .rule("(a)", {red().on_group(1)})
        .rule("(b)", {red().on_group(2)});

    EXPECT_EQ(builder.size(), 1u);

    auto rules = finish(builder);
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().category(), ErrorCategory::Rule);
    EXPECT_NE(rules.error().message().find("rule #1"), std::string_view::npos);
}

TEST(RuleSetTest, CopiesShareRules) {
    RuleSetBuilder first("shared");
    auto rules = finish(first.rule("a", red()));
    ASSERT_TRUE(rules.has_value());

    RuleSet copy = *rules;
    EXPECT_TRUE(copy.same_rules(*rules));

    RuleSetBuilder second("shared");
    auto rebuilt = finish(second.rule("a", red()));
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_FALSE(rebuilt->same_rules(*rules));
}

TEST(RuleSetTest, ConcatenationAppends) {
    RuleSetBuilder markup("markup");
    RuleSetBuilder links("links");
    auto first = finish(markup.rule("a", red()).rule("b", red()));
    auto second = finish(links.rule("c", red()));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    RuleSet combined = *first + *second;

    ASSERT_EQ(combined.size(), 3u);
    EXPECT_EQ(combined.name(), "markup+links");
    EXPECT_EQ(combined[0].pattern.source(), "a");
    EXPECT_EQ(combined[2].pattern.source(), "c");

    RuleSet unnamed = RuleSet{} + *second;
    EXPECT_EQ(unnamed.name(), "links");
}

TEST(StyleMutationTest, FixedAndComputed) {
    auto fixed = StyleMutation::fixed(AttributeKey::Kern, 0.5);
    EXPECT_FALSE(fixed.is_dynamic());
    EXPECT_FALSE(fixed.target_group().has_value());

    auto computed = StyleMutation::computed(AttributeKey::Link,
        [](std::string_view text, const Match&) -> std::optional<StyleValue> {
            return Link{std::string(text)};
        });
    EXPECT_TRUE(computed.is_dynamic());
    EXPECT_EQ(computed.on_group(2).target_group(), 2u);
    EXPECT_EQ(computed.key(), AttributeKey::Link);
}

TEST(StyleMutationTest, TargetSpan) {
    auto pattern = Pattern::compile("(a)(b)?c");
    ASSERT_TRUE(pattern.has_value());
    auto matches = pattern->find_all("xac");
    ASSERT_EQ(matches.size(), 1u);

    auto whole = StyleMutation::fixed(AttributeKey::Kern, 1.0);
    EXPECT_EQ(whole.target_span(matches[0]), (TextRange{1, 2}));
    EXPECT_EQ(whole.on_group(1).target_span(matches[0]), (TextRange{1, 1}));
    EXPECT_FALSE(whole.on_group(2).target_span(matches[0]).has_value());
}

TEST(AttributeSetTest, SetOverwritesAndMerge) {
    AttributeSet attributes;
    attributes.set(AttributeKey::ForegroundColor, Color::rgb(1, 2, 3));
    attributes.set(AttributeKey::ForegroundColor, Color::rgb(4, 5, 6));

    ASSERT_EQ(attributes.size(), 1u);
    ASSERT_NE(attributes.get<Color>(AttributeKey::ForegroundColor), nullptr);
    EXPECT_EQ(*attributes.get<Color>(AttributeKey::ForegroundColor), Color::rgb(4, 5, 6));
    EXPECT_EQ(attributes.get<double>(AttributeKey::ForegroundColor), nullptr);

    AttributeSet overlay{{AttributeKey::Kern, 0.5}, {AttributeKey::ForegroundColor, Color::rgb(9, 9, 9)}};
    attributes.merge(overlay);
    EXPECT_EQ(attributes.size(), 2u);
    EXPECT_EQ(*attributes.get<Color>(AttributeKey::ForegroundColor), Color::rgb(9, 9, 9));

    EXPECT_TRUE(attributes.erase(AttributeKey::Kern));
    EXPECT_FALSE(attributes.erase(AttributeKey::Kern));
}

TEST(AttributeSetTest, KeyNames) {
    EXPECT_EQ(to_string(AttributeKey::Font), "font");
    EXPECT_EQ(to_string(AttributeKey::StrikethroughColor), "strikethrough-color");
}
