// Editor binding tests

#include <hilite/editor/binding.hpp>
#include <hilite/editor/memory_surface.hpp>

#include <gtest/gtest.h>

#include <memory>

using namespace hilite;
using namespace hilite::editor;
using highlight::AttributeKey;
using highlight::FontTraits;
using highlight::RuleSet;
using highlight::RuleSetBuilder;
using highlight::StyleMutation;

namespace {

RuleSet rules_for(std::string_view pattern, FontTraits traits) {
    RuleSetBuilder builder("test");
    builder.rule(pattern, StyleMutation::fixed(AttributeKey::FontTraits, traits));
    auto rules = std::move(builder).build();
    EXPECT_TRUE(rules.has_value());
    return rules ? std::move(*rules) : RuleSet{};
}

FontTraits traits_at(const TextSurface& surface, TextOffset offset) {
    const auto styled = surface.styled_text();
    const auto* traits = styled.get_at<FontTraits>(offset, AttributeKey::FontTraits);
    return traits ? *traits : FontTraits::None;
}

class EditorTest : public ::testing::Test {
protected:
    MemoryTextSurface surface_{"plain *word*"};
    std::string value_{"plain *word*"};
    RuleSet emphasis_ = rules_for(R"(\*[^*]+\*)", FontTraits::Italic);
};

} // namespace

TEST_F(EditorTest, StylesOnConstruction) {
    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_);

    EXPECT_EQ(traits_at(surface_, 7), FontTraits::Italic);
    EXPECT_EQ(traits_at(surface_, 0), FontTraits::None);
    EXPECT_EQ(editor.update_state().generation, 1u);
    EXPECT_EQ(surface_.pending_tasks(), 0u);
}

TEST_F(EditorTest, TypingUpdatesBindingAndRestyles) {
    std::vector<std::string> changes;
    EditorCallbacks callbacks;
    callbacks.on_text_change = [&](const std::string& text) { changes.push_back(text); };

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
    surface_.type_text(" and *more*");

    EXPECT_EQ(value_, "plain *word* and *more*");
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0], value_);
    EXPECT_EQ(traits_at(surface_, 19), FontTraits::Italic);
    EXPECT_EQ(surface_.selection(), SelectionState::caret(value_.size()));
}

TEST_F(EditorTest, RefreshPreservesSelection) {
    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_);
    surface_.select(TextRange{5, 0});

    editor.refresh();

    EXPECT_EQ(surface_.selection(), SelectionState::caret(5));
}

TEST_F(EditorTest, RefreshPushesEmbedderValue) {
    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_);

    value_ = "*new*";
    UpdateResult result = editor.refresh();

    EXPECT_TRUE(result.applied);
    EXPECT_EQ(surface_.text(), "*new*");
    EXPECT_EQ(traits_at(surface_, 1), FontTraits::Italic);
}

TEST_F(EditorTest, SelectionChangesArePostedToNextTurn) {
    std::vector<std::vector<TextRange>> reported;
    EditorCallbacks callbacks;
    callbacks.on_selection_change = [&](const std::vector<TextRange>& ranges) { reported.push_back(ranges); };

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
    surface_.select(TextRange{1, 3});

    EXPECT_TRUE(reported.empty());
    EXPECT_EQ(surface_.run_pending(), 1u);

    ASSERT_EQ(reported.size(), 1u);
    ASSERT_EQ(reported[0].size(), 1u);
    EXPECT_EQ(reported[0][0], (TextRange{1, 3}));
}

TEST_F(EditorTest, RestyleDoesNotReportSelection) {
    int reports = 0;
    EditorCallbacks callbacks;
    callbacks.on_selection_change = [&](const std::vector<TextRange>&) { ++reports; };

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
    editor.refresh();
    editor.refresh();
    surface_.run_pending();

    EXPECT_EQ(reports, 0);
}

TEST_F(EditorTest, SynchronousSelectionNotifications) {
    int reports = 0;
    EditorCallbacks callbacks;
    callbacks.on_selection_change = [&](const std::vector<TextRange>&) { ++reports; };
    EditorConfig config;
    config.async_selection_notifications = false;

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks, config);
    surface_.select(TextRange{2, 0});

    EXPECT_EQ(reports, 1);
    EXPECT_EQ(surface_.pending_tasks(), 0u);
}

TEST_F(EditorTest, FirstSelectionChange) {
    std::vector<TextRange> primaries;

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_);
    editor.on_first_selection_change([&](TextRange range) { primaries.push_back(range); });

    surface_.select(SelectionState{{TextRange{3, 1}, TextRange{8, 2}}});
    surface_.run_pending();

    ASSERT_EQ(primaries.size(), 1u);
    EXPECT_EQ(primaries[0], (TextRange{3, 1}));
}

TEST_F(EditorTest, PostedNotificationAfterEditorIsGone) {
    int reports = 0;
    EditorCallbacks callbacks;
    callbacks.on_selection_change = [&](const std::vector<TextRange>&) { ++reports; };

    {
        HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
        surface_.select(TextRange{1, 0});
    }

    EXPECT_EQ(surface_.run_pending(), 1u);
    EXPECT_EQ(reports, 0);
}

TEST_F(EditorTest, EditingCallbacksSyncBinding) {
    int began = 0;
    int ended = 0;
    EditorCallbacks callbacks;
    callbacks.on_editing_began = [&] { ++began; };
    callbacks.on_editing_ended = [&] { ++ended; };

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
    value_.clear();

    surface_.begin_editing();
    EXPECT_EQ(began, 1);
    EXPECT_EQ(value_, "plain *word*");

    surface_.end_editing();
    EXPECT_EQ(ended, 1);
}

TEST_F(EditorTest, IntrospectRunsAfterInstall) {
    std::vector<std::string> seen;
    EditorCallbacks callbacks;
    callbacks.introspect = [&](TextSurface& surface) {
        seen.push_back(surface.text());
        EXPECT_NE(dynamic_cast<MemoryTextSurface*>(&surface), nullptr);
    };

    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_, callbacks);
    value_ = "changed";
    editor.refresh();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "plain *word*");
    EXPECT_EQ(seen[1], "changed");
}

TEST_F(EditorTest, SetRulesRestyles) {
    HighlightedEditor editor(surface_, TextBinding::bound_to(value_), emphasis_);
    EXPECT_EQ(traits_at(surface_, 0), FontTraits::None);

    editor.set_rules(rules_for("plain", FontTraits::Bold));

    EXPECT_EQ(editor.rules().name(), "test");
    EXPECT_EQ(traits_at(surface_, 0), FontTraits::Bold);
    EXPECT_EQ(traits_at(surface_, 7), FontTraits::None);
}

TEST_F(EditorTest, GetterSetterBinding) {
    auto store = std::make_shared<std::string>("*x*");
    int writes = 0;
    TextBinding binding(
        [store] { return *store; },
        [store, &writes](std::string text) { ++writes; *store = std::move(text); });

    HighlightedEditor editor(surface_, binding, emphasis_);
    EXPECT_EQ(surface_.text(), "*x*");

    surface_.type_text("y");
    EXPECT_EQ(*store, "*x*y");
    EXPECT_EQ(writes, 1);
}
