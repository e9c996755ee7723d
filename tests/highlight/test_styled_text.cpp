// Styled text and run buffer tests

#include <hilite/highlight/styled_text.hpp>

#include <gtest/gtest.h>

using namespace hilite;
using namespace hilite::highlight;

namespace {

const AttributeSet BASE{{AttributeKey::ForegroundColor, Color::rgb(0, 0, 0)}};

} // namespace

TEST(StyledTextTest, UnstyledHasOneRun) {
    StyledText styled("plain text", BASE);

    ASSERT_EQ(styled.runs().size(), 1u);
    EXPECT_EQ(styled.runs()[0].range, (TextRange{0, 10}));
    EXPECT_EQ(styled.runs()[0].attributes, BASE);
    EXPECT_EQ(styled.length(), 10u);
}

TEST(StyledTextTest, EmptyTextHasNoRuns) {
    StyledText styled("", BASE);

    EXPECT_TRUE(styled.runs().empty());
    EXPECT_EQ(styled.attributes_at(0), BASE);
    EXPECT_EQ(styled.run_index_at(0), 0u);
}

TEST(StyleBufferTest, ApplySplitsRuns) {
    StyleBuffer buffer(10, BASE);
    buffer.apply(TextRange{3, 4}, AttributeKey::Kern, 0.5);

    StyledText styled = std::move(buffer).finish("0123456789");

    ASSERT_EQ(styled.runs().size(), 3u);
    EXPECT_EQ(styled.runs()[0].range, (TextRange{0, 3}));
    EXPECT_EQ(styled.runs()[1].range, (TextRange{3, 4}));
    EXPECT_EQ(styled.runs()[2].range, (TextRange{7, 3}));

    EXPECT_EQ(styled.get_at<double>(2, AttributeKey::Kern), nullptr);
    ASSERT_NE(styled.get_at<double>(3, AttributeKey::Kern), nullptr);
    EXPECT_DOUBLE_EQ(*styled.get_at<double>(6, AttributeKey::Kern), 0.5);
    EXPECT_EQ(styled.get_at<double>(7, AttributeKey::Kern), nullptr);

    // Base attributes stay under the applied key
    EXPECT_NE(styled.attribute_at(4, AttributeKey::ForegroundColor), nullptr);
}

TEST(StyleBufferTest, EqualNeighboursCoalesce) {
    StyleBuffer buffer(9, BASE);
    buffer.apply(TextRange{0, 3}, AttributeKey::Kern, 1.0);
    buffer.apply(TextRange{3, 3}, AttributeKey::Kern, 1.0);

    StyledText styled = std::move(buffer).finish("abcdefghi");

    ASSERT_EQ(styled.runs().size(), 2u);
    EXPECT_EQ(styled.runs()[0].range, (TextRange{0, 6}));
    EXPECT_EQ(styled.runs()[1].range, (TextRange{6, 3}));
}

TEST(StyleBufferTest, LaterValueOverwrites) {
    StyleBuffer buffer(6, {});
    buffer.apply(TextRange{0, 6}, AttributeKey::ForegroundColor, Color::rgb(1, 1, 1));
    buffer.apply(TextRange{2, 2}, AttributeKey::ForegroundColor, Color::rgb(2, 2, 2));

    StyledText styled = std::move(buffer).finish("abcdef");

    ASSERT_EQ(styled.runs().size(), 3u);
    EXPECT_EQ(*styled.get_at<Color>(1, AttributeKey::ForegroundColor), Color::rgb(1, 1, 1));
    EXPECT_EQ(*styled.get_at<Color>(2, AttributeKey::ForegroundColor), Color::rgb(2, 2, 2));
    EXPECT_EQ(*styled.get_at<Color>(4, AttributeKey::ForegroundColor), Color::rgb(1, 1, 1));
}

TEST(StyleBufferTest, RangesAreClipped) {
    StyleBuffer buffer(4, {});
    buffer.apply(TextRange{2, 100}, AttributeKey::Kern, 2.0);
    buffer.apply(TextRange{10, 3}, AttributeKey::Kern, 3.0);

    StyledText styled = std::move(buffer).finish("abcd");

    ASSERT_EQ(styled.runs().size(), 2u);
    EXPECT_EQ(styled.runs()[1].range, (TextRange{2, 2}));
    EXPECT_DOUBLE_EQ(*styled.get_at<double>(3, AttributeKey::Kern), 2.0);
}

TEST(StyledTextTest, RunLookup) {
    StyleBuffer buffer(6, {});
    buffer.apply(TextRange{2, 2}, AttributeKey::Kern, 1.0);
    StyledText styled = std::move(buffer).finish("abcdef");

    EXPECT_EQ(styled.run_index_at(0), 0u);
    EXPECT_EQ(styled.run_index_at(2), 1u);
    EXPECT_EQ(styled.run_index_at(3), 1u);
    EXPECT_EQ(styled.run_index_at(4), 2u);
    EXPECT_EQ(styled.run_index_at(6), styled.runs().size());
}

TEST(StyledTextTest, DigestTracksAttributes) {
    auto make = [](double kern) {
        StyleBuffer buffer(5, {});
        buffer.apply(TextRange{1, 2}, AttributeKey::Kern, kern);
        return std::move(buffer).finish("hello");
    };

    EXPECT_EQ(make(0.5).digest(), make(0.5).digest());
    EXPECT_EQ(make(0.5), make(0.5));
    EXPECT_NE(make(0.5).digest(), make(1.5).digest());
    EXPECT_NE(make(0.5), make(1.5));
    EXPECT_NE(StyledText("hello", {}), StyledText("hellO", {}));
}
