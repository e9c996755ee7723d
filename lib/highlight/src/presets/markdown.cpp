#include <hilite/highlight/presets.hpp>
#include "preset_support.hpp"

namespace hilite::highlight::presets {

namespace {

constexpr std::string_view INLINE_CODE = R"(`[^`]*`)";
constexpr std::string_view CODE_BLOCK = R"((`){3}((?!\1).)+\1{3})";
constexpr std::string_view HEADING = R"(^#{1,6}\s.*$)";
constexpr std::string_view LINK_OR_IMAGE = R"(!?\[([^\[\]]*)\]\((.*?)\))";
constexpr std::string_view LINK_OR_IMAGE_TAG = R"(!?\[([^\[\]]*)\]\[(.*?)\])";
constexpr std::string_view BOLD = R"(((\*|_){2})((?!\1).)+\1)";
constexpr std::string_view UNDERSCORE_EMPHASIS = R"((?<!_)_[^_]+_(?!\*))";
constexpr std::string_view ASTERISK_EMPHASIS = R"((?<!\*)(\*)((?!\1).)+\1(?!\*))";
constexpr std::string_view BOLD_EMPHASIS_ASTERISK = R"((\*){3}((?!\1).)+\1{3})";
constexpr std::string_view BLOCKQUOTE = R"(^>.*)";
constexpr std::string_view HORIZONTAL_RULE = "\n\n(-{3}|\\*{3})\n";
constexpr std::string_view UNORDERED_LIST = R"(^(\-|\*)\s)";
constexpr std::string_view ORDERED_LIST = R"(^\d*\.\s)";
constexpr std::string_view BUTTON = R"(<\s*button[^>]*>(.*?)<\s*/\s*button>)";
constexpr std::string_view STRIKETHROUGH = R"((~)((?!\1).)+\1)";
constexpr std::string_view TAG = R"(^\[([^\[\]]*)\]:)";
constexpr std::string_view FOOTNOTE = R"(\[\^(.*?)\])";
constexpr std::string_view HTML = R"(<([A-Z][A-Z0-9]*)\b[^>]*>(.*?)</\1>)";

} // namespace

Result<RuleSet> make_markdown(const PresetTheme& theme) {
    using namespace detail;
    using enum PatternOptions;

    const FontSpec heading_base = theme.body_font;

    RuleSetBuilder builder("markdown");
    builder
        .rule(INLINE_CODE, font(theme.code_font))
        .rule(CODE_BLOCK, DotMatchesLineSeparators, font(theme.code_font))
        .rule(HEADING, AnchorsMatchLines, {
            traits(FontTraits::Bold | FontTraits::Expanded),
            StyleMutation::fixed(AttributeKey::Kern, 0.5),
            heading_font(heading_base),
        })
        .rule(LINK_OR_IMAGE, underline())
        .rule(LINK_OR_IMAGE_TAG, underline())
        .rule(BOLD, traits(FontTraits::Bold))
        .rule(ASTERISK_EMPHASIS, traits(FontTraits::Italic))
        .rule(UNDERSCORE_EMPHASIS, traits(FontTraits::Italic))
        .rule(BOLD_EMPHASIS_ASTERISK, traits(FontTraits::Bold | FontTraits::Italic))
        .rule(BLOCKQUOTE, AnchorsMatchLines, background(theme.secondary_background))
        .rule(HORIZONTAL_RULE, foreground(theme.lighter_color))
        .rule(UNORDERED_LIST, AnchorsMatchLines, foreground(theme.lighter_color))
        .rule(ORDERED_LIST, AnchorsMatchLines, foreground(theme.lighter_color))
        .rule(BUTTON, foreground(theme.lighter_color))
        .rule(STRIKETHROUGH, {
            StyleMutation::fixed(AttributeKey::StrikethroughStyle, LineStyle::Single),
            StyleMutation::fixed(AttributeKey::StrikethroughColor, theme.text_color),
        })
        .rule(TAG, AnchorsMatchLines, foreground(theme.lighter_color))
        .rule(FOOTNOTE, foreground(theme.lighter_color))
        .rule(HTML, DotMatchesLineSeparators | CaseInsensitive, {
            font(theme.code_font),
            foreground(theme.lighter_color),
        });

    return std::move(builder).build();
}

const RuleSet& markdown() {
    static const RuleSet rules = detail::require_preset(make_markdown(), "markdown");
    return rules;
}

} // namespace hilite::highlight::presets
