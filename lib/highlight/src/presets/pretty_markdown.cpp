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
constexpr std::string_view STRIKETHROUGH = R"((~~)((?!\1).)+\1)";
constexpr std::string_view TAG = R"(^\[([^\[\]]*)\]:)";
constexpr std::string_view FOOTNOTE = R"(\[\^(.*?)\])";
constexpr std::string_view HTML = R"(<([A-Z][A-Z0-9]*)\b[^>]*>(.*?)</\1>)";
constexpr std::string_view CHECKBOX_UNCHECKED = R"(^(\[\s\]).*)";

// Syntax markers, dimmed after the constructs above are styled
constexpr std::string_view ASTERISK_SYNTAX = R"(\*)";
constexpr std::string_view HEADING_SYNTAX = R"(^#{1,6})";
constexpr std::string_view ITALIC_OPEN_SYNTAX = R"((?<=^|[^*])\*(?=[^*]))";
constexpr std::string_view ITALIC_CLOSE_SYNTAX = R"((?<=[^*])\*(?=[^*]|$))";
constexpr std::string_view HIGHLIGHTED_TEXT = R"(==.*?==)";
constexpr std::string_view HIGHLIGHTED_SYNTAX = R"((?<=\s)==|==(?=\s))";

constexpr double LIST_INDENT = 15.0;
constexpr double LIST_SPACING = 12.0;
constexpr double HEADING_SPACING = 10.0;
constexpr double SYNTAX_MARKER_SIZE = 14.0;

StyleMutation paragraph(double first_indent, double indent, double spacing) {
    return StyleMutation::fixed(AttributeKey::ParagraphStyle, ParagraphStyle{first_indent, indent, spacing});
}

} // namespace

Result<RuleSet> make_pretty_markdown(const PresetTheme& theme) {
    using namespace detail;
    using enum PatternOptions;

    const FontSpec marker_font{"", SYNTAX_MARKER_SIZE, FontTraits::None};

    RuleSetBuilder builder("pretty-markdown");
    builder
        .rule(INLINE_CODE, font(theme.code_font))
        .rule(CODE_BLOCK, DotMatchesLineSeparators, font(theme.code_font))
        .rule(HEADING, AnchorsMatchLines, {
            StyleMutation::fixed(AttributeKey::Kern, 0.5),
            heading_font(theme.heading_font),
            paragraph(0.0, 0.0, HEADING_SPACING),
        })
        .rule(LINK_OR_IMAGE, underline())
        .rule(LINK_OR_IMAGE_TAG, underline())
        .rule(BOLD, traits(FontTraits::Bold))
        .rule(ASTERISK_EMPHASIS, traits(FontTraits::Italic))
        .rule(UNDERSCORE_EMPHASIS, traits(FontTraits::Italic))
        .rule(BOLD_EMPHASIS_ASTERISK, traits(FontTraits::Bold | FontTraits::Italic))
        .rule(BLOCKQUOTE, AnchorsMatchLines, background(theme.secondary_background))
        .rule(HORIZONTAL_RULE, foreground(theme.lighter_color))
        .rule(UNORDERED_LIST, AnchorsMatchLines, paragraph(LIST_INDENT, LIST_INDENT, LIST_SPACING))
        .rule(ORDERED_LIST, AnchorsMatchLines, {
            paragraph(LIST_INDENT, LIST_INDENT, LIST_SPACING),
            foreground(theme.lighter_color),
        })
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
        })
        .rule(ASTERISK_SYNTAX, foreground(theme.lighter_color))
        .rule(HEADING_SYNTAX, AnchorsMatchLines, {
            foreground(theme.lighter_color),
            font(marker_font),
        })
        .rule(ITALIC_OPEN_SYNTAX, foreground(theme.lighter_color))
        .rule(ITALIC_CLOSE_SYNTAX, foreground(theme.lighter_color))
        .rule(HIGHLIGHTED_TEXT, {
            background(theme.text_highlight),
            foreground(theme.text_color),
        })
        .rule(HIGHLIGHTED_SYNTAX, foreground(theme.lighter_color))
        .rule(CHECKBOX_UNCHECKED, AnchorsMatchLines, background(theme.checkbox_background));

    return std::move(builder).build();
}

const RuleSet& pretty_markdown() {
    static const RuleSet rules = detail::require_preset(make_pretty_markdown(), "pretty-markdown");
    return rules;
}

} // namespace hilite::highlight::presets
