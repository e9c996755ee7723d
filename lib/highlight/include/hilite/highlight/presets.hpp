#pragma once

#include <hilite/core/result.hpp>
#include <hilite/core/types.hpp>
#include <hilite/highlight/rule.hpp>
#include <hilite/highlight/style.hpp>

#include <string_view>

namespace hilite::highlight::presets {

inline constexpr int MAX_HEADING_LEVEL = 6;

// Fonts and colors the presets style with
struct PresetTheme {
    FontSpec body_font{"", 15.0, FontTraits::None};
    FontSpec heading_font{"", 13.0, FontTraits::Bold};
    FontSpec code_font{"Menlo", 13.0, FontTraits::Monospace};
    Color text_color{Color::rgb(0x1d, 0x1d, 0x1f)};
    // Editor canvas behind the text
    Color background{Color::rgb(0xff, 0xff, 0xff)};
    Color lighter_color{Color::rgb(0xaa, 0xaa, 0xaa)};
    Color secondary_background{Color::rgb(0xf2, 0xf2, 0xf7)};
    Color text_highlight{Color::rgba(22, 214, 248, 77)};
    Color checkbox_background{Color::rgba(245, 142, 39, 51)};

    [[nodiscard]] static PresetTheme light();
    [[nodiscard]] static PresetTheme dark();
    [[nodiscard]] static PresetTheme for_appearance(Appearance appearance);

    // Base attributes for unstyled text: body font and text color
    [[nodiscard]] AttributeSet base_attributes() const;
};

// Font size for a heading whose line starts with hashes leading '#'
[[nodiscard]] double heading_point_size(std::size_t hashes, double base_size) noexcept;

// Lightweight markup (markdown) highlighting
[[nodiscard]] Result<RuleSet> make_markdown(const PresetTheme& theme = PresetTheme::light());

// Markdown variant that dims syntax markers and adds ==highlight== and
// checkbox rules. Its strikethrough uses "~~" where make_markdown uses "~".
[[nodiscard]] Result<RuleSet> make_pretty_markdown(const PresetTheme& theme = PresetTheme::light());

// Underlines URLs and attaches a Link value
[[nodiscard]] Result<RuleSet> make_url();

// Built once with the light theme. A broken built-in pattern is a
// programming error: it is logged and raised as std::bad_expected_access.
[[nodiscard]] const RuleSet& markdown();
[[nodiscard]] const RuleSet& pretty_markdown();
[[nodiscard]] const RuleSet& url();

// The compiled URL detector used by url()
[[nodiscard]] const Pattern& url_pattern();

} // namespace hilite::highlight::presets
