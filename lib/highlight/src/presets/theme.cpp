#include <hilite/highlight/presets.hpp>
#include "preset_support.hpp"

#include <algorithm>

namespace hilite::highlight::presets {

PresetTheme PresetTheme::light() {
    return PresetTheme{};
}

PresetTheme PresetTheme::dark() {
    PresetTheme theme;
    theme.text_color = Color::rgb(0xff, 0xff, 0xff);
    theme.background = Color::rgb(0x1e, 0x1e, 0x1e);
    theme.lighter_color = Color::rgb(0x8e, 0x8e, 0x93);
    theme.secondary_background = Color::rgb(0x55, 0x55, 0x55);
    return theme;
}

PresetTheme PresetTheme::for_appearance(Appearance appearance) {
    return appearance == Appearance::Dark ? dark() : light();
}

AttributeSet PresetTheme::base_attributes() const {
    AttributeSet base;
    base.set(AttributeKey::Font, body_font);
    base.set(AttributeKey::ForegroundColor, text_color);
    return base;
}

double heading_point_size(std::size_t hashes, double base_size) noexcept {
    const auto level = static_cast<int>(std::min<std::size_t>(hashes, MAX_HEADING_LEVEL));
    return static_cast<double>(MAX_HEADING_LEVEL - level) * 2.5 + base_size;
}

namespace detail {

StyleMutation heading_font(const FontSpec& base) {
    return StyleMutation::computed(AttributeKey::Font,
        [base](std::string_view content, const Match&) -> std::optional<StyleValue> {
            const auto hashes = static_cast<std::size_t>(
                std::find_if(content.begin(), content.end(), [](char c) { return c != '#'; }) -
                content.begin());
            return base.with_size(heading_point_size(hashes, base.point_size));
        });
}

} // namespace detail

} // namespace hilite::highlight::presets
