#pragma once

#include <hilite/highlight/presets.hpp>

#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace hilite::highlight::presets::detail {

// Unwraps a built-in preset; a failure here means a pattern in this library
// is broken, so it is logged and rethrown by value()
inline RuleSet require_preset(Result<RuleSet> result, std::string_view name) {
    if (!result) {
        spdlog::critical("Built-in preset '{}' failed to build: {}", name, result.error().format());
    } else {
        spdlog::debug("Built preset '{}' with {} rules", name, result->size());
    }
    return std::move(result).value();
}

inline StyleMutation foreground(Color color) {
    return StyleMutation::fixed(AttributeKey::ForegroundColor, color);
}

inline StyleMutation background(Color color) {
    return StyleMutation::fixed(AttributeKey::BackgroundColor, color);
}

inline StyleMutation font(const FontSpec& spec) {
    return StyleMutation::fixed(AttributeKey::Font, spec);
}

inline StyleMutation traits(FontTraits value) {
    return StyleMutation::fixed(AttributeKey::FontTraits, value);
}

inline StyleMutation underline() {
    return StyleMutation::fixed(AttributeKey::UnderlineStyle, LineStyle::Single);
}

// Font sized by the number of leading '#' in the heading line
StyleMutation heading_font(const FontSpec& base);

} // namespace hilite::highlight::presets::detail
