#include <hilite/highlight/style.hpp>

namespace hilite::highlight {

std::string_view to_string(AttributeKey key) noexcept {
    switch (key) {
        case AttributeKey::Font:               return "font";
        case AttributeKey::FontTraits:         return "font-traits";
        case AttributeKey::ForegroundColor:    return "foreground-color";
        case AttributeKey::BackgroundColor:    return "background-color";
        case AttributeKey::Kern:               return "kern";
        case AttributeKey::UnderlineStyle:     return "underline-style";
        case AttributeKey::StrikethroughStyle: return "strikethrough-style";
        case AttributeKey::StrikethroughColor: return "strikethrough-color";
        case AttributeKey::ParagraphStyle:     return "paragraph-style";
        case AttributeKey::Link:               return "link";
    }
    return "unknown";
}

// AttributeSet

void AttributeSet::set(AttributeKey key, StyleValue value) {
    values_.insert_or_assign(key, std::move(value));
}

bool AttributeSet::erase(AttributeKey key) {
    return values_.erase(key) > 0;
}

const StyleValue* AttributeSet::find(AttributeKey key) const {
    auto it = values_.find(key);
    return it != values_.end() ? &it->second : nullptr;
}

void AttributeSet::merge(const AttributeSet& other) {
    for (const auto& [key, value] : other.values_) {
        values_.insert_or_assign(key, value);
    }
}

// StyleMutation

StyleMutation StyleMutation::fixed(AttributeKey key, StyleValue value) {
    return StyleMutation(key, std::move(value));
}

StyleMutation StyleMutation::computed(AttributeKey key, StyleCalculator calculator) {
    return StyleMutation(key, std::move(calculator));
}

StyleMutation StyleMutation::on_group(std::size_t group) const {
    StyleMutation copy = *this;
    copy.group_ = group;
    return copy;
}

std::optional<TextRange> StyleMutation::target_span(const Match& match) const {
    return match.group(group_.value_or(0));
}

std::optional<StyleValue> StyleMutation::resolve(std::string_view target_text, const Match& match) const {
    if (const auto* value = std::get_if<StyleValue>(&source_)) {
        return *value;
    }
    const auto& calculator = std::get<StyleCalculator>(source_);
    if (!calculator) {
        return std::nullopt;
    }
    return calculator(target_text, match);
}

} // namespace hilite::highlight
