#pragma once

#include <hilite/core/bitflags.hpp>
#include <hilite/core/types.hpp>
#include <hilite/highlight/pattern.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hilite::highlight {

// Attribute keys a rule can set. Adapters decide how each is rendered.
enum class AttributeKey : std::uint8_t {
    Font,
    FontTraits,
    ForegroundColor,
    BackgroundColor,
    Kern,
    UnderlineStyle,
    StrikethroughStyle,
    StrikethroughColor,
    ParagraphStyle,
    Link,
};

[[nodiscard]] std::string_view to_string(AttributeKey key) noexcept;

enum class FontTraits : std::uint8_t {
    None      = 0,
    Bold      = 1 << 0,
    Italic    = 1 << 1,
    Expanded  = 1 << 2,
    Monospace = 1 << 3,
};

} // namespace hilite::highlight

namespace hilite {
template<>
struct EnableBitflags<highlight::FontTraits> : std::true_type {};
} // namespace hilite

namespace hilite::highlight {

HILITE_USE_BITFLAG_OPERATORS;

// Font request; family may be empty for "system font"
struct FontSpec {
    std::string family;
    double point_size{0.0};
    FontTraits traits{FontTraits::None};

    [[nodiscard]] FontSpec with_size(double size) const {
        FontSpec copy = *this;
        copy.point_size = size;
        return copy;
    }

    bool operator==(const FontSpec&) const = default;
};

enum class LineStyle : std::uint8_t {
    None,
    Single,
    Thick,
    Double,
};

struct ParagraphStyle {
    double first_line_head_indent{0.0};
    double head_indent{0.0};
    double paragraph_spacing{0.0};

    bool operator==(const ParagraphStyle&) const = default;
};

struct Link {
    std::string target;

    bool operator==(const Link&) const = default;
};

// Opaque to the engine: values are only copied, compared and overwritten
using StyleValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    Color,
    FontSpec,
    FontTraits,
    LineStyle,
    ParagraphStyle,
    Link>;

// Resolved attributes of a span, at most one value per key
class AttributeSet {
public:
    using Storage = std::map<AttributeKey, StyleValue>;
    using const_iterator = Storage::const_iterator;

    AttributeSet() = default;
    AttributeSet(std::initializer_list<Storage::value_type> values)
        : values_(values)
    {}

    // Overwrites any existing value for key
    void set(AttributeKey key, StyleValue value);
    bool erase(AttributeKey key);

    [[nodiscard]] const StyleValue* find(AttributeKey key) const;
    [[nodiscard]] bool contains(AttributeKey key) const { return values_.contains(key); }

    template<typename T>
    [[nodiscard]] const T* get(AttributeKey key) const {
        const StyleValue* value = find(key);
        return value ? std::get_if<T>(value) : nullptr;
    }

    // Values of other overwrite ours
    void merge(const AttributeSet& other);

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return values_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return values_.end(); }

    bool operator==(const AttributeSet&) const = default;

private:
    Storage values_;
};

// Computes a value from the text of the targeted span and the full match.
// Returning nullopt omits the attribute for that span.
using StyleCalculator = std::function<std::optional<StyleValue>(std::string_view target_text,
                                                                const Match& match)>;

// One attribute change applied to each match of a rule, or to one of its
// capture groups.
class StyleMutation {
public:
    [[nodiscard]] static StyleMutation fixed(AttributeKey key, StyleValue value);
    [[nodiscard]] static StyleMutation computed(AttributeKey key, StyleCalculator calculator);

    // Restrict to a capture group; skipped for matches where it is unset
    [[nodiscard]] StyleMutation on_group(std::size_t group) const;

    [[nodiscard]] AttributeKey key() const noexcept { return key_; }
    [[nodiscard]] std::optional<std::size_t> target_group() const noexcept { return group_; }
    [[nodiscard]] bool is_dynamic() const noexcept {
        return std::holds_alternative<StyleCalculator>(source_);
    }

    // Span this mutation targets within match, nullopt if its group is unset
    [[nodiscard]] std::optional<TextRange> target_span(const Match& match) const;

    [[nodiscard]] std::optional<StyleValue> resolve(std::string_view target_text,
                                                    const Match& match) const;

private:
    StyleMutation(AttributeKey key, std::variant<StyleValue, StyleCalculator> source)
        : key_(key)
        , source_(std::move(source))
    {}

    AttributeKey key_;
    std::variant<StyleValue, StyleCalculator> source_;
    std::optional<std::size_t> group_;
};

} // namespace hilite::highlight
