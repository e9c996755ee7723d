#include <hilite/highlight/presets.hpp>
#include "preset_support.hpp"

#include <algorithm>

namespace hilite::highlight::presets {

namespace {

constexpr std::string_view URL_PATTERN =
    R"(((https?://)?((www\.)?\w+\.)+(com|org|net|edu|gov|mil|biz|info|io|mobi|name|ly|tv|co|uk|ca|de|jp|fr|au|us|ru|ch|it|nl|se|no|es|in|ae|ar|at|be|bg|br|bz|cl|cn|cz|dk|fi|gr|hk|hu|id|ie|il|in|ir|is|kr|kz|lt|lu|lv|ma|mx|my|nz|ph|pk|pl|pt|ro|sa|sg|si|sk|th|tr|ua|vn|za)(\b|/)(/\w+\.\w+)*(\?\w+(&\w+)*)?))";

// Rejects targets no host could open: empty, or containing whitespace or
// control characters
bool is_valid_link_target(std::string_view target) {
    if (target.empty()) {
        return false;
    }
    return std::none_of(target.begin(), target.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte <= 0x20 || byte == 0x7f;
    });
}

StyleMutation link() {
    return StyleMutation::computed(AttributeKey::Link,
        [](std::string_view target, const Match&) -> std::optional<StyleValue> {
            if (!is_valid_link_target(target)) {
                return std::nullopt;
            }
            return Link{std::string(target)};
        });
}

} // namespace

const Pattern& url_pattern() {
    static const Pattern pattern = [] {
        auto compiled = Pattern::compile(URL_PATTERN);
        if (!compiled) {
            spdlog::critical("Built-in URL pattern failed to compile: {}", compiled.error().format());
        }
        return std::move(compiled).value();
    }();
    return pattern;
}

Result<RuleSet> make_url() {
    RuleSetBuilder builder("url");
    builder.rule(url_pattern(), {detail::underline(), link()});
    return std::move(builder).build();
}

const RuleSet& url() {
    static const RuleSet rules = detail::require_preset(make_url(), "url");
    return rules;
}

} // namespace hilite::highlight::presets
