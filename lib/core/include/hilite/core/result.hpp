#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>

namespace hilite {

// Error category for classification
enum class ErrorCategory {
    None,
    Pattern,    // Regular expression failed to compile
    Rule,       // Rule set could not be assembled
    Style,      // Style value could not be produced
    Host,       // Host surface rejected an operation
    Config,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "none";
        case ErrorCategory::Pattern:  return "pattern";
        case ErrorCategory::Rule:     return "rule";
        case ErrorCategory::Style:    return "style";
        case ErrorCategory::Host:     return "host";
        case ErrorCategory::Config:   return "config";
        case ErrorCategory::Internal: return "internal";
    }
    return "unknown";
}

// Error type with context
class Error {
public:
    Error() = default;

    explicit Error(std::string_view message,
                   ErrorCategory category = ErrorCategory::Internal,
                   std::source_location loc = std::source_location::current())
        : message_(message)
        , category_(category)
        , file_(loc.file_name())
        , line_(loc.line())
    {}

    Error(std::string message,
          ErrorCategory category = ErrorCategory::Internal,
          std::source_location loc = std::source_location::current())
        : message_(std::move(message))
        , category_(category)
        , file_(loc.file_name())
        , line_(loc.line())
    {}

    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }
    [[nodiscard]] std::string_view file() const noexcept { return file_; }
    [[nodiscard]] std::uint32_t line() const noexcept { return line_; }

    [[nodiscard]] std::string format() const {
        return fmt::format("[{}:{}] {} error: {}", file_, line_, to_string(category_), message_);
    }

    // Prefix the message, keeping category and origin
    [[nodiscard]] Error with_context(std::string_view context) const {
        Error chained = *this;
        chained.message_ = fmt::format("{}: {}", context, message_);
        return chained;
    }

private:
    std::string message_;
    ErrorCategory category_{ErrorCategory::None};
    std::string_view file_;
    std::uint32_t line_{0};
};

template<typename T>
using Result = std::expected<T, Error>;

inline Error pattern_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Pattern, loc);
}

inline Error rule_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Rule, loc);
}

inline Error internal_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
    return Error(msg, ErrorCategory::Internal, loc);
}

} // namespace hilite
