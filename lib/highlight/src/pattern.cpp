#include <hilite/highlight/pattern.hpp>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace hilite::highlight {

namespace {

struct CodeDeleter {
    void operator()(pcre2_code* code) const noexcept { pcre2_code_free(code); }
};

struct MatchDataDeleter {
    void operator()(pcre2_match_data* data) const noexcept { pcre2_match_data_free(data); }
};

struct CompileContextDeleter {
    void operator()(pcre2_compile_context* ctx) const noexcept { pcre2_compile_context_free(ctx); }
};

using CodePtr = std::unique_ptr<pcre2_code, CodeDeleter>;
using MatchDataPtr = std::unique_ptr<pcre2_match_data, MatchDataDeleter>;
using CompileContextPtr = std::unique_ptr<pcre2_compile_context, CompileContextDeleter>;

std::uint32_t compile_flags(PatternOptions options) {
    // Unicode-aware \w, \b and \s; malformed UTF-8 in subjects is skipped
    // rather than failing the whole match call.
    std::uint32_t flags = PCRE2_UTF | PCRE2_UCP | PCRE2_MATCH_INVALID_UTF;
    if (has_flag(options, PatternOptions::CaseInsensitive)) flags |= PCRE2_CASELESS;
    if (has_flag(options, PatternOptions::AnchorsMatchLines)) flags |= PCRE2_MULTILINE;
    if (has_flag(options, PatternOptions::DotMatchesLineSeparators)) flags |= PCRE2_DOTALL;
    return flags;
}

std::string error_text(int code) {
    std::array<PCRE2_UCHAR, 256> buffer{};
    const int len = pcre2_get_error_message(code, buffer.data(), buffer.size());
    if (len < 0) {
        return fmt::format("PCRE2 error {}", code);
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len));
}

// PCRE2 rejects a null pointer even for zero-length input
PCRE2_SPTR subject_pointer(std::string_view text) {
    static constexpr char empty[] = "";
    return reinterpret_cast<PCRE2_SPTR>(text.data() ? text.data() : empty);
}

// Offset just past the UTF-8 code point starting at offset
std::size_t next_code_point(std::string_view text, std::size_t offset) {
    if (offset >= text.size()) return offset + 1;
    ++offset;
    while (offset < text.size() && (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80) {
        ++offset;
    }
    return offset;
}

} // namespace

struct Pattern::Program {
    std::string source;
    PatternOptions options{PatternOptions::None};
    CodePtr code;
    std::size_t capture_count{0};
    bool jit{false};
};

Pattern::Pattern(std::shared_ptr<const Program> program)
    : program_(std::move(program))
{}

Result<Pattern> Pattern::compile(std::string_view source, PatternOptions options) {
    CompileContextPtr context(pcre2_compile_context_create(nullptr));
    if (!context) {
        return std::unexpected(internal_error("failed to allocate PCRE2 compile context"));
    }
    pcre2_set_newline(context.get(), PCRE2_NEWLINE_ANYCRLF);

    int error_code = 0;
    PCRE2_SIZE error_offset = 0;
    CodePtr code(pcre2_compile(
        subject_pointer(source),
        source.size(),
        compile_flags(options),
        &error_code,
        &error_offset,
        context.get()));

    if (!code) {
        return std::unexpected(pattern_error(fmt::format(
            "invalid pattern '{}' at offset {}: {}", source, error_offset, error_text(error_code))));
    }

    auto program = std::make_shared<Program>();
    program->source = std::string(source);
    program->options = options;

    std::uint32_t captures = 0;
    if (const int rc = pcre2_pattern_info(code.get(), PCRE2_INFO_CAPTURECOUNT, &captures); rc != 0) {
        return std::unexpected(internal_error(fmt::format(
            "cannot read capture count of '{}': {}", source, error_text(rc))));
    }
    program->capture_count = captures;

    // JIT is an accelerator only; interpreted matching gives the same results
    const int jit_rc = pcre2_jit_compile(code.get(), PCRE2_JIT_COMPLETE);
    program->jit = jit_rc == 0;
    if (!program->jit) {
        spdlog::trace("JIT unavailable for pattern '{}': {}", source, error_text(jit_rc));
    }

    program->code = std::move(code);
    return Pattern(std::move(program));
}

const std::string& Pattern::source() const noexcept {
    return program_->source;
}

PatternOptions Pattern::options() const noexcept {
    return program_->options;
}

std::size_t Pattern::capture_count() const noexcept {
    return program_->capture_count;
}

bool Pattern::jit_compiled() const noexcept {
    return program_->jit;
}

std::vector<Match> Pattern::find_all(std::string_view subject) const {
    std::vector<Match> matches;

    MatchDataPtr data(pcre2_match_data_create_from_pattern(program_->code.get(), nullptr));
    if (!data) {
        spdlog::error("Failed to allocate match data for pattern '{}'", program_->source);
        return matches;
    }

    const PCRE2_SPTR subject_ptr = subject_pointer(subject);
    const std::size_t group_total = program_->capture_count + 1;
    std::size_t offset = 0;

    while (offset <= subject.size()) {
        const int rc = pcre2_match(program_->code.get(), subject_ptr, subject.size(),
                                   offset, 0, data.get(), nullptr);
        if (rc == PCRE2_ERROR_NOMATCH) {
            break;
        }
        if (rc < 0) {
            // e.g. match limit exceeded on pathological input; keep what we have
            spdlog::warn("Pattern '{}' stopped scanning at offset {}: {}",
                         program_->source, offset, error_text(rc));
            break;
        }

        const PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(data.get());
        std::vector<std::optional<TextRange>> groups;
        groups.reserve(group_total);
        for (std::size_t i = 0; i < group_total; ++i) {
            const PCRE2_SIZE begin = ovector[2 * i];
            const PCRE2_SIZE end = ovector[2 * i + 1];
            if (begin == PCRE2_UNSET || i >= static_cast<std::size_t>(rc)) {
                groups.emplace_back(std::nullopt);
            } else {
                groups.emplace_back(TextRange::from_bounds(begin, end));
            }
        }

        const std::size_t match_start = ovector[0];
        const std::size_t match_end = ovector[1];
        matches.emplace_back(subject, std::move(groups));

        // \K can report an end before the start; treat it as empty
        if (match_end <= match_start) {
            offset = next_code_point(subject, std::max(match_start, match_end));
        } else {
            offset = match_end;
        }
    }

    return matches;
}

bool Pattern::matches_anywhere(std::string_view subject) const {
    MatchDataPtr data(pcre2_match_data_create_from_pattern(program_->code.get(), nullptr));
    if (!data) return false;
    const int rc = pcre2_match(program_->code.get(), subject_pointer(subject),
                               subject.size(), 0, 0, data.get(), nullptr);
    return rc >= 0;
}

} // namespace hilite::highlight
