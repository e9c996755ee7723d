#include <hilite/highlight/styled_text.hpp>
#include <hilite/core/hash.hpp>

#include <algorithm>
#include <type_traits>

namespace hilite::highlight {

namespace {

void hash_value(StreamingHasher& hasher, const StyleValue& value) {
    hasher.update_value(value.index());
    std::visit([&hasher](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
                      std::is_same_v<T, double> || std::is_same_v<T, FontTraits> ||
                      std::is_same_v<T, LineStyle>) {
            hasher.update_value(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            hasher.update(v);
        } else if constexpr (std::is_same_v<T, Color>) {
            hasher.update_value(v.packed_rgba());
        } else if constexpr (std::is_same_v<T, FontSpec>) {
            hasher.update(v.family);
            hasher.update_value(v.point_size);
            hasher.update_value(v.traits);
        } else if constexpr (std::is_same_v<T, ParagraphStyle>) {
            hasher.update_value(v.first_line_head_indent);
            hasher.update_value(v.head_indent);
            hasher.update_value(v.paragraph_spacing);
        } else if constexpr (std::is_same_v<T, Link>) {
            hasher.update(v.target);
        }
    }, value);
}

void hash_attributes(StreamingHasher& hasher, const AttributeSet& attributes) {
    hasher.update_value(attributes.size());
    for (const auto& [key, value] : attributes) {
        hasher.update_value(key);
        hash_value(hasher, value);
    }
}

} // namespace

// StyledText

StyledText::StyledText(std::string text, AttributeSet base)
    : text_(std::move(text))
    , base_(std::move(base))
{
    if (!text_.empty()) {
        runs_.push_back(StyledRun{TextRange{0, text_.size()}, base_});
    }
    compute_digest();
}

StyledText::StyledText(std::string text, std::vector<StyledRun> runs, AttributeSet base)
    : text_(std::move(text))
    , runs_(std::move(runs))
    , base_(std::move(base))
{
    compute_digest();
}

void StyledText::compute_digest() {
    StreamingHasher hasher;
    hasher.update(std::string_view(text_));
    hash_attributes(hasher, base_);
    hasher.update_value(runs_.size());
    for (const auto& run : runs_) {
        hasher.update_value(run.range.start);
        hasher.update_value(run.range.length);
        hash_attributes(hasher, run.attributes);
    }
    digest_ = hasher.finalize();
}

std::size_t StyledText::run_index_at(TextOffset offset) const {
    if (offset >= text_.size()) {
        return runs_.size();
    }
    // First run starting after offset, then step back
    auto it = std::upper_bound(runs_.begin(), runs_.end(), offset,
        [](TextOffset value, const StyledRun& run) { return value < run.range.start; });
    if (it == runs_.begin()) {
        return runs_.size();
    }
    return static_cast<std::size_t>(std::distance(runs_.begin(), it) - 1);
}

const AttributeSet& StyledText::attributes_at(TextOffset offset) const {
    const std::size_t index = run_index_at(offset);
    return index < runs_.size() ? runs_[index].attributes : base_;
}

const StyleValue* StyledText::attribute_at(TextOffset offset, AttributeKey key) const {
    return attributes_at(offset).find(key);
}

bool StyledText::operator==(const StyledText& other) const {
    if (digest_ != other.digest_) {
        return false;
    }
    return text_ == other.text_ && runs_ == other.runs_ && base_ == other.base_;
}

// StyleBuffer

StyleBuffer::StyleBuffer(TextOffset length, AttributeSet base)
    : length_(length)
    , base_(std::move(base))
{
    if (length_ > 0) {
        runs_.emplace(0, base_);
    }
}

StyleBuffer::RunMap::iterator StyleBuffer::split_at(TextOffset offset) {
    auto it = runs_.lower_bound(offset);
    if (it != runs_.end() && it->first == offset) {
        return it;
    }
    // offset lies inside the run before it; that run keeps its attributes
    // on both sides of the new boundary
    auto containing = std::prev(it);
    return runs_.emplace_hint(it, offset, containing->second);
}

void StyleBuffer::apply(TextRange range, AttributeKey key, const StyleValue& value) {
    const TextRange clipped = range.clamped_to(length_);
    if (clipped.empty()) {
        return;
    }

    auto first = split_at(clipped.start);
    auto last = clipped.end() < length_ ? split_at(clipped.end()) : runs_.end();

    for (auto it = first; it != last; ++it) {
        it->second.set(key, value);
    }
}

StyledText StyleBuffer::finish(std::string text) && {
    std::vector<StyledRun> runs;
    runs.reserve(runs_.size());

    for (auto it = runs_.begin(); it != runs_.end(); ++it) {
        auto next = std::next(it);
        const TextOffset end = next != runs_.end() ? next->first : length_;
        if (!runs.empty() && runs.back().attributes == it->second) {
            runs.back().range.length = end - runs.back().range.start;
            continue;
        }
        runs.push_back(StyledRun{TextRange::from_bounds(it->first, end), std::move(it->second)});
    }

    return StyledText(std::move(text), std::move(runs), std::move(base_));
}

} // namespace hilite::highlight
