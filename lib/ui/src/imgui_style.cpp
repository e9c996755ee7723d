#include <hilite/ui/imgui_style.hpp>

namespace hilite::ui {

using highlight::AttributeKey;
using highlight::LineStyle;

namespace {

PreviewSpan span_style(const highlight::AttributeSet& attributes, const ImGuiSurfaceConfig& config) {
    PreviewSpan span;
    span.color = config.color_default;

    if (const auto* color = attributes.get<Color>(AttributeKey::ForegroundColor)) {
        span.color = to_imu32(*color);
    } else if (attributes.contains(AttributeKey::Link)) {
        span.color = config.color_link;
    }
    if (const auto* background = attributes.get<Color>(AttributeKey::BackgroundColor)) {
        span.background = to_imu32(*background);
    }
    if (const auto* underline = attributes.get<LineStyle>(AttributeKey::UnderlineStyle)) {
        span.underline = *underline != LineStyle::None;
    }
    if (const auto* strike = attributes.get<LineStyle>(AttributeKey::StrikethroughStyle)) {
        span.strikethrough = *strike != LineStyle::None;
    }
    return span;
}

} // namespace

std::vector<PreviewSpan> layout_preview(const highlight::StyledText& styled,
                                        const ImGuiSurfaceConfig& config) {
    std::vector<PreviewSpan> spans;
    const std::string_view text = styled.text();

    for (const auto& run : styled.runs()) {
        const PreviewSpan style = span_style(run.attributes, config);
        std::string_view rest = text.substr(run.range.start, run.range.length);

        while (!rest.empty()) {
            const auto newline = rest.find('\n');
            PreviewSpan span = style;
            if (newline == std::string_view::npos) {
                span.text = rest;
                rest = {};
            } else {
                span.text = rest.substr(0, newline);
                span.line_break_after = true;
                rest.remove_prefix(newline + 1);
            }
            spans.push_back(span);
        }
    }

    return spans;
}

} // namespace hilite::ui
