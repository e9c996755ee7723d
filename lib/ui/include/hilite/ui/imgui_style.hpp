#pragma once

#include <hilite/core/types.hpp>
#include <hilite/highlight/styled_text.hpp>

#include <imgui.h>

#include <optional>
#include <string_view>
#include <vector>

namespace hilite::ui {

// Configuration for the ImGui text surface
struct ImGuiSurfaceConfig {
    bool show_preview{true};        // draw styled text below the input
    float input_height_lines{8.0f};
    float underline_thickness{1.0f};

    // Fallback colors (ABGR format)
    ImU32 color_default{0xFFD4D4D4};
    ImU32 color_link{0xFFD69C56};
};

[[nodiscard]] inline ImU32 to_imu32(Color color) {
    return IM_COL32(color.r, color.g, color.b, color.a);
}

// One drawable piece of a styled run, never spanning a line break
struct PreviewSpan {
    std::string_view text;
    ImU32 color{0};
    std::optional<ImU32> background;
    bool underline{false};
    bool strikethrough{false};
    bool line_break_after{false};
};

// Splits runs at '\n' and resolves colors. ImGui draws with a single font,
// so font, kerning and paragraph attributes are not represented.
[[nodiscard]] std::vector<PreviewSpan> layout_preview(const highlight::StyledText& styled,
                                                      const ImGuiSurfaceConfig& config);

} // namespace hilite::ui
