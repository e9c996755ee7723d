#pragma once

#include <hilite/core/types.hpp>
#include <hilite/highlight/style.hpp>

#include <QColor>
#include <QTextCharFormat>

namespace hilite::ui {

[[nodiscard]] QColor to_qcolor(Color color);
[[nodiscard]] Color from_qcolor(const QColor& color);

// Character format for a run. Keys Qt cannot express (strikethrough color,
// paragraph style) are left out.
[[nodiscard]] QTextCharFormat to_char_format(const highlight::AttributeSet& attributes);

// Attributes recovered from a character format; only properties the format
// actually sets are reported
[[nodiscard]] highlight::AttributeSet from_char_format(const QTextCharFormat& format);

} // namespace hilite::ui
