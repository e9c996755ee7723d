#include <hilite/ui-qt/qt_style.hpp>

#include <QFont>
#include <QString>
#include <QStringList>

namespace hilite::ui {

using highlight::AttributeKey;
using highlight::AttributeSet;
using highlight::FontSpec;
using highlight::FontTraits;
using highlight::LineStyle;

namespace {

void apply_traits(QTextCharFormat& format, FontTraits traits) {
    if (has_flag(traits, FontTraits::Bold)) {
        format.setFontWeight(QFont::Bold);
    }
    if (has_flag(traits, FontTraits::Italic)) {
        format.setFontItalic(true);
    }
    if (has_flag(traits, FontTraits::Expanded)) {
        format.setFontStretch(QFont::Expanded);
    }
    if (has_flag(traits, FontTraits::Monospace)) {
        format.setFontFixedPitch(true);
        format.setFontStyleHint(QFont::Monospace);
    }
}

FontTraits read_traits(const QTextCharFormat& format) {
    FontTraits traits = FontTraits::None;
    if (format.hasProperty(QTextFormat::FontWeight) && format.fontWeight() >= QFont::Bold) {
        traits |= FontTraits::Bold;
    }
    if (format.hasProperty(QTextFormat::FontItalic) && format.fontItalic()) {
        traits |= FontTraits::Italic;
    }
    if (format.hasProperty(QTextFormat::FontStretch) && format.fontStretch() >= QFont::Expanded) {
        traits |= FontTraits::Expanded;
    }
    if (format.hasProperty(QTextFormat::FontFixedPitch) && format.fontFixedPitch()) {
        traits |= FontTraits::Monospace;
    }
    return traits;
}

void apply_value(QTextCharFormat& format, AttributeKey key, const highlight::StyleValue& value) {
    switch (key) {
        case AttributeKey::Font:
            if (const auto* font = std::get_if<FontSpec>(&value)) {
                if (!font->family.empty()) {
                    format.setFontFamilies(QStringList{QString::fromStdString(font->family)});
                }
                if (font->point_size > 0.0) {
                    format.setFontPointSize(font->point_size);
                }
                apply_traits(format, font->traits);
            }
            break;

        case AttributeKey::FontTraits:
            if (const auto* traits = std::get_if<FontTraits>(&value)) {
                apply_traits(format, *traits);
            }
            break;

        case AttributeKey::ForegroundColor:
            if (const auto* color = std::get_if<Color>(&value)) {
                format.setForeground(to_qcolor(*color));
            }
            break;

        case AttributeKey::BackgroundColor:
            if (const auto* color = std::get_if<Color>(&value)) {
                format.setBackground(to_qcolor(*color));
            }
            break;

        case AttributeKey::Kern:
            if (const auto* kern = std::get_if<double>(&value)) {
                format.setFontLetterSpacingType(QFont::AbsoluteSpacing);
                format.setFontLetterSpacing(*kern);
            }
            break;

        case AttributeKey::UnderlineStyle:
            // Qt draws one line weight; every non-None style underlines
            if (const auto* style = std::get_if<LineStyle>(&value)) {
                format.setUnderlineStyle(*style == LineStyle::None
                    ? QTextCharFormat::NoUnderline
                    : QTextCharFormat::SingleUnderline);
            }
            break;

        case AttributeKey::StrikethroughStyle:
            if (const auto* style = std::get_if<LineStyle>(&value)) {
                format.setFontStrikeOut(*style != LineStyle::None);
            }
            break;

        case AttributeKey::Link:
            if (const auto* link = std::get_if<highlight::Link>(&value)) {
                format.setAnchor(true);
                format.setAnchorHref(QString::fromStdString(link->target));
            }
            break;

        case AttributeKey::StrikethroughColor:
        case AttributeKey::ParagraphStyle:
            break;
    }
}

} // namespace

QColor to_qcolor(Color color) {
    return QColor(color.r, color.g, color.b, color.a);
}

Color from_qcolor(const QColor& color) {
    const QColor rgb = color.toRgb();
    return Color::rgba(static_cast<std::uint8_t>(rgb.red()), static_cast<std::uint8_t>(rgb.green()),
                       static_cast<std::uint8_t>(rgb.blue()), static_cast<std::uint8_t>(rgb.alpha()));
}

QTextCharFormat to_char_format(const AttributeSet& attributes) {
    QTextCharFormat format;
    for (const auto& [key, value] : attributes) {
        apply_value(format, key, value);
    }
    return format;
}

AttributeSet from_char_format(const QTextCharFormat& format) {
    AttributeSet attributes;

    const QStringList families = format.fontFamilies().toStringList();
    const bool has_size = format.hasProperty(QTextFormat::FontPointSize);
    if (!families.isEmpty() || has_size) {
        FontSpec font;
        if (!families.isEmpty()) {
            font.family = families.front().toStdString();
        }
        if (has_size) {
            font.point_size = format.fontPointSize();
        }
        attributes.set(AttributeKey::Font, font);
    }

    if (const FontTraits traits = read_traits(format); !no_flags(traits)) {
        attributes.set(AttributeKey::FontTraits, traits);
    }

    if (format.hasProperty(QTextFormat::ForegroundBrush)) {
        attributes.set(AttributeKey::ForegroundColor, from_qcolor(format.foreground().color()));
    }
    if (format.hasProperty(QTextFormat::BackgroundBrush)) {
        attributes.set(AttributeKey::BackgroundColor, from_qcolor(format.background().color()));
    }

    if (format.hasProperty(QTextFormat::FontLetterSpacing) &&
        format.fontLetterSpacingType() == QFont::AbsoluteSpacing) {
        attributes.set(AttributeKey::Kern, format.fontLetterSpacing());
    }

    if (format.underlineStyle() != QTextCharFormat::NoUnderline) {
        attributes.set(AttributeKey::UnderlineStyle, LineStyle::Single);
    }
    if (format.hasProperty(QTextFormat::FontStrikeOut) && format.fontStrikeOut()) {
        attributes.set(AttributeKey::StrikethroughStyle, LineStyle::Single);
    }

    if (format.isAnchor() && !format.anchorHref().isEmpty()) {
        attributes.set(AttributeKey::Link, highlight::Link{format.anchorHref().toStdString()});
    }

    return attributes;
}

} // namespace hilite::ui
