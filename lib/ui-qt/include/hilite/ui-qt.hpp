#pragma once

// hilite Qt adapter - convenience header

#include "hilite/ui-qt/qt_style.hpp"
#include "hilite/ui-qt/qt_text_surface.hpp"
#include "hilite/ui-qt/highlighted_text_edit.hpp"
