#pragma once

// hilite editor library - convenience header

#include "hilite/editor/selection.hpp"
#include "hilite/editor/events.hpp"
#include "hilite/editor/text_surface.hpp"
#include "hilite/editor/memory_surface.hpp"
#include "hilite/editor/updater.hpp"
#include "hilite/editor/binding.hpp"
