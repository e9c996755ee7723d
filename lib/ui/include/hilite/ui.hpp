#pragma once

// hilite ImGui adapter - convenience header

#include "hilite/ui/imgui_style.hpp"
#include "hilite/ui/imgui_text_surface.hpp"
