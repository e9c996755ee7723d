#pragma once

// hilite core library - convenience header

#include "hilite/core/types.hpp"
#include "hilite/core/bitflags.hpp"
#include "hilite/core/result.hpp"
#include "hilite/core/hash.hpp"
#include "hilite/core/logging.hpp"
#include "hilite/core/utf16_map.hpp"
