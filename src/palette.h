#pragma once

#include <array>
#include <cstddef>

// One candidate glyph and the 2x2 intensity pattern it draws:
// pattern[0] = {top-left, top-right}, pattern[1] = {bottom-left, bottom-right}.
struct PaletteEntry {
    const char* glyph;       // UTF-8
    float pattern[2][2];
};

static constexpr size_t PALETTE_SIZE = 19;

// The fixed glyph palette. Order is part of the output contract: the matcher
// breaks ties in favour of the earlier entry. The sixteen quadrant blocks come
// first, indexed by their bit pattern (tl=8, tr=4, bl=2, br=1), followed by
// the light, medium and dark shades.
const std::array<PaletteEntry, PALETTE_SIZE>& block_palette();

// Commonly referenced entries.
static constexpr size_t GLYPH_SPACE = 0;
static constexpr size_t GLYPH_FULL  = 15;
static constexpr size_t GLYPH_LIGHT_SHADE  = 16;
static constexpr size_t GLYPH_MEDIUM_SHADE = 17;
static constexpr size_t GLYPH_DARK_SHADE   = 18;
