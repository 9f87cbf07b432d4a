#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "render.h"

// Pick the font used for previews. Tries, in order: `explicit_path`,
// $BLOCKART_FONT, the compile-time FONT_PATH, then the usual DejaVu Sans
// Mono locations. Returns an empty string if none exists.
std::string resolve_font_path(const std::string& explicit_path);

// Rasterise a grid into a grayscale PNG, white glyphs on black. Each cell is
// cell_px wide and 2 * cell_px tall. Returns an empty vector (and logs why)
// if the font cannot be loaded. Throws InvalidParameterError if cell_px <= 0.
std::vector<uint8_t> render_preview_png(const RenderGrid& grid,
                                        const std::string& font_path,
                                        int cell_px, std::ostringstream& log);
