#include "preview.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "errors.h"

namespace fs = std::filesystem;

std::string resolve_font_path(const std::string& explicit_path) {
    std::vector<std::string> candidates;
    if (!explicit_path.empty()) candidates.push_back(explicit_path);
    if (const char* env = std::getenv("BLOCKART_FONT")) candidates.push_back(env);
#ifdef FONT_PATH
    candidates.push_back(FONT_PATH);
#endif
    candidates.push_back("fonts/DejaVuSansMono.ttf");
    candidates.push_back("/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf");
    candidates.push_back("/usr/share/fonts/TTF/DejaVuSansMono.ttf");

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!path.empty() && fs::is_regular_file(path, ec)) return path;
    }
    return {};
}

// Decode the first code point of a UTF-8 string.
static uint32_t first_codepoint(const char* s) {
    auto b = reinterpret_cast<const unsigned char*>(s);
    if (b[0] < 0x80) return b[0];
    if ((b[0] & 0xE0) == 0xC0) return ((b[0] & 0x1F) << 6) | (b[1] & 0x3F);
    if ((b[0] & 0xF0) == 0xE0)
        return ((b[0] & 0x0F) << 12) | ((b[1] & 0x3F) << 6) | (b[2] & 0x3F);
    return ((b[0] & 0x07) << 18) | ((b[1] & 0x3F) << 12) | ((b[2] & 0x3F) << 6) | (b[3] & 0x3F);
}

// Blit a FreeType bitmap onto a grayscale tile (white on black, max blend).
static void blit_glyph(cv::Mat& tile, const FT_Bitmap& bmp, int ox, int oy) {
    for (unsigned r = 0; r < bmp.rows; r++) {
        for (unsigned c = 0; c < bmp.width; c++) {
            int px = ox + static_cast<int>(c);
            int py = oy + static_cast<int>(r);
            if (px < 0 || px >= tile.cols || py < 0 || py >= tile.rows) continue;
            uint8_t ink = bmp.buffer[r * bmp.pitch + c];
            uint8_t& cur = tile.at<uint8_t>(py, px);
            cur = std::max(cur, ink);
        }
    }
}

// Render one glyph into a cell_w x cell_h tile. The em box is scaled to the
// cell height so full blocks span the whole cell.
static cv::Mat render_glyph_tile(FT_Face face, const char* glyph,
                                 int cell_w, int cell_h, std::ostringstream& log) {
    cv::Mat tile(cell_h, cell_w, CV_8UC1, cv::Scalar(0));
    uint32_t cp = first_codepoint(glyph);
    if (cp == ' ') return tile;

    FT_UInt gi = FT_Get_Char_Index(face, cp);
    if (!gi) {
        log << "Preview: font has no glyph for U+" << std::hex << cp << std::dec << "\n";
        return tile;
    }
    if (FT_Load_Glyph(face, gi, FT_LOAD_RENDER)) return tile;

    const FT_Bitmap& bmp = face->glyph->bitmap;
    int asc = static_cast<int>(face->size->metrics.ascender >> 6);
    int desc = static_cast<int>(face->size->metrics.descender >> 6);
    int line_h = std::max(1, asc - desc);
    // Baseline sits where the ascender ends when the line box fills the cell.
    int baseline = cell_h * asc / line_h;
    int ox = face->glyph->bitmap_left;
    int oy = baseline - face->glyph->bitmap_top;
    blit_glyph(tile, bmp, ox, oy);
    return tile;
}

std::vector<uint8_t> render_preview_png(const RenderGrid& grid,
                                        const std::string& font_path,
                                        int cell_px, std::ostringstream& log) {
    if (cell_px <= 0)
        throw InvalidParameterError("preview cell size must be positive, got " + std::to_string(cell_px));

    std::vector<uint8_t> png;
    if (grid.lines <= 0 || grid.columns <= 0) {
        log << "Preview: empty grid\n";
        return png;
    }

    FT_Library ft;
    if (FT_Init_FreeType(&ft)) {
        log << "Preview: FreeType init failed\n";
        return png;
    }
    FT_Face face;
    if (font_path.empty() || FT_New_Face(ft, font_path.c_str(), 0, &face)) {
        log << "Preview: cannot load font '" << font_path << "'\n";
        FT_Done_FreeType(ft);
        return png;
    }

    int cell_w = cell_px;
    int cell_h = cell_px * 2;
    FT_Set_Pixel_Sizes(face, 0, cell_h);

    const auto& palette = block_palette();
    std::array<cv::Mat, PALETTE_SIZE> tiles;
    for (size_t i = 0; i < palette.size(); i++)
        tiles[i] = render_glyph_tile(face, palette[i].glyph, cell_w, cell_h, log);

    FT_Done_Face(face);
    FT_Done_FreeType(ft);

    cv::Mat canvas(grid.lines * cell_h, grid.columns * cell_w, CV_8UC1, cv::Scalar(0));
    for (int r = 0; r < grid.lines; r++) {
        for (int c = 0; c < grid.columns; c++) {
            const cv::Mat& tile = tiles[grid.cells[static_cast<size_t>(r) * grid.columns + c]];
            tile.copyTo(canvas(cv::Rect(c * cell_w, r * cell_h, cell_w, cell_h)));
        }
    }

    if (!cv::imencode(".png", canvas, png)) {
        log << "Preview: PNG encoding failed\n";
        png.clear();
        return png;
    }
    log << "Preview: " << canvas.cols << "x" << canvas.rows << " px, "
        << png.size() << " bytes (" << font_path << ")\n";
    return png;
}
