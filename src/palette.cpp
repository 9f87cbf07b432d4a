#include "palette.h"

static const std::array<PaletteEntry, PALETTE_SIZE> PALETTE = {{
    {" ", {{0, 0}, {0, 0}}},
    {"▗", {{0, 0}, {0, 1}}},
    {"▖", {{0, 0}, {1, 0}}},
    {"▄", {{0, 0}, {1, 1}}},
    {"▝", {{0, 1}, {0, 0}}},
    {"▐", {{0, 1}, {0, 1}}},
    {"▞", {{0, 1}, {1, 0}}},
    {"▟", {{0, 1}, {1, 1}}},
    {"▘", {{1, 0}, {0, 0}}},
    {"▚", {{1, 0}, {0, 1}}},
    {"▌", {{1, 0}, {1, 0}}},
    {"▙", {{1, 0}, {1, 1}}},
    {"▀", {{1, 1}, {0, 0}}},
    {"▜", {{1, 1}, {0, 1}}},
    {"▛", {{1, 1}, {1, 0}}},
    {"█", {{1, 1}, {1, 1}}},
    // Uniform shades
    {"░", {{0.25f, 0.25f}, {0.25f, 0.25f}}},
    {"▒", {{0.50f, 0.50f}, {0.50f, 0.50f}}},
    {"▓", {{0.75f, 0.75f}, {0.75f, 0.75f}}},
}};

const std::array<PaletteEntry, PALETTE_SIZE>& block_palette() {
    return PALETTE;
}
