#include "matcher.h"

#include <limits>

float quadrant_distance(const QuadrantSample& sample, const float pattern[2][2]) {
    float d = 0;
    for (int r = 0; r < 2; r++) {
        for (int c = 0; c < 2; c++) {
            float diff = sample.q[r][c] - pattern[r][c];
            d += diff * diff;
        }
    }
    return d;
}

MatchResult best_fit(const QuadrantSample& sample) {
    const auto& palette = block_palette();
    MatchResult best;
    best.distance = std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < palette.size(); i++) {
        float d = quadrant_distance(sample, palette[i].pattern);
        // Strict comparison keeps the first entry on ties.
        if (d < best.distance) {
            best.index = i;
            best.glyph = palette[i].glyph;
            best.distance = d;
        }
    }
    return best;
}
