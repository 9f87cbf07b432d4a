#pragma once

#include <cstddef>

#include "cell_sampler.h"
#include "palette.h"

struct MatchResult {
    size_t index = 0;         // into block_palette()
    const char* glyph = " ";
    float distance = 0;       // squared L2 over the four quadrants
};

// Squared Euclidean distance between a sample and a palette pattern.
float quadrant_distance(const QuadrantSample& sample, const float pattern[2][2]);

// Palette entry closest to the sample. Ties go to the earliest entry.
MatchResult best_fit(const QuadrantSample& sample);
