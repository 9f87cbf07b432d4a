#pragma once

#include <opencv2/core.hpp>

// Mean intensity of the four quadrants of one output cell:
// q[0] = {top-left, top-right}, q[1] = {bottom-left, bottom-right}.
struct QuadrantSample {
    float q[2][2] = {};
};

// Pixel boundaries of one cell along one axis.
struct CellSpan {
    int start = 0;
    int mid = 0;
    int end = 0;
};

// start = floor(index * size), mid = floor((index + 0.5) * size),
// end = floor((index + 1) * size), each clamped to [0, limit].
// Truncation means neighbouring cells may differ by a pixel; this is kept
// so output matches the established block-art conversion.
CellSpan cell_span(int index, double cell_size_px, int limit);

// Sample cell (cell_x, cell_y) of a CV_32FC1 brightness field partitioned
// into cells of cell_w_px x cell_h_px pixels. An empty quadrant has mean 0.
QuadrantSample sample_cell(const cv::Mat& field, int cell_x, int cell_y,
                           double cell_w_px, double cell_h_px);
