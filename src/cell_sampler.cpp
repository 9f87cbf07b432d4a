#include "cell_sampler.h"

#include <algorithm>
#include <cmath>

CellSpan cell_span(int index, double cell_size_px, int limit) {
    auto edge = [&](double pos) {
        int px = static_cast<int>(std::floor(pos * cell_size_px));
        return std::max(0, std::min(px, limit));
    };
    CellSpan s;
    s.start = edge(index);
    s.mid = edge(index + 0.5);
    s.end = edge(index + 1.0);
    return s;
}

// Mean over [x0,x1) x [y0,y1); 0 for an empty rectangle.
static float region_mean(const cv::Mat& field, int x0, int y0, int x1, int y1) {
    if (x1 <= x0 || y1 <= y0) return 0.0f;
    cv::Scalar m = cv::mean(field(cv::Rect(x0, y0, x1 - x0, y1 - y0)));
    return static_cast<float>(m[0]);
}

QuadrantSample sample_cell(const cv::Mat& field, int cell_x, int cell_y,
                           double cell_w_px, double cell_h_px) {
    CV_Assert(field.type() == CV_32FC1);
    CellSpan xs = cell_span(cell_x, cell_w_px, field.cols);
    CellSpan ys = cell_span(cell_y, cell_h_px, field.rows);

    QuadrantSample s;
    s.q[0][0] = region_mean(field, xs.start, ys.start, xs.mid, ys.mid);
    s.q[0][1] = region_mean(field, xs.mid,   ys.start, xs.end, ys.mid);
    s.q[1][0] = region_mean(field, xs.start, ys.mid,   xs.mid, ys.end);
    s.q[1][1] = region_mean(field, xs.mid,   ys.mid,   xs.end, ys.end);
    return s;
}
