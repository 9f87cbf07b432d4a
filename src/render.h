#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "image_source.h"
#include "palette.h"

struct RenderParams {
    int lines = 40;           // output height in text rows
    float contrast = 1.0f;    // contrast strength, 1 = unchanged
    float brightness = 0.0f;  // added to luma before alpha compositing
    int threads = 0;          // 0 = one per hardware thread
};

// Rendered character grid. Cells hold palette indices, row-major.
struct RenderGrid {
    int lines = 0;
    int columns = 0;
    std::vector<uint8_t> cells;

    const char* glyph_at(int row, int col) const;
    std::vector<std::string> rows() const;
    std::string text() const;  // rows joined by '\n', no trailing newline
    std::array<int, PALETTE_SIZE> glyph_counts() const;
};

struct RenderResult {
    RenderGrid grid;
    std::string log;
};

// Column count for a grid of `lines` rows over a width x height image.
// Character cells are about twice as tall as wide, hence the factor 2.
// Returns 0 for non-positive input. Throws InvalidParameterError when the
// grid would be too wide to resample.
int output_columns(int lines, int width, int height);

using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

std::thread spawn_thread(std::function<void()> fn);

// Run work(0) .. work(n - 1), each on its own thread. Workers that cannot be
// started run on the calling thread instead. Returns the number of threads
// started (0 when n <= 1, which runs inline).
int run_workers(int n, const std::function<void(int)>& work,
                const ThreadSpawner& spawn = spawn_thread);

// Sample and match every cell of a CV_32FC1 brightness field laid out as
// lines x columns cells. Rows are distributed over `threads` workers.
RenderGrid match_field(const cv::Mat& brightness, int lines, int columns,
                       int threads, std::ostringstream& log);

// Full pipeline over an already decoded image.
// Throws InvalidParameterError for lines <= 0 or a zero-area image.
RenderResult render_gray_alpha(const GrayAlphaImage& img, const RenderParams& params);

// Decode then render. Throws ImageLoadError or InvalidParameterError.
RenderResult render_image_data(const std::vector<uint8_t>& image_data,
                               const RenderParams& params);
RenderResult render_image_file(const std::string& path, const RenderParams& params);
