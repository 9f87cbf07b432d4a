#include "render.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <system_error>
#include <thread>

#include "cell_sampler.h"
#include "errors.h"
#include "matcher.h"
#include "tone.h"

// ═══════════════════════════════════════════════════════════════════════════════
// RenderGrid
// ═══════════════════════════════════════════════════════════════════════════════

const char* RenderGrid::glyph_at(int row, int col) const {
    return block_palette()[cells[static_cast<size_t>(row) * columns + col]].glyph;
}

std::vector<std::string> RenderGrid::rows() const {
    std::vector<std::string> out;
    out.reserve(lines);
    for (int r = 0; r < lines; r++) {
        std::string row;
        for (int c = 0; c < columns; c++) row += glyph_at(r, c);
        out.push_back(std::move(row));
    }
    return out;
}

std::string RenderGrid::text() const {
    std::string out;
    auto all = rows();
    for (size_t i = 0; i < all.size(); i++) {
        if (i > 0) out += '\n';
        out += all[i];
    }
    return out;
}

std::array<int, PALETTE_SIZE> RenderGrid::glyph_counts() const {
    std::array<int, PALETTE_SIZE> counts{};
    for (uint8_t idx : cells) counts[idx]++;
    return counts;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Stage 1: Grid geometry and parameter checks
// ═══════════════════════════════════════════════════════════════════════════════

int output_columns(int lines, int width, int height) {
    if (lines <= 0 || width <= 0 || height <= 0) return 0;
    double aspect = static_cast<double>(width) / height;
    double cols = std::round(lines * aspect * 2.0);
    // The resampled field is twice the grid in each axis.
    if (cols > INT_MAX / 2)
        throw InvalidParameterError("output would need " + std::to_string(static_cast<long long>(cols)) +
                                    " columns; image aspect too wide");
    // A very tall, narrow image still gets one column.
    return std::max(1, static_cast<int>(cols));
}

static void check_lines(int lines) {
    if (lines <= 0)
        throw InvalidParameterError("line count must be positive, got " + std::to_string(lines));
    if (lines > INT_MAX / 2)
        throw InvalidParameterError("line count too large: " + std::to_string(lines));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Stage 2: Cell sampling and glyph matching
// ═══════════════════════════════════════════════════════════════════════════════

std::thread spawn_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

int run_workers(int n, const std::function<void(int)>& work, const ThreadSpawner& spawn) {
    if (n <= 1) {
        if (n == 1) work(0);
        return 0;
    }
    std::vector<std::thread> workers;
    workers.reserve(n);
    int t = 0;
    try {
        for (; t < n; t++)
            workers.push_back(spawn([&work, t] { work(t); }));
    } catch (const std::system_error&) {
        // Out of threads: workers t..n-1 run below on this thread.
    }
    try {
        for (int rest = t; rest < n; rest++) work(rest);
    } catch (...) {
        for (auto& th : workers) th.join();
        throw;
    }
    for (auto& th : workers) th.join();
    return static_cast<int>(workers.size());
}

RenderGrid match_field(const cv::Mat& brightness, int lines, int columns,
                       int threads, std::ostringstream& log) {
    CV_Assert(brightness.type() == CV_32FC1);
    RenderGrid grid;
    grid.lines = lines;
    grid.columns = columns;
    grid.cells.assign(static_cast<size_t>(lines) * columns, GLYPH_SPACE);
    if (lines <= 0 || columns <= 0) return grid;

    double cell_w = static_cast<double>(brightness.cols) / columns;
    double cell_h = static_cast<double>(brightness.rows) / lines;

    int n_threads = threads > 0 ? threads
                                : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    n_threads = std::min(n_threads, lines);

    // Rows are interleaved across workers; each worker writes only its own
    // rows, so the grid needs no locking.
    auto match_rows = [&](int first) {
        for (int y = first; y < lines; y += n_threads) {
            uint8_t* row = grid.cells.data() + static_cast<size_t>(y) * columns;
            for (int x = 0; x < columns; x++) {
                QuadrantSample s = sample_cell(brightness, x, y, cell_w, cell_h);
                row[x] = static_cast<uint8_t>(best_fit(s).index);
            }
        }
    };

    int started = run_workers(n_threads, match_rows);
    log << "Matched " << grid.cells.size() << " cells on " << n_threads
        << (n_threads == 1 ? " thread\n" : " threads\n");
    if (n_threads > 1 && started < n_threads)
        log << "Only " << started << " worker threads started, the rest ran inline\n";
    return grid;
}

static void log_glyph_counts(const RenderGrid& grid, std::ostringstream& log) {
    auto counts = grid.glyph_counts();
    const auto& palette = block_palette();
    log << "Glyphs:";
    for (size_t i = 0; i < counts.size(); i++) {
        if (counts[i] == 0) continue;
        log << " '" << palette[i].glyph << "'=" << counts[i];
    }
    log << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Top-level API
// ═══════════════════════════════════════════════════════════════════════════════

RenderResult render_gray_alpha(const GrayAlphaImage& img, const RenderParams& params) {
    check_lines(params.lines);
    if (img.width() <= 0 || img.height() <= 0)
        throw InvalidParameterError("source image has zero area");
    if (img.alpha.size() != img.gray.size())
        throw InvalidParameterError("gray and alpha planes differ in size");

    RenderResult result;
    std::ostringstream log;
    log << "Image: " << img.width() << "x" << img.height() << "\n";

    int lines = params.lines;
    int columns = output_columns(lines, img.width(), img.height());
    log << "Grid: " << lines << " lines x " << columns << " columns\n";

    // Two samples per cell along each axis give each cell its 2x2 quadrants.
    cv::Size target(columns * 2, lines * 2);
    NormalizedFields fields = resample_normalized(img, target);
    log << "Resampled to " << target.width << "x" << target.height
        << " (" << fields.filter << ")\n";

    // Brightness shifts the raw luma, so transparent pixels stay black
    // however bright the shift.
    cv::Mat gray = params.brightness != 0.0f
        ? shift_brightness(fields.gray, params.brightness)
        : fields.gray;
    cv::Mat brightness = boost_contrast(composite_over_black(gray, fields.alpha),
                                        params.contrast);
    log << "Tone: brightness=" << params.brightness
        << ", contrast=" << params.contrast << "\n";

    result.grid = match_field(brightness, lines, columns, params.threads, log);
    log_glyph_counts(result.grid, log);

    result.log = log.str();
    return result;
}

RenderResult render_image_data(const std::vector<uint8_t>& image_data,
                               const RenderParams& params) {
    check_lines(params.lines);
    return render_gray_alpha(decode_gray_alpha(image_data), params);
}

RenderResult render_image_file(const std::string& path, const RenderParams& params) {
    check_lines(params.lines);
    return render_gray_alpha(load_gray_alpha(path), params);
}
