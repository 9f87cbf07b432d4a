#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

// Decoded source image as two 8-bit planes of equal size.
struct GrayAlphaImage {
    cv::Mat gray;   // CV_8UC1, luma
    cv::Mat alpha;  // CV_8UC1, 255 = opaque
    int width() const { return gray.cols; }
    int height() const { return gray.rows; }
};

// Luma and alpha fields normalised to [0, 1] (CV_32FC1). Luma is straight
// (not premultiplied) and 0 where alpha is 0.
struct NormalizedFields {
    cv::Mat gray;
    cv::Mat alpha;
    std::string filter;  // e.g. "area", "lanczos4 x, area y", "none"
};

// Split any decoded OpenCV image (1, 3 or 4 channels; 8-bit, 16-bit or
// float) into luma and alpha. Images without alpha are fully opaque.
// Throws ImageLoadError for layouts it cannot interpret.
GrayAlphaImage split_gray_alpha(const cv::Mat& img);

// Decode an encoded image (PNG, JPEG, ...). Throws ImageLoadError.
GrayAlphaImage decode_gray_alpha(const std::vector<uint8_t>& image_data);

// Read and decode an image file. Throws ImageLoadError.
GrayAlphaImage load_gray_alpha(const std::string& path);

// Read a whole file into memory. Returns false if it cannot be opened.
bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out);

// Resample both planes to `size` and normalise to [0, 1]. Luma is resampled
// premultiplied by alpha. Each axis is resized on its own: area averaging
// where it shrinks, Lanczos where it grows.
NormalizedFields resample_normalized(const GrayAlphaImage& img, cv::Size size);
