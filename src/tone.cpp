#include "tone.h"

#include <algorithm>

static inline float clamp01(float v) {
    return std::min(1.0f, std::max(0.0f, v));
}

// Same line as (v - 0.5) * s + 0.5, arranged so that s == 1 is exact.
float adjust_contrast(float value, float strength) {
    return clamp01(value * strength + (0.5f - 0.5f * strength));
}

float apply_brightness_shift(float value, float delta) {
    return clamp01(value + delta);
}

// Clamp a CV_32F field to [0, 1] in place.
static void clamp_field(cv::Mat& field) {
    cv::max(field, 0.0, field);
    cv::min(field, 1.0, field);
}

cv::Mat boost_contrast(const cv::Mat& field, float strength) {
    CV_Assert(field.type() == CV_32FC1);
    cv::Mat out;
    // out = field * strength + (0.5 - 0.5 * strength)
    field.convertTo(out, CV_32F, strength, 0.5 - 0.5 * static_cast<double>(strength));
    clamp_field(out);
    return out;
}

cv::Mat shift_brightness(const cv::Mat& field, float delta) {
    CV_Assert(field.type() == CV_32FC1);
    cv::Mat out;
    field.convertTo(out, CV_32F, 1.0, delta);
    clamp_field(out);
    return out;
}

cv::Mat composite_over_black(const cv::Mat& gray, const cv::Mat& alpha) {
    CV_Assert(gray.type() == CV_32FC1 && alpha.type() == CV_32FC1);
    CV_Assert(gray.size() == alpha.size());
    cv::Mat out;
    cv::multiply(gray, alpha, out);
    return out;
}
