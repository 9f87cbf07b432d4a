#pragma once

#include <opencv2/core.hpp>

// Scalar tone curves. Both clamp their result to [0, 1].
//   adjust_contrast:        (v - 0.5) * strength + 0.5
//   apply_brightness_shift: v + delta
float adjust_contrast(float value, float strength);
float apply_brightness_shift(float value, float delta);

// Elementwise versions over CV_32FC1 fields. The input is not modified.
cv::Mat boost_contrast(const cv::Mat& field, float strength);
cv::Mat shift_brightness(const cv::Mat& field, float delta);

// Composite a grayscale field over black using its alpha field
// (gray * alpha). Both must be CV_32FC1 of the same size.
cv::Mat composite_over_black(const cv::Mat& gray, const cv::Mat& alpha);
