#include "image_source.h"

#include <fstream>
#include <iterator>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "errors.h"

// Bring any supported depth down to 8 bits per channel.
static cv::Mat to_8bit(const cv::Mat& img) {
    cv::Mat out;
    switch (img.depth()) {
        case CV_8U:
            return img;
        case CV_16U:
            img.convertTo(out, CV_8U, 1.0 / 257.0);
            return out;
        case CV_32F:
        case CV_64F:
            img.convertTo(out, CV_8U, 255.0);
            return out;
        default:
            throw ImageLoadError("unsupported pixel depth " + std::to_string(img.depth()));
    }
}

GrayAlphaImage split_gray_alpha(const cv::Mat& img) {
    GrayAlphaImage out;
    if (img.empty()) return out;

    cv::Mat src = to_8bit(img);
    switch (src.channels()) {
        case 1:
            out.gray = src.clone();
            out.alpha = cv::Mat(src.size(), CV_8UC1, cv::Scalar(255));
            break;
        case 2:
            // gray + alpha
            cv::extractChannel(src, out.gray, 0);
            cv::extractChannel(src, out.alpha, 1);
            break;
        case 3:
            cv::cvtColor(src, out.gray, cv::COLOR_BGR2GRAY);
            out.alpha = cv::Mat(src.size(), CV_8UC1, cv::Scalar(255));
            break;
        case 4:
            cv::cvtColor(src, out.gray, cv::COLOR_BGRA2GRAY);
            cv::extractChannel(src, out.alpha, 3);
            break;
        default:
            throw ImageLoadError("unsupported channel count " + std::to_string(src.channels()));
    }
    return out;
}

GrayAlphaImage decode_gray_alpha(const std::vector<uint8_t>& image_data) {
    if (image_data.empty()) throw ImageLoadError("could not decode image: no data");

    cv::Mat img;
    try {
        img = cv::imdecode(image_data, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ImageLoadError(std::string("could not decode image: ") + e.what());
    }
    if (img.empty()) throw ImageLoadError("could not decode image");
    return split_gray_alpha(img);
}

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

GrayAlphaImage load_gray_alpha(const std::string& path) {
    std::vector<uint8_t> buf;
    if (!read_file_bytes(path, buf))
        throw ImageLoadError("cannot open image: " + path);
    try {
        return decode_gray_alpha(buf);
    } catch (const ImageLoadError& e) {
        throw ImageLoadError(std::string(e.what()) + ": " + path);
    }
}

// Filter for one axis: area averaging when it shrinks, Lanczos when it grows.
static int axis_filter(int from, int to) {
    return to < from ? cv::INTER_AREA : cv::INTER_LANCZOS4;
}

static const char* filter_name(int interp) {
    return interp == cv::INTER_AREA ? "area" : "lanczos4";
}

// Resize a CV_32F plane one axis at a time so each axis gets its own filter.
static cv::Mat resize_axes(const cv::Mat& src, cv::Size size) {
    cv::Mat out = src;
    if (size.width != out.cols) {
        cv::Mat tmp;
        cv::resize(out, tmp, cv::Size(size.width, out.rows), 0, 0,
                   axis_filter(out.cols, size.width));
        out = tmp;
    }
    if (size.height != out.rows) {
        cv::Mat tmp;
        cv::resize(out, tmp, cv::Size(out.cols, size.height), 0, 0,
                   axis_filter(out.rows, size.height));
        out = tmp;
    }
    return out;
}

static std::string describe_filters(cv::Size from, cv::Size to) {
    bool rx = from.width != to.width;
    bool ry = from.height != to.height;
    if (!rx && !ry) return "none";
    const char* fx = filter_name(axis_filter(from.width, to.width));
    const char* fy = filter_name(axis_filter(from.height, to.height));
    if (rx && ry) {
        if (std::string(fx) == fy) return fx;
        return std::string(fx) + " x, " + fy + " y";
    }
    return rx ? std::string(fx) + " x" : std::string(fy) + " y";
}

NormalizedFields resample_normalized(const GrayAlphaImage& img, cv::Size size) {
    NormalizedFields out;
    out.filter = describe_filters(img.gray.size(), size);

    cv::Mat gray, alpha;
    img.gray.convertTo(gray, CV_32F, 1.0 / 255.0);
    img.alpha.convertTo(alpha, CV_32F, 1.0 / 255.0);

    // Resample premultiplied luma so hidden gray under transparent pixels
    // never bleeds into visible neighbours.
    cv::Mat premul;
    cv::multiply(gray, alpha, premul);
    premul = resize_axes(premul, size);
    alpha = resize_axes(alpha, size);

    // Lanczos can ring outside [0, 1].
    cv::max(alpha, 0.0, alpha);
    cv::min(alpha, 1.0, alpha);
    cv::max(premul, 0.0, premul);
    cv::min(premul, alpha, premul);

    cv::divide(premul, alpha, out.gray);
    out.gray.setTo(0.0, alpha <= 0.0);
    out.alpha = alpha;
    return out;
}
