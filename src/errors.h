#pragma once

#include <stdexcept>
#include <string>

// The source image could not be read or decoded.
class ImageLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A caller-supplied parameter or the source geometry makes rendering
// impossible (non-positive line count, zero-area image, ...).
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
