#pragma once

#include <stdexcept>
#include <string>

/// Unknown padding mode name, or padding requested for the "boundary" mode.
class InvalidPaddingMode : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Malformed filter bank, unknown wavelet, or malformed coefficient container.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Requested decomposition level is not supported by the signal/filter lengths.
class LevelRangeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Packet tree path that is malformed or deeper than the tree.
class PathKeyError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/// Packet tree accessed before transform() was called.
class TreeNotBuiltError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
