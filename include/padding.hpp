#pragma once

#include <torch/torch.h>

#include <string>
#include <utility>

/// Signal extension used before each analysis convolution.
///   zero      - pad with zeros
///   constant  - repeat the edge sample
///   reflect   - mirror without repeating the edge sample
///   periodic  - wrap around
///   boundary  - no padding; boundary-orthogonalized matrices are used instead
enum class PaddingMode { zero, constant, reflect, periodic, boundary };

/// Parse a padding mode from a string.
/// Accepted values: "zero", "constant", "reflect", "periodic", "boundary".
/// Throws InvalidPaddingMode for anything else.
PaddingMode parse_padding_mode(std::string const& name);

std::string to_string(PaddingMode mode);

/// Left/right padding for one analysis level: (2 * filt_len - 3) / 2 on each
/// side, plus one sample on the right for odd-length data. This reproduces the
/// floor((N + L - 1) / 2) coefficient length of PyWavelets.
std::pair<int64_t, int64_t> get_pad(int64_t data_len, int64_t filt_len);

/// Pad the last dimension of data for one analysis level.
/// data must be 3-D [batch, channels, N] as required by the functional pad.
/// Throws LevelRangeError in reflect mode when a pad is not shorter than N.
torch::Tensor fwt_pad(
    torch::Tensor const& data,
    int64_t filt_len,
    PaddingMode mode);
