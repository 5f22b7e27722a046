#pragma once

#include <torch/torch.h>

#include "orthogonalize.hpp"
#include "padding.hpp"
#include "wavelet.hpp"

#include <utility>
#include <vector>

/// Multi-level 1-D coefficients, coarsest first:
/// [approx_L, detail_L, detail_{L-1}, ..., detail_1].
using CoefficientList = std::vector<torch::Tensor>;

/// Maximum useful decomposition level, floor(log2(data_len / (filt_len - 1))).
/// Returns 0 if the filter is shorter than 2 taps or the signal is too short.
int64_t dwt_max_level(int64_t data_len, int64_t filt_len);

/// Resolve a requested level against max(dwt_max_level(data_len, filt_len), 1).
/// level = -1 returns that bound; a level outside [1, bound] throws LevelRangeError.
int64_t resolve_level(int64_t data_len, int64_t filt_len, int64_t level);

/// One analysis level along dimension dim: pad, then a stride-2 two-channel
/// convolution with the (flipped) decomposition filters.
/// Returns (approx, detail) with dim shrunk to floor((N + L - 1) / 2).
std::pair<torch::Tensor, torch::Tensor> dwt_along_dim(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t dim,
    PaddingMode mode);

/// One synthesis level along dimension dim: stride-2 transposed convolution of
/// (approx, detail) with the reconstruction filters. The result is not cropped;
/// its length along dim is 2 * (M - 1) + L.
torch::Tensor idwt_along_dim(
    torch::Tensor const& approx,
    torch::Tensor const& detail,
    FilterTensors const& filters,
    int64_t dim);

/// Remove the analysis padding from a synthesized dimension. Both sides lose
/// (2L - 3) / 2 samples; if target_len is given and the result would not match
/// it, the right side loses one more. Throws ConfigurationError when neither
/// crop produces target_len.
torch::Tensor crop_synthesis(
    torch::Tensor const& data,
    int64_t filt_len,
    int64_t dim,
    int64_t target_len = -1);

/// Multi-level 1-D decomposition of the last dimension of data.
/// data: [..., N]; all leading dimensions are batch dimensions.
/// level = -1 selects max(dwt_max_level(N, L), 1).
/// Throws LevelRangeError for a level outside [1, max level].
/// PaddingMode::boundary runs the boundary-matrix transform instead.
CoefficientList wavedec(
    torch::Tensor const& data,
    Wavelet const& wavelet,
    int64_t level = -1,
    PaddingMode mode = PaddingMode::reflect,
    OrthMethod orth_method = OrthMethod::qr);

/// wavedec with a tensor filter bank in natural PyWavelets order, e.g. the
/// filters of a SoftOrthogonalWavelet. Gradients reach both data and filters.
/// The filters are cast to the dtype/device of data.
/// Throws ConfigurationError for PaddingMode::boundary or a malformed bank.
CoefficientList wavedec(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t level = -1,
    PaddingMode mode = PaddingMode::reflect);

/// Multi-level 1-D reconstruction from a wavedec result.
/// The output may carry up to one extra sample per level for odd input
/// lengths; callers truncate to the original length.
/// mode only matters for PaddingMode::boundary, which inverts the
/// boundary-matrix transform.
torch::Tensor waverec(
    CoefficientList const& coeffs,
    Wavelet const& wavelet,
    PaddingMode mode = PaddingMode::reflect,
    OrthMethod orth_method = OrthMethod::qr);

/// waverec with a tensor filter bank; the inverse of the tensor overload of wavedec.
torch::Tensor waverec(
    CoefficientList const& coeffs,
    FilterTensors const& filters);
