#pragma once

#include <torch/torch.h>

#include "orthogonalize.hpp"
#include "padding.hpp"
#include "wavelet.hpp"

#include <vector>

/// Detail subbands of one 2-D level, in PyWavelets order.
///   horizontal - highpass along height, lowpass along width  (cH)
///   vertical   - lowpass along height, highpass along width  (cV)
///   diagonal   - highpass along both                         (cD)
struct DetailCoefficients2D {
    torch::Tensor horizontal;
    torch::Tensor vertical;
    torch::Tensor diagonal;
};

/// Multi-level 2-D coefficients: the coarsest approximation followed by the
/// detail subbands of every level, coarsest level first.
struct Coefficients2D {
    torch::Tensor approx;
    std::vector<DetailCoefficients2D> details;
};

/// Separable multi-level 2-D decomposition of the last two dimensions.
/// data: [..., H, W]. Each level filters the height axis first, then the width
/// axis of both height outputs.
/// level = -1 selects max(dwt_max_level(min(H, W), L), 1).
/// PaddingMode::boundary runs the boundary-matrix transform instead.
Coefficients2D wavedec2(
    torch::Tensor const& data,
    Wavelet const& wavelet,
    int64_t level = -1,
    PaddingMode mode = PaddingMode::reflect,
    OrthMethod orth_method = OrthMethod::qr);

/// wavedec2 with a tensor filter bank in natural PyWavelets order.
/// Throws ConfigurationError for PaddingMode::boundary or a malformed bank.
Coefficients2D wavedec2(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t level = -1,
    PaddingMode mode = PaddingMode::reflect);

/// Inverse of wavedec2. Each level synthesizes along the width axis
/// (approx with vertical, horizontal with diagonal), then along the height axis.
torch::Tensor waverec2(
    Coefficients2D const& coeffs,
    Wavelet const& wavelet,
    PaddingMode mode = PaddingMode::reflect,
    OrthMethod orth_method = OrthMethod::qr);

/// waverec2 with a tensor filter bank.
torch::Tensor waverec2(
    Coefficients2D const& coeffs,
    FilterTensors const& filters);

/// Flatten to [approx, h_L, v_L, d_L, ..., h_1, v_1, d_1].
std::vector<torch::Tensor> flatten_2d_coeffs(Coefficients2D const& coeffs);
