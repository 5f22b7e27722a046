#pragma once

#include <torch/torch.h>

#include "conv_transform.hpp"
#include "conv_transform_2d.hpp"
#include "orthogonalize.hpp"
#include "wavelet.hpp"

#include <map>
#include <vector>

/// Largest level L such that the signal length is divisible by 2^L and the
/// subband split at level L is still at least dec_len long.
int64_t compute_max_level(int64_t signal_length, int64_t dec_len);

/// Boundary-orthogonalized analysis/synthesis operators, built once per
/// subband length and reused while dtype and device stay the same.
/// Throws ConfigurationError if the wavelet is not orthogonal.
class BoundaryOperatorCache {
public:
    BoundaryOperatorCache(Wavelet wavelet, OrthMethod orth_method);

    torch::Tensor const& analysis(int64_t length, torch::TensorOptions const& opts);
    torch::Tensor const& synthesis(int64_t length, torch::TensorOptions const& opts);

    Wavelet const& wavelet() const { return wavelet_; }

private:
    Wavelet wavelet_;
    OrthMethod orth_method_;
    std::map<int64_t, torch::Tensor> analysis_;
    std::map<int64_t, torch::Tensor> synthesis_;
};

/// Multi-level 1-D boundary wavelet decomposition with sparse matrices.
/// Same coefficient layout as wavedec: [approx_L, detail_L, ..., detail_1].
class MatrixWavedec {
public:
    /// level = -1 selects the largest feasible level up to max(dwt_max_level(N, L), 1).
    explicit MatrixWavedec(Wavelet wavelet, int64_t level = -1, OrthMethod orth_method = OrthMethod::qr);

    CoefficientList operator()(torch::Tensor const& data);

private:
    BoundaryOperatorCache operators_;
    int64_t level_;
};

/// Inverse of MatrixWavedec.
class MatrixWaverec {
public:
    explicit MatrixWaverec(Wavelet wavelet, OrthMethod orth_method = OrthMethod::qr);

    torch::Tensor operator()(CoefficientList const& coeffs);

private:
    BoundaryOperatorCache operators_;
};

/// Multi-level separable 2-D boundary wavelet decomposition of [..., H, W].
class MatrixWavedec2 {
public:
    /// level = -1 selects the largest level feasible for both H and W, up to
    /// max(dwt_max_level(min(H, W), L), 1).
    explicit MatrixWavedec2(Wavelet wavelet, int64_t level = -1, OrthMethod orth_method = OrthMethod::qr);

    Coefficients2D operator()(torch::Tensor const& data);

private:
    BoundaryOperatorCache operators_;
    int64_t level_;
};

/// Inverse of MatrixWavedec2.
class MatrixWaverec2 {
public:
    explicit MatrixWaverec2(Wavelet wavelet, OrthMethod orth_method = OrthMethod::qr);

    torch::Tensor operator()(Coefficients2D const& coeffs);

private:
    BoundaryOperatorCache operators_;
};

/// Validate a boundary-matrix level for one or more signal dimensions and
/// resolve level = -1 to the largest feasible level.
/// Levels are bounded like the convolution transform, by
/// max(dwt_max_level(shortest dimension, L), 1).
/// Throws LevelRangeError above that bound, or if a dimension is not divisible
/// by 2^level or its deepest split is shorter than the filter.
int64_t resolve_matrix_level(
    std::vector<int64_t> const& signal_dims,
    int64_t level,
    int64_t dec_len);
