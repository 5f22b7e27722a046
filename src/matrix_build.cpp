#include "matrix_build.hpp"

#include "errors.hpp"
#include "sparse_math.hpp"

#include <string>

static void check_matrix_length(Wavelet const& wavelet, int64_t length) {
    if (length % 2 != 0 || length < wavelet.dec_len()) {
        throw LevelRangeError(
            "Boundary matrices need an even length of at least the filter length " +
            std::to_string(wavelet.dec_len()) + ", got " + std::to_string(length));
    }
}

torch::Tensor construct_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts) {

    check_matrix_length(wavelet, length);
    auto filters = get_filter_tensors(wavelet, /*flip=*/false, opts);

    auto analysis_lo = construct_strided_conv_matrix(filters.dec_lo, length, 2);
    auto analysis_hi = construct_strided_conv_matrix(filters.dec_hi, length, 2);

    return torch::cat({analysis_lo, analysis_hi}).coalesce();
}

torch::Tensor construct_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts) {

    check_matrix_length(wavelet, length);
    auto filters = get_filter_tensors(wavelet, /*flip=*/false, opts);

    // The synthesis rows are the time-reversed reconstruction filters.
    auto synthesis_lo = construct_strided_conv_matrix(filters.rec_lo.flip(0), length, 2);
    auto synthesis_hi = construct_strided_conv_matrix(filters.rec_hi.flip(0), length, 2);

    return torch::cat({synthesis_lo, synthesis_hi}).t().coalesce();
}

torch::Tensor construct_boundary_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts,
    OrthMethod method) {

    auto analysis = construct_a(wavelet, length, opts);
    return orthogonalize(analysis, wavelet.dec_len(), method);
}

torch::Tensor construct_boundary_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts,
    OrthMethod method) {

    // orthogonalize() works on rows; the boundary structure of S sits in its
    // columns, so orthogonalize S^T and transpose back.
    auto synthesis_t = construct_s(wavelet, length, opts).t();
    return orthogonalize(synthesis_t, wavelet.rec_len(), method).t().coalesce();
}
