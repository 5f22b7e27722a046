#include "conv_transform_2d.hpp"

#include "conv_transform.hpp"
#include "errors.hpp"
#include "matrix_transform.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <string>

Coefficients2D wavedec2(
    torch::Tensor const& data,
    Wavelet const& wavelet,
    int64_t level,
    PaddingMode mode,
    OrthMethod orth_method) {

    if (mode == PaddingMode::boundary) {
        return MatrixWavedec2(wavelet, level, orth_method)(data);
    }
    return wavedec2(data, get_filter_tensors(wavelet, /*flip=*/false, options_like(data)), level, mode);
}

Coefficients2D wavedec2(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t level,
    PaddingMode mode) {

    if (mode == PaddingMode::boundary) {
        throw ConfigurationError("The boundary mode needs a Wavelet; tensor filter banks only support padded modes");
    }
    if (data.dim() < 2) {
        throw std::invalid_argument("data must have at least 2 dimensions");
    }
    check_filter_tensors(filters);

    auto const bank = flip_decomposition(cast_filters(filters, options_like(data)));
    // The shorter side bounds the level.
    level = resolve_level(std::min(data.size(-2), data.size(-1)), bank.dec_lo.size(0), level);

    std::vector<DetailCoefficients2D> details;
    details.reserve(level);
    auto approx = data;
    for (int64_t l = 0; l < level; ++l) {
        // ll, lh, hl, hh name the (height, width) filter pair.
        auto [lo_h, hi_h] = dwt_along_dim(approx, bank, -2, mode);
        auto [ll, lh] = dwt_along_dim(lo_h, bank, -1, mode);
        auto [hl, hh] = dwt_along_dim(hi_h, bank, -1, mode);
        details.push_back(DetailCoefficients2D{
            .horizontal = hl,
            .vertical = lh,
            .diagonal = hh,
        });
        approx = ll;
    }

    std::reverse(details.begin(), details.end());
    return Coefficients2D{.approx = approx, .details = std::move(details)};
}

torch::Tensor waverec2(
    Coefficients2D const& coeffs,
    Wavelet const& wavelet,
    PaddingMode mode,
    OrthMethod orth_method) {

    if (mode == PaddingMode::boundary) {
        return MatrixWaverec2(wavelet, orth_method)(coeffs);
    }
    return waverec2(coeffs, get_filter_tensors(wavelet, /*flip=*/false, options_like(coeffs.approx)));
}

torch::Tensor waverec2(
    Coefficients2D const& coeffs,
    FilterTensors const& filters) {

    if (coeffs.details.empty()) {
        throw ConfigurationError("waverec2 needs at least one level of detail coefficients");
    }
    check_filter_tensors(filters);

    auto const bank = cast_filters(filters, options_like(coeffs.approx));
    int64_t const filt_len = bank.rec_lo.size(0);

    auto approx = coeffs.approx;
    for (size_t pos = 0; pos < coeffs.details.size(); ++pos) {
        auto const& level_details = coeffs.details[pos];

        // The next level's subbands fix the cropped shape; the last level
        // keeps the default crop.
        int64_t target_h = -1;
        int64_t target_w = -1;
        if (pos + 1 < coeffs.details.size()) {
            auto const& next = coeffs.details[pos + 1].horizontal;
            target_h = next.size(-2);
            target_w = next.size(-1);
        }

        auto lo_h = idwt_along_dim(approx, level_details.vertical, bank, -1);
        auto hi_h = idwt_along_dim(level_details.horizontal, level_details.diagonal, bank, -1);
        lo_h = crop_synthesis(lo_h, filt_len, -1, target_w);
        hi_h = crop_synthesis(hi_h, filt_len, -1, target_w);

        auto rec = idwt_along_dim(lo_h, hi_h, bank, -2);
        approx = crop_synthesis(rec, filt_len, -2, target_h);
    }
    return approx;
}

std::vector<torch::Tensor> flatten_2d_coeffs(Coefficients2D const& coeffs) {
    std::vector<torch::Tensor> flat;
    flat.reserve(1 + 3 * coeffs.details.size());
    flat.push_back(coeffs.approx);
    for (auto const& level_details : coeffs.details) {
        flat.push_back(level_details.horizontal);
        flat.push_back(level_details.vertical);
        flat.push_back(level_details.diagonal);
    }
    return flat;
}
