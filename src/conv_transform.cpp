#include "conv_transform.hpp"

#include "errors.hpp"
#include "matrix_transform.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <string>

int64_t dwt_max_level(int64_t data_len, int64_t filt_len) {
    if (filt_len < 2 || data_len < 1) {
        return 0;
    }
    int64_t ratio = data_len / (filt_len - 1);
    int64_t level = -1;
    while (ratio > 0) {
        ratio >>= 1;
        ++level;
    }
    return std::max<int64_t>(level, 0);
}

int64_t resolve_level(int64_t data_len, int64_t filt_len, int64_t level) {
    int64_t const max_level = std::max<int64_t>(dwt_max_level(data_len, filt_len), 1);
    if (level == -1) {
        return max_level;
    }
    if (level < 1 || level > max_level) {
        throw LevelRangeError(
            "Level " + std::to_string(level) + " is outside [1, " + std::to_string(max_level) +
            "] for signal length " + std::to_string(data_len) + " and filter length " +
            std::to_string(filt_len));
    }
    return level;
}

/// Stack the two filters of a bank into a [2, 1, L] conv kernel.
static torch::Tensor two_channel_kernel(torch::Tensor const& lo, torch::Tensor const& hi) {
    return torch::stack({lo, hi}).unsqueeze(1);
}

std::pair<torch::Tensor, torch::Tensor> dwt_along_dim(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t dim,
    PaddingMode mode) {

    // Move the filtered dimension last and fold everything else into the batch.
    auto x = torch::movedim(data, dim, -1);
    auto shape = x.sizes().vec();
    int64_t const N = shape.back();
    auto flat = x.reshape({-1, 1, N});                                     // [batch, 1, N]

    int64_t const filt_len = filters.dec_lo.size(0);
    auto padded = fwt_pad(flat, filt_len, mode);
    auto kernel = two_channel_kernel(filters.dec_lo, filters.dec_hi);
    auto res = torch::conv1d(padded, kernel, /*bias=*/{}, /*stride=*/2);   // [batch, 2, M]

    shape.back() = res.size(-1);
    auto approx = res.select(1, 0).reshape(shape);
    auto detail = res.select(1, 1).reshape(shape);
    return {torch::movedim(approx, -1, dim), torch::movedim(detail, -1, dim)};
}

torch::Tensor idwt_along_dim(
    torch::Tensor const& approx,
    torch::Tensor const& detail,
    FilterTensors const& filters,
    int64_t dim) {

    if (approx.sizes() != detail.sizes()) {
        throw ConfigurationError(
            "Approximation and detail shapes differ: " + std::to_string(approx.size(dim)) +
            " vs " + std::to_string(detail.size(dim)) + " along dim " + std::to_string(dim));
    }

    auto a = torch::movedim(approx, dim, -1);
    auto d = torch::movedim(detail, dim, -1);
    auto shape = a.sizes().vec();
    int64_t const M = shape.back();

    auto stacked = torch::stack({a.reshape({-1, M}), d.reshape({-1, M})}, 1);   // [batch, 2, M]
    auto kernel = two_channel_kernel(filters.rec_lo, filters.rec_hi);
    auto res = torch::conv_transpose1d(stacked, kernel, /*bias=*/{}, /*stride=*/2);  // [batch, 1, 2(M-1)+L]

    shape.back() = res.size(-1);
    return torch::movedim(res.reshape(shape), -1, dim);
}

torch::Tensor crop_synthesis(
    torch::Tensor const& data,
    int64_t filt_len,
    int64_t dim,
    int64_t target_len) {

    int64_t const len = data.size(dim);
    int64_t const padl = (2 * filt_len - 3) / 2;
    int64_t padr = (2 * filt_len - 3) / 2;

    if (target_len >= 0 && len - padl - padr != target_len) {
        // The analysis side padded odd lengths by one extra sample on the right.
        padr += 1;
        if (len - padl - padr != target_len) {
            throw ConfigurationError(
                "Cannot crop synthesized length " + std::to_string(len) +
                " to the next coefficient length " + std::to_string(target_len));
        }
    }
    return data.narrow(dim, padl, len - padl - padr);
}

CoefficientList wavedec(
    torch::Tensor const& data,
    Wavelet const& wavelet,
    int64_t level,
    PaddingMode mode,
    OrthMethod orth_method) {

    if (mode == PaddingMode::boundary) {
        return MatrixWavedec(wavelet, level, orth_method)(data);
    }
    return wavedec(data, get_filter_tensors(wavelet, /*flip=*/false, options_like(data)), level, mode);
}

CoefficientList wavedec(
    torch::Tensor const& data,
    FilterTensors const& filters,
    int64_t level,
    PaddingMode mode) {

    if (mode == PaddingMode::boundary) {
        throw ConfigurationError("The boundary mode needs a Wavelet; tensor filter banks only support padded modes");
    }
    if (data.dim() < 1) {
        throw std::invalid_argument("data must have at least 1 dimension");
    }
    check_filter_tensors(filters);

    auto const bank = flip_decomposition(cast_filters(filters, options_like(data)));
    level = resolve_level(data.size(-1), bank.dec_lo.size(0), level);

    // Details are collected finest first and emitted coarsest first.
    CoefficientList details;
    details.reserve(level);
    auto approx = data;
    for (int64_t l = 0; l < level; ++l) {
        auto [lo, hi] = dwt_along_dim(approx, bank, -1, mode);
        details.push_back(hi);
        approx = lo;
    }

    CoefficientList result;
    result.reserve(level + 1);
    result.push_back(approx);
    result.insert(result.end(), details.rbegin(), details.rend());
    return result;
}

torch::Tensor waverec(
    CoefficientList const& coeffs,
    Wavelet const& wavelet,
    PaddingMode mode,
    OrthMethod orth_method) {

    if (mode == PaddingMode::boundary) {
        return MatrixWaverec(wavelet, orth_method)(coeffs);
    }
    if (coeffs.empty()) {
        throw ConfigurationError("waverec needs an approximation and at least one detail");
    }
    return waverec(coeffs, get_filter_tensors(wavelet, /*flip=*/false, options_like(coeffs.front())));
}

torch::Tensor waverec(
    CoefficientList const& coeffs,
    FilterTensors const& filters) {

    if (coeffs.size() < 2) {
        throw ConfigurationError("waverec needs an approximation and at least one detail");
    }
    check_filter_tensors(filters);

    auto const& first = coeffs.front();
    auto const bank = cast_filters(filters, options_like(first));
    int64_t const filt_len = bank.rec_lo.size(0);

    auto approx = first;
    for (size_t pos = 1; pos < coeffs.size(); ++pos) {
        auto rec = idwt_along_dim(approx, coeffs[pos], bank, -1);
        int64_t const target_len = pos + 1 < coeffs.size() ? coeffs[pos + 1].size(-1) : -1;
        approx = crop_synthesis(rec, filt_len, -1, target_len);
    }
    return approx;
}
