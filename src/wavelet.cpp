#include "wavelet.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

/// Build an orthogonal wavelet from its scaling coefficients h, using the
/// PyWavelets layout: rec_lo = h, dec_lo = reverse(h),
/// rec_hi[k] = (-1)^k h[L-1-k], dec_hi = reverse(rec_hi).
static Wavelet make_orthogonal(std::string name, std::vector<double> const& h) {
    std::size_t const len = h.size();

    std::vector<double> rec_hi(len);
    for (std::size_t k = 0; k < len; ++k) {
        double const sign = (k % 2 == 0) ? 1.0 : -1.0;
        rec_hi[k] = sign * h[len - 1 - k];
    }

    return Wavelet{
        .name = std::move(name),
        .dec_lo = std::vector<double>(h.rbegin(), h.rend()),
        .dec_hi = std::vector<double>(rec_hi.rbegin(), rec_hi.rend()),
        .rec_lo = h,
        .rec_hi = rec_hi,
    };
}

static Wavelet make_haar() {
    double const s = std::sqrt(2.0) / 2.0;
    return make_orthogonal("haar", {s, s});
}

Wavelet make_wavelet(std::string const& name) {
    if (name == "haar" || name == "db1") {
        return make_haar();
    }
    if (name == "db2" || name == "sym2") {
        return make_orthogonal("db2", {
            0.4829629131445341, 0.8365163037378079,
            0.2241438680420134, -0.1294095225512604});
    }
    if (name == "db3" || name == "sym3") {
        return make_orthogonal("db3", {
            0.3326705529500825, 0.8068915093110924, 0.4598775021184914,
            -0.1350110200102546, -0.0854412738820267, 0.0352262918857095});
    }
    if (name == "db4") {
        return make_orthogonal("db4", {
            0.2303778133088964, 0.7148465705529154, 0.6308807679298587,
            -0.0279837694168599, -0.1870348117190931, 0.0308413818355607,
            0.0328830116668852, -0.0105974017850690});
    }
    if (name == "db5") {
        return make_orthogonal("db5", {
            0.1601023979741929, 0.6038292697971895, 0.7243085284377726,
            0.1384281459013203, -0.2422948870663823, -0.0322448695846381,
            0.0775714938400459, -0.0062414902127983, -0.0125807519990820,
            0.0033357252854738});
    }
    throw ConfigurationError("Unknown wavelet: " + name);
}

Wavelet resolve_wavelet(FilterBankSource const& source, std::string const& name) {
    auto filters = source.filter_bank();
    if (filters.size() < 4) {
        throw ConfigurationError(
            "Filter bank '" + name + "' has " + std::to_string(filters.size()) +
            " filters, expected 4");
    }

    std::size_t const len = filters[0].size();
    if (len < 2) {
        throw ConfigurationError(
            "Filter bank '" + name + "' needs filters of at least 2 taps, got " + std::to_string(len));
    }
    for (std::size_t i = 1; i < 4; ++i) {
        if (filters[i].size() != len) {
            throw ConfigurationError(
                "Filter bank '" + name + "' has filters of unequal length (" +
                std::to_string(len) + " vs " + std::to_string(filters[i].size()) + ")");
        }
    }

    return Wavelet{
        .name = name,
        .dec_lo = std::move(filters[0]),
        .dec_hi = std::move(filters[1]),
        .rec_lo = std::move(filters[2]),
        .rec_hi = std::move(filters[3]),
    };
}

FilterTensors get_filter_tensors(
    Wavelet const& wavelet,
    bool flip,
    torch::TensorOptions const& opts) {

    auto dec_lo = torch::tensor(wavelet.dec_lo, opts);
    auto dec_hi = torch::tensor(wavelet.dec_hi, opts);
    if (flip) {
        dec_lo = dec_lo.flip(0);
        dec_hi = dec_hi.flip(0);
    }
    return FilterTensors{
        .dec_lo = dec_lo,
        .dec_hi = dec_hi,
        .rec_lo = torch::tensor(wavelet.rec_lo, opts),
        .rec_hi = torch::tensor(wavelet.rec_hi, opts),
    };
}

/// Correlation of a and b at an even shift: sum_k a[k] * b[k + shift].
static double shifted_dot(std::vector<double> const& a, std::vector<double> const& b, int shift) {
    double sum = 0.0;
    int const len = static_cast<int>(a.size());
    for (int k = 0; k < len; ++k) {
        int const j = k + shift;
        if (j >= 0 && j < len) {
            sum += a[k] * b[j];
        }
    }
    return sum;
}

bool is_orthogonal(Wavelet const& wavelet, double tol) {
    int const len = wavelet.dec_len();
    if (len < 2 || wavelet.dec_hi.size() != wavelet.dec_lo.size() ||
        wavelet.rec_len() != len || wavelet.rec_hi.size() != wavelet.rec_lo.size()) {
        return false;
    }

    auto const reversed = [](std::vector<double> v) {
        std::reverse(v.begin(), v.end());
        return v;
    };
    auto const near = [tol](std::vector<double> const& a, std::vector<double> const& b) {
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::abs(a[i] - b[i]) > tol) return false;
        }
        return true;
    };
    if (!near(wavelet.rec_lo, reversed(wavelet.dec_lo)) ||
        !near(wavelet.rec_hi, reversed(wavelet.dec_hi))) {
        return false;
    }

    for (int shift = -(len - 1); shift < len; ++shift) {
        if (shift % 2 != 0) continue;
        double const expected = shift == 0 ? 1.0 : 0.0;
        if (std::abs(shifted_dot(wavelet.dec_lo, wavelet.dec_lo, shift) - expected) > tol) return false;
        if (std::abs(shifted_dot(wavelet.dec_hi, wavelet.dec_hi, shift) - expected) > tol) return false;
        if (std::abs(shifted_dot(wavelet.dec_lo, wavelet.dec_hi, shift)) > tol) return false;
    }
    return true;
}

void check_filter_tensors(FilterTensors const& filters) {
    if (!filters.dec_lo.defined()) {
        throw ConfigurationError("Filter bank has an undefined decomposition lowpass filter");
    }
    int64_t const len = filters.dec_lo.numel();
    for (auto const& filter : {filters.dec_lo, filters.dec_hi, filters.rec_lo, filters.rec_hi}) {
        if (!filter.defined() || filter.dim() != 1) {
            throw ConfigurationError("Filter bank tensors must be defined and 1-D");
        }
        if (!filter.is_floating_point()) {
            throw ConfigurationError("Filter bank tensors must have a floating point dtype");
        }
        if (filter.size(0) != len) {
            throw ConfigurationError(
                "Filter bank has filters of unequal length (" + std::to_string(len) + " vs " +
                std::to_string(filter.size(0)) + ")");
        }
    }
    if (len < 2) {
        throw ConfigurationError(
            "Filter bank needs filters of at least 2 taps, got " + std::to_string(len));
    }
}

FilterTensors cast_filters(FilterTensors const& filters, torch::TensorOptions const& opts) {
    return FilterTensors{
        .dec_lo = filters.dec_lo.to(opts),
        .dec_hi = filters.dec_hi.to(opts),
        .rec_lo = filters.rec_lo.to(opts),
        .rec_hi = filters.rec_hi.to(opts),
    };
}

FilterTensors flip_decomposition(FilterTensors const& filters) {
    return FilterTensors{
        .dec_lo = filters.dec_lo.flip(0),
        .dec_hi = filters.dec_hi.flip(0),
        .rec_lo = filters.rec_lo,
        .rec_hi = filters.rec_hi,
    };
}

// ========================== Learnable bank ==========================

static torch::Tensor as_parameter(torch::Tensor const& filter) {
    return filter.detach().clone().requires_grad_(true);
}

SoftOrthogonalWavelet::SoftOrthogonalWavelet(
    torch::Tensor const& rec_lo,
    torch::Tensor const& rec_hi,
    torch::Tensor const& dec_lo,
    torch::Tensor const& dec_hi) {

    FilterTensors const bank{.dec_lo = dec_lo, .dec_hi = dec_hi, .rec_lo = rec_lo, .rec_hi = rec_hi};
    check_filter_tensors(bank);
    filters_ = FilterTensors{
        .dec_lo = as_parameter(dec_lo),
        .dec_hi = as_parameter(dec_hi),
        .rec_lo = as_parameter(rec_lo),
        .rec_hi = as_parameter(rec_hi),
    };
}

SoftOrthogonalWavelet::SoftOrthogonalWavelet(Wavelet const& init, torch::TensorOptions const& opts)
    : SoftOrthogonalWavelet(
          torch::tensor(init.rec_lo, opts),
          torch::tensor(init.rec_hi, opts),
          torch::tensor(init.dec_lo, opts),
          torch::tensor(init.dec_hi, opts)) {}

std::vector<torch::Tensor> SoftOrthogonalWavelet::parameters() const {
    return {filters_.dec_lo, filters_.dec_hi, filters_.rec_lo, filters_.rec_hi};
}

/// Full linear convolution of two equal-length filters, length 2L - 1.
static torch::Tensor full_convolution(torch::Tensor const& a, torch::Tensor const& b) {
    int64_t const len = b.size(0);
    auto res = torch::conv1d(
        a.reshape({1, 1, -1}), b.flip(0).reshape({1, 1, -1}),
        /*bias=*/{}, /*stride=*/1, /*padding=*/len - 1);
    return res.reshape({-1});
}

torch::Tensor SoftOrthogonalWavelet::perfect_reconstruction_loss() const {
    int64_t const len = filter_length();
    auto const distortion = full_convolution(filters_.dec_lo, filters_.rec_lo) +
                            full_convolution(filters_.dec_hi, filters_.rec_hi);

    auto target = torch::zeros({2 * len - 1}, distortion.options().requires_grad(false));
    target.narrow(0, len - 1, 1).fill_(2.0);
    return (distortion - target).pow(2).sum();
}

torch::Tensor SoftOrthogonalWavelet::alias_cancellation_loss() const {
    int64_t const len = filter_length();
    // (-1)^k modulation, i.e. H(-z).
    auto sign = torch::ones({len}, filters_.dec_lo.options().requires_grad(false));
    sign.slice(0, 1, len, 2).fill_(-1.0);

    auto const alias = full_convolution(filters_.dec_lo * sign, filters_.rec_lo) +
                       full_convolution(filters_.dec_hi * sign, filters_.rec_hi);
    return alias.pow(2).sum();
}

torch::Tensor SoftOrthogonalWavelet::orthogonality_loss() const {
    return (filters_.rec_lo - filters_.dec_lo.flip(0)).pow(2).sum() +
           (filters_.rec_hi - filters_.dec_hi.flip(0)).pow(2).sum();
}

torch::Tensor SoftOrthogonalWavelet::wavelet_loss() const {
    return perfect_reconstruction_loss() + alias_cancellation_loss() + orthogonality_loss();
}
