#include "matrix_transform.hpp"

#include "errors.hpp"
#include "matrix_build.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <limits>
#include <string>

// ========================== Helper functions ==========================

/// Size of each subband before the split at this level: signal_length / 2^(level-1).
static int64_t subband_size_before_split(int64_t signal_length, int64_t level) {
    return signal_length / (1LL << (level - 1));
}

int64_t compute_max_level(int64_t signal_length, int64_t dec_len) {
    int64_t L = 0;
    int64_t divisor = 1;
    while (signal_length % (divisor * 2) == 0 && signal_length / divisor >= dec_len) {
        ++L;
        divisor *= 2;
    }
    return L;
}

int64_t resolve_matrix_level(
    std::vector<int64_t> const& signal_dims,
    int64_t level,
    int64_t dec_len) {

    auto const shape_str = [&signal_dims]() {
        std::string s;
        for (size_t i = 0; i < signal_dims.size(); ++i) {
            if (i > 0) s += ", ";
            s += std::to_string(signal_dims[i]);
        }
        return "(" + s + ")";
    };

    if (signal_dims.empty()) {
        throw std::invalid_argument("resolve_matrix_level needs at least one signal dimension");
    }
    // The convolution bound of the shortest dimension caps every level.
    int64_t const shortest = *std::min_element(signal_dims.begin(), signal_dims.end());

    if (level == -1) {
        // Auto-compute: the bound, lowered to the deepest level every dimension supports.
        level = resolve_level(shortest, dec_len, -1);
        for (int64_t dim_size : signal_dims) {
            level = std::min(level, compute_max_level(dim_size, dec_len));
        }
        if (level < 1) {
            throw LevelRangeError(
                "Cannot auto-compute a boundary level: signal shape " + shape_str() +
                " with filter length " + std::to_string(dec_len) + " yields level 0");
        }
        return level;
    }

    level = resolve_level(shortest, dec_len, level);

    int64_t const divisor = 1LL << level;
    for (int64_t dim_size : signal_dims) {
        if (dim_size % divisor != 0) {
            throw LevelRangeError(
                "Signal shape " + shape_str() + " is not divisible by 2^level = " +
                std::to_string(divisor));
        }
        // Smallest subband at the deepest split must be >= dec_len.
        int64_t const min_subband = subband_size_before_split(dim_size, level);
        if (min_subband < dec_len) {
            throw LevelRangeError(
                "Subband size " + std::to_string(min_subband) + " at level " +
                std::to_string(level) + " is smaller than filter length " +
                std::to_string(dec_len));
        }
    }
    return level;
}

/// Apply a sparse [N, N] matrix along dimension dim of a dense tensor.
/// Sparse mm only acts on the leading dimension, so dim is moved first and the
/// remaining dimensions are folded into columns.
static torch::Tensor apply_matrix_along_dim(
    torch::Tensor const& matrix,
    torch::Tensor const& data,
    int64_t dim) {

    auto x = torch::movedim(data, dim, 0);
    auto const shape = x.sizes().vec();
    auto result = torch::mm(matrix, x.reshape({shape[0], -1}));
    return torch::movedim(result.reshape(shape), 0, dim);
}

// ========================== Operator cache ==========================

BoundaryOperatorCache::BoundaryOperatorCache(Wavelet wavelet, OrthMethod orth_method)
    : wavelet_(std::move(wavelet)), orth_method_(orth_method) {
    if (!is_orthogonal(wavelet_)) {
        throw ConfigurationError(
            "The boundary transform needs an orthogonal wavelet; '" + wavelet_.name +
            "' is not orthogonal");
    }
}

static bool matches(torch::Tensor const& cached, torch::TensorOptions const& opts) {
    return cached.dtype() == opts.dtype() && cached.device() == opts.device();
}

torch::Tensor const& BoundaryOperatorCache::analysis(int64_t length, torch::TensorOptions const& opts) {
    auto it = analysis_.find(length);
    if (it == analysis_.end() || !matches(it->second, opts)) {
        auto matrix = construct_boundary_a(wavelet_, length, opts, orth_method_);
        it = analysis_.insert_or_assign(length, std::move(matrix)).first;
    }
    return it->second;
}

torch::Tensor const& BoundaryOperatorCache::synthesis(int64_t length, torch::TensorOptions const& opts) {
    auto it = synthesis_.find(length);
    if (it == synthesis_.end() || !matches(it->second, opts)) {
        auto matrix = construct_boundary_s(wavelet_, length, opts, orth_method_);
        it = synthesis_.insert_or_assign(length, std::move(matrix)).first;
    }
    return it->second;
}

// ========================== 1-D transforms ==========================

MatrixWavedec::MatrixWavedec(Wavelet wavelet, int64_t level, OrthMethod orth_method)
    : operators_(std::move(wavelet), orth_method), level_(level) {}

CoefficientList MatrixWavedec::operator()(torch::Tensor const& data) {
    if (data.dim() < 1) {
        throw std::invalid_argument("data must have at least 1 dimension");
    }
    int64_t const N = data.size(-1);
    int64_t const level = resolve_matrix_level({N}, level_, operators_.wavelet().dec_len());
    auto const opts = options_like(data);

    CoefficientList details;
    details.reserve(level);
    auto approx = data;
    for (int64_t l = 0; l < level; ++l) {
        int64_t const M = approx.size(-1);
        // Analysis puts the lowpass half on top and the highpass half below.
        auto split = apply_matrix_along_dim(operators_.analysis(M, opts), approx, -1);
        details.push_back(split.narrow(-1, M / 2, M / 2));
        approx = split.narrow(-1, 0, M / 2);
    }

    CoefficientList result;
    result.reserve(level + 1);
    result.push_back(approx);
    result.insert(result.end(), details.rbegin(), details.rend());
    return result;
}

MatrixWaverec::MatrixWaverec(Wavelet wavelet, OrthMethod orth_method)
    : operators_(std::move(wavelet), orth_method) {}

torch::Tensor MatrixWaverec::operator()(CoefficientList const& coeffs) {
    if (coeffs.size() < 2) {
        throw ConfigurationError("waverec needs an approximation and at least one detail");
    }
    auto const opts = options_like(coeffs.front());

    auto approx = coeffs.front();
    for (size_t pos = 1; pos < coeffs.size(); ++pos) {
        if (approx.sizes() != coeffs[pos].sizes()) {
            throw ConfigurationError(
                "Approximation and detail shapes differ at position " + std::to_string(pos));
        }
        auto joined = torch::cat({approx, coeffs[pos]}, -1);
        approx = apply_matrix_along_dim(operators_.synthesis(joined.size(-1), opts), joined, -1);
    }
    return approx;
}

// ========================== 2-D transforms ==========================

MatrixWavedec2::MatrixWavedec2(Wavelet wavelet, int64_t level, OrthMethod orth_method)
    : operators_(std::move(wavelet), orth_method), level_(level) {}

Coefficients2D MatrixWavedec2::operator()(torch::Tensor const& data) {
    if (data.dim() < 2) {
        throw std::invalid_argument("data must have at least 2 dimensions");
    }
    int64_t const H = data.size(-2);
    int64_t const W = data.size(-1);
    int64_t const level = resolve_matrix_level({H, W}, level_, operators_.wavelet().dec_len());
    auto const opts = options_like(data);

    std::vector<DetailCoefficients2D> details;
    details.reserve(level);
    auto approx = data;
    for (int64_t l = 0; l < level; ++l) {
        int64_t const h = approx.size(-2);
        int64_t const w = approx.size(-1);

        // Height first, then width. The result tiles as
        //   [ approx     | vertical ]
        //   [ horizontal | diagonal ]
        auto split = apply_matrix_along_dim(operators_.analysis(h, opts), approx, -2);
        split = apply_matrix_along_dim(operators_.analysis(w, opts), split, -1);

        auto top = split.narrow(-2, 0, h / 2);
        auto bottom = split.narrow(-2, h / 2, h / 2);
        details.push_back(DetailCoefficients2D{
            .horizontal = bottom.narrow(-1, 0, w / 2),
            .vertical = top.narrow(-1, w / 2, w / 2),
            .diagonal = bottom.narrow(-1, w / 2, w / 2),
        });
        approx = top.narrow(-1, 0, w / 2);
    }

    std::reverse(details.begin(), details.end());
    return Coefficients2D{.approx = approx, .details = std::move(details)};
}

MatrixWaverec2::MatrixWaverec2(Wavelet wavelet, OrthMethod orth_method)
    : operators_(std::move(wavelet), orth_method) {}

torch::Tensor MatrixWaverec2::operator()(Coefficients2D const& coeffs) {
    if (coeffs.details.empty()) {
        throw ConfigurationError("waverec2 needs at least one level of detail coefficients");
    }
    auto const opts = options_like(coeffs.approx);

    auto approx = coeffs.approx;
    for (auto const& level_details : coeffs.details) {
        if (approx.sizes() != level_details.horizontal.sizes() ||
            approx.sizes() != level_details.vertical.sizes() ||
            approx.sizes() != level_details.diagonal.sizes()) {
            throw ConfigurationError("Approximation and detail subband shapes differ");
        }
        auto top = torch::cat({approx, level_details.vertical}, -1);
        auto bottom = torch::cat({level_details.horizontal, level_details.diagonal}, -1);
        auto tiled = torch::cat({top, bottom}, -2);

        // Undo width first, then height.
        tiled = apply_matrix_along_dim(operators_.synthesis(tiled.size(-1), opts), tiled, -1);
        approx = apply_matrix_along_dim(operators_.synthesis(tiled.size(-2), opts), tiled, -2);
    }
    return approx;
}
