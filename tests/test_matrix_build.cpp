#include "errors.hpp"
#include "matrix_build.hpp"
#include "sparse_math.hpp"

#include "test_util.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static constexpr double TOL = 1e-10;

// Verify A has shape (length, length) for various input sizes.
static void test_a_shape() {
    auto const w = make_wavelet("haar");
    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);

    for (int64_t len : {8, 16, 32}) {
        auto a = construct_a(w, len, opts);
        assert(a.size(0) == len);
        assert(a.size(1) == len);
    }
    std::cout << "  test_a_shape passed." << std::endl;
}

// Verify S has shape (length, length) for various input sizes.
static void test_s_shape() {
    auto const w = make_wavelet("haar");
    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);

    for (int64_t len : {8, 16, 32}) {
        auto s = construct_s(w, len, opts);
        assert(s.size(0) == len);
        assert(s.size(1) == len);
    }
    std::cout << "  test_s_shape passed." << std::endl;
}

// For Haar, S @ A = I exactly (filters are length 2, no boundary issues).
static void test_haar_perfect_reconstruction() {
    auto const w = make_wavelet("haar");
    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);
    int64_t const n = 8;

    auto a = construct_a(w, n, opts);
    auto s = construct_s(w, n, opts);
    auto sa = torch::mm(s.to_dense(), a.to_dense());
    auto eye = torch::eye(n, opts);

    auto diff = (sa - eye).abs().max().item<double>();
    if (diff > TOL) {
        std::cerr << "S @ A not identity, max diff = " << diff << std::endl;
        assert(false);
    }
    std::cout << "  test_haar_perfect_reconstruction passed." << std::endl;
}

// Top half of A matches dec_lo strided conv, bottom half matches dec_hi.
static void test_a_lowpass_highpass_split() {
    auto const w = make_wavelet("haar");
    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);
    int64_t const n = 8;

    auto a = construct_a(w, n, opts);

    auto const filters = get_filter_tensors(w, /*flip=*/false, opts);
    auto expected_lo = construct_strided_conv_matrix(filters.dec_lo, n, 2);
    auto expected_hi = construct_strided_conv_matrix(filters.dec_hi, n, 2);

    auto top = a.to_dense().slice(0, 0, n / 2);
    auto bot = a.to_dense().slice(0, n / 2, n);

    auto diff_lo = (top - expected_lo.to_dense()).abs().max().item<double>();
    auto diff_hi = (bot - expected_hi.to_dense()).abs().max().item<double>();

    if (diff_lo > TOL) {
        std::cerr << "A top half != dec_lo strided conv, max diff = " << diff_lo << std::endl;
        assert(false);
    }
    if (diff_hi > TOL) {
        std::cerr << "A bottom half != dec_hi strided conv, max diff = " << diff_hi << std::endl;
        assert(false);
    }
    std::cout << "  test_a_lowpass_highpass_split passed." << std::endl;
}

// Odd lengths and lengths shorter than the filter are rejected.
static void test_invalid_lengths() {
    auto const opts = torch::TensorOptions().dtype(torch::kFloat64);
    auto const db3 = make_wavelet("db3");

    assert(throws_as<LevelRangeError>([&] { construct_a(db3, 15, opts); }));
    assert(throws_as<LevelRangeError>([&] { construct_a(db3, 4, opts); }));
    assert(throws_as<LevelRangeError>([&] { construct_s(db3, 9, opts); }));
    assert(throws_as<LevelRangeError>([&] { construct_boundary_a(db3, 2, opts); }));
    std::cout << "  test_invalid_lengths passed." << std::endl;
}

// Matrices follow the requested dtype.
static void test_matrix_dtype() {
    auto const w = make_wavelet("db2");
    auto const opts = torch::TensorOptions().dtype(torch::kFloat32);
    auto a = construct_boundary_a(w, 16, opts);
    auto s = construct_boundary_s(w, 16, opts);
    assert(a.dtype() == torch::kFloat32);
    assert(s.dtype() == torch::kFloat32);

    auto sa = torch::mm(s.to_dense(), a.to_dense());
    assert_close(sa, torch::eye(16, opts), 1e-5, "float32 S @ A");
    std::cout << "  test_matrix_dtype passed." << std::endl;
}

int main() {
    test_a_shape();
    test_s_shape();
    test_haar_perfect_reconstruction();
    test_a_lowpass_highpass_split();
    test_invalid_lengths();
    test_matrix_dtype();

    std::cout << "All matrix_build tests passed." << std::endl;
    return 0;
}
