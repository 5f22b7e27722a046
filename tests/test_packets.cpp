#include "conv_transform.hpp"
#include "conv_transform_2d.hpp"
#include "errors.hpp"
#include "packets.hpp"

#include "test_util.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <string>

static constexpr double TOL = 1e-10;

using Paths = std::vector<std::string>;

static torch::Tensor worked_example_signal() {
    return torch::tensor({56.0, 40.0, 8.0, 24.0, 48.0, 48.0, 40.0, 16.0}, torch::kFloat64);
}

static std::vector<double> values_at(WaveletPacketTree& tree, Paths const& paths) {
    std::vector<double> values;
    for (auto const& path : paths) {
        values.push_back(tree[path].item<double>());
    }
    return values;
}

static void assert_values(std::vector<double> const& got, std::vector<double> const& expected, char const* msg) {
    assert(got.size() == expected.size());
    for (size_t i = 0; i < got.size(); ++i) {
        if (std::abs(got[i] - expected[i]) > TOL) {
            std::cerr << msg << "[" << i << "]: expected " << expected[i] << ", got " << got[i] << std::endl;
            assert(false);
        }
    }
}

// ========================== Orderings ==========================

static void test_graycode_order() {
    assert(get_graycode_order(0) == Paths{""});
    assert(get_graycode_order(1) == (Paths{"a", "d"}));
    assert(get_graycode_order(2) == (Paths{"aa", "ad", "dd", "da"}));
    assert(get_graycode_order(3) == (Paths{"aaa", "aad", "add", "ada", "dda", "ddd", "dad", "daa"}));
    assert(get_graycode_order(2, 'l', 'h') == (Paths{"ll", "lh", "hh", "hl"}));

    // Neighbours differ in exactly one symbol.
    auto const order = get_graycode_order(5);
    assert(order.size() == 32);
    for (size_t i = 1; i < order.size(); ++i) {
        int changed = 0;
        for (size_t k = 0; k < order[i].size(); ++k) {
            changed += order[i][k] != order[i - 1][k];
        }
        assert(changed == 1);
    }
    std::cout << "  test_graycode_order passed." << std::endl;
}

static void test_freq_order_2d() {
    auto const level1 = get_freq_order(1);
    assert(level1.size() == 2);
    assert(level1[0] == (Paths{"a", "v"}));
    assert(level1[1] == (Paths{"h", "d"}));

    auto const level2 = get_freq_order(2);
    assert(level2.size() == 4);
    assert(level2[0] == (Paths{"aa", "av", "vv", "va"}));
    assert(level2[1] == (Paths{"ah", "ad", "vd", "vh"}));

    // Every path of the level appears exactly once.
    std::set<std::string> seen;
    for (auto const& row : get_freq_order(3)) {
        assert(row.size() == 8);
        seen.insert(row.begin(), row.end());
    }
    assert(seen.size() == 64);
    std::cout << "  test_freq_order_2d passed." << std::endl;
}

// ========================== 1-D trees ==========================

// Worked example with the unnormalized Haar bank.
static void test_worked_example() {
    WaveletPacket tree(worked_example_signal(), unscaled_haar(), PaddingMode::reflect, 3);
    assert(tree.max_level() == 3);

    assert_values(to_vector(tree["a"]), {48, 16, 48, 28}, "a");
    assert_values(to_vector(tree["d"]), {8, -8, 0, 12}, "d");
    assert_values(to_vector(tree["aa"]), {32, 38}, "aa");
    assert_values(to_vector(tree["ad"]), {16, 10}, "ad");
    assert_values(to_vector(tree["da"]), {0, 6}, "da");
    assert_values(to_vector(tree["dd"]), {8, -6}, "dd");

    auto const natural = tree.get_level(3);
    assert(natural == (Paths{"aaa", "aad", "ada", "add", "daa", "dad", "dda", "ddd"}));
    assert_values(values_at(tree, natural), {35, -3, 13, 3, 3, -3, 1, 7}, "natural level 3");

    auto const freq = tree.get_level(3, PacketOrder::freq);
    assert_values(values_at(tree, freq), {35, -3, 3, 13, 1, 7, -3, 3}, "freq level 3");

    // The root holds the input.
    assert_close(tree[""], worked_example_signal(), TOL, "root");
    std::cout << "  test_worked_example passed." << std::endl;
}

// Every level-L node equals one wavedec level applied to its parent.
static void test_nodes_follow_wavedec() {
    auto const w = make_wavelet("db2");
    auto x = torch::randn({3, 64}, torch::kFloat64);
    WaveletPacket tree(x, w, PaddingMode::periodic, 3);

    for (int64_t level = 1; level <= 3; ++level) {
        for (auto const& path : tree.get_level(level)) {
            auto parent = tree[path.substr(0, path.size() - 1)];
            auto split = wavedec(parent, w, 1, PaddingMode::periodic);
            auto const& expected = path.back() == 'a' ? split[0] : split[1];
            assert_close(tree[path], expected, TOL, "node " + path);
        }
    }
    std::cout << "  test_nodes_follow_wavedec passed." << std::endl;
}

static void test_access_errors() {
    auto empty = WaveletPacket::create_empty(make_wavelet("haar"));
    assert(!empty.built());
    assert(throws_as<TreeNotBuiltError>([&] { empty["a"]; }));
    assert(throws_as<TreeNotBuiltError>([&] { empty.max_level(); }));
    assert(throws_as<TreeNotBuiltError>([&] { empty.get_level(1); }));
    assert(throws_as<TreeNotBuiltError>([&] { empty.reconstruct(); }));
    assert(throws_as<std::invalid_argument>([&] { empty["a"]; }));

    empty.transform(worked_example_signal(), 2);
    assert(empty.built());
    assert(throws_as<PathKeyError>([&] { empty["aaa"]; }));
    assert(throws_as<PathKeyError>([&] { empty["ax"]; }));
    assert(throws_as<PathKeyError>([&] { empty.at("h"); }));
    assert(throws_as<PathKeyError>([&] { empty.get_level(3); }));
    assert(throws_as<PathKeyError>([&] { empty.get_level(-1); }));
    assert(empty.get_level(0) == Paths{""});
    std::cout << "  test_access_errors passed." << std::endl;
}

static void test_level_selection() {
    auto const w = make_wavelet("db2");
    auto x = torch::randn({64}, torch::kFloat64);

    WaveletPacket tree(x, w);
    assert(tree.max_level() == dwt_max_level(64, 4));

    assert(throws_as<LevelRangeError>([&] { tree.transform(x, 0); }));
    assert(throws_as<LevelRangeError>([&] { tree.transform(x, 5); }));

    // Boundary trees keep the same bound even where the matrices would allow more.
    WaveletPacket boundary(x, w, PaddingMode::boundary);
    assert(compute_max_level(64, 4) == 5);
    assert(boundary.max_level() == dwt_max_level(64, 4));
    assert(throws_as<LevelRangeError>([&] { boundary.transform(x, 5); }));
    assert(throws_as<LevelRangeError>([&] { wavedec(x, w, 5, PaddingMode::boundary); }));
    assert(wavedec(x, w, -1, PaddingMode::boundary).size() == 5);

    // Below the bound, the matrices may still lower the automatic level.
    auto const haar = make_wavelet("haar");
    auto y = torch::randn({80}, torch::kFloat64);
    assert(dwt_max_level(80, 2) == 6);
    assert(WaveletPacket(y, haar, PaddingMode::boundary).max_level() == 4);

    WaveletPacket2D boundary_2d(torch::randn({32, 64}, torch::kFloat64), w, PaddingMode::boundary);
    assert(boundary_2d.max_level() == dwt_max_level(32, 4));
    std::cout << "  test_level_selection passed." << std::endl;
}

// Lazy trees only hold the ancestors of accessed nodes and agree with eager ones.
static void test_lazy_matches_eager() {
    auto const w = make_wavelet("db3");
    auto x = torch::randn({2, 96}, torch::kFloat64);

    WaveletPacket eager(x, w, PaddingMode::zero, 3);
    assert(eager.node_count() == 1 + 2 + 4 + 8);

    auto lazy = WaveletPacket::create_empty(w, PaddingMode::zero);
    lazy.transform(x, 3, /*lazy=*/true);
    assert(lazy.node_count() == 1);
    assert(!lazy.contains("dad"));

    assert_close(lazy["dad"], eager["dad"], TOL, "lazy dad");
    assert(lazy.contains("dad"));
    assert(lazy.contains("da"));
    assert(!lazy.contains("aaa"));
    assert(lazy.node_count() == 1 + 2 + 2 + 2);

    for (auto const& path : eager.get_level(3, PacketOrder::freq)) {
        assert_close(lazy[path], eager[path], TOL, "lazy " + path);
    }
    assert(lazy.node_count() == eager.node_count());
    std::cout << "  test_lazy_matches_eager passed." << std::endl;
}

// Transforming again discards every node of the previous signal.
static void test_retransform() {
    WaveletPacket tree(worked_example_signal(), unscaled_haar(), PaddingMode::reflect, 3);
    auto const before = tree["aaa"].item<double>();
    assert(std::abs(before - 35.0) < TOL);

    auto doubled = worked_example_signal() * 2.0;
    tree.transform(doubled, 2);
    assert(tree.max_level() == 2);
    assert(tree.node_count() == 1 + 2 + 4);
    assert(!tree.contains("aaa"));
    assert_values(to_vector(tree["aa"]), {64, 76}, "aa after retransform");

    // Same input twice gives the same tree.
    tree.transform(doubled, 2);
    assert_values(to_vector(tree["aa"]), {64, 76}, "aa after second retransform");

    // Every node equals the node of a tree built from scratch.
    auto const db2 = make_wavelet("db2");
    auto x = torch::randn({2, 64}, torch::kFloat64);
    auto y = torch::randn({2, 48}, torch::kFloat64);
    WaveletPacket reused(x, db2, PaddingMode::reflect, 3);
    reused.transform(y, 2);
    WaveletPacket fresh(y, db2, PaddingMode::reflect, 2);
    assert(reused.node_count() == fresh.node_count());
    for (int64_t level = 0; level <= 2; ++level) {
        for (auto const& path : fresh.get_level(level)) {
            assert_close(reused[path], fresh[path], TOL, "retransformed node '" + path + "'");
        }
    }
    assert(!reused.contains("aaa"));
    std::cout << "  test_retransform passed." << std::endl;
}

static void test_retransform_2d() {
    auto const db2 = make_wavelet("db2");
    auto x = torch::randn({2, 32, 32}, torch::kFloat64);
    auto y = torch::randn({2, 24, 40}, torch::kFloat64);

    WaveletPacket2D reused(x, db2, PaddingMode::zero, 2);
    reused.transform(y, 1);
    WaveletPacket2D fresh(y, db2, PaddingMode::zero, 1);
    assert(reused.max_level() == 1);
    assert(reused.node_count() == fresh.node_count());
    for (int64_t level = 0; level <= 1; ++level) {
        for (auto const& path : fresh.get_level(level)) {
            assert_close(reused[path], fresh[path], TOL, "retransformed 2-D node '" + path + "'");
        }
    }
    assert(!reused.contains("aa"));

    // Back to two levels on the first image.
    reused.transform(x, 2);
    WaveletPacket2D again(x, db2, PaddingMode::zero, 2);
    for (auto const& path : again.get_level(2)) {
        assert_close(reused[path], again[path], TOL, "second 2-D retransform '" + path + "'");
    }
    std::cout << "  test_retransform_2d passed." << std::endl;
}

static void test_reconstruct() {
    for (auto mode : {PaddingMode::zero, PaddingMode::reflect, PaddingMode::periodic, PaddingMode::boundary}) {
        for (auto const* name : {"haar", "db2", "db3"}) {
            auto const w = make_wavelet(name);
            int64_t const N = mode == PaddingMode::boundary ? 96 : 67;
            auto x = torch::randn({3, N}, torch::kFloat64);

            WaveletPacket tree(x, w, mode, 3);
            auto rec = tree.reconstruct();
            assert_close(rec, x, 1e-9, std::string(name) + " " + to_string(mode) + " reconstruct");
        }
    }

    // Lazy trees are completed before reconstruction.
    auto const db2 = make_wavelet("db2");
    auto x = torch::randn({64}, torch::kFloat64);
    auto lazy = WaveletPacket::create_empty(db2);
    lazy.transform(x, 2, /*lazy=*/true);
    assert_close(lazy.reconstruct(), x, 1e-9, "lazy reconstruct");

    // Zeroing the detail leaves removes the highpass content only.
    WaveletPacket tree(x, db2, PaddingMode::reflect, 1);
    tree["d"].zero_();
    auto smooth = tree.reconstruct();
    auto expected = waverec({wavedec(x, db2, 1)[0], torch::zeros_like(tree["d"])}, db2).narrow(-1, 0, 64);
    assert_close(smooth, expected, 1e-9, "lowpass reconstruct");
    std::cout << "  test_reconstruct passed." << std::endl;
}

// Haar needs no boundary treatment, so the boundary tree equals the zero-padded one.
static void test_boundary_tree() {
    auto const haar = make_wavelet("haar");
    auto x = torch::randn({2, 32}, torch::kFloat64);

    WaveletPacket boundary(x, haar, PaddingMode::boundary, 3);
    WaveletPacket zero(x, haar, PaddingMode::zero, 3);
    for (auto const& path : zero.get_level(3)) {
        assert_close(boundary[path], zero[path], TOL, "haar boundary " + path);
    }

    assert(throws_as<ConfigurationError>([&] {
        WaveletPacket tree(x, unscaled_haar(), PaddingMode::boundary);
    }));
    assert(throws_as<LevelRangeError>([&] {
        WaveletPacket tree(torch::randn({30}, torch::kFloat64), haar, PaddingMode::boundary, 2);
    }));
    std::cout << "  test_boundary_tree passed." << std::endl;
}

// ========================== 2-D trees ==========================

static void test_2d_nodes() {
    auto const w = make_wavelet("db2");
    auto x = torch::randn({2, 32, 40}, torch::kFloat64);
    WaveletPacket2D tree(x, w, PaddingMode::reflect, 2);

    assert(tree.max_level() == 2);
    assert(tree.alphabet() == "ahvd");
    assert(tree.node_count() == 1 + 4 + 16);

    auto coeffs = wavedec2(x, w, 1);
    assert_close(tree["a"], coeffs.approx, TOL, "a");
    assert_close(tree["h"], coeffs.details[0].horizontal, TOL, "h");
    assert_close(tree["v"], coeffs.details[0].vertical, TOL, "v");
    assert_close(tree["d"], coeffs.details[0].diagonal, TOL, "d");

    auto inner = wavedec2(tree["h"], w, 1);
    assert_close(tree["ha"], inner.approx, TOL, "ha");
    assert_close(tree["hv"], inner.details[0].vertical, TOL, "hv");

    assert(tree.get_level(1) == (Paths{"a", "h", "v", "d"}));
    assert(tree.get_level(1, PacketOrder::freq) == (Paths{"a", "v", "h", "d"}));
    auto const freq2 = tree.get_level(2, PacketOrder::freq);
    assert(freq2.size() == 16);
    assert(freq2[4] == "ah");
    assert(freq2[15] == "da");
    std::cout << "  test_2d_nodes passed." << std::endl;
}

static void test_2d_reconstruct() {
    for (auto mode : {PaddingMode::zero, PaddingMode::reflect, PaddingMode::boundary}) {
        auto const w = make_wavelet("db2");
        bool const boundary = mode == PaddingMode::boundary;
        auto x = torch::randn({2, boundary ? 32 : 30, boundary ? 48 : 37}, torch::kFloat64);

        WaveletPacket2D tree(x, w, mode, 2);
        assert_close(tree.reconstruct(), x, 1e-9, "2-D reconstruct " + to_string(mode));
    }

    auto const haar = make_wavelet("haar");
    auto x = torch::randn({16, 16}, torch::kFloat64);
    auto lazy = WaveletPacket2D::create_empty(haar, PaddingMode::boundary);
    lazy.transform(x, 2, /*lazy=*/true);
    WaveletPacket2D zero(x, haar, PaddingMode::zero, 2);
    assert_close(lazy["dv"], zero["dv"], TOL, "haar boundary dv");
    assert(lazy.node_count() == 1 + 4 + 4);
    assert_close(lazy.reconstruct(), x, 1e-9, "lazy 2-D reconstruct");
    std::cout << "  test_2d_reconstruct passed." << std::endl;
}

static void test_2d_validation() {
    auto const haar = make_wavelet("haar");
    assert(throws_as<std::invalid_argument>([&] {
        WaveletPacket2D tree(torch::randn({16}, torch::kFloat64), haar);
    }));
    auto tree = WaveletPacket2D::create_empty(haar);
    assert(throws_as<TreeNotBuiltError>([&] { tree["a"]; }));
    tree.transform(torch::randn({8, 8}, torch::kFloat64), 1);
    assert(throws_as<PathKeyError>([&] { tree["aa"]; }));
    assert(throws_as<PathKeyError>([&] { tree["x"]; }));
    std::cout << "  test_2d_validation passed." << std::endl;
}

int main() {
    torch::manual_seed(0);

    test_graycode_order();
    test_freq_order_2d();
    test_worked_example();
    test_nodes_follow_wavedec();
    test_access_errors();
    test_level_selection();
    test_lazy_matches_eager();
    test_retransform();
    test_retransform_2d();
    test_reconstruct();
    test_boundary_tree();
    test_2d_nodes();
    test_2d_reconstruct();
    test_2d_validation();

    std::cout << "All packet tests passed." << std::endl;
    return 0;
}
