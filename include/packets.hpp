#pragma once

#include <torch/torch.h>

#include "matrix_transform.hpp"
#include "orthogonalize.hpp"
#include "padding.hpp"
#include "wavelet.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/// Order of the paths returned by get_level.
///   natural - path-lexicographic in alphabet order (aa, ad, da, dd)
///   freq    - ascending frequency (Gray code order: aa, ad, dd, da)
enum class PacketOrder { natural, freq };

/// 1-D frequency order of the depth-level paths over the symbols {x, y}.
/// Level 0 yields the root path only.
std::vector<std::string> get_graycode_order(int64_t level, char x = 'a', char y = 'd');

/// 2-D frequency order of the depth-level paths over {a, h, v, d}.
/// Row r holds the packets of the r-th lowest height frequency, ordered by
/// ascending width frequency.
std::vector<std::vector<std::string>> get_freq_order(int64_t level);

/// A node in the packet tree arena.
struct PacketNode {
    std::string path;
    int64_t depth;
    int64_t parent;          // index of the parent node, -1 for the root
    torch::Tensor data;
};

/// Path-addressed wavelet packet tree. Every node at depth < max_level splits
/// into one child per alphabet symbol by a single transform level.
///
/// The tree starts Empty and is Built by transform(). Transforming again
/// discards every node. Nodes are materialized eagerly by transform(), or on
/// first access when transform() is called with lazy = true.
class WaveletPacketTree {
public:
    virtual ~WaveletPacketTree() = default;

    /// Node tensor at path. Materializes missing ancestors of lazily built trees.
    /// Throws TreeNotBuiltError before transform(), PathKeyError for a path
    /// deeper than max_level or with a symbol outside the alphabet.
    torch::Tensor operator[](std::string const& path);
    torch::Tensor at(std::string const& path) { return (*this)[path]; }

    /// True if the node at path has been materialized.
    bool contains(std::string const& path) const;

    /// All paths at the given depth. freq order is the Gray code order in 1-D
    /// and the row-major frequency grid of get_freq_order in 2-D.
    std::vector<std::string> get_level(int64_t level, PacketOrder order = PacketOrder::natural) const;

    /// Rebuild every inner node from its children, deepest level first, and
    /// return the root. Leaf tensors modified in place are picked up.
    torch::Tensor reconstruct();

    bool built() const { return built_; }
    int64_t max_level() const;
    size_t node_count() const { return nodes_.size(); }
    std::string const& alphabet() const { return alphabet_; }
    Wavelet const& wavelet() const { return wavelet_; }
    PaddingMode mode() const { return mode_; }
    OrthMethod orth_method() const { return orth_method_; }

protected:
    WaveletPacketTree(Wavelet wavelet, PaddingMode mode, OrthMethod orth_method, std::string alphabet);

    /// Discard all nodes and store the new root.
    void reset(torch::Tensor const& data, int64_t max_level, bool lazy);

    /// One transform level: one child tensor per alphabet symbol, in alphabet order.
    virtual std::vector<torch::Tensor> split(torch::Tensor const& data) = 0;

    /// Inverse of split, trimmed to parent_shape.
    virtual torch::Tensor merge(std::vector<torch::Tensor> const& children, torch::IntArrayRef parent_shape) = 0;

    virtual std::vector<std::string> freq_level(int64_t level) const = 0;

    Wavelet wavelet_;
    PaddingMode mode_;
    OrthMethod orth_method_;

private:
    void check_built() const;
    int64_t materialize(std::string const& path);
    void expand(int64_t node_index);

    std::string alphabet_;
    bool built_ = false;
    int64_t max_level_ = 0;
    std::vector<PacketNode> nodes_;
    std::unordered_map<std::string, int64_t> index_;
};

/// 1-D wavelet packet tree over the last dimension, alphabet {a, d}.
class WaveletPacket : public WaveletPacketTree {
public:
    /// Empty tree; call transform() before accessing nodes.
    explicit WaveletPacket(
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        OrthMethod orth_method = OrthMethod::qr);

    /// Same as an empty tree followed by transform(data, max_level).
    WaveletPacket(
        torch::Tensor const& data,
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        int64_t max_level = -1,
        OrthMethod orth_method = OrthMethod::qr);

    static WaveletPacket create_empty(
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        OrthMethod orth_method = OrthMethod::qr);

    /// Rebuild the tree for data: [..., N].
    /// max_level = -1 selects max(dwt_max_level(N, L), 1). Boundary mode keeps
    /// that bound and lowers it to the deepest level the matrices support.
    WaveletPacket& transform(torch::Tensor const& data, int64_t max_level = -1, bool lazy = false);

protected:
    std::vector<torch::Tensor> split(torch::Tensor const& data) override;
    torch::Tensor merge(std::vector<torch::Tensor> const& children, torch::IntArrayRef parent_shape) override;
    std::vector<std::string> freq_level(int64_t level) const override;

private:
    std::optional<MatrixWavedec> matrix_wavedec_;
    std::optional<MatrixWaverec> matrix_waverec_;
};

/// 2-D wavelet packet tree over the last two dimensions, alphabet {a, h, v, d}.
class WaveletPacket2D : public WaveletPacketTree {
public:
    explicit WaveletPacket2D(
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        OrthMethod orth_method = OrthMethod::qr);

    WaveletPacket2D(
        torch::Tensor const& data,
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        int64_t max_level = -1,
        OrthMethod orth_method = OrthMethod::qr);

    static WaveletPacket2D create_empty(
        Wavelet wavelet,
        PaddingMode mode = PaddingMode::reflect,
        OrthMethod orth_method = OrthMethod::qr);

    /// Rebuild the tree for data: [..., H, W].
    /// max_level = -1 selects max(dwt_max_level(min(H, W), L), 1). Boundary
    /// mode keeps that bound and lowers it to the deepest level the matrices
    /// support.
    WaveletPacket2D& transform(torch::Tensor const& data, int64_t max_level = -1, bool lazy = false);

protected:
    std::vector<torch::Tensor> split(torch::Tensor const& data) override;
    torch::Tensor merge(std::vector<torch::Tensor> const& children, torch::IntArrayRef parent_shape) override;
    std::vector<std::string> freq_level(int64_t level) const override;

private:
    std::optional<MatrixWavedec2> matrix_wavedec_;
    std::optional<MatrixWaverec2> matrix_waverec_;
};
