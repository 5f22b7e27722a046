#include "packets.hpp"

#include "conv_transform.hpp"
#include "conv_transform_2d.hpp"
#include "errors.hpp"

#include <algorithm>
#include <map>
#include <utility>

// ========================== Path orderings ==========================

/// All paths of the given length over the alphabet, first symbol slowest.
static std::vector<std::string> natural_paths(std::string const& alphabet, int64_t level) {
    std::vector<std::string> paths = {""};
    for (int64_t l = 0; l < level; ++l) {
        std::vector<std::string> next;
        next.reserve(paths.size() * alphabet.size());
        for (auto const& path : paths) {
            for (char symbol : alphabet) {
                next.push_back(path + symbol);
            }
        }
        paths = std::move(next);
    }
    return paths;
}

std::vector<std::string> get_graycode_order(int64_t level, char x, char y) {
    if (level < 1) {
        return {""};
    }
    // Prepending x keeps the order of the previous level; prepending y walks
    // it backwards, so neighbouring packets differ in a single split.
    std::vector<std::string> order = {std::string(1, x), std::string(1, y)};
    for (int64_t l = 1; l < level; ++l) {
        std::vector<std::string> next;
        next.reserve(order.size() * 2);
        for (auto const& path : order) {
            next.push_back(x + path);
        }
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            next.push_back(y + *it);
        }
        order = std::move(next);
    }
    return order;
}

std::vector<std::vector<std::string>> get_freq_order(int64_t level) {
    // Each 2-D symbol is a (height, width) pair of lowpass/highpass splits:
    // a = (l, l), h = (h, l), v = (l, h), d = (h, h).
    std::map<std::string, std::map<std::string, std::string>> grid;
    for (auto const& path : natural_paths("ahvd", level)) {
        std::string row_path;
        std::string col_path;
        for (char symbol : path) {
            row_path += (symbol == 'h' || symbol == 'd') ? 'h' : 'l';
            col_path += (symbol == 'v' || symbol == 'd') ? 'h' : 'l';
        }
        grid[row_path][col_path] = path;
    }

    auto const graycode = get_graycode_order(level, 'l', 'h');
    std::vector<std::vector<std::string>> result;
    result.reserve(graycode.size());
    for (auto const& row_path : graycode) {
        auto const& row = grid.at(row_path);
        std::vector<std::string> ordered_row;
        ordered_row.reserve(graycode.size());
        for (auto const& col_path : graycode) {
            ordered_row.push_back(row.at(col_path));
        }
        result.push_back(std::move(ordered_row));
    }
    return result;
}

// ========================== Tree arena ==========================

WaveletPacketTree::WaveletPacketTree(
    Wavelet wavelet,
    PaddingMode mode,
    OrthMethod orth_method,
    std::string alphabet)
    : wavelet_(std::move(wavelet)),
      mode_(mode),
      orth_method_(orth_method),
      alphabet_(std::move(alphabet)) {}

void WaveletPacketTree::check_built() const {
    if (!built_) {
        throw TreeNotBuiltError("The wavelet packet tree has not been built; call transform() first");
    }
}

int64_t WaveletPacketTree::max_level() const {
    check_built();
    return max_level_;
}

void WaveletPacketTree::reset(torch::Tensor const& data, int64_t max_level, bool lazy) {
    nodes_.clear();
    index_.clear();
    max_level_ = max_level;
    built_ = true;

    nodes_.push_back(PacketNode{.path = "", .depth = 0, .parent = -1, .data = data});
    index_.emplace("", 0);

    if (lazy) {
        return;
    }
    // Breadth-first: nodes_ grows while it is walked.
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].depth < max_level_) {
            expand(static_cast<int64_t>(i));
        }
    }
}

void WaveletPacketTree::expand(int64_t node_index) {
    // Copies: nodes_ may reallocate below.
    auto const parent_data = nodes_[node_index].data;
    auto const parent_path = nodes_[node_index].path;
    int64_t const depth = nodes_[node_index].depth + 1;

    auto children = split(parent_data);
    for (size_t k = 0; k < alphabet_.size(); ++k) {
        auto path = parent_path + alphabet_[k];
        index_.emplace(path, static_cast<int64_t>(nodes_.size()));
        nodes_.push_back(PacketNode{
            .path = std::move(path),
            .depth = depth,
            .parent = node_index,
            .data = children[k],
        });
    }
}

int64_t WaveletPacketTree::materialize(std::string const& path) {
    auto it = index_.find(path);
    if (it != index_.end()) {
        return it->second;
    }
    int64_t const parent = materialize(path.substr(0, path.size() - 1));
    expand(parent);
    return index_.at(path);
}

torch::Tensor WaveletPacketTree::operator[](std::string const& path) {
    check_built();
    if (static_cast<int64_t>(path.size()) > max_level_) {
        throw PathKeyError(
            "Path '" + path + "' is deeper than the tree's max level " + std::to_string(max_level_));
    }
    if (path.find_first_not_of(alphabet_) != std::string::npos) {
        throw PathKeyError("Path '" + path + "' contains symbols outside '" + alphabet_ + "'");
    }
    return nodes_[materialize(path)].data;
}

bool WaveletPacketTree::contains(std::string const& path) const {
    return index_.count(path) > 0;
}

std::vector<std::string> WaveletPacketTree::get_level(int64_t level, PacketOrder order) const {
    check_built();
    if (level < 0 || level > max_level_) {
        throw PathKeyError(
            "Level " + std::to_string(level) + " is outside [0, " + std::to_string(max_level_) + "]");
    }
    if (order == PacketOrder::freq) {
        return freq_level(level);
    }
    return natural_paths(alphabet_, level);
}

torch::Tensor WaveletPacketTree::reconstruct() {
    check_built();
    for (auto const& path : natural_paths(alphabet_, max_level_)) {
        materialize(path);
    }

    for (int64_t level = max_level_ - 1; level >= 0; --level) {
        for (auto const& path : natural_paths(alphabet_, level)) {
            std::vector<torch::Tensor> children;
            children.reserve(alphabet_.size());
            for (char symbol : alphabet_) {
                children.push_back(nodes_[index_.at(path + symbol)].data);
            }
            auto& node = nodes_[index_.at(path)];
            node.data = merge(children, node.data.sizes());
        }
    }
    return nodes_[index_.at("")].data;
}

// ========================== 1-D tree ==========================

WaveletPacket::WaveletPacket(Wavelet wavelet, PaddingMode mode, OrthMethod orth_method)
    : WaveletPacketTree(std::move(wavelet), mode, orth_method, "ad") {
    if (mode_ == PaddingMode::boundary) {
        matrix_wavedec_.emplace(wavelet_, 1, orth_method_);
        matrix_waverec_.emplace(wavelet_, orth_method_);
    }
}

WaveletPacket::WaveletPacket(
    torch::Tensor const& data,
    Wavelet wavelet,
    PaddingMode mode,
    int64_t max_level,
    OrthMethod orth_method)
    : WaveletPacket(std::move(wavelet), mode, orth_method) {
    transform(data, max_level);
}

WaveletPacket WaveletPacket::create_empty(Wavelet wavelet, PaddingMode mode, OrthMethod orth_method) {
    return WaveletPacket(std::move(wavelet), mode, orth_method);
}

WaveletPacket& WaveletPacket::transform(torch::Tensor const& data, int64_t max_level, bool lazy) {
    if (data.dim() < 1) {
        throw std::invalid_argument("data must have at least 1 dimension");
    }
    int64_t const N = data.size(-1);
    int64_t const level = mode_ == PaddingMode::boundary
        ? resolve_matrix_level({N}, max_level, wavelet_.dec_len())
        : resolve_level(N, wavelet_.dec_len(), max_level);
    reset(data, level, lazy);
    return *this;
}

std::vector<torch::Tensor> WaveletPacket::split(torch::Tensor const& data) {
    if (matrix_wavedec_) {
        return (*matrix_wavedec_)(data);
    }
    return wavedec(data, wavelet_, 1, mode_);
}

torch::Tensor WaveletPacket::merge(std::vector<torch::Tensor> const& children, torch::IntArrayRef parent_shape) {
    auto rec = matrix_waverec_ ? (*matrix_waverec_)(children) : waverec(children, wavelet_, mode_);
    return rec.narrow(-1, 0, parent_shape.back());
}

std::vector<std::string> WaveletPacket::freq_level(int64_t level) const {
    return get_graycode_order(level);
}

// ========================== 2-D tree ==========================

WaveletPacket2D::WaveletPacket2D(Wavelet wavelet, PaddingMode mode, OrthMethod orth_method)
    : WaveletPacketTree(std::move(wavelet), mode, orth_method, "ahvd") {
    if (mode_ == PaddingMode::boundary) {
        matrix_wavedec_.emplace(wavelet_, 1, orth_method_);
        matrix_waverec_.emplace(wavelet_, orth_method_);
    }
}

WaveletPacket2D::WaveletPacket2D(
    torch::Tensor const& data,
    Wavelet wavelet,
    PaddingMode mode,
    int64_t max_level,
    OrthMethod orth_method)
    : WaveletPacket2D(std::move(wavelet), mode, orth_method) {
    transform(data, max_level);
}

WaveletPacket2D WaveletPacket2D::create_empty(Wavelet wavelet, PaddingMode mode, OrthMethod orth_method) {
    return WaveletPacket2D(std::move(wavelet), mode, orth_method);
}

WaveletPacket2D& WaveletPacket2D::transform(torch::Tensor const& data, int64_t max_level, bool lazy) {
    if (data.dim() < 2) {
        throw std::invalid_argument("data must have at least 2 dimensions");
    }
    int64_t const H = data.size(-2);
    int64_t const W = data.size(-1);
    int64_t const level = mode_ == PaddingMode::boundary
        ? resolve_matrix_level({H, W}, max_level, wavelet_.dec_len())
        : resolve_level(std::min(H, W), wavelet_.dec_len(), max_level);
    reset(data, level, lazy);
    return *this;
}

std::vector<torch::Tensor> WaveletPacket2D::split(torch::Tensor const& data) {
    auto coeffs = matrix_wavedec_ ? (*matrix_wavedec_)(data) : wavedec2(data, wavelet_, 1, mode_);
    auto const& details = coeffs.details.front();
    return {coeffs.approx, details.horizontal, details.vertical, details.diagonal};
}

torch::Tensor WaveletPacket2D::merge(std::vector<torch::Tensor> const& children, torch::IntArrayRef parent_shape) {
    Coefficients2D const coeffs{
        .approx = children[0],
        .details = {DetailCoefficients2D{
            .horizontal = children[1],
            .vertical = children[2],
            .diagonal = children[3],
        }},
    };
    auto rec = matrix_waverec_ ? (*matrix_waverec_)(coeffs) : waverec2(coeffs, wavelet_, mode_);
    int64_t const ndim = static_cast<int64_t>(parent_shape.size());
    return rec.narrow(-2, 0, parent_shape[ndim - 2]).narrow(-1, 0, parent_shape[ndim - 1]);
}

std::vector<std::string> WaveletPacket2D::freq_level(int64_t level) const {
    std::vector<std::string> paths;
    for (auto const& row : get_freq_order(level)) {
        paths.insert(paths.end(), row.begin(), row.end());
    }
    return paths;
}
