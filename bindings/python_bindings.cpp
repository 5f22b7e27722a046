#include "conv_transform.hpp"
#include "conv_transform_2d.hpp"
#include "errors.hpp"
#include "matrix_transform.hpp"
#include "packets.hpp"
#include "wavelet.hpp"

#include <torch/extension.h>
#include <pybind11/stl.h>

#include <tuple>

namespace {

using DetailTuple = std::tuple<torch::Tensor, torch::Tensor, torch::Tensor>;

std::vector<torch::Tensor> wavedec_wrapper(
    torch::Tensor const& data,
    std::string const& wavelet_name,
    int64_t level,
    std::string const& mode,
    std::string const& orth_method) {
    return wavedec(
        data, make_wavelet(wavelet_name), level,
        parse_padding_mode(mode), parse_orth_method(orth_method));
}

torch::Tensor waverec_wrapper(
    std::vector<torch::Tensor> const& coeffs,
    std::string const& wavelet_name,
    std::string const& mode,
    std::string const& orth_method) {
    return waverec(
        coeffs, make_wavelet(wavelet_name),
        parse_padding_mode(mode), parse_orth_method(orth_method));
}

/// Returned as (approx, [(horizontal, vertical, diagonal), ...]), coarsest first.
std::tuple<torch::Tensor, std::vector<DetailTuple>> wavedec2_wrapper(
    torch::Tensor const& data,
    std::string const& wavelet_name,
    int64_t level,
    std::string const& mode,
    std::string const& orth_method) {
    auto coeffs = wavedec2(
        data, make_wavelet(wavelet_name), level,
        parse_padding_mode(mode), parse_orth_method(orth_method));
    std::vector<DetailTuple> details;
    details.reserve(coeffs.details.size());
    for (auto const& d : coeffs.details) {
        details.emplace_back(d.horizontal, d.vertical, d.diagonal);
    }
    return {coeffs.approx, details};
}

torch::Tensor waverec2_wrapper(
    torch::Tensor const& approx,
    std::vector<DetailTuple> const& details,
    std::string const& wavelet_name,
    std::string const& mode,
    std::string const& orth_method) {
    Coefficients2D coeffs{.approx = approx, .details = {}};
    coeffs.details.reserve(details.size());
    for (auto const& [h, v, d] : details) {
        coeffs.details.push_back(DetailCoefficients2D{.horizontal = h, .vertical = v, .diagonal = d});
    }
    return waverec2(
        coeffs, make_wavelet(wavelet_name),
        parse_padding_mode(mode), parse_orth_method(orth_method));
}

PacketOrder parse_packet_order(std::string const& order) {
    if (order == "natural") return PacketOrder::natural;
    if (order == "freq") return PacketOrder::freq;
    throw std::invalid_argument("Unknown packet order '" + order + "'; expected 'natural' or 'freq'");
}

/// Tree methods shared by the 1-D and 2-D packet classes.
template <typename Tree>
void def_tree_methods(py::class_<Tree>& cls) {
    cls.def(py::init([](std::string const& wavelet_name, std::string const& mode, std::string const& orth_method) {
                return Tree::create_empty(
                    make_wavelet(wavelet_name), parse_padding_mode(mode), parse_orth_method(orth_method));
            }),
            "Empty tree; call transform() before indexing",
            py::arg("wavelet_name"),
            py::arg("mode") = "reflect",
            py::arg("orth_method") = "qr")
        .def("transform",
             [](Tree& tree, torch::Tensor const& data, int64_t max_level, bool lazy) -> Tree& {
                 return tree.transform(data, max_level, lazy);
             },
             py::return_value_policy::reference_internal,
             py::arg("data"),
             py::arg("max_level") = -1,
             py::arg("lazy") = false)
        .def("__getitem__", [](Tree& tree, std::string const& path) { return tree[path]; })
        .def("__contains__", [](Tree const& tree, std::string const& path) { return tree.contains(path); })
        .def("get_level",
             [](Tree const& tree, int64_t level, std::string const& order) {
                 return tree.get_level(level, parse_packet_order(order));
             },
             py::arg("level"),
             py::arg("order") = "natural")
        .def("reconstruct", [](Tree& tree) { return tree.reconstruct(); })
        .def_property_readonly("max_level", [](Tree const& tree) { return tree.max_level(); })
        .def_property_readonly("built", [](Tree const& tree) { return tree.built(); })
        .def("__len__", [](Tree const& tree) { return tree.node_count(); });
}

}  // namespace

PYBIND11_MODULE(wavepack, m) {
    m.doc() = "Batched wavelet transforms and wavelet packets, C++ / LibTorch implementation";

    // Argument errors surface as ValueError subclasses, unknown packet paths as KeyError.
    py::register_exception<InvalidPaddingMode>(m, "InvalidPaddingMode", PyExc_ValueError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<LevelRangeError>(m, "LevelRangeError", PyExc_ValueError);
    py::register_exception<TreeNotBuiltError>(m, "TreeNotBuiltError", PyExc_ValueError);
    py::register_exception<PathKeyError>(m, "PathKeyError", PyExc_KeyError);

    m.def("wavedec", &wavedec_wrapper,
          "Multi-level 1-D wavelet decomposition along the last dimension",
          py::arg("data"),
          py::arg("wavelet_name"),
          py::arg("level") = -1,
          py::arg("mode") = "reflect",
          py::arg("orth_method") = "qr");

    m.def("waverec", &waverec_wrapper,
          "Multi-level 1-D wavelet reconstruction",
          py::arg("coeffs"),
          py::arg("wavelet_name"),
          py::arg("mode") = "reflect",
          py::arg("orth_method") = "qr");

    m.def("wavedec2", &wavedec2_wrapper,
          "Multi-level 2-D wavelet decomposition along the last two dimensions",
          py::arg("data"),
          py::arg("wavelet_name"),
          py::arg("level") = -1,
          py::arg("mode") = "reflect",
          py::arg("orth_method") = "qr");

    m.def("waverec2", &waverec2_wrapper,
          "Multi-level 2-D wavelet reconstruction",
          py::arg("approx"),
          py::arg("details"),
          py::arg("wavelet_name"),
          py::arg("mode") = "reflect",
          py::arg("orth_method") = "qr");

    m.def("dwt_max_level", &dwt_max_level,
          "Maximum useful decomposition level for a signal and filter length",
          py::arg("data_len"),
          py::arg("filt_len"));

    m.def("compute_max_level", &compute_max_level,
          "Maximum feasible boundary-matrix decomposition level",
          py::arg("signal_length"),
          py::arg("dec_len"));

    m.def("get_freq_order", &get_freq_order,
          "2-D wavelet packet paths arranged by frequency",
          py::arg("level"));

    py::class_<WaveletPacket> packet(m, "WaveletPacket");
    packet.def(py::init([](torch::Tensor const& data, std::string const& wavelet_name,
                           std::string const& mode, int64_t max_level, std::string const& orth_method) {
                   return WaveletPacket(
                       data, make_wavelet(wavelet_name), parse_padding_mode(mode),
                       max_level, parse_orth_method(orth_method));
               }),
               py::arg("data"),
               py::arg("wavelet_name"),
               py::arg("mode") = "reflect",
               py::arg("max_level") = -1,
               py::arg("orth_method") = "qr");
    def_tree_methods(packet);

    py::class_<WaveletPacket2D> packet_2d(m, "WaveletPacket2D");
    packet_2d.def(py::init([](torch::Tensor const& data, std::string const& wavelet_name,
                              std::string const& mode, int64_t max_level, std::string const& orth_method) {
                      return WaveletPacket2D(
                          data, make_wavelet(wavelet_name), parse_padding_mode(mode),
                          max_level, parse_orth_method(orth_method));
                  }),
                  py::arg("data"),
                  py::arg("wavelet_name"),
                  py::arg("mode") = "reflect",
                  py::arg("max_level") = -1,
                  py::arg("orth_method") = "qr");
    def_tree_methods(packet_2d);
}
