#include "padding.hpp"

#include "errors.hpp"

#include <algorithm>
#include <string>

namespace F = torch::nn::functional;

PaddingMode parse_padding_mode(std::string const& name) {
    if (name == "zero") return PaddingMode::zero;
    if (name == "constant") return PaddingMode::constant;
    if (name == "reflect") return PaddingMode::reflect;
    if (name == "periodic") return PaddingMode::periodic;
    if (name == "boundary") return PaddingMode::boundary;
    throw InvalidPaddingMode("Padding mode not supported: " + name);
}

std::string to_string(PaddingMode mode) {
    switch (mode) {
        case PaddingMode::zero: return "zero";
        case PaddingMode::constant: return "constant";
        case PaddingMode::reflect: return "reflect";
        case PaddingMode::periodic: return "periodic";
        case PaddingMode::boundary: return "boundary";
    }
    throw std::logic_error("Invalid PaddingMode");
}

std::pair<int64_t, int64_t> get_pad(int64_t data_len, int64_t filt_len) {
    int64_t const padl = (2 * filt_len - 3) / 2;
    int64_t padr = (2 * filt_len - 3) / 2;
    // Pad to an even length so the stride-2 convolution sees every sample.
    if (data_len % 2 != 0) {
        padr += 1;
    }
    return {padl, padr};
}

torch::Tensor fwt_pad(
    torch::Tensor const& data,
    int64_t filt_len,
    PaddingMode mode) {

    if (mode == PaddingMode::boundary) {
        throw InvalidPaddingMode("The boundary mode does not pad; use the matrix transform");
    }

    int64_t const len = data.size(-1);
    auto const [padl, padr] = get_pad(len, filt_len);
    if (padl == 0 && padr == 0) {
        return data;
    }
    if (mode == PaddingMode::reflect && std::max(padl, padr) >= len) {
        throw LevelRangeError(
            "Signal length " + std::to_string(len) + " is too short to reflect-pad by " +
            std::to_string(std::max(padl, padr)) + " for filter length " + std::to_string(filt_len));
    }

    auto opts = F::PadFuncOptions({padl, padr});
    switch (mode) {
        case PaddingMode::zero:
            return F::pad(data, opts.mode(torch::kConstant).value(0.0));
        case PaddingMode::constant:
            return F::pad(data, opts.mode(torch::kReplicate));
        case PaddingMode::reflect:
            return F::pad(data, opts.mode(torch::kReflect));
        case PaddingMode::periodic:
            return F::pad(data, opts.mode(torch::kCircular));
        case PaddingMode::boundary:
            break;
    }
    throw std::logic_error("Invalid PaddingMode");
}
