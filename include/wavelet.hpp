#pragma once

#include <torch/torch.h>

#include <string>
#include <vector>

/// A discrete wavelet defined by its four filter banks.
/// The decomposition (analysis) filters split a signal into lowpass and highpass
/// subbands. The reconstruction (synthesis) filters recombine them.
struct Wavelet {
    std::string name;
    std::vector<double> dec_lo;   // decomposition lowpass  (analysis scaling)
    std::vector<double> dec_hi;   // decomposition highpass (analysis wavelet)
    std::vector<double> rec_lo;   // reconstruction lowpass  (synthesis scaling)
    std::vector<double> rec_hi;   // reconstruction highpass (synthesis wavelet)

    int dec_len() const { return static_cast<int>(dec_lo.size()); }
    int rec_len() const { return static_cast<int>(rec_lo.size()); }
};

/// Anything that can hand out a filter bank in (dec_lo, dec_hi, rec_lo, rec_hi) order.
class FilterBankSource {
public:
    virtual ~FilterBankSource() = default;
    virtual std::vector<std::vector<double>> filter_bank() const = 0;
};

/// User-supplied filters, e.g. unscaled or learned banks.
class CustomFilterBank : public FilterBankSource {
public:
    explicit CustomFilterBank(std::vector<std::vector<double>> filters)
        : filters_(std::move(filters)) {}

    std::vector<std::vector<double>> filter_bank() const override { return filters_; }

private:
    std::vector<std::vector<double>> filters_;
};

/// Four filters as 1-D tensors. Unless a function says otherwise they are in
/// natural PyWavelets order; the transforms flip the decomposition pair
/// themselves. Tensors that require grad receive gradients from any
/// convolution transform they are passed to.
struct FilterTensors {
    torch::Tensor dec_lo;
    torch::Tensor dec_hi;
    torch::Tensor rec_lo;
    torch::Tensor rec_hi;
};

/// Look up a built-in wavelet: "haar"/"db1", "db2".."db5", "sym2", "sym3".
/// Throws ConfigurationError for unknown names.
Wavelet make_wavelet(std::string const& name);

/// Validate a filter bank and wrap it as a Wavelet.
/// Throws ConfigurationError if there are fewer than four filters, or the
/// filters are shorter than two taps or of unequal length.
Wavelet resolve_wavelet(FilterBankSource const& source, std::string const& name = "custom");

/// Convert the filters to tensors with the given dtype/device.
/// With flip = true the decomposition filters are time-reversed so that the
/// cross-correlation computed by conv1d becomes a true convolution.
FilterTensors get_filter_tensors(
    Wavelet const& wavelet,
    bool flip,
    torch::TensorOptions const& opts);

/// True if the bank satisfies the orthogonal perfect-reconstruction conditions:
/// unit-norm analysis filters, orthogonality under even shifts, and synthesis
/// filters equal to the time-reversed analysis filters.
bool is_orthogonal(Wavelet const& wavelet, double tol = 1e-10);

/// Check a tensor bank: four 1-D floating point tensors of one length >= 2.
/// Throws ConfigurationError otherwise.
void check_filter_tensors(FilterTensors const& filters);

/// The bank converted to dtype/device of opts. Differentiable.
FilterTensors cast_filters(FilterTensors const& filters, torch::TensorOptions const& opts);

/// Time-reverse the decomposition pair for use as conv1d kernels.
FilterTensors flip_decomposition(FilterTensors const& filters);

/// Filter bank with trainable coefficients, kept close to an orthogonal
/// wavelet by a penalty instead of a hard constraint.
///
/// The filters are leaf tensors with requires_grad set. Pass filters() to the
/// tensor overloads of wavedec/waverec (or wavedec2/waverec2), add
/// wavelet_loss() to the training objective and optimize parameters().
class SoftOrthogonalWavelet {
public:
    /// Argument order follows the synthesis-first layout of the bank.
    SoftOrthogonalWavelet(
        torch::Tensor const& rec_lo,
        torch::Tensor const& rec_hi,
        torch::Tensor const& dec_lo,
        torch::Tensor const& dec_hi);

    /// Start from a fixed wavelet, e.g. make_wavelet("db4").
    explicit SoftOrthogonalWavelet(
        Wavelet const& init,
        torch::TensorOptions const& opts = torch::TensorOptions().dtype(torch::kFloat64));

    FilterTensors const& filters() const { return filters_; }
    std::vector<torch::Tensor> parameters() const;
    int64_t filter_length() const { return filters_.dec_lo.size(0); }

    /// Squared error of the distortion term, conv(dec_lo, rec_lo) + conv(dec_hi, rec_hi),
    /// against 2 at the centre tap and 0 elsewhere.
    torch::Tensor perfect_reconstruction_loss() const;

    /// Squared norm of the aliasing term of the two-channel bank.
    torch::Tensor alias_cancellation_loss() const;

    /// Squared distance of the synthesis filters from the time-reversed analysis filters.
    torch::Tensor orthogonality_loss() const;

    /// Sum of the three penalties; zero for any orthogonal wavelet.
    torch::Tensor wavelet_loss() const;

private:
    FilterTensors filters_;
};
