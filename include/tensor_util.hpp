#pragma once

#include <torch/torch.h>

/// Dtype and device of t, without its layout.
/// Filters, matrices and padding tensors are built to match their input, and
/// the sparse constructors reject the Strided layout carried by t.options().
inline torch::TensorOptions options_like(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(t.dtype()).device(t.device());
}

/// int64 index options on the device of t.
inline torch::TensorOptions index_options_like(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(torch::kLong).device(t.device());
}
