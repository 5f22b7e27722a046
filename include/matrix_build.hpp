#pragma once

#include <torch/torch.h>

#include "orthogonalize.hpp"
#include "wavelet.hpp"

// Single-level boundary wavelet operators for a subband of `length` samples.
// BoundaryOperatorCache builds one pair per subband length and reuses it for
// every level and every axis of that length.
//
// All builders throw LevelRangeError unless length is even and at least
// wavelet.dec_len(), and return a coalesced sparse COO tensor of shape
// (length, length) with the dtype/device of opts.

/// Raw analysis matrix A: the top length/2 rows convolve with dec_lo, the
/// bottom length/2 rows with dec_hi, both at stride 2. Rows near the edges
/// are truncated and therefore not orthonormal.
torch::Tensor construct_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts);

/// Raw synthesis matrix S, the transpose of the stacked strided convolutions
/// with the time-reversed rec_lo and rec_hi.
torch::Tensor construct_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts);

/// A with its truncated rows orthonormalized by method; the result is
/// orthogonal for orthogonal wavelets.
torch::Tensor construct_boundary_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts,
    OrthMethod method = OrthMethod::qr);

/// Synthesis counterpart of construct_boundary_a; it inverts the boundary A
/// of the same wavelet, length and method.
torch::Tensor construct_boundary_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts,
    OrthMethod method = OrthMethod::qr);
