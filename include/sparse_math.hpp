#pragma once

#include <torch/torch.h>

/// Sparse [N, N] matrix of the full convolution with filter, cut to the N
/// outputs centred on the input ("sameshift"). Taps that fall outside the
/// signal are dropped, so edge rows hold fewer than filter.size(0) entries.
torch::Tensor construct_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length);

/// Every stride-th row of construct_conv_matrix, starting at row 1: the
/// analysis rows of one decomposition level. Shape (input_length / stride, input_length).
torch::Tensor construct_strided_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length,
    int64_t stride);

/// Gather the given rows of a sparse [M, N] matrix into a sparse [rows, N] matrix.
torch::Tensor sparse_select_rows(
    torch::Tensor const& matrix,
    torch::Tensor const& rows);

/// Overwrite the given rows of a sparse [M, N] matrix with a dense [rows, N]
/// block. Returns a new coalesced sparse matrix; the input is not modified.
torch::Tensor sparse_replace_rows(
    torch::Tensor const& matrix,
    torch::Tensor const& rows,
    torch::Tensor const& dense_rows);
