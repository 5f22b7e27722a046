#include "sparse_math.hpp"

#include "tensor_util.hpp"

#include <vector>

/// Non-zero pattern of the sameshift convolution matrix: entry (row, col)
/// holds filter[fi]. Rows are filtered through keep_row, which returns the
/// output row index or -1 to drop the row.
template <typename RowMap>
static torch::Tensor conv_matrix_from_pattern(
    torch::Tensor const& filter,
    int64_t input_length,
    int64_t output_rows,
    RowMap keep_row) {

    int64_t const filter_len = filter.size(0);
    int64_t const filter_offset = filter_len % 2;

    // Sameshift centering: the center tap sits on the diagonal. Positions
    // outside [start_row, start_row + input_length) fall off the signal.
    int64_t const start_row = filter_len / 2 - 1 + filter_offset;
    int64_t const stop_row = start_row + input_length - 1;

    std::vector<int64_t> rows;
    std::vector<int64_t> cols;
    std::vector<int64_t> taps;

    for (int64_t col = 0; col < input_length; ++col) {
        for (int64_t fi = 0; fi < filter_len; ++fi) {
            int64_t const pos = fi + col;
            if (pos < start_row || pos > stop_row) continue;
            int64_t const row = keep_row(pos - start_row);
            if (row < 0) continue;
            rows.push_back(row);
            cols.push_back(col);
            taps.push_back(fi);
        }
    }

    auto const long_opts = index_options_like(filter);
    auto indices = torch::stack({
        torch::tensor(rows, long_opts),
        torch::tensor(cols, long_opts)});
    auto values = filter.index({torch::tensor(taps, long_opts)});

    return torch::sparse_coo_tensor(
        indices, values, {output_rows, input_length}, options_like(filter)).coalesce();
}

torch::Tensor construct_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length) {

    return conv_matrix_from_pattern(
        filter, input_length, input_length,
        [](int64_t row) { return row; });
}

torch::Tensor construct_strided_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length,
    int64_t stride) {

    // Row 1 is the first center-aligned output position of the sameshift
    // convolution; every stride-th row after it is kept.
    int64_t const output_rows = input_length / stride;
    return conv_matrix_from_pattern(
        filter, input_length, output_rows,
        [stride, output_rows](int64_t row) -> int64_t {
            if (row < 1 || (row - 1) % stride != 0) return -1;
            int64_t const out = (row - 1) / stride;
            return out < output_rows ? out : -1;
        });
}

torch::Tensor sparse_select_rows(
    torch::Tensor const& matrix,
    torch::Tensor const& rows) {

    int64_t const count = rows.numel();
    auto const opts = options_like(matrix);
    auto const long_opts = index_options_like(matrix);

    auto sel_indices = torch::stack({torch::arange(count, long_opts), rows});
    auto selection = torch::sparse_coo_tensor(
        sel_indices, torch::ones(count, opts), {count, matrix.size(0)}, opts);
    return torch::mm(selection, matrix);
}

torch::Tensor sparse_replace_rows(
    torch::Tensor const& matrix,
    torch::Tensor const& rows,
    torch::Tensor const& dense_rows) {

    int64_t const num_rows = matrix.size(0);
    auto const opts = options_like(matrix);
    auto const long_opts = index_options_like(matrix);

    // Zero the old rows with a diagonal mask.
    auto diag_idx = torch::arange(num_rows, long_opts);
    auto diag_vals = torch::ones(num_rows, opts).index_fill(0, rows, 0.0);
    auto removal = torch::sparse_coo_tensor(
        torch::stack({diag_idx, diag_idx}), diag_vals, {num_rows, num_rows}, opts);
    auto result = torch::mm(removal, matrix);

    // Scatter the new rows in with a [num_rows, count] placement matrix.
    int64_t const count = rows.numel();
    auto place_indices = torch::stack({rows, torch::arange(count, long_opts)});
    auto placement = torch::sparse_coo_tensor(
        place_indices, torch::ones(count, opts), {num_rows, count}, opts);
    auto addition = torch::mm(placement, dense_rows).to_sparse();

    return (result + addition).coalesce();
}
