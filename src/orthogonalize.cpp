#include "orthogonalize.hpp"

#include "errors.hpp"
#include "sparse_math.hpp"

#include <vector>

OrthMethod parse_orth_method(std::string const& name) {
    if (name == "qr") return OrthMethod::qr;
    if (name == "gramschmidt") return OrthMethod::gramschmidt;
    throw ConfigurationError("Unknown orthogonalization method: " + name);
}

std::string to_string(OrthMethod method) {
    switch (method) {
        case OrthMethod::qr: return "qr";
        case OrthMethod::gramschmidt: return "gramschmidt";
    }
    throw std::logic_error("Invalid OrthMethod");
}

/// Interior rows each carry exactly filt_len non-zeros; rows cut off by the
/// signal edges carry fewer.
torch::Tensor find_boundary_rows(
    torch::Tensor const& matrix,
    int64_t filt_len) {

    auto coalesced = matrix.coalesce();
    auto row_indices = coalesced.indices()[0];
    auto [unique, inverse, counts] = at::unique_consecutive(row_indices,
        /*return_inverse=*/false, /*return_counts=*/true);
    return unique.index({counts != filt_len});
}

torch::Tensor orth_by_qr(
    torch::Tensor const& matrix,
    torch::Tensor const& boundary_rows) {

    if (boundary_rows.numel() == 0) {
        return matrix;
    }

    // The boundary block is [num_boundary, N] with num_boundary << N, so a
    // dense QR of its transpose is cheap. Q^T holds the new rows.
    auto block = sparse_select_rows(matrix, boundary_rows).to_dense();
    auto [q, r] = torch::linalg_qr(block.t());
    return sparse_replace_rows(matrix, boundary_rows, q.t());
}

torch::Tensor orth_by_gram_schmidt(
    torch::Tensor const& matrix,
    torch::Tensor const& boundary_rows) {

    if (boundary_rows.numel() == 0) {
        return matrix;
    }

    auto block = sparse_select_rows(matrix, boundary_rows).to_dense();

    // Each row loses its projections onto the rows already processed and is
    // then normalized.
    std::vector<torch::Tensor> basis;
    basis.reserve(block.size(0));
    for (int64_t i = 0; i < block.size(0); ++i) {
        auto const row = block[i];
        auto orthogonal = row;
        for (auto const& done : basis) {
            orthogonal = orthogonal - torch::dot(row, done) * done;
        }
        basis.push_back(orthogonal / orthogonal.norm());
    }

    return sparse_replace_rows(matrix, boundary_rows, torch::stack(basis));
}

torch::Tensor orthogonalize(
    torch::Tensor const& matrix,
    int64_t filt_len,
    OrthMethod method) {

    auto boundary = find_boundary_rows(matrix, filt_len);

    if (boundary.numel() == 0) {
        return matrix;
    }

    switch (method) {
        case OrthMethod::qr:
            return orth_by_qr(matrix, boundary);
        case OrthMethod::gramschmidt:
            return orth_by_gram_schmidt(matrix, boundary);
    }
    throw std::logic_error("Invalid OrthMethod");
}
