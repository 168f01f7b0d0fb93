#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/dense.hpp"

#include <string>
#include <vector>

// =============================================================================
/// @file h5ad.hpp
/// @brief Expression matrix loader for AnnData (.h5ad) files
///
/// AnnData stores X as observations x variables (cells x genes). The loader
/// returns the transpose, genes x samples, row-major, which is the layout
/// the pairwise kernels consume.
///
/// Supported X encodings:
///   - dense 2-D dataset of any integer or float type
///   - group with encoding-type csr_matrix or csc_matrix
///     (datasets data, indices, indptr and a shape attribute)
///
/// Gene names are read from var/<var._index>, falling back to var/_index.
// =============================================================================

namespace gvmi::io {

/// @brief Owning genes x samples expression matrix with gene labels.
struct ExpressionData {
    std::vector<Real> values;        // row-major [n_genes x n_samples]
    std::vector<std::string> genes;  // [n_genes]
    Size n_samples = 0;

    [[nodiscard]] Size n_genes() const noexcept { return genes.size(); }

    [[nodiscard]] DenseArray<const Real> matrix() const noexcept {
        return DenseArray<const Real>(values.data(),
                                      static_cast<Index>(genes.size()),
                                      static_cast<Index>(n_samples));
    }
};

/// @brief Load X and var names from an .h5ad file.
///
/// @param path      Path to the .h5ad file
/// @param max_genes Keep only the first max_genes genes (0 keeps all)
///
/// @throws FileNotFoundError path does not exist
/// @throws ReadError         not an HDF5 file, or X / var layout is malformed
/// @throws TypeError         X holds non-numeric data
GVMI_EXPORT ExpressionData load_h5ad(const std::string& path, Size max_genes = 0);

} // namespace gvmi::io
