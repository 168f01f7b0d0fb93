// =============================================================================
// FILE: gvmi/io/h5ad.cpp
// BRIEF: AnnData X / var loader
// =============================================================================

#include "gvmi/io/h5ad.hpp"
#include "gvmi/io/hdf5.hpp"
#include "gvmi/core/error.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <tuple>
#include <utility>

namespace gvmi::io {

namespace {

constexpr const char* DEFAULT_VAR_INDEX = "_index";

enum class SparseLayout { CSR, CSC };

std::vector<std::string> read_var_names(const h5::File& file) {
    if (!file.is_group("var")) {
        throw ReadError("h5ad: missing 'var' group");
    }
    h5::Group var = file.open_group("var");

    std::string index_name = DEFAULT_VAR_INDEX;
    if (var.has_attr("_index")) {
        index_name = var.read_attr_string("_index");
    }
    if (!var.exists(index_name)) {
        throw ReadError("h5ad: gene names dataset 'var/" + index_name + "' not found");
    }
    return var.open_dataset(index_name).read_strings();
}

SparseLayout sparse_layout(const h5::Group& x) {
    std::string encoding;
    if (x.has_attr("encoding-type")) {
        encoding = x.read_attr_string("encoding-type");
    } else if (x.has_attr("h5sparse_format")) {
        encoding = x.read_attr_string("h5sparse_format");
    }

    if (encoding == "csr_matrix" || encoding == "csr") return SparseLayout::CSR;
    if (encoding == "csc_matrix" || encoding == "csc") return SparseLayout::CSC;
    throw ReadError("h5ad: unsupported X encoding '" + encoding + "'");
}

std::pair<Size, Size> sparse_shape(const h5::Group& x) {
    const char* attr = x.has_attr("shape") ? "shape" : "h5sparse_shape";
    if (!x.has_attr(attr)) {
        throw ReadError("h5ad: sparse X has no shape attribute");
    }
    std::vector<std::int64_t> shape = x.read_attr_vector<std::int64_t>(attr);
    if (shape.size() != 2 || shape[0] < 0 || shape[1] < 0) {
        throw ReadError("h5ad: sparse X shape must have two non-negative entries");
    }
    return {static_cast<Size>(shape[0]), static_cast<Size>(shape[1])};
}

// X (obs x var, compressed) -> out (kept genes x obs, dense)
void densify_sparse(const h5::Group& x, Size n_obs, Size n_var, Size n_keep,
                    std::vector<Real>& out) {
    const SparseLayout layout = sparse_layout(x);
    const std::vector<Real> data = x.open_dataset("data").read_vector<Real>();
    const std::vector<std::int64_t> indices = x.open_dataset("indices").read_vector<std::int64_t>();
    const std::vector<std::int64_t> indptr = x.open_dataset("indptr").read_vector<std::int64_t>();

    const Size n_major = (layout == SparseLayout::CSR) ? n_obs : n_var;
    const Size n_minor = (layout == SparseLayout::CSR) ? n_var : n_obs;

    if (indptr.size() != n_major + 1) {
        throw ReadError("h5ad: indptr has " + std::to_string(indptr.size()) +
                        " entries, expected " + std::to_string(n_major + 1));
    }
    if (data.size() != indices.size()) {
        throw ReadError("h5ad: data and indices lengths differ");
    }

    const Size limit = (layout == SparseLayout::CSR) ? n_major : std::min(n_major, n_keep);
    for (Size m = 0; m < limit; ++m) {
        const std::int64_t begin = indptr[m];
        const std::int64_t end = indptr[m + 1];
        if (begin < 0 || end < begin || static_cast<Size>(end) > data.size()) {
            throw ReadError("h5ad: indptr is not monotonic or exceeds data length");
        }
        for (std::int64_t k = begin; k < end; ++k) {
            const std::int64_t minor = indices[static_cast<Size>(k)];
            if (minor < 0 || static_cast<Size>(minor) >= n_minor) {
                throw ReadError("h5ad: column index out of range in X");
            }
            const Size obs = (layout == SparseLayout::CSR) ? m : static_cast<Size>(minor);
            const Size gene = (layout == SparseLayout::CSR) ? static_cast<Size>(minor) : m;
            if (gene < n_keep) {
                out[gene * n_obs + obs] = data[static_cast<Size>(k)];
            }
        }
    }
}

} // anonymous namespace

ExpressionData load_h5ad(const std::string& path, Size max_genes) {
    if (!std::filesystem::exists(path)) {
        throw FileNotFoundError(path);
    }

    h5::File file(path);
    std::vector<std::string> genes = read_var_names(file);

    if (!file.exists("X")) {
        throw ReadError("h5ad: missing 'X'");
    }

    ExpressionData result;
    Size n_obs = 0;
    Size n_var = 0;

    if (file.is_group("X")) {
        h5::Group x = file.open_group("X");
        std::tie(n_obs, n_var) = sparse_shape(x);
        if (genes.size() != n_var) {
            throw ReadError("h5ad: X has " + std::to_string(n_var) + " variables but var has " +
                            std::to_string(genes.size()) + " names");
        }
        const Size n_keep = (max_genes > 0) ? std::min(max_genes, n_var) : n_var;
        result.values.assign(n_keep * n_obs, Real(0));
        densify_sparse(x, n_obs, n_var, n_keep, result.values);
        genes.resize(n_keep);
    } else {
        h5::Dataset x = file.open_dataset("X");
        const std::vector<hsize_t> dims = x.dims();
        if (dims.size() != 2) {
            throw ReadError("h5ad: dense X must be 2-D, got rank " + std::to_string(dims.size()));
        }
        n_obs = static_cast<Size>(dims[0]);
        n_var = static_cast<Size>(dims[1]);
        if (genes.size() != n_var) {
            throw ReadError("h5ad: X has " + std::to_string(n_var) + " variables but var has " +
                            std::to_string(genes.size()) + " names");
        }
        const Size n_keep = (max_genes > 0) ? std::min(max_genes, n_var) : n_var;

        // Only the leading n_keep columns are read
        std::vector<Real> raw(n_obs * n_keep);
        if (!raw.empty()) {
            x.read_hyperslab(raw.data(), {0, 0},
                             {static_cast<hsize_t>(n_obs), static_cast<hsize_t>(n_keep)});
        }

        result.values.assign(n_keep * n_obs, Real(0));
        for (Size obs = 0; obs < n_obs; ++obs) {
            const Real* src = raw.data() + obs * n_keep;
            for (Size g = 0; g < n_keep; ++g) {
                result.values[g * n_obs + obs] = src[g];
            }
        }
        genes.resize(n_keep);
    }

    result.genes = std::move(genes);
    result.n_samples = n_obs;
    return result;
}

} // namespace gvmi::io
