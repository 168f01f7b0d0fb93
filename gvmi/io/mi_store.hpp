#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/kernel/mi_table.hpp"

#include <string>

// =============================================================================
// FILE: gvmi/io/mi_store.hpp
// BRIEF: HDF5 persistence of mutual information tables
// =============================================================================
//
// Layout:
//   /mutual_information   float64 [n_genes x n_genes]
//   /genes                vlen utf-8 strings [n_genes]
//   attributes on /       n_genes, n_pairs (int64), computation_time (float64),
//                         timestamp, source (strings), n_bins (int64)
// =============================================================================

namespace gvmi::io {

struct ResultMetadata {
    double computation_time = 0.0;  // seconds
    std::string timestamp;
    std::string source;             // input file the table was computed from
    Index n_bins = 10;
};

struct StoredResult {
    kernel::mi::MITable table;
    ResultMetadata metadata;
    Size n_pairs = 0;
};

// Local time as "YYYY-MM-DD HH:MM:SS"
GVMI_EXPORT std::string current_timestamp();

// Overwrites an existing file. Throws WriteError / IOError.
GVMI_EXPORT void save_mi_table(const std::string& path,
                               const kernel::mi::MITable& table,
                               const ResultMetadata& metadata);

// Throws FileNotFoundError, ReadError
GVMI_EXPORT StoredResult load_mi_table(const std::string& path);

} // namespace gvmi::io
