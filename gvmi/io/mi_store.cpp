// =============================================================================
// FILE: gvmi/io/mi_store.cpp
// BRIEF: HDF5 persistence of mutual information tables
// =============================================================================

#include "gvmi/io/mi_store.hpp"
#include "gvmi/io/hdf5.hpp"
#include "gvmi/core/error.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gvmi::io {

namespace {

constexpr const char* MATRIX_DATASET = "mutual_information";
constexpr const char* GENES_DATASET = "genes";

} // anonymous namespace

std::string current_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

void save_mi_table(const std::string& path,
                   const kernel::mi::MITable& table,
                   const ResultMetadata& metadata) {
    const Size n = table.size();

    // Stored as float64 whatever Real is
    Array<const Real> values = table.data();
    std::vector<double> buffer(values.begin(), values.end());

    h5::File file = h5::File::create(path);
    file.write_dataset<double>(MATRIX_DATASET, buffer.data(),
                               {static_cast<hsize_t>(n), static_cast<hsize_t>(n)});
    file.write_strings(GENES_DATASET, table.labels());

    file.write_attr<std::int64_t>("n_genes", static_cast<std::int64_t>(n));
    file.write_attr<std::int64_t>("n_pairs", static_cast<std::int64_t>(n * (n + 1) / 2));
    file.write_attr<double>("computation_time", metadata.computation_time);
    file.write_attr_string("timestamp", metadata.timestamp);
    file.write_attr_string("source", metadata.source);
    file.write_attr<std::int64_t>("n_bins", static_cast<std::int64_t>(metadata.n_bins));
    file.flush();
}

StoredResult load_mi_table(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw FileNotFoundError(path);
    }

    h5::File file(path);
    if (!file.exists(MATRIX_DATASET) || !file.exists(GENES_DATASET)) {
        throw ReadError("Not a mutual information result file: " + path);
    }

    std::vector<std::string> genes = file.open_dataset(GENES_DATASET).read_strings();
    h5::Dataset matrix = file.open_dataset(MATRIX_DATASET);
    const std::vector<hsize_t> dims = matrix.dims();
    if (dims.size() != 2 || dims[0] != genes.size() || dims[1] != genes.size()) {
        throw ReadError("Result matrix shape does not match " +
                        std::to_string(genes.size()) + " genes");
    }
    const std::vector<double> values = matrix.read_vector<double>();

    StoredResult result;
    result.table = kernel::mi::MITable(std::move(genes));
    Array<Real> dst = result.table.data();
    for (Size k = 0; k < values.size(); ++k) {
        dst[k] = static_cast<Real>(values[k]);
    }

    const Size n = result.table.size();
    result.n_pairs = file.has_attr("n_pairs")
        ? static_cast<Size>(file.read_attr<std::int64_t>("n_pairs"))
        : n * (n + 1) / 2;
    if (file.has_attr("computation_time")) {
        result.metadata.computation_time = file.read_attr<double>("computation_time");
    }
    if (file.has_attr("timestamp")) {
        result.metadata.timestamp = file.read_attr_string("timestamp");
    }
    if (file.has_attr("source")) {
        result.metadata.source = file.read_attr_string("source");
    }
    if (file.has_attr("n_bins")) {
        result.metadata.n_bins = static_cast<Index>(file.read_attr<std::int64_t>("n_bins"));
    }
    return result;
}

} // namespace gvmi::io
