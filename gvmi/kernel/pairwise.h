// =============================================================================
// FILE: gvmi/kernel/pairwise.h
// BRIEF: API reference for all-pairs mutual information
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/dense.hpp"
#include "gvmi/core/progress.hpp"
#include "gvmi/kernel/mi_table.hpp"

#include <string>
#include <vector>

namespace gvmi::kernel::mi {

struct PairwiseOptions {
    Index n_bins = 10;
    Size n_threads = 0;
};

/* -----------------------------------------------------------------------------
 * FUNCTION: decode_pair
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Map a flat pair index to (i, j), i <= j, row-major over the upper
 *     triangle including the diagonal.
 *
 * PRECONDITIONS:
 *     - k < n * (n + 1) / 2
 *
 * COMPLEXITY:
 *     Time:  O(1)
 * -------------------------------------------------------------------------- */
std::pair<Size, Size> decode_pair(Size k, Size n) noexcept;

/* -----------------------------------------------------------------------------
 * FUNCTION: compute_pairwise
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Mutual information between every pair of rows, self-pairs included.
 *
 * PARAMETERS:
 *     matrix   [in]  Expression matrix, one gene per row [genes x samples]
 *     labels   [in]  Gene labels [genes]
 *     options  [in]  Bin count and thread count
 *     sink     [in]  Progress receiver, may be null
 *
 * PRECONDITIONS:
 *     - matrix.rows > 0 and matrix.cols > 0           (else EmptyInputError)
 *     - labels.size() == matrix.rows                  (else DimensionMismatchError)
 *     - MIN_N_BINS <= options.n_bins <= MAX_N_BINS    (else ValueError)
 *
 * POSTCONDITIONS:
 *     - table.at(a, b) == table.at(b, a) for every pair of labels
 *     - table.at(a, a) is present for every label
 *     - Every score >= -1e-9
 *     - Result independent of thread count and scheduling
 *     - sink receives on_start(n(n+1)/2, "Computing mutual information..."),
 *       increasing on_advance positions, then
 *       on_finish("Mutual information computation completed!")
 *
 * ALGORITHM:
 *     1. Validate; no work is scheduled on failure
 *     2. Bin each row once against its own quantiles (parallel over rows)
 *     3. Score n(n+1)/2 pairs in parallel, each into a private slot
 *     4. Merge slots into the symmetric table on the calling thread
 *
 * COMPLEXITY:
 *     Time:  O(genes^2 * (samples + n_bins^2) / threads)
 *     Space: O(genes^2 + genes * samples)
 *
 * THREAD SAFETY:
 *     Not safe to call concurrently with Scheduler::set_num_threads.
 *     options.n_threads > 0 changes the worker count for this call only.
 * -------------------------------------------------------------------------- */
MITable compute_pairwise(
    DenseArray<const Real> matrix,           // Expression [genes x samples]
    const std::vector<std::string>& labels,  // Gene labels [genes]
    const PairwiseOptions& options = {},     // Bins and threads
    progress::ProgressSink* sink = nullptr   // Optional progress receiver
);

} // namespace gvmi::kernel::mi
