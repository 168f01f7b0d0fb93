#pragma once

#include "gvmi/config.hpp"
#include "gvmi/core/type.hpp"
#include "gvmi/core/macros.hpp"

#include <hwy/highway.h>
#include <hwy/contrib/sort/vqsort-inl.h>

#include <concepts>

// =============================================================================
// FILE: gvmi/core/sort.hpp
// BRIEF: In-place sorting (via Google Highway VQSort)
// =============================================================================

namespace gvmi::sort {

template <typename T>
concept TotallyOrdered = std::totally_ordered<T>;

template <TotallyOrdered T>
GVMI_FORCE_INLINE void sort(Array<T> data) {
    if (GVMI_UNLIKELY(data.len < 2)) return;
    hwy::HWY_NAMESPACE::VQSortStatic(data.ptr, data.len, hwy::SortAscending());
}

} // namespace gvmi::sort
