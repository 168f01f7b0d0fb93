#pragma once

#include "gvmi/config.hpp"
#include "gvmi/core/type.hpp"
#include "gvmi/core/macros.hpp"
#include "gvmi/core/error.hpp"
#include <new>
#include <memory>
#include <string>
#include <type_traits>

// =============================================================================
// FILE: gvmi/core/memory.hpp
// BRIEF: Aligned allocation for numeric scratch buffers
// =============================================================================

namespace gvmi::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (GVMI_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;

// Zero-initialised aligned array. Throws OutOfMemoryError on failure.
template <typename T>
GVMI_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    static_assert(std::is_arithmetic_v<T>,
                  "aligned_alloc: Type must be arithmetic");

    if (GVMI_UNLIKELY(count == 0)) {
        return AlignedPtr<T>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;
    try {
        raw_ptr = new (std::align_val_t(alignment)) T[count]();
    } catch (const std::bad_alloc&) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }
    return AlignedPtr<T>(raw_ptr, AlignedDeleter<T>(alignment));
}

} // namespace gvmi::memory
