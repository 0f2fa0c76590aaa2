#pragma once

/**
 * @file buffer_lease.hpp
 * @brief Runtime exclusive access to borrowed caller arrays.
 *
 * A partition request borrows the caller's adjacency arrays for its whole
 * lifetime and METIS may write to them during a solve. A BufferLease records
 * the borrowed address range in a process-wide registry; taking a second
 * lease on any overlapping range fails until the first lease is released.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <cstddef>

namespace mpart {

/**
 * @brief Move-only handle on an exclusively borrowed memory range.
 */
class MPART_API BufferLease {
public:
    /// An empty lease that guards nothing
    BufferLease() = default;

    /**
     * @brief Leases [data, data + bytes).
     *
     * A zero-length range is never registered.
     *
     * @param name Array name used in the error message
     * @throws std::logic_error if the range overlaps a live lease
     */
    BufferLease(const char* name, const void* data, std::size_t bytes);

    template <typename T>
    static BufferLease of(const char* name, ArrayView<T> view) {
        return BufferLease(name, view.data(), view.size() * sizeof(T));
    }

    ~BufferLease();

    BufferLease(BufferLease&& other) noexcept;
    BufferLease& operator=(BufferLease&& other) noexcept;

    BufferLease(const BufferLease&) = delete;
    BufferLease& operator=(const BufferLease&) = delete;

    bool active() const { return begin_ != nullptr; }

    /// Returns true if any live lease overlaps [data, data + bytes)
    static bool isLeased(const void* data, std::size_t bytes);

private:
    void release() noexcept;

    const char* begin_ = nullptr;
    const char* end_ = nullptr;
};

}  // namespace mpart
