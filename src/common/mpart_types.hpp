#pragma once

/**
 * @file mpart_types.hpp
 * @brief Common type definitions shared across mpart modules.
 *
 * The integer and floating-point widths follow the installed METIS build, so
 * arrays built with these types can be handed to METIS without conversion.
 */

#include "mpart_export.hpp"

#include <metis.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

namespace mpart {

// =============================================================================
// Numeric Types
// =============================================================================

/// Integer type used by METIS (32 or 64 bit depending on IDXTYPEWIDTH)
using Idx = idx_t;

/// Floating-point type used by METIS (float or double depending on REALTYPEWIDTH)
using Real = real_t;

static_assert(std::is_signed<Idx>::value, "METIS idx_t must be signed");

/// Length of the METIS options array
constexpr std::size_t NOPTIONS = METIS_NOPTIONS;

/// Raw option vector as METIS reads it
using OptionArray = std::array<Idx, NOPTIONS>;

/// Sentinel meaning "let METIS pick its default"
constexpr Idx OPTION_DEFAULT = -1;

/// Returns true if a container length can be passed to METIS as an Idx
inline bool fitsIdx(std::size_t n) {
    return n <= static_cast<std::size_t>(std::numeric_limits<Idx>::max());
}

// =============================================================================
// ArrayView
// =============================================================================

/**
 * @brief Non-owning view over a contiguous array.
 *
 * Partition requests borrow caller memory through this type instead of
 * copying it. The viewed memory must outlive the view.
 */
template <typename T>
class ArrayView {
public:
    using value_type = std::remove_const_t<T>;

    ArrayView() = default;
    ArrayView(T* data, std::size_t size) : data_(data), size_(size) {}

    template <typename Alloc>
    ArrayView(std::vector<value_type, Alloc>& v) : data_(v.data()), size_(v.size()) {}

    template <typename U = T, typename = std::enable_if_t<std::is_const<U>::value>>
    ArrayView(const std::vector<value_type>& v) : data_(v.data()), size_(v.size()) {}

    template <std::size_t N>
    ArrayView(T (&arr)[N]) : data_(arr), size_(N) {}

    template <std::size_t N>
    ArrayView(std::array<value_type, N>& arr) : data_(arr.data()), size_(N) {}

    /// Mutable view converts to a read-only one
    template <typename U,
              typename = std::enable_if_t<std::is_same<const U, T>::value &&
                                          !std::is_same<U, T>::value>>
    ArrayView(ArrayView<U> other) : data_(other.data()), size_(other.size()) {}

    T* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    T& operator[](std::size_t i) const { return data_[i]; }
    T& front() const { return data_[0]; }
    T& back() const { return data_[size_ - 1]; }

    T* begin() const { return data_; }
    T* end() const { return data_ + size_; }

private:
    T* data_ = nullptr;
    std::size_t size_ = 0;
};

/// Mutable index array borrowed from the caller
using IdxView = ArrayView<Idx>;

/// Read-only index array
using ConstIdxView = ArrayView<const Idx>;

/// Mutable real array borrowed from the caller
using RealView = ArrayView<Real>;

}  // namespace mpart
