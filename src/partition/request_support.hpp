#pragma once

/**
 * @file request_support.hpp
 * @brief Helpers shared by the Graph and Mesh partition requests.
 *
 * Internal header; not part of the installed API.
 */

#include "common/mpart_types.hpp"
#include "options.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpart {
namespace detail {

/// Lifecycle of a partition request
enum class RequestState {
    Ready,     // Builder methods allowed
    Solving,   // A METIS call is in flight
    Consumed   // A terminal operation already ran
};

/// Null when the attribute was not set
template <typename T>
T* pointerOrNull(ArrayView<T> view) {
    return view.empty() ? nullptr : view.data();
}

/// Builder methods are only valid before the terminal call
inline void requireReady(RequestState state, const char* operation) {
    if (state != RequestState::Ready) {
        throw std::logic_error(std::string(operation) +
                               " called on a partition request that was already solved");
    }
}

/**
 * @brief Marks a request as solving for the duration of a terminal call.
 *
 * The request ends up Consumed whether the call succeeds or throws.
 */
class SolveScope {
public:
    SolveScope(RequestState& state, const char* operation) : state_(state) {
        requireReady(state, operation);
        state_ = RequestState::Solving;
    }
    ~SolveScope() { state_ = RequestState::Consumed; }

    SolveScope(const SolveScope&) = delete;
    SolveScope& operator=(const SolveScope&) = delete;

private:
    RequestState& state_;
};

/// Forces C numbering; warns when the caller asked for something else
inline void forceCNumbering(Options& options) {
    Idx requested = options.get(OptionKey::Numbering);
    if (requested != OPTION_DEFAULT && requested != 0) {
        std::cerr << "Warning: METIS numbering option " << requested
                  << " overridden to C-style numbering\n";
    }
    options.set(Option::numbering(Numbering::C));
}

/**
 * @brief Copy of the adjacency arrays taken before a METIS call.
 *
 * METIS documents that it restores any array it modifies. When enabled, the
 * snapshot is compared after the call to catch a solver that does not.
 */
class InputSnapshot {
public:
    InputSnapshot(bool enabled, ConstIdxView offsets, ConstIdxView items)
        : enabled_(enabled) {
        if (enabled_) {
            offsets_.assign(offsets.begin(), offsets.end());
            items_.assign(items.begin(), items.end());
        }
    }

    /// @throws std::logic_error if either array changed
    void verify(const char* routine, ConstIdxView offsets, ConstIdxView items) const {
        if (!enabled_)
            return;
        if (!std::equal(offsets.begin(), offsets.end(), offsets_.begin(), offsets_.end()) ||
            !std::equal(items.begin(), items.end(), items_.begin(), items_.end())) {
            throw std::logic_error(std::string(routine) +
                                   " did not restore its input arrays");
        }
    }

private:
    bool enabled_;
    std::vector<Idx> offsets_;
    std::vector<Idx> items_;
};

}  // namespace detail
}  // namespace mpart
