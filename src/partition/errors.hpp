#pragma once

/**
 * @file errors.hpp
 * @brief Error taxonomy for partition requests.
 *
 * Two families are kept apart:
 * - StructureError: the input arrays do not describe a valid graph or mesh.
 *   Reported only by validated construction.
 * - ErrorKind: METIS itself refused or failed. Reported only by the terminal
 *   solve operations, derived from the METIS status code.
 *
 * Misuse of the builder (wrong attribute or output lengths, lengths that do
 * not fit in Idx, solving twice) is reported with the standard logic_error
 * family and never through these types.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <stdexcept>
#include <string>

namespace mpart {

/// Failure reported by a METIS call
enum class ErrorKind {
    Input,   ///< METIS_ERROR_INPUT: invalid input
    Memory,  ///< METIS_ERROR_MEMORY: out of memory
    Other    ///< METIS_ERROR: unspecified failure
};

/// Structural violation found before any METIS call
enum class StructureError {
    None,                    ///< The arrays are valid
    NonPositiveConstraints,  ///< Constraint count is not strictly positive
    NonPositiveParts,        ///< Part count is not strictly positive
    EmptyOffsets,            ///< The offsets array has no element
    OffsetsOverflow,         ///< The offsets length does not fit in Idx
    OffsetsNotSorted,        ///< Offsets decrease or start below zero
    InvalidLastOffset,       ///< The last offset cannot be an array length
    ItemsLengthMismatch,     ///< items.size() differs from the last offset
    ItemsOutOfBounds         ///< An item is not a valid vertex or node index
};

/// Short description of an ErrorKind
MPART_API const char* errorKindToString(ErrorKind kind);

/// Short description of a StructureError
MPART_API const char* structureErrorToString(StructureError error);

/// Any structural violation collapses to an input error
inline ErrorKind toErrorKind(StructureError) {
    return ErrorKind::Input;
}

/**
 * @brief Thrown when METIS returns a failure status.
 */
class MPART_API PartitionError : public std::runtime_error {
public:
    explicit PartitionError(ErrorKind kind);
    PartitionError(ErrorKind kind, const std::string& context);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown by validated construction when the arrays are malformed.
 */
class MPART_API InvalidStructureError : public std::invalid_argument {
public:
    explicit InvalidStructureError(StructureError error);

    StructureError kind() const { return error_; }

    /// The coarse classification, always ErrorKind::Input
    ErrorKind errorKind() const { return toErrorKind(error_); }

private:
    StructureError error_;
};

/**
 * @brief Converts a METIS status code.
 *
 * Returns normally on METIS_OK and throws PartitionError for the three known
 * failure codes. Any other value means the linked METIS does not match the
 * headers and throws std::logic_error.
 *
 * @param status Value returned by a METIS routine
 * @param routine Name of the routine, used in messages
 */
MPART_API void checkStatus(int status, const char* routine);

/**
 * @brief Requires an array to have exactly the expected length.
 * @throws std::invalid_argument naming the array when lengths differ
 */
MPART_API void checkLength(const char* name, std::size_t actual, Idx expected);

/**
 * @brief Converts a length to Idx.
 * @throws std::length_error naming the array when it does not fit
 */
MPART_API Idx toIdx(const char* name, std::size_t length);

/**
 * @brief Length of an array holding count entries per item, as an Idx.
 * @throws std::length_error naming the array when the product does not fit
 */
MPART_API Idx lengthProduct(const char* name, Idx count, Idx items);

}  // namespace mpart
