#include "errors.hpp"

#include <limits>
#include <sstream>

namespace mpart
{

    const char *errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Input:
            return "invalid input";
        case ErrorKind::Memory:
            return "out of memory";
        case ErrorKind::Other:
            return "METIS returned an error";
        }
        return "unknown error";
    }

    const char *structureErrorToString(StructureError error)
    {
        switch (error)
        {
        case StructureError::None:
            return "no error";
        case StructureError::NonPositiveConstraints:
            return "the number of constraints must be strictly positive";
        case StructureError::NonPositiveParts:
            return "the number of parts must be strictly positive";
        case StructureError::EmptyOffsets:
            return "the offsets array is empty";
        case StructureError::OffsetsOverflow:
            return "the offsets array is longer than Idx can represent";
        case StructureError::OffsetsNotSorted:
            return "the offsets array is not sorted";
        case StructureError::InvalidLastOffset:
            return "the last offset is not a valid length";
        case StructureError::ItemsLengthMismatch:
            return "the items length does not match the last offset";
        case StructureError::ItemsOutOfBounds:
            return "an item is out of bounds";
        }
        return "unknown structure error";
    }

    // =========================================================================
    // Exceptions
    // =========================================================================

    PartitionError::PartitionError(ErrorKind kind)
        : std::runtime_error(errorKindToString(kind)), kind_(kind)
    {
    }

    PartitionError::PartitionError(ErrorKind kind, const std::string &context)
        : std::runtime_error(context + ": " + errorKindToString(kind)), kind_(kind)
    {
    }

    InvalidStructureError::InvalidStructureError(StructureError error)
        : std::invalid_argument(std::string("invalid structure: ") +
                                structureErrorToString(error)),
          error_(error)
    {
    }

    // =========================================================================
    // Status and Length Checks
    // =========================================================================

    void checkStatus(int status, const char *routine)
    {
        switch (status)
        {
        case METIS_OK:
            return;
        case METIS_ERROR_INPUT:
            throw PartitionError(ErrorKind::Input, routine);
        case METIS_ERROR_MEMORY:
            throw PartitionError(ErrorKind::Memory, routine);
        case METIS_ERROR:
            throw PartitionError(ErrorKind::Other, routine);
        default:
        {
            std::ostringstream msg;
            msg << "unexpected status code (" << status << ") from " << routine;
            throw std::logic_error(msg.str());
        }
        }
    }

    void checkLength(const char *name, std::size_t actual, Idx expected)
    {
        if (expected < 0 || actual != static_cast<std::size_t>(expected))
        {
            std::ostringstream msg;
            msg << name << " has length " << actual << " but " << expected
                << " is required";
            throw std::invalid_argument(msg.str());
        }
    }

    Idx toIdx(const char *name, std::size_t length)
    {
        if (!fitsIdx(length))
        {
            throw std::length_error(std::string(name) + " array larger than Idx can hold");
        }
        return static_cast<Idx>(length);
    }

    Idx lengthProduct(const char *name, Idx count, Idx items)
    {
        if (count < 0 || items < 0 ||
            (count > 0 && items > std::numeric_limits<Idx>::max() / count))
        {
            throw std::length_error(std::string(name) + " array larger than Idx can hold");
        }
        return count * items;
    }

} // namespace mpart
