#include "structure_check.hpp"

#include <algorithm>

namespace mpart
{

    namespace
    {

        StructureCheck failure(StructureError error)
        {
            StructureCheck check;
            check.error = error;
            return check;
        }

        // Non-decreasing and starting at zero or above
        bool offsetsSorted(ConstIdxView offsets)
        {
            if (offsets.front() < 0)
                return false;
            return std::is_sorted(offsets.begin(), offsets.end());
        }

    } // anonymous namespace

    // =========================================================================
    // Graph
    // =========================================================================

    StructureCheck checkGraph(Idx ncon, Idx nparts, ConstIdxView xadj, ConstIdxView adjncy)
    {
        if (ncon <= 0)
            return failure(StructureError::NonPositiveConstraints);
        if (nparts <= 0)
            return failure(StructureError::NonPositiveParts);
        if (xadj.empty())
            return failure(StructureError::EmptyOffsets);

        Idx last = xadj.back();
        if (last < 0)
            return failure(StructureError::InvalidLastOffset);
        if (!fitsIdx(adjncy.size()) || static_cast<Idx>(adjncy.size()) != last)
            return failure(StructureError::ItemsLengthMismatch);

        if (!offsetsSorted(xadj))
            return failure(StructureError::OffsetsNotSorted);
        if (!fitsIdx(xadj.size()))
            return failure(StructureError::OffsetsOverflow);

        Idx nvtxs = static_cast<Idx>(xadj.size()) - 1;
        for (auto v : adjncy)
        {
            if (v < 0 || v >= nvtxs)
                return failure(StructureError::ItemsOutOfBounds);
        }

        StructureCheck check;
        check.entityCount = nvtxs;
        return check;
    }

    // =========================================================================
    // Mesh
    // =========================================================================

    StructureCheck checkMeshStructure(ConstIdxView eptr, ConstIdxView eind)
    {
        if (eptr.empty())
            return failure(StructureError::EmptyOffsets);
        if (!offsetsSorted(eptr))
            return failure(StructureError::OffsetsNotSorted);
        if (!fitsIdx(eptr.size()))
            return failure(StructureError::OffsetsOverflow);

        Idx last = eptr.back();
        if (last < 0)
            return failure(StructureError::InvalidLastOffset);
        if (!fitsIdx(eind.size()) || static_cast<Idx>(eind.size()) != last)
            return failure(StructureError::ItemsLengthMismatch);

        Idx maxNode = -1;
        for (auto n : eind)
        {
            if (n < 0)
                return failure(StructureError::ItemsOutOfBounds);
            maxNode = std::max(maxNode, n);
        }
        if (maxNode == std::numeric_limits<Idx>::max())
            return failure(StructureError::ItemsOutOfBounds);

        StructureCheck check;
        check.entityCount = static_cast<Idx>(eptr.size()) - 1;
        check.nodeCount = maxNode + 1;
        return check;
    }

    StructureCheck checkMesh(Idx nparts, ConstIdxView eptr, ConstIdxView eind)
    {
        if (nparts <= 0)
            return failure(StructureError::NonPositiveParts);
        return checkMeshStructure(eptr, eind);
    }

} // namespace mpart
