#include "dual.hpp"
#include "buffer_lease.hpp"
#include "errors.hpp"
#include "structure_check.hpp"

#include <sstream>
#include <stdexcept>

namespace mpart
{

    // =========================================================================
    // Dual
    // =========================================================================

    Dual::Dual(SolverBackend *backend, Idx *xadj, std::size_t xadjSize)
        : backend_(backend), xadj_(xadj), xadjSize_(xadjSize)
    {
    }

    Dual::~Dual()
    {
        release();
    }

    Dual::Dual(Dual &&other) noexcept
        : backend_(other.backend_),
          xadj_(other.xadj_),
          adjncy_(other.adjncy_),
          xadjSize_(other.xadjSize_),
          adjncySize_(other.adjncySize_)
    {
        other.xadj_ = nullptr;
        other.adjncy_ = nullptr;
        other.xadjSize_ = 0;
        other.adjncySize_ = 0;
    }

    Dual &Dual::operator=(Dual &&other) noexcept
    {
        if (this != &other)
        {
            release();
            backend_ = other.backend_;
            xadj_ = other.xadj_;
            adjncy_ = other.adjncy_;
            xadjSize_ = other.xadjSize_;
            adjncySize_ = other.adjncySize_;
            other.xadj_ = nullptr;
            other.adjncy_ = nullptr;
            other.xadjSize_ = 0;
            other.adjncySize_ = 0;
        }
        return *this;
    }

    void Dual::release() noexcept
    {
        if (xadj_ != nullptr)
        {
            backend_->release(xadj_);
            xadj_ = nullptr;
        }
        if (adjncy_ != nullptr)
        {
            backend_->release(adjncy_);
            adjncy_ = nullptr;
        }
        xadjSize_ = 0;
        adjncySize_ = 0;
    }

    // =========================================================================
    // Mesh to Dual
    // =========================================================================

    Dual meshToDual(IdxView eptr, IdxView eind, Idx ncommon, SolverBackend &backend)
    {
        StructureCheck check = checkMeshStructure(eptr, eind);
        if (!check.ok())
        {
            throw InvalidStructureError(check.error);
        }

        BufferLease eptrLease = BufferLease::of("eptr", eptr);
        BufferLease eindLease = BufferLease::of("eind", eind);

        Idx ne = check.entityCount;
        Idx nn = check.nodeCount;
        Idx numflag = 0;
        Idx *xadj = nullptr;
        Idx *adjncy = nullptr;

        int status = backend.meshToDual(&ne, &nn, eptr.data(), eind.data(), &ncommon,
                                        &numflag, &xadj, &adjncy);
        checkStatus(status, "METIS_MeshToDual");

        // Adopt before inspecting, so both arrays are freed on any failure below
        Dual dual(&backend, xadj, eptr.size());
        dual.adjncy_ = adjncy;

        if (xadj == nullptr)
        {
            throw std::logic_error("METIS_MeshToDual succeeded without allocating xadj");
        }

        Idx edges = xadj[check.entityCount];
        if (edges < 0)
        {
            std::ostringstream msg;
            msg << "METIS_MeshToDual returned a negative adjacency length (" << edges << ")";
            throw std::logic_error(msg.str());
        }
        if (edges > 0 && adjncy == nullptr)
        {
            throw std::logic_error("METIS_MeshToDual succeeded without allocating adjncy");
        }
        dual.adjncySize_ = static_cast<std::size_t>(edges);

        return dual;
    }

    Dual meshToDual(IdxView eptr, IdxView eind, Idx ncommon)
    {
        return meshToDual(eptr, eind, ncommon, metisBackend());
    }

} // namespace mpart
