#include "mesh.hpp"
#include "structure_check.hpp"

#include <algorithm>
#include <limits>

namespace mpart
{

    // =========================================================================
    // Construction
    // =========================================================================

    Mesh::Mesh(Idx nparts, Idx nn, IdxView eptr, IdxView eind)
        : nparts_(nparts),
          ne_(static_cast<Idx>(eptr.size()) - 1),
          nn_(nn),
          eptr_(eptr),
          eind_(eind),
          backend_(&metisBackend()),
          eptrLease_(BufferLease::of("eptr", eptr)),
          eindLease_(BufferLease::of("eind", eind))
    {
    }

    Mesh Mesh::create(Idx nparts, IdxView eptr, IdxView eind)
    {
        StructureCheck check = checkMesh(nparts, eptr, eind);
        if (!check.ok())
        {
            throw InvalidStructureError(check.error);
        }
        return Mesh(nparts, check.nodeCount, eptr, eind);
    }

    Mesh Mesh::createUnchecked(Idx nparts, IdxView eptr, IdxView eind)
    {
        if (nparts <= 0)
            throw std::invalid_argument("nparts must be strictly greater than zero");
        toIdx("eptr", eptr.size());
        if (eptr.empty())
            throw std::invalid_argument("eptr cannot be empty");
        Idx eindLen = toIdx("eind", eind.size());
        if (eindLen != eptr.back())
            throw std::invalid_argument("eind length must equal the last element of eptr");

        Idx maxNode = eind.empty() ? -1 : *std::max_element(eind.begin(), eind.end());
        if (maxNode == std::numeric_limits<Idx>::max())
            throw std::length_error("node count does not fit in Idx");
        return Mesh(nparts, maxNode + 1, eptr, eind);
    }

    // =========================================================================
    // Builder
    // =========================================================================

    Mesh &Mesh::setElementWeights(IdxView vwgt)
    {
        detail::requireReady(state_, "setElementWeights");
        checkLength("vwgt", vwgt.size(), ne_);
        vwgt_ = vwgt;
        return *this;
    }

    Mesh &Mesh::setElementSizes(IdxView vsize)
    {
        detail::requireReady(state_, "setElementSizes");
        checkLength("vsize", vsize.size(), ne_);
        vsize_ = vsize;
        return *this;
    }

    Mesh &Mesh::setTargetPartWeights(RealView tpwgts)
    {
        detail::requireReady(state_, "setTargetPartWeights");
        checkLength("tpwgts", tpwgts.size(), nparts_);
        tpwgts_ = tpwgts;
        return *this;
    }

    Mesh &Mesh::setSharedNodeThreshold(Idx ncommon)
    {
        detail::requireReady(state_, "setSharedNodeThreshold");
        ncommon_ = ncommon;
        return *this;
    }

    Mesh &Mesh::setOption(const Option &option)
    {
        detail::requireReady(state_, "setOption");
        options_.set(option);
        return *this;
    }

    Mesh &Mesh::setOptions(const OptionArray &options)
    {
        detail::requireReady(state_, "setOptions");
        options_.setAll(options);
        return *this;
    }

    Mesh &Mesh::setBackend(SolverBackend &backend)
    {
        detail::requireReady(state_, "setBackend");
        backend_ = &backend;
        return *this;
    }

    Mesh &Mesh::setVerifyInputRestore(bool enabled)
    {
        detail::requireReady(state_, "setVerifyInputRestore");
        verifyRestore_ = enabled;
        return *this;
    }

    // =========================================================================
    // Partitioning
    // =========================================================================

    Idx Mesh::partDual(IdxView epart, IdxView npart)
    {
        return solve(true, epart, npart);
    }

    Idx Mesh::partNodal(IdxView epart, IdxView npart)
    {
        return solve(false, epart, npart);
    }

    Idx Mesh::solve(bool dual, IdxView epart, IdxView npart)
    {
        const char *routine = dual ? "METIS_PartMeshDual" : "METIS_PartMeshNodal";
        detail::SolveScope scope(state_, routine);

        checkLength("epart", epart.size(), ne_);
        checkLength("npart", npart.size(), nn_);
        detail::forceCNumbering(options_);

        if (nparts_ == 1)
        {
            std::fill(epart.begin(), epart.end(), 0);
            std::fill(npart.begin(), npart.end(), 0);
            return 0;
        }

        Idx ne = ne_;
        Idx nn = nn_;
        Idx nparts = nparts_;
        Idx objval = 0;

        detail::InputSnapshot snapshot(verifyRestore_, eptr_, eind_);

        int status;
        if (dual)
        {
            Idx ncommon = ncommon_;
            status = backend_->partMeshDual(
                &ne, &nn, eptr_.data(), eind_.data(),
                detail::pointerOrNull(vwgt_),
                detail::pointerOrNull(vsize_),
                &ncommon, &nparts,
                detail::pointerOrNull(tpwgts_),
                options_.data(), &objval, epart.data(), npart.data());
        }
        else
        {
            status = backend_->partMeshNodal(
                &ne, &nn, eptr_.data(), eind_.data(),
                detail::pointerOrNull(vwgt_),
                detail::pointerOrNull(vsize_),
                &nparts,
                detail::pointerOrNull(tpwgts_),
                options_.data(), &objval, epart.data(), npart.data());
        }

        checkStatus(status, routine);
        snapshot.verify(routine, eptr_, eind_);
        return objval;
    }

} // namespace mpart
