#include "graph.hpp"
#include "structure_check.hpp"

#include <algorithm>

namespace mpart
{

    // =========================================================================
    // Construction
    // =========================================================================

    Graph::Graph(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy)
        : ncon_(ncon),
          nparts_(nparts),
          nvtxs_(static_cast<Idx>(xadj.size()) - 1),
          xadj_(xadj),
          adjncy_(adjncy),
          backend_(&metisBackend()),
          xadjLease_(BufferLease::of("xadj", xadj)),
          adjncyLease_(BufferLease::of("adjncy", adjncy))
    {
    }

    Graph Graph::create(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy)
    {
        StructureCheck check = checkGraph(ncon, nparts, xadj, adjncy);
        if (!check.ok())
        {
            throw InvalidStructureError(check.error);
        }
        return Graph(ncon, nparts, xadj, adjncy);
    }

    Graph Graph::createUnchecked(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy)
    {
        if (ncon <= 0)
            throw std::invalid_argument("ncon must be strictly greater than zero");
        if (nparts <= 0)
            throw std::invalid_argument("nparts must be strictly greater than zero");
        toIdx("xadj", xadj.size());
        if (xadj.empty())
            throw std::invalid_argument("xadj cannot be empty");
        Idx adjncyLen = toIdx("adjncy", adjncy.size());
        if (adjncyLen != xadj.back())
            throw std::invalid_argument("adjncy length must equal the last element of xadj");

        return Graph(ncon, nparts, xadj, adjncy);
    }

    // =========================================================================
    // Builder
    // =========================================================================

    Graph &Graph::setVertexWeights(IdxView vwgt)
    {
        detail::requireReady(state_, "setVertexWeights");
        checkLength("vwgt", vwgt.size(), lengthProduct("vwgt", ncon_, nvtxs_));
        vwgt_ = vwgt;
        return *this;
    }

    Graph &Graph::setVertexSizes(IdxView vsize)
    {
        detail::requireReady(state_, "setVertexSizes");
        checkLength("vsize", vsize.size(), nvtxs_);
        vsize_ = vsize;
        return *this;
    }

    Graph &Graph::setEdgeWeights(IdxView adjwgt)
    {
        detail::requireReady(state_, "setEdgeWeights");
        checkLength("adjwgt", adjwgt.size(), xadj_.back());
        adjwgt_ = adjwgt;
        return *this;
    }

    Graph &Graph::setTargetPartWeights(RealView tpwgts)
    {
        detail::requireReady(state_, "setTargetPartWeights");
        checkLength("tpwgts", tpwgts.size(), lengthProduct("tpwgts", ncon_, nparts_));
        tpwgts_ = tpwgts;
        return *this;
    }

    Graph &Graph::setImbalanceTolerances(RealView ubvec)
    {
        detail::requireReady(state_, "setImbalanceTolerances");
        checkLength("ubvec", ubvec.size(), ncon_);
        ubvec_ = ubvec;
        return *this;
    }

    Graph &Graph::setOption(const Option &option)
    {
        detail::requireReady(state_, "setOption");
        options_.set(option);
        return *this;
    }

    Graph &Graph::setOptions(const OptionArray &options)
    {
        detail::requireReady(state_, "setOptions");
        options_.setAll(options);
        return *this;
    }

    Graph &Graph::setBackend(SolverBackend &backend)
    {
        detail::requireReady(state_, "setBackend");
        backend_ = &backend;
        return *this;
    }

    Graph &Graph::setVerifyInputRestore(bool enabled)
    {
        detail::requireReady(state_, "setVerifyInputRestore");
        verifyRestore_ = enabled;
        return *this;
    }

    // =========================================================================
    // Partitioning
    // =========================================================================

    Idx Graph::partRecursive(IdxView part)
    {
        return solve(false, part);
    }

    Idx Graph::partKway(IdxView part)
    {
        return solve(true, part);
    }

    Idx Graph::solve(bool kway, IdxView part)
    {
        const char *routine = kway ? "METIS_PartGraphKway" : "METIS_PartGraphRecursive";
        detail::SolveScope scope(state_, routine);

        checkLength("part", part.size(), nvtxs_);
        detail::forceCNumbering(options_);

        // METIS mishandles a single part; the answer is trivial anyway
        if (nparts_ == 1)
        {
            std::fill(part.begin(), part.end(), 0);
            return 0;
        }

        Idx nvtxs = nvtxs_;
        Idx ncon = ncon_;
        Idx nparts = nparts_;
        Idx objval = 0;

        detail::InputSnapshot snapshot(verifyRestore_, xadj_, adjncy_);

        int status;
        if (kway)
        {
            status = backend_->partGraphKway(
                &nvtxs, &ncon, xadj_.data(), adjncy_.data(),
                detail::pointerOrNull(vwgt_),
                detail::pointerOrNull(vsize_),
                detail::pointerOrNull(adjwgt_),
                &nparts,
                detail::pointerOrNull(tpwgts_),
                detail::pointerOrNull(ubvec_),
                options_.data(), &objval, part.data());
        }
        else
        {
            status = backend_->partGraphRecursive(
                &nvtxs, &ncon, xadj_.data(), adjncy_.data(),
                detail::pointerOrNull(vwgt_),
                detail::pointerOrNull(vsize_),
                detail::pointerOrNull(adjwgt_),
                &nparts,
                detail::pointerOrNull(tpwgts_),
                detail::pointerOrNull(ubvec_),
                options_.data(), &objval, part.data());
        }

        checkStatus(status, routine);
        snapshot.verify(routine, xadj_, adjncy_);
        return objval;
    }

} // namespace mpart
