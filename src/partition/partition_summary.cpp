#include "partition_summary.hpp"

#include <algorithm>
#include <iomanip>
#include <stdexcept>

namespace mpart
{

    std::vector<Idx> countPartSizes(ConstIdxView parts)
    {
        if (parts.empty())
        {
            return {};
        }

        Idx nParts = *std::max_element(parts.begin(), parts.end()) + 1;
        std::vector<Idx> counts(std::max<Idx>(nParts, 0), 0);
        for (auto p : parts)
        {
            if (p >= 0 && p < nParts)
            {
                counts[p]++;
            }
        }
        return counts;
    }

    Idx computeEdgeCut(ConstIdxView xadj, ConstIdxView adjncy, ConstIdxView adjwgt,
                       ConstIdxView parts)
    {
        if (xadj.empty() || parts.size() + 1 != xadj.size())
        {
            throw std::invalid_argument("parts must have one entry per vertex");
        }

        Idx cut = 0;
        for (std::size_t v = 0; v + 1 < xadj.size(); ++v)
        {
            for (Idx j = xadj[v]; j < xadj[v + 1]; ++j)
            {
                if (parts[adjncy[j]] != parts[v])
                {
                    cut += adjwgt.empty() ? 1 : adjwgt[j];
                }
            }
        }
        return cut / 2;
    }

    void printPartitionSummary(ConstIdxView parts, std::ostream &os)
    {
        std::vector<Idx> counts = countPartSizes(parts);
        if (counts.empty())
        {
            os << "--- Partition Summary ---\n";
            os << "No partitions found.\n";
            return;
        }

        Idx nParts = static_cast<Idx>(counts.size());

        os << "--- Partition Summary ---\n";
        os << "Number of partitions: " << nParts << "\n";

        std::size_t total = parts.size();
        Idx minCount = *std::min_element(counts.begin(), counts.end());
        Idx maxCount = *std::max_element(counts.begin(), counts.end());
        double avgCount = static_cast<double>(total) / nParts;

        for (Idx p = 0; p < nParts; ++p)
        {
            double pct = 100.0 * counts[p] / total;
            os << "  Partition " << std::setw(3) << p << ": "
               << std::setw(8) << counts[p] << " entities ("
               << std::fixed << std::setprecision(1) << pct << "%)\n";
        }

        os << "\nBalance Statistics:\n";
        os << "  Min entities per partition: " << minCount << "\n";
        os << "  Max entities per partition: " << maxCount << "\n";
        os << "  Avg entities per partition: " << std::fixed
           << std::setprecision(1) << avgCount << "\n";

        double imbalance = (maxCount > 0)
                               ? (static_cast<double>(maxCount) / avgCount - 1.0) * 100.0
                               : 0.0;
        os << "  Load imbalance: " << std::fixed << std::setprecision(1)
           << imbalance << "%\n";
    }

} // namespace mpart
