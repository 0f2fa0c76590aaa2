#include "metis_io.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mpart {

namespace {

[[noreturn]] void fail(const std::string& source, std::size_t line, const std::string& what) {
    throw std::runtime_error(source + ":" + std::to_string(line) + ": " + what);
}

/// Returns false at end of stream; skips '%' comment lines
bool nextLine(std::istream& is, std::string& line, std::size_t& lineNo) {
    while (std::getline(is, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && line[0] == '%') {
            continue;
        }
        return true;
    }
    return false;
}

bool fitsValue(long long value) {
    return value <= static_cast<long long>(std::numeric_limits<Idx>::max());
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

}  // namespace

// =========================================================================
// Reading
// =========================================================================

GraphData parseMetisGraph(std::istream& is, const std::string& source) {
    std::string line;
    std::size_t lineNo = 0;

    // Header, skipping leading blank lines
    bool haveHeader = false;
    while (nextLine(is, line, lineNo)) {
        if (!isBlank(line)) {
            haveHeader = true;
            break;
        }
    }
    if (!haveHeader) {
        fail(source, lineNo, "missing header line");
    }

    long long nvtxs = 0;
    long long nedges = 0;
    std::string fmt = "0";
    long long ncon = 0;
    {
        std::istringstream header(line);
        if (!(header >> nvtxs >> nedges)) {
            fail(source, lineNo, "header must start with vertex and edge counts");
        }
        header >> fmt >> ncon;
    }
    if (nvtxs < 0 || nedges < 0) {
        fail(source, lineNo, "negative vertex or edge count");
    }
    if (!fitsIdx(static_cast<std::size_t>(nvtxs)) ||
        static_cast<unsigned long long>(nedges) >
            static_cast<unsigned long long>(std::numeric_limits<Idx>::max()) / 2) {
        fail(source, lineNo, "graph is too large for the index type");
    }
    if (fmt.size() > 3 || fmt.find_first_not_of("01") != std::string::npos) {
        fail(source, lineNo, "invalid format flag '" + fmt + "'");
    }
    fmt.insert(0, 3 - fmt.size(), '0');
    bool hasSizes = fmt[0] == '1';
    bool hasVertexWeights = fmt[1] == '1';
    bool hasEdgeWeights = fmt[2] == '1';

    if (ncon < 0) {
        fail(source, lineNo, "negative constraint count");
    }
    if (!fitsIdx(static_cast<std::size_t>(ncon))) {
        fail(source, lineNo, "constraint count is too large for the index type");
    }
    if (ncon > 0 && !hasVertexWeights) {
        fail(source, lineNo, "constraint count given without vertex weights");
    }

    GraphData graph;
    graph.ncon = static_cast<Idx>(hasVertexWeights ? (ncon > 0 ? ncon : 1) : 1);
    graph.xadj.reserve(static_cast<std::size_t>(nvtxs) + 1);
    graph.adjncy.reserve(static_cast<std::size_t>(2 * nedges));

    for (long long v = 0; v < nvtxs; ++v) {
        if (!nextLine(is, line, lineNo)) {
            fail(source, lineNo, "expected " + std::to_string(nvtxs) +
                                     " vertex lines, found " + std::to_string(v));
        }
        std::istringstream row(line);
        long long value = 0;

        if (hasSizes) {
            if (!(row >> value) || value < 0 || !fitsValue(value)) {
                fail(source, lineNo, "missing, negative or oversized vertex size");
            }
            graph.vsize.push_back(static_cast<Idx>(value));
        }
        if (hasVertexWeights) {
            for (Idx c = 0; c < graph.ncon; ++c) {
                if (!(row >> value) || value < 0 || !fitsValue(value)) {
                    fail(source, lineNo, "missing, negative or oversized vertex weight");
                }
                graph.vwgt.push_back(static_cast<Idx>(value));
            }
        }

        while (row >> value) {
            if (value < 1 || value > nvtxs) {
                fail(source, lineNo, "neighbour " + std::to_string(value) + " out of range");
            }
            if (value - 1 == v) {
                fail(source, lineNo, "self loop on vertex " + std::to_string(v + 1));
            }
            graph.adjncy.push_back(static_cast<Idx>(value - 1));

            if (hasEdgeWeights) {
                long long weight = 0;
                if (!(row >> weight) || weight <= 0 || !fitsValue(weight)) {
                    fail(source, lineNo, "missing, non-positive or oversized edge weight");
                }
                graph.adjwgt.push_back(static_cast<Idx>(weight));
            }
        }
        if (!row.eof()) {
            fail(source, lineNo, "unexpected token");
        }
        graph.xadj.push_back(static_cast<Idx>(graph.adjncy.size()));
    }

    if (static_cast<long long>(graph.adjncy.size()) != 2 * nedges) {
        fail(source, lineNo, "header declares " + std::to_string(nedges) + " edges but " +
                                 std::to_string(graph.adjncy.size()) +
                                 " adjacency entries were read");
    }

    while (nextLine(is, line, lineNo)) {
        if (!isBlank(line)) {
            fail(source, lineNo, "trailing data after the last vertex");
        }
    }

    return graph;
}

GraphData readMetisGraph(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + filepath);
    }
    return parseMetisGraph(file, filepath);
}

// =========================================================================
// Writing
// =========================================================================

void writePartitionFile(const std::string& filepath, ConstIdxView parts) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open partition file for writing: " + filepath);
    }
    for (Idx p : parts) {
        file << p << '\n';
    }
    if (!file) {
        throw std::runtime_error("Failed writing partition file: " + filepath);
    }
}

}  // namespace mpart
