#include "element_mesh.hpp"

#include <algorithm>
#include <stdexcept>

namespace mpart {

Idx ElementMesh::nodeCount() const {
    if (eind.empty()) {
        return 0;
    }
    return *std::max_element(eind.begin(), eind.end()) + 1;
}

void ElementMesh::addElement(const std::vector<Idx>& nodes) {
    eind.insert(eind.end(), nodes.begin(), nodes.end());
    eptr.push_back(static_cast<Idx>(eind.size()));
}

ElementMesh ElementMesh::fromCells(const std::vector<std::vector<Idx>>& cells) {
    ElementMesh mesh;
    for (const auto& cell : cells) {
        mesh.addElement(cell);
    }
    return mesh;
}

ElementMesh ElementMesh::structuredQuad(int nx, int ny) {
    if (nx <= 0 || ny <= 0) {
        throw std::invalid_argument("structured mesh requires positive nx and ny");
    }

    ElementMesh mesh;
    int numNodesX = nx + 1;

    // Generate cell connectivity
    mesh.eind.reserve(static_cast<std::size_t>(4 * nx * ny));
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            Idx n0 = static_cast<Idx>(j * numNodesX + i);
            Idx n1 = static_cast<Idx>(j * numNodesX + (i + 1));
            Idx n2 = static_cast<Idx>((j + 1) * numNodesX + (i + 1));
            Idx n3 = static_cast<Idx>((j + 1) * numNodesX + i);
            mesh.addElement({n0, n1, n2, n3});
        }
    }

    return mesh;
}

}  // namespace mpart
