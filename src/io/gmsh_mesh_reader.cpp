#include "gmsh_mesh_reader.hpp"

#include <gmsh.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mpart {

ElementMesh readGmshMesh(const std::string& mshFile, int gmshVerbose) {
    gmsh::option::setNumber("General.Verbosity", gmshVerbose);
    gmsh::open(mshFile);

    std::vector<int> elemTypes;
    std::vector<std::vector<std::size_t>> elemTags;
    std::vector<std::vector<std::size_t>> elemNodeTags;
    gmsh::model::mesh::getElements(elemTypes, elemTags, elemNodeTags);

    struct TypeInfo {
        int dim;
        int numNodes;
        int numPrimaryNodes;
    };
    std::vector<TypeInfo> infos;
    infos.reserve(elemTypes.size());

    int dimension = -1;
    for (int et : elemTypes) {
        std::string name;
        int dim, order, numNodes, numPrimaryNodes;
        std::vector<double> localNodeCoords;
        gmsh::model::mesh::getElementProperties(et, name, dim, order, numNodes,
                                                localNodeCoords, numPrimaryNodes);
        infos.push_back({dim, numNodes, numPrimaryNodes});
        dimension = std::max(dimension, dim);
    }

    if (dimension < 0) {
        throw std::runtime_error("No elements found in mesh file: " + mshFile);
    }

    ElementMesh mesh;
    std::unordered_map<std::size_t, Idx> tagToIndex;

    for (std::size_t i = 0; i < elemTypes.size(); ++i) {
        const TypeInfo& info = infos[i];
        if (info.dim != dimension) {
            continue;  // Boundary and embedded entities
        }

        std::size_t numElements = elemTags[i].size();
        const auto& allNodeTags = elemNodeTags[i];

        for (std::size_t j = 0; j < numElements; ++j) {
            for (int k = 0; k < info.numPrimaryNodes; ++k) {
                std::size_t nodeTag = allNodeTags[j * info.numNodes + k];
                auto [it, inserted] =
                    tagToIndex.emplace(nodeTag, static_cast<Idx>(mesh.nodeTags.size()));
                if (inserted) {
                    mesh.nodeTags.push_back(nodeTag);
                }
                mesh.eind.push_back(it->second);
            }
            mesh.eptr.push_back(static_cast<Idx>(mesh.eind.size()));
        }
    }

    if (!fitsIdx(mesh.eind.size())) {
        throw std::runtime_error("Mesh is too large for the index type: " + mshFile);
    }

    return mesh;
}

}  // namespace mpart
