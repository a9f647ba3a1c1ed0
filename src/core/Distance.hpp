// ========================= src/core/Distance.hpp =========================
#pragma once
#include "Types.hpp"

namespace vp {

    // Square matrix of shortest tunnel distances, row-major.
    struct DistanceMatrix {
        int n{ 0 };
        std::vector<Dist> d;

        Dist at(int i, int j) const { return d[size_t(i) * n + j]; }
        Dist& at(int i, int j) { return d[size_t(i) * n + j]; }

        bool isSymmetric() const;

        // all-pairs shortest paths over an undirected adjacency list (Floyd-Warshall, unit weights)
        static DistanceMatrix compute(const std::vector<std::vector<int>>& adjacency);

        // rows/cols restricted to 'keep', in that order
        DistanceMatrix subMatrix(const std::vector<int>& keep) const;
    };

} // namespace vp
