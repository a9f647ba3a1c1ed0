// ========================= src/core/Distance.cpp =========================
#include "Distance.hpp"

namespace vp {

    DistanceMatrix DistanceMatrix::compute(const std::vector<std::vector<int>>& adjacency) {
        DistanceMatrix m; m.n = (int)adjacency.size();
        m.d.assign(size_t(m.n) * m.n, kUnreachable);
        for (int i = 0; i < m.n; ++i) {
            m.at(i, i) = 0;
            for (int j : adjacency[i]) {
                if (j == i) continue;
                // tunnels work both ways even if the report lists only one side
                m.at(i, j) = 1; m.at(j, i) = 1;
            }
        }

        for (int k = 0; k < m.n; ++k) {
            for (int i = 0; i < m.n; ++i) {
                Dist ik = m.at(i, k);
                if (ik == kUnreachable) continue;
                for (int j = 0; j < m.n; ++j) {
                    Dist via = saturatingAdd(ik, m.at(k, j));
                    if (via < m.at(i, j)) m.at(i, j) = via;
                }
            }
        }
        return m;
    }

    DistanceMatrix DistanceMatrix::subMatrix(const std::vector<int>& keep) const {
        DistanceMatrix s; s.n = (int)keep.size();
        s.d.resize(size_t(s.n) * s.n);
        for (int i = 0; i < s.n; ++i)
            for (int j = 0; j < s.n; ++j) s.at(i, j) = at(keep[i], keep[j]);
        return s;
    }

    bool DistanceMatrix::isSymmetric() const {
        for (int i = 0; i < n; ++i) {
            if (at(i, i) != 0) return false;
            for (int j = i + 1; j < n; ++j) if (at(i, j) != at(j, i)) return false;
        }
        return true;
    }

} // namespace vp
