// ========================= src/core/Combiner.cpp =========================
#include "Combiner.hpp"
#include <algorithm>

namespace vp {

    std::vector<MaskValue> rankedMasks(const std::vector<Pressure>& table) {
        std::vector<MaskValue> out;
        for (size_t m = 0; m < table.size(); ++m) {
            if (table[m] > 0) out.push_back(MaskValue{ Mask(m), table[m] });
        }
        std::stable_sort(out.begin(), out.end(), [](const MaskValue& a, const MaskValue& b) { return a.value > b.value; });
        return out;
    }

    Pressure bestDisjointPair(const std::vector<Pressure>& table) {
        auto ranked = rankedMasks(table);
        if (ranked.empty()) return 0;

        Pressure best = ranked[0].value; // paired with the empty walk
        for (size_t i = 0; i < ranked.size(); ++i) {
            const auto& a = ranked[i];
            if (2 * a.value <= best) break;
            for (size_t j = i + 1; j < ranked.size(); ++j) {
                const auto& b = ranked[j];
                if (a.value + b.value <= best) break;
                if (a.mask & b.mask) continue;
                // sorted descending: the first disjoint partner is the best one for 'a'
                best = a.value + b.value;
                break;
            }
        }
        return best;
    }

} // namespace vp
