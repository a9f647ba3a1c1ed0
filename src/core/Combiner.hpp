// ========================= src/core/Combiner.hpp =========================
#pragma once
#include "Types.hpp"

namespace vp {

    struct MaskValue { Mask mask{ 0 }; Pressure value{ 0 }; };

    // Non-zero entries of a best-per-mask table, sorted by value descending.
    std::vector<MaskValue> rankedMasks(const std::vector<Pressure>& table);

    // Best value1 + value2 over two disjoint masks of the table. A helper that opens
    // nothing is a valid partner, so the result is never below the best single entry.
    Pressure bestDisjointPair(const std::vector<Pressure>& table);

} // namespace vp
