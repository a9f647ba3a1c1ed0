// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <limits>

namespace vp {

    using Mask = uint32_t;          // bit i = interesting valve i opened
    using Dist = uint16_t;          // tunnel steps between two valves
    using Pressure = int64_t;       // flow * minutes, summed over a walk

    constexpr int kMaxInteresting = 16;                                  // mask width used by the search
    constexpr Dist kUnreachable = std::numeric_limits<Dist>::max();     // sentinel for "no route"
    constexpr int kMaxValves = kUnreachable - 1;                        // keeps every real distance below the sentinel
    constexpr int kMaxFlow = 100000000;                                  // 2 * 16 * kMaxFlow * INT_MAX minutes fits in Pressure

    // One line of the scan report, as handed over by the parser.
    struct ValveRecord {
        std::string name;
        int flow{ 0 };
        std::vector<std::string> tunnels;
    };

    using ValveList = std::vector<ValveRecord>;

    struct SolveOptions {
        std::string startValve{ "AA" };
        int timeBudget{ 30 };
        int helperBudget{ 26 };
        double helperPruneRatio{ 0.75 }; // table pass prunes only when bound <= ratio * best
        int exhaustiveBelow{ 12 };       // fewer interesting valves than this: table pass does not prune
        int threads{ 1 };                // >1 splits the root children across workers
    };

    struct SearchStats {
        uint64_t expanded{ 0 };
        uint64_t pruned{ 0 };
        uint64_t tableEntries{ 0 };

        void merge(const SearchStats& o) { expanded += o.expanded; pruned += o.pruned; tableEntries += o.tableEntries; }
    };

    inline Dist saturatingAdd(Dist a, Dist b) {
        if (a == kUnreachable || b == kUnreachable) return kUnreachable;
        uint32_t s = uint32_t(a) + uint32_t(b);
        return s >= kUnreachable ? kUnreachable : Dist(s);
    }

} // namespace vp
