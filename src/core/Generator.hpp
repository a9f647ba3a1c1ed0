// ========================= src/core/Generator.hpp =========================
#pragma once
#include "Types.hpp"

namespace vp {

    struct GenOptions {
        int valves{ 10 };             // total valves, start included
        int interesting{ 6 };         // valves with flow > 0 (start excluded, capped to valves-1)
        int maxFlow{ 25 };
        int extraTunnels{ 4 };        // added on top of the spanning tree
        bool startHasFlow{ false };
        uint64_t seed{ 0xA17C3B5ECAFEBEEFULL };
    };

    struct RNG { uint64_t s = 0x9E3779B97F4A7C15ULL; uint64_t next(); int irange(int lo, int hi); };

    // Random connected networks for the desktop tool and the property tests.
    class Generator {
    public:
        explicit Generator(GenOptions opt);

        // Valve 0 is named after 'start'; the rest get two-letter names AA..ZZ in order.
        ValveList makeOne(const std::string& start = "AA");

        static std::string nameFor(int i);

    private:
        GenOptions opt; RNG rng;
    };

} // namespace vp
