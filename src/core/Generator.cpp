// ========================= src/core/Generator.cpp =========================
#include "Generator.hpp"
#include <algorithm>
#include <set>

namespace vp {

    static uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }
    uint64_t RNG::next() { s ^= rotl(s, 7); s ^= (s >> 9); return s * 0x9E3779B97F4A7C15ULL; }
    int RNG::irange(int lo, int hi) { return lo + int(next() % uint64_t(hi - lo + 1)); }

    Generator::Generator(GenOptions opt_) :opt(opt_) { rng.s = opt.seed ? opt.seed : 0xBADC0FFEEULL; }

    std::string Generator::nameFor(int i) {
        std::string n(2, 'A');
        n[0] = char('A' + (i / 26) % 26);
        n[1] = char('A' + i % 26);
        return n;
    }

    ValveList Generator::makeOne(const std::string& start) {
        int count = std::max(1, std::min(opt.valves, 26 * 26));
        ValveList out(count);

        // names: start first, then AA.. skipping whatever the start took
        out[0].name = start;
        for (int i = 1, k = 0; i < count; ++k) {
            std::string n = nameFor(k);
            if (n == start) continue;
            out[i++].name = n;
        }

        // flows: pick 'interesting' non-start valves at random
        std::vector<int> order;
        for (int i = 1; i < count; ++i) order.push_back(i);
        for (size_t i = 0; i < order.size(); ++i) std::swap(order[i], order[size_t(rng.irange(0, (int)order.size() - 1))]);
        int flowing = std::min<int>(std::max(0, opt.interesting), (int)order.size());
        int maxFlow = std::max(1, opt.maxFlow);
        for (int i = 0; i < flowing; ++i) out[order[i]].flow = rng.irange(1, maxFlow);
        if (opt.startHasFlow) out[0].flow = rng.irange(1, maxFlow);

        // random spanning tree keeps everything reachable, then a few shortcuts
        std::set<std::pair<int, int>> edges;
        for (int i = 1; i < count; ++i) {
            int j = rng.irange(0, i - 1);
            edges.insert({ j, i });
        }
        for (int e = 0, tries = 0; e < opt.extraTunnels && tries < opt.extraTunnels * 8 && count > 2; ++tries) {
            int a = rng.irange(0, count - 1), b = rng.irange(0, count - 1);
            if (a == b) continue;
            if (edges.insert({ std::min(a, b), std::max(a, b) }).second) ++e;
        }
        for (const auto& [a, b] : edges) {
            out[a].tunnels.push_back(out[b].name);
            out[b].tunnels.push_back(out[a].name);
        }
        return out;
    }

} // namespace vp
