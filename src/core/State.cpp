// ========================= src/core/State.cpp =========================
#include "State.hpp"

namespace vp {

    SearchState SearchState::root(const Network& net, int budget) {
        SearchState s;
        s.pos = net.start < 0 ? 0 : net.start;
        s.remaining = budget < 0 ? 0 : budget;
        return s;
    }

    bool SearchState::canOpen(const Network& net, int target) const {
        if (target < 0 || target >= net.size()) return false;
        if (isOpen(target) || net.flow[target] <= 0) return false;
        Dist d = net.dist.at(pos, target);
        if (d == kUnreachable) return false;
        return remaining > int(d) + 1;
    }

    SearchState SearchState::open(const Network& net, int target) const {
        SearchState next;
        next.pos = target;
        next.remaining = remaining - (int(net.dist.at(pos, target)) + 1);
        next.visited = visited | (Mask(1) << target);
        next.pressure = pressure + Pressure(net.flow[target]) * next.remaining;
        return next;
    }

    void SearchState::children(const Network& net, std::vector<SearchState>& out) const {
        for (int t = 0; t < net.size(); ++t) {
            if (canOpen(net, t)) out.push_back(open(net, t));
        }
    }

    Pressure SearchState::bound(const Network& net) const {
        Pressure total = pressure;
        if (net.empty()) return total;
        // standing on an unopened valve: it can open after 1 minute, the rest 2 apart
        int t = (!isOpen(pos) && net.flow[pos] > 0) ? remaining - 1 : remaining - 2;
        for (int v : net.byFlow) {
            if (t <= 0) break;
            if (isOpen(v) || net.flow[v] <= 0) continue;
            total += Pressure(net.flow[v]) * t;
            t -= 2;
        }
        return total;
    }

} // namespace vp
