// ========================= src/core/State.hpp =========================
#pragma once
#include "Network.hpp"

namespace vp {

    struct SearchState {
        int pos{ 0 };
        int remaining{ 0 };
        Mask visited{ 0 };
        Pressure pressure{ 0 };

        static SearchState root(const Network& net, int budget);

        bool isOpen(int v) const { return (visited >> v) & 1u; }

        // move legality: travel + 1 minute to open must leave at least one minute of flow
        bool canOpen(const Network& net, int target) const;
        SearchState open(const Network& net, int target) const;

        // appends every legal successor to 'out' (out is not cleared)
        void children(const Network& net, std::vector<SearchState>& out) const;

        // Optimistic total pressure reachable from here. Ignores the tunnels and lets the
        // highest unopened flows open 2 minutes apart, so it never underestimates.
        Pressure bound(const Network& net) const;
    };

} // namespace vp
