// ========================= src/core/Network.hpp =========================
#pragma once
#include "Distance.hpp"

namespace vp {

    // Valves worth visiting (flow > 0, plus the start), renumbered 0..k-1.
    struct Network {
        std::vector<std::string> names;   // interesting valves only
        std::vector<int> flow;
        DistanceMatrix dist;              // k x k
        std::vector<int> byFlow;          // indices, descending flow (bound only)
        int start{ -1 };                  // -1 for an empty network

        // full graph, kept for display
        std::vector<std::string> allNames;
        std::vector<std::vector<int>> tunnels;
        DistanceMatrix allDist;
        std::vector<int> keptFrom;        // interesting index -> index in the full graph

        int size() const { return static_cast<int>(flow.size()); }
        bool empty() const { return flow.empty(); }

        // Validates the records and reduces them. Returns nullopt and fills 'reason'
        // on a configuration error (unknown tunnel, missing start, too many valves...).
        static std::optional<Network> build(const ValveList& records, const std::string& startValve, std::string* reason = nullptr);
    };

} // namespace vp
