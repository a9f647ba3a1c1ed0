// ========================= src/core/Network.cpp =========================
#include "Network.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace vp {

    static std::optional<Network> fail(std::string* reason, const std::string& msg) {
        if (reason) *reason = msg;
        return std::nullopt;
    }

    std::optional<Network> Network::build(const ValveList& records, const std::string& startValve, std::string* reason) {
        Network net;
        if (records.empty()) return net;
        if ((int)records.size() > kMaxValves)
            return fail(reason, "too many valves: " + std::to_string(records.size()) + " (limit " + std::to_string(kMaxValves) + ")");

        std::unordered_map<std::string, int> index;
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& r = records[i];
            if (r.flow < 0) return fail(reason, "valve " + r.name + " has negative flow rate " + std::to_string(r.flow));
            if (r.flow > kMaxFlow) return fail(reason, "valve " + r.name + " flow rate " + std::to_string(r.flow) + " exceeds " + std::to_string(kMaxFlow));
            if (!index.emplace(r.name, (int)i).second) return fail(reason, "duplicate valve " + r.name);
        }

        auto it = index.find(startValve);
        if (it == index.end()) return fail(reason, "start valve " + startValve + " is not in the network");
        const int startFull = it->second;

        net.allNames.reserve(records.size());
        net.tunnels.resize(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            net.allNames.push_back(records[i].name);
            for (const auto& t : records[i].tunnels) {
                auto jt = index.find(t);
                if (jt == index.end()) return fail(reason, "valve " + records[i].name + " has a tunnel to unknown valve " + t);
                net.tunnels[i].push_back(jt->second);
            }
        }
        net.allDist = DistanceMatrix::compute(net.tunnels);

        // start goes first so it keeps index 0 whatever its flow
        net.keptFrom.push_back(startFull);
        for (int i = 0; i < (int)records.size(); ++i) {
            if (i != startFull && records[i].flow > 0) net.keptFrom.push_back(i);
        }
        if ((int)net.keptFrom.size() > kMaxInteresting)
            return fail(reason, "too many interesting valves: " + std::to_string(net.keptFrom.size()) + " (mask width " + std::to_string(kMaxInteresting) + ")");

        for (int i : net.keptFrom) {
            net.names.push_back(records[i].name);
            net.flow.push_back(records[i].flow);
        }
        net.dist = net.allDist.subMatrix(net.keptFrom);
        net.start = 0;

        net.byFlow.resize(net.flow.size());
        std::iota(net.byFlow.begin(), net.byFlow.end(), 0);
        std::stable_sort(net.byFlow.begin(), net.byFlow.end(), [&](int a, int b) { return net.flow[a] > net.flow[b]; });
        return net;
    }

} // namespace vp
