// ========================= src/io/Scan.hpp =========================
#pragma once
#include "../core/Types.hpp"
#include <string>

namespace vp {

    // Scan report text, one valve per line:
    //   Valve AA has flow rate=0; tunnels lead to valves DD, II, BB
    //   Valve JJ has flow rate=21; tunnel leads to valve II
    struct ScanIO {
        static std::optional<ValveRecord> parseLine(const std::string& line, std::string* reason = nullptr);
        static std::optional<ValveList> parse(const std::string& text, std::string* reason = nullptr);
        static std::optional<ValveList> loadFile(const std::string& path, std::string* reason = nullptr);

        static std::string format(const ValveList& valves);
        static bool saveFile(const std::string& path, const ValveList& valves);
    };

} // namespace vp
