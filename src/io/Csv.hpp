// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Network.hpp"
#include <string>
#include <vector>

namespace vp {

    struct CsvRow {
        int index{ 0 };             // run number
        std::string source;         // scan file path or "generated:<seed>"
        int Valves{ 0 };
        int Interesting{ 0 };
        std::string Start;
        int Budget{ 0 };
        int64_t Pressure{ 0 };
        int HelperBudget{ 0 };
        int64_t PressureWithHelper{ 0 };
        uint64_t Nodes{ 0 };
    };

    struct CsvIO {
        static CsvRow encode(int index, const std::string& source, const Network& net, const SolveOptions& opt,
            Pressure pressure, Pressure pressureWithHelper, uint64_t nodes);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true);
        static std::vector<CsvRow> load(const std::string& path);
    };

} // namespace vp
