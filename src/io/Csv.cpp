// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <exception>
#include <stdexcept>
#include <cstdint>

namespace vp {

    static const char* kHeader = "index,source,valves,interesting,start,budget,pressure,helper_budget,pressure_with_helper,nodes";

    CsvRow CsvIO::encode(int index, const std::string& source, const Network& net, const SolveOptions& opt,
        Pressure pressure, Pressure pressureWithHelper, uint64_t nodes) {
        CsvRow row;
        row.index = index;
        row.source = source;
        row.Valves = (int)net.allNames.size();
        row.Interesting = net.size();
        row.Start = opt.startValve;
        row.Budget = opt.timeBudget;
        row.Pressure = pressure;
        row.HelperBudget = opt.helperBudget;
        row.PressureWithHelper = pressureWithHelper;
        row.Nodes = nodes;
        return row;
    }

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    // commas would break the columns; paths rarely have them
    static std::string clean(const std::string& s) {
        std::string out = s;
        for (char& c : out) if (c == ',' || c == '\n' || c == '\r') c = '_';
        return out;
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) return false;
        if (!exists || !appendIfExists) f << kHeader << "\n";
        for (const auto& r : rows) {
            f << r.index << ',' << clean(r.source) << ',' << r.Valves << ',' << r.Interesting << ',' << clean(r.Start) << ','
                << r.Budget << ',' << r.Pressure << ',' << r.HelperBudget << ',' << r.PressureWithHelper << ',' << r.Nodes << "\n";
        }
        return bool(f);
    }

    // whole cell must be a number: "12abc" is rejected
    template <typename T, typename Conv>
    static T parseCell(const std::string& cell, Conv conv) {
        std::size_t pos = 0;
        T v = T(conv(cell, &pos, 10));
        if (pos != cell.size()) throw std::invalid_argument(cell);
        return v;
    }

    static int toInt(const std::string& s) {
        return parseCell<int>(s, [](const std::string& c, std::size_t* p, int b) { return std::stoi(c, p, b); });
    }
    static int64_t toI64(const std::string& s) {
        return parseCell<int64_t>(s, [](const std::string& c, std::size_t* p, int b) { return std::stoll(c, p, b); });
    }
    static uint64_t toU64(const std::string& s) {
        if (!s.empty() && s[0] == '-') throw std::invalid_argument(s);
        return parseCell<uint64_t>(s, [](const std::string& c, std::size_t* p, int b) { return std::stoull(c, p, b); });
    }

    std::vector<CsvRow> CsvIO::load(const std::string& path) {
        std::vector<CsvRow> out; std::ifstream f(path);
        if (!f) return out;
        std::string line; bool first = true;
        while (std::getline(f, line)) {
            if (first) { first = false; continue; }
            if (line.empty()) continue;
            auto cells = split(line, ',');
            if (cells.size() != 10) continue;
            CsvRow r; int i = 0;
            try {
                r.index = toInt(cells[i++]);
                r.source = cells[i++];
                r.Valves = toInt(cells[i++]);
                r.Interesting = toInt(cells[i++]);
                r.Start = cells[i++];
                r.Budget = toInt(cells[i++]);
                r.Pressure = toI64(cells[i++]);
                r.HelperBudget = toInt(cells[i++]);
                r.PressureWithHelper = toI64(cells[i++]);
                r.Nodes = toU64(cells[i++]);
            }
            catch (const std::exception&) {
                continue; // malformed row
            }
            out.push_back(std::move(r));
        }
        return out;
    }

} // namespace vp
