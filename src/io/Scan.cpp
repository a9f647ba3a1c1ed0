// ========================= src/io/Scan.cpp =========================
#include "Scan.hpp"
#include <fstream>
#include <sstream>
#include <cctype>

namespace vp {

    static std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace((unsigned char)s[b])) ++b;
        while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
        return s.substr(b, e - b);
    }

    static bool isName(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) if (!std::isalnum((unsigned char)c)) return false;
        return true;
    }

    // consumes 'lit' at 'pos'
    static bool expect(const std::string& s, size_t& pos, const char* lit) {
        std::string l(lit);
        if (s.compare(pos, l.size(), l) != 0) return false;
        pos += l.size();
        return true;
    }

    static std::optional<ValveRecord> bad(std::string* reason, const std::string& msg) {
        if (reason) *reason = msg;
        return std::nullopt;
    }

    std::optional<ValveRecord> ScanIO::parseLine(const std::string& raw, std::string* reason) {
        std::string line = trim(raw);
        ValveRecord v;
        size_t pos = 0;
        if (!expect(line, pos, "Valve ")) return bad(reason, "expected 'Valve '");

        size_t sp = line.find(' ', pos);
        if (sp == std::string::npos) return bad(reason, "missing valve name");
        v.name = line.substr(pos, sp - pos);
        if (!isName(v.name)) return bad(reason, "bad valve name '" + v.name + "'");
        pos = sp;

        if (!expect(line, pos, " has flow rate=")) return bad(reason, "expected 'has flow rate='");
        size_t numStart = pos;
        while (pos < line.size() && std::isdigit((unsigned char)line[pos])) ++pos;
        if (pos == numStart) return bad(reason, "missing flow rate");
        if (pos - numStart > 9) return bad(reason, "flow rate too large");
        v.flow = std::stoi(line.substr(numStart, pos - numStart));

        if (!expect(line, pos, "; ")) return bad(reason, "expected ';' after flow rate");
        if (!expect(line, pos, "tunnels lead to valves ") && !expect(line, pos, "tunnel leads to valve "))
            return bad(reason, "expected tunnel list");

        std::istringstream iss(line.substr(pos));
        std::string cur;
        while (std::getline(iss, cur, ',')) {
            cur = trim(cur);
            if (!isName(cur)) return bad(reason, "bad tunnel target '" + cur + "'");
            v.tunnels.push_back(cur);
        }
        if (v.tunnels.empty()) return bad(reason, "empty tunnel list");
        return v;
    }

    std::optional<ValveList> ScanIO::parse(const std::string& text, std::string* reason) {
        ValveList out;
        std::istringstream iss(text);
        std::string line; int lineNo = 0;
        while (std::getline(iss, line)) {
            ++lineNo;
            if (trim(line).empty()) continue;
            std::string why;
            auto v = parseLine(line, &why);
            if (!v) {
                if (reason) *reason = "line " + std::to_string(lineNo) + ": " + why;
                return std::nullopt;
            }
            out.push_back(std::move(*v));
        }
        return out;
    }

    std::optional<ValveList> ScanIO::loadFile(const std::string& path, std::string* reason) {
        std::ifstream f(path);
        if (!f) {
            if (reason) *reason = "cannot open " + path;
            return std::nullopt;
        }
        std::ostringstream oss; oss << f.rdbuf();
        return parse(oss.str(), reason);
    }

    std::string ScanIO::format(const ValveList& valves) {
        std::ostringstream oss;
        for (const auto& v : valves) {
            oss << "Valve " << v.name << " has flow rate=" << v.flow << "; ";
            oss << (v.tunnels.size() == 1 ? "tunnel leads to valve " : "tunnels lead to valves ");
            for (size_t i = 0; i < v.tunnels.size(); ++i) {
                if (i) oss << ", ";
                oss << v.tunnels[i];
            }
            oss << "\n";
        }
        return oss.str();
    }

    bool ScanIO::saveFile(const std::string& path, const ValveList& valves) {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) return false;
        f << format(valves);
        return bool(f);
    }

} // namespace vp
