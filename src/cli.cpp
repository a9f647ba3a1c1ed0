// ========================= src/cli.cpp =========================
#include "core/Solver.hpp"
#include "io/Scan.hpp"
#include "io/Csv.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace vp;

static int usage(const char* argv0) {
    std::fprintf(stderr,
        "usage: %s <scan-file> [--start NAME] [--budget N] [--helper-budget N]\n"
        "       [--prune-ratio R] [--exhaustive-below K] [--threads N] [--csv PATH] [--verbose]\n", argv0);
    return 2;
}

static bool toInt(const char* s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < 0 || v > 1000000) return false;
    out = int(v); return true;
}

static bool toDouble(const char* s, double& out) {
    char* end = nullptr;
    out = std::strtod(s, &end);
    return end != s && *end == '\0';
}

int main(int argc, char* argv[]) {
    SolveOptions opt;
    std::string scanPath, csvPath;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool hasValue = i + 1 < argc;
        bool ok = true;
        if (a == "--verbose" || a == "-v") verbose = true;
        else if (a == "--start" && hasValue) opt.startValve = argv[++i];
        else if (a == "--budget" && hasValue) ok = toInt(argv[++i], opt.timeBudget);
        else if (a == "--helper-budget" && hasValue) ok = toInt(argv[++i], opt.helperBudget);
        else if (a == "--prune-ratio" && hasValue) ok = toDouble(argv[++i], opt.helperPruneRatio);
        else if (a == "--exhaustive-below" && hasValue) ok = toInt(argv[++i], opt.exhaustiveBelow);
        else if (a == "--threads" && hasValue) ok = toInt(argv[++i], opt.threads);
        else if (a == "--csv" && hasValue) csvPath = argv[++i];
        else if (!a.empty() && a[0] != '-' && scanPath.empty()) scanPath = a;
        else ok = false;
        if (!ok) return usage(argv[0]);
    }
    if (scanPath.empty()) return usage(argv[0]);

    std::string reason;
    auto records = ScanIO::loadFile(scanPath, &reason);
    if (!records) { std::fprintf(stderr, "error: %s\n", reason.c_str()); return 1; }

    auto net = Network::build(*records, opt.startValve, &reason);
    if (!net) { std::fprintf(stderr, "error: %s\n", reason.c_str()); return 1; }

    SearchStats single, helper;
    Pressure pressure = maxPressure(*net, opt.timeBudget, opt, &single);
    Pressure withHelper = maxPressureWithHelper(*net, opt.helperBudget, opt, &helper);

    std::printf("%lld\n%lld\n", (long long)pressure, (long long)withHelper);

    if (verbose) {
        std::fprintf(stderr, "[search] valves=%zu interesting=%d\n", records->size(), net->size());
        std::fprintf(stderr, "[search] single: expanded=%llu pruned=%llu\n",
            (unsigned long long)single.expanded, (unsigned long long)single.pruned);
        std::fprintf(stderr, "[search] helper: expanded=%llu pruned=%llu masks=%llu\n",
            (unsigned long long)helper.expanded, (unsigned long long)helper.pruned, (unsigned long long)helper.tableEntries);
    }

    if (!csvPath.empty()) {
        auto existing = CsvIO::load(csvPath);
        int idx = existing.empty() ? 0 : existing.back().index + 1;
        auto row = CsvIO::encode(idx, scanPath, *net, opt, pressure, withHelper, single.expanded + helper.expanded);
        if (!CsvIO::save(csvPath, { row }, true)) {
            std::fprintf(stderr, "error: cannot write %s\n", csvPath.c_str());
            return 1;
        }
    }
    return 0;
}
