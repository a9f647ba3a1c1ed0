#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/Solver.hpp"
#include "core/Combiner.hpp"
#include "core/Generator.hpp"

using namespace vp;

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

ValveRecord valve(const std::string& name, int flow, std::vector<std::string> tunnels) {
    ValveRecord v; v.name = name; v.flow = flow; v.tunnels = std::move(tunnels);
    return v;
}

ValveList exampleValves() {
    return {
        valve("AA", 0, { "DD", "II", "BB" }),
        valve("BB", 13, { "CC", "AA" }),
        valve("CC", 2, { "DD", "BB" }),
        valve("DD", 20, { "CC", "AA", "EE" }),
        valve("EE", 3, { "FF", "DD" }),
        valve("FF", 0, { "EE", "GG" }),
        valve("GG", 0, { "FF", "HH" }),
        valve("HH", 22, { "GG" }),
        valve("II", 0, { "AA", "JJ" }),
        valve("JJ", 21, { "II" }),
    };
}

Network buildOrDie(const ValveList& records, const std::string& start = "AA") {
    std::string reason;
    auto net = Network::build(records, start, &reason);
    REQUIRE(net.has_value(), "network rejected: " << reason);
    return *net;
}

int indexOf(const Network& net, const std::string& name) {
    for (int i = 0; i < net.size(); ++i) if (net.names[i] == name) return i;
    return -1;
}

// Plain exhaustive search, independent of the branch function.
Pressure bruteForce(const Network& net, int pos, int remaining, Mask visited, Pressure pressure) {
    Pressure best = pressure;
    for (int t = 0; t < net.size(); ++t) {
        if ((visited >> t) & 1u) continue;
        if (net.flow[t] <= 0) continue;
        Dist d = net.dist.at(pos, t);
        if (d == kUnreachable) continue;
        int left = remaining - int(d) - 1;
        if (left <= 0) continue;
        best = std::max(best, bruteForce(net, t, left, visited | (Mask(1) << t), pressure + Pressure(net.flow[t]) * left));
    }
    return best;
}

Pressure bruteForce(const Network& net, const SearchState& s) {
    return bruteForce(net, s.pos, s.remaining, s.visited, s.pressure);
}

void fillBruteTable(const Network& net, const SearchState& s, std::vector<Pressure>& table) {
    table[s.visited] = std::max(table[s.visited], s.pressure);
    std::vector<SearchState> kids;
    s.children(net, kids);
    for (const auto& k : kids) fillBruteTable(net, k, table);
}

Pressure brutePair(const std::vector<Pressure>& table) {
    Pressure best = 0;
    for (size_t a = 0; a < table.size(); ++a)
        for (size_t b = 0; b < table.size(); ++b)
            if ((a & b) == 0) best = std::max(best, table[a] + table[b]);
    return best;
}

// every reachable state must have bound >= exhaustive optimum from it
int checkBoundsFrom(const Network& net, const SearchState& s) {
    Pressure truth = bruteForce(net, s);
    REQUIRE(s.bound(net) >= truth, "bound " << s.bound(net) << " below optimum " << truth
        << " (pos=" << s.pos << " remaining=" << s.remaining << " visited=" << s.visited << ")");
    int checked = 1;
    std::vector<SearchState> kids;
    s.children(net, kids);
    for (const auto& k : kids) checked += checkBoundsFrom(net, k);
    return checked;
}

GenOptions smallOptions(uint64_t seed, int valves, int interesting, bool startHasFlow) {
    GenOptions g;
    g.valves = valves;
    g.interesting = interesting;
    g.maxFlow = 20;
    g.extraTunnels = 2;
    g.startHasFlow = startHasFlow;
    g.seed = seed;
    return g;
}

} // namespace

static void runDistanceMatrix() {
    Network net = buildOrDie(exampleValves());
    REQUIRE(net.allDist.n == 10, "full matrix covers every valve");
    REQUIRE(net.allDist.isSymmetric(), "full matrix symmetric with zero diagonal");
    REQUIRE(net.dist.isSymmetric(), "reduced matrix symmetric with zero diagonal");

    int aa = indexOf(net, "AA"), hh = indexOf(net, "HH"), jj = indexOf(net, "JJ"), cc = indexOf(net, "CC");
    REQUIRE(net.dist.at(aa, hh) == 5, "AA -> HH is 5 steps");
    REQUIRE(net.dist.at(aa, jj) == 2, "AA -> JJ is 2 steps");
    REQUIRE(net.dist.at(jj, cc) == 4, "JJ -> CC is 4 steps");

    // one-sided tunnel listing still connects both ways
    ValveList oneWay = { valve("AA", 0, { "BB" }), valve("BB", 5, { "CC" }), valve("CC", 7, {}) };
    Network n2 = buildOrDie(oneWay);
    REQUIRE(n2.dist.at(indexOf(n2, "CC"), indexOf(n2, "AA")) == 2, "undirected tunnels");

    // disconnected valve stays unreachable and is never a target
    ValveList split = { valve("AA", 0, { "BB" }), valve("BB", 5, { "AA" }), valve("CC", 50, {}) };
    Network n3 = buildOrDie(split);
    REQUIRE(n3.dist.at(indexOf(n3, "AA"), indexOf(n3, "CC")) == kUnreachable, "no route to CC");
    REQUIRE(maxPressure(n3, 10) == 5 * 8, "only BB counts");
    std::cout << "[PASS] distance matrix\n";
}

static void runReduction() {
    Network net = buildOrDie(exampleValves());
    REQUIRE(net.size() == 7, "six flowing valves plus the start, got " << net.size());
    REQUIRE(net.start == 0 && net.names[0] == "AA", "start keeps index 0");
    REQUIRE(net.names[net.byFlow[0]] == "HH", "highest flow first");
    for (size_t i = 1; i < net.byFlow.size(); ++i)
        REQUIRE(net.flow[net.byFlow[i - 1]] >= net.flow[net.byFlow[i]], "byFlow descending");
    for (int i = 1; i < net.size(); ++i) REQUIRE(net.flow[i] > 0, "zero-flow valves dropped");
    std::cout << "[PASS] reduction\n";
}

static void runCanonicalExample() {
    Network net = buildOrDie(exampleValves());
    REQUIRE(maxPressure(net, 30) == 1651, "single agent, 30 minutes");
    REQUIRE(maxPressureWithHelper(net, 26) == 1707, "with helper, 26 minutes");

    SolveOptions pruned;
    pruned.exhaustiveBelow = 0; // force the 0.75 table pruning
    REQUIRE(maxPressureWithHelper(net, 26, pruned) == 1707, "table pruning keeps the best pair");

    SolveOptions threaded;
    threaded.threads = 4;
    REQUIRE(maxPressure(net, 30, threaded) == 1651, "threaded single agent");
    REQUIRE(maxPressureWithHelper(net, 26, threaded) == 1707, "threaded with helper");

    // repeated calls on the same network
    for (int i = 0; i < 3; ++i) {
        REQUIRE(maxPressure(net, 30) == 1651, "deterministic single agent");
        REQUIRE(maxPressureWithHelper(net, 26) == 1707, "deterministic with helper");
    }
    std::cout << "[PASS] canonical example (1651 / 1707)\n";
}

static void runBudgetProperties() {
    Network net = buildOrDie(exampleValves());
    REQUIRE(maxPressure(net, 0) == 0, "zero budget");
    REQUIRE(maxPressureWithHelper(net, 0) == 0, "zero budget with helper");
    REQUIRE(maxPressure(net, 2) == 0, "AA has no flow and every valve is at least 1 step away");

    Pressure prev = 0;
    for (int t = 0; t <= 30; ++t) {
        Pressure p = maxPressure(net, t);
        REQUIRE(p >= prev, "non-decreasing in budget at t=" << t);
        Pressure h = maxPressureWithHelper(net, t);
        REQUIRE(h >= p, "helper never hurts at t=" << t << " (" << h << " < " << p << ")");
        prev = p;
    }
    std::cout << "[PASS] budget properties\n";
}

static void runBoundSoundness() {
    int states = 0;
    for (uint64_t seed = 1; seed <= 40; ++seed) {
        int valves = 4 + int(seed % 3);
        Generator gen(smallOptions(seed * 7919, valves, std::min(valves - 1, 4), seed % 4 == 0));
        Network net = buildOrDie(gen.makeOne("AA"));
        for (int budget : { 5, 12, 20 }) {
            states += checkBoundsFrom(net, SearchState::root(net, budget));
        }
    }
    REQUIRE(states > 100, "explored enough states, got " << states);
    std::cout << "[PASS] bound soundness (" << states << " states)\n";
}

static void runAgainstBruteForce() {
    for (uint64_t seed = 1; seed <= 30; ++seed) {
        Generator gen(smallOptions(seed * 104729, 6 + int(seed % 4), 5, seed % 5 == 0));
        Network net = buildOrDie(gen.makeOne("AA"));
        for (int budget : { 8, 15, 26, 30 }) {
            SearchState root = SearchState::root(net, budget);
            Pressure truth = bruteForce(net, root);
            REQUIRE(maxPressure(net, budget) == truth, "seed " << seed << " budget " << budget);

            std::vector<Pressure> table(size_t(1) << net.size(), 0);
            fillBruteTable(net, root, table);
            Pressure pair = brutePair(table);
            REQUIRE(maxPressureWithHelper(net, budget) == pair, "pair seed " << seed << " budget " << budget);

            SolveOptions loose;
            loose.exhaustiveBelow = 0;
            Pressure approx = maxPressureWithHelper(net, budget, loose);
            REQUIRE(approx <= pair && approx >= truth, "pruned table stays within [single, exact]");

            SolveOptions threaded;
            threaded.threads = 3;
            REQUIRE(maxPressure(net, budget, threaded) == truth, "threaded single agent");
            REQUIRE(maxPressureWithHelper(net, budget, threaded) == pair, "threaded pair");
        }
    }
    std::cout << "[PASS] branch-and-bound matches brute force\n";
}

static void runTableContents() {
    Network net = buildOrDie(exampleValves());
    Solver solver(net);
    std::vector<Pressure> table;
    auto res = solver.fillTable(26, 0.0, table);
    REQUIRE(table.size() == (size_t(1) << net.size()), "dense table sized 2^k");
    REQUIRE(table[0] == 0, "empty walk releases nothing");
    for (size_t m = 0; m < table.size(); ++m)
        if (m & 1u) REQUIRE(table[m] == 0, "start valve never opened (flow 0)");
    REQUIRE(res.stats.tableEntries > 0, "table filled");

    int jj = indexOf(net, "JJ"), bb = indexOf(net, "BB"), cc = indexOf(net, "CC");
    Mask human = (Mask(1) << jj) | (Mask(1) << bb) | (Mask(1) << cc);
    REQUIRE(table[human] == 764, "JJ, BB, CC in 26 minutes, got " << table[human]);
    std::cout << "[PASS] best-per-mask table\n";
}

static void runCombiner() {
    std::vector<Pressure> empty(8, 0);
    REQUIRE(bestDisjointPair(empty) == 0, "nothing to pair");

    std::vector<Pressure> single(8, 0);
    single[1] = 5;
    REQUIRE(bestDisjointPair(single) == 5, "helper may stay idle");

    std::vector<Pressure> t(8, 0);
    t[1] = 10; t[2] = 9; t[3] = 15; t[4] = 1;
    REQUIRE(bestDisjointPair(t) == 19, "10 + 9 beats 15 + 1");

    std::vector<Pressure> overlap(8, 0);
    overlap[3] = 40; overlap[6] = 39; overlap[1] = 2; overlap[4] = 1;
    REQUIRE(bestDisjointPair(overlap) == 41, "masks 3 and 6 share bit 1; best is 3 + 4");

    auto ranked = rankedMasks(t);
    REQUIRE(ranked.size() == 4 && ranked[0].mask == 3 && ranked[3].mask == 4, "ranked by value");
    std::cout << "[PASS] combiner\n";
}

static void runZeroFlowPassThrough() {
    Network base = buildOrDie(exampleValves());
    Pressure expect = maxPressure(base, 30);
    Pressure expectHelper = maxPressureWithHelper(base, 26);

    // a dead-end chain of zero-flow valves never shortens a route
    ValveList deadEnd = exampleValves();
    deadEnd.push_back(valve("ZZ", 0, { "JJ" }));
    deadEnd.push_back(valve("ZY", 0, { "ZZ" }));
    Network withLeaf = buildOrDie(deadEnd);
    REQUIRE(withLeaf.size() == base.size(), "same interesting valves");
    REQUIRE(maxPressure(withLeaf, 30) == expect, "leaf valve changes nothing");
    REQUIRE(maxPressureWithHelper(withLeaf, 26) == expectHelper, "leaf valve changes nothing with helper");
    std::cout << "[PASS] zero-flow pass-through\n";
}

static void runConfigurationErrors() {
    std::string reason;

    ValveList unknown = { valve("AA", 0, { "QQ" }) };
    REQUIRE(!Network::build(unknown, "AA", &reason), "unknown tunnel rejected");
    REQUIRE(reason.find("QQ") != std::string::npos, "reason names the valve: " << reason);

    ValveList noStart = { valve("BB", 3, { "CC" }), valve("CC", 1, { "BB" }) };
    REQUIRE(!Network::build(noStart, "AA", &reason), "missing start rejected");
    REQUIRE(reason.find("start") != std::string::npos, "reason mentions start: " << reason);

    ValveList dup = { valve("AA", 0, { "AA" }), valve("AA", 1, { "AA" }) };
    REQUIRE(!Network::build(dup, "AA", &reason), "duplicate rejected");

    ValveList negative = { valve("AA", -1, { "AA" }) };
    REQUIRE(!Network::build(negative, "AA", &reason), "negative flow rejected");

    ValveList huge = { valve("AA", 0, { "BB" }), valve("BB", kMaxFlow + 1, { "AA" }) };
    REQUIRE(!Network::build(huge, "AA", &reason), "flow above the limit rejected");
    REQUIRE(reason.find("BB") != std::string::npos && reason.find("exceeds") != std::string::npos,
        "reason names the valve and the limit: " << reason);

    GenOptions g; g.valves = 20; g.interesting = kMaxInteresting; g.seed = 99;
    Generator gen(g);
    REQUIRE(!Network::build(gen.makeOne("AA"), "AA", &reason), "17 interesting valves exceed the mask");
    REQUIRE(reason.find("interesting") != std::string::npos, "reason names the limit: " << reason);

    g.interesting = kMaxInteresting - 1;
    Generator fits(g);
    REQUIRE(Network::build(fits.makeOne("AA"), "AA", &reason).has_value(), "16 interesting valves fit");

    // empty input is valid
    auto empty = Network::build({}, "AA", &reason);
    REQUIRE(empty.has_value() && empty->empty(), "empty network accepted");
    REQUIRE(maxPressure(*empty, 30) == 0, "empty network releases nothing");
    REQUIRE(maxPressureWithHelper(*empty, 26) == 0, "empty network releases nothing with helper");
    std::cout << "[PASS] configuration errors\n";
}

static void runLargeFlows() {
    // products overflow 32 bits: 28 * 1e8 alone is 2.8e9
    ValveList v = { valve("AA", 0, { "BB", "CC" }), valve("BB", 100000000, { "AA" }), valve("CC", 90000000, { "AA" }) };
    Network net = buildOrDie(v);
    const Pressure single = Pressure(100000000) * 28 + Pressure(90000000) * 25;
    REQUIRE(single == 5050000000LL, "hand total");
    REQUIRE(maxPressure(net, 30) == single, "BB then CC, got " << maxPressure(net, 30));
    REQUIRE(SearchState::root(net, 30).bound(net) >= single, "bound does not wrap");

    // each agent opens one valve at minute 24
    const Pressure pair = Pressure(100000000) * 24 + Pressure(90000000) * 24;
    REQUIRE(maxPressureWithHelper(net, 26) == pair, "pair of 4560000000, got " << maxPressureWithHelper(net, 26));

    SolveOptions pruned;
    pruned.exhaustiveBelow = 0;
    pruned.threads = 2;
    REQUIRE(maxPressure(net, 30, pruned) == single, "threaded single agent with large flows");
    REQUIRE(maxPressureWithHelper(net, 26, pruned) == pair, "pruned table with large flows");

    std::vector<Pressure> table = { 0, 3000000000LL, 2900000000LL, 0 };
    REQUIRE(bestDisjointPair(table) == 5900000000LL, "combiner sums past 32 bits");
    std::cout << "[PASS] large flows\n";
}

static void runPositiveFlowStart() {
    ValveList v = { valve("AA", 10, { "BB" }), valve("BB", 1, { "AA" }) };
    Network net = buildOrDie(v);
    REQUIRE(net.size() == 2, "start with flow counted once");
    // open AA at 4 (40), walk to BB and open at 2 (2)
    REQUIRE(maxPressure(net, 5) == 42, "start valve opened first");
    REQUIRE(maxPressureWithHelper(net, 5) == 10 * 4 + 1 * 3, "each agent opens one");
    REQUIRE(SearchState::root(net, 5).bound(net) >= 42, "bound covers opening in place");
    std::cout << "[PASS] positive-flow start\n";
}

int main() {
    runDistanceMatrix();
    runReduction();
    runCanonicalExample();
    runBudgetProperties();
    runBoundSoundness();
    runAgainstBruteForce();
    runTableContents();
    runCombiner();
    runZeroFlowPassThrough();
    runConfigurationErrors();
    runPositiveFlowStart();
    runLargeFlows();
    std::cout << "[PASS] all valve search tests\n";
    return 0;
}
