// ========================= src/core/Solver.hpp =========================
#pragma once
#include "State.hpp"
#include <atomic>

namespace vp {

    struct SolveResult {
        Pressure best{ 0 };     // highest pressure found (exact when pruning is strict)
        SearchStats stats;
    };

    // Depth-first branch-and-bound over the reduced network. The network must outlive the solver.
    class Solver {
    public:
        explicit Solver(const Network& net, int threads = 1) :net(net), threads(threads) {}

        // exact single-agent optimum: children with bound <= best are dropped
        SolveResult solve(int budget) const;

        // Fills table[mask] with the best pressure of any path opening exactly 'mask'.
        // Children are dropped only when bound <= pruneRatio * best; pruneRatio <= 0 keeps everything.
        SolveResult fillTable(int budget, double pruneRatio, std::vector<Pressure>& table) const;

    private:
        struct Node { SearchState s; Pressure bound{ 0 }; };

        const Network& net;
        int threads{ 1 };

        SolveResult run(int budget, double pruneRatio, std::vector<Pressure>* table) const;
        void explore(std::vector<Node>& stack, double pruneRatio, std::atomic<Pressure>& best, std::vector<Pressure>* table, SearchStats& stats) const;
        void expand(const SearchState& s, double pruneRatio, Pressure best, std::vector<Node>& kids, SearchStats& stats) const;
    };

    Pressure maxPressure(const Network& net, int timeBudget, const SolveOptions& opt = {}, SearchStats* stats = nullptr);
    Pressure maxPressureWithHelper(const Network& net, int timeBudget, const SolveOptions& opt = {}, SearchStats* stats = nullptr);

} // namespace vp
