// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include "Combiner.hpp"
#include <algorithm>
#include <thread>

namespace vp {

    static bool prunes(Pressure bound, Pressure best, double ratio) {
        if (ratio <= 0.0) return false;
        if (ratio == 1.0) return bound <= best; // doubles drop low bits past 2^53
        return double(bound) <= ratio * double(best);
    }

    static void raiseBest(std::atomic<Pressure>& best, Pressure value) {
        Pressure cur = best.load(std::memory_order_relaxed);
        while (value > cur && !best.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {}
    }

    SolveResult Solver::solve(int budget) const {
        return run(budget, 1.0, nullptr);
    }

    SolveResult Solver::fillTable(int budget, double pruneRatio, std::vector<Pressure>& table) const {
        return run(budget, pruneRatio, &table);
    }

    // Children of 's' that survive pruning, sorted by ascending bound so the most
    // promising one ends up on top of the stack.
    void Solver::expand(const SearchState& s, double pruneRatio, Pressure best, std::vector<Node>& kids, SearchStats& stats) const {
        std::vector<SearchState> next;
        s.children(net, next);
        for (const auto& c : next) {
            Pressure b = c.bound(net);
            if (prunes(b, best, pruneRatio)) { ++stats.pruned; continue; }
            kids.push_back(Node{ c, b });
        }
        std::stable_sort(kids.begin(), kids.end(), [](const Node& a, const Node& b) { return a.bound < b.bound; });
    }

    void Solver::explore(std::vector<Node>& stack, double pruneRatio, std::atomic<Pressure>& best, std::vector<Pressure>* table, SearchStats& stats) const {
        std::vector<Node> kids;
        while (!stack.empty()) {
            Node n = stack.back(); stack.pop_back();
            // best may have risen since this node was pushed
            if (prunes(n.bound, best.load(std::memory_order_relaxed), pruneRatio)) { ++stats.pruned; continue; }

            ++stats.expanded;
            raiseBest(best, n.s.pressure);
            if (table) {
                Pressure& slot = (*table)[n.s.visited];
                if (n.s.pressure > slot) slot = n.s.pressure;
            }

            kids.clear();
            expand(n.s, pruneRatio, best.load(std::memory_order_relaxed), kids, stats);
            stack.insert(stack.end(), kids.begin(), kids.end());
        }
    }

    SolveResult Solver::run(int budget, double pruneRatio, std::vector<Pressure>* table) const {
        SolveResult res;
        if (table) table->assign(size_t(1) << net.size(), 0);
        if (net.empty()) return res;

        std::atomic<Pressure> best{ 0 };
        SearchState root = SearchState::root(net, budget);

        if (threads <= 1) {
            std::vector<Node> stack{ Node{ root, root.bound(net) } };
            explore(stack, pruneRatio, best, table, res.stats);
        }
        else {
            // Root handled here; its children are dealt round-robin to the workers,
            // each of which searches its share single-threaded.
            ++res.stats.expanded;
            std::vector<Node> top;
            expand(root, pruneRatio, 0, top, res.stats);
            std::reverse(top.begin(), top.end());

            int workers = std::max(1, std::min(threads, (int)top.size()));
            std::vector<std::vector<Node>> stacks(workers);
            for (size_t i = 0; i < top.size(); ++i) stacks[i % workers].push_back(top[i]);
            for (auto& st : stacks) std::reverse(st.begin(), st.end());

            std::vector<std::vector<Pressure>> tables(table ? workers : 0);
            std::vector<SearchStats> stats(workers);
            std::vector<std::thread> pool;
            pool.reserve(workers);
            for (int w = 0; w < workers; ++w) {
                if (table) tables[w].assign(table->size(), 0);
            }
            try {
                for (int w = 0; w < workers; ++w) {
                    pool.emplace_back([this, w, pruneRatio, &stacks, &best, &tables, &stats, table]() {
                        explore(stacks[w], pruneRatio, best, table ? &tables[w] : nullptr, stats[w]);
                    });
                }
            }
            catch (...) {
                // a joinable std::thread must not be destroyed
                for (auto& t : pool) t.join();
                throw;
            }
            for (auto& t : pool) t.join();

            for (int w = 0; w < workers; ++w) {
                res.stats.merge(stats[w]);
                if (!table) continue;
                for (size_t m = 0; m < table->size(); ++m) (*table)[m] = std::max((*table)[m], tables[w][m]);
            }
        }

        res.best = best.load();
        if (table) res.stats.tableEntries = (uint64_t)std::count_if(table->begin(), table->end(), [](Pressure v) { return v > 0; });
        return res;
    }

    Pressure maxPressure(const Network& net, int timeBudget, const SolveOptions& opt, SearchStats* stats) {
        Solver solver(net, opt.threads);
        auto res = solver.solve(timeBudget);
        if (stats) stats->merge(res.stats);
        return res.best;
    }

    Pressure maxPressureWithHelper(const Network& net, int timeBudget, const SolveOptions& opt, SearchStats* stats) {
        Solver solver(net, opt.threads);
        double ratio = net.size() < opt.exhaustiveBelow ? 0.0 : opt.helperPruneRatio;
        std::vector<Pressure> table;
        auto res = solver.fillTable(timeBudget, ratio, table);
        if (stats) stats->merge(res.stats);
        return bestDisjointPair(table);
    }

} // namespace vp
