// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/Generator.hpp"
#include "../core/Solver.hpp"
#include "../io/Csv.hpp"
#include <string>
#include <thread>
#include <mutex>
#include <atomic>

namespace vp {

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        SolveOptions opt; GenOptions gen;
        ValveList records;
        std::optional<Network> net;     // rebuilt whenever records or the start valve change
        std::string source;             // where 'records' came from
        std::string scanPath{ "input.txt" };
        std::string savePath{ "results.csv" };
        std::string loadPath{ "results.csv" };
        std::vector<CsvRow> history;    // in‑memory run log
        SearchStats lastSingle, lastHelper;
        int selected{ -1 };             // interesting valve highlighted in the graph

        // background solve
        std::thread solveThread;
        std::atomic<bool> isSolving{ false };
        std::atomic<int> solvePhase{ 0 }; // 1 = single agent, 2 = with helper
        std::mutex pendingMutex;
        std::vector<CsvRow> pending;
        SearchStats pendingSingle, pendingHelper;

        std::mutex statusMutex;
        std::string statusMessage;

        void setStatus(const std::string& msg);
        std::string getStatus();

        void rebuildNetwork();
        void startSolve();
        void collectResults();

        // UI helpers
        void drawControls();
        void drawNetwork();
        void drawGraph();
        void drawHistory();
    };

} // namespace vp
