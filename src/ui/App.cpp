// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "../io/Scan.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace vp {

    AppUI::AppUI() {
        Generator g(gen);
        records = g.makeOne(opt.startValve);
        source = "generated:" + std::to_string(gen.seed);
        rebuildNetwork();
    }

    AppUI::~AppUI() {
        if (solveThread.joinable()) {
            solveThread.join();
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::rebuildNetwork() {
        std::string reason;
        net = Network::build(records, opt.startValve, &reason);
        selected = -1;
        if (!net) setStatus("Network rejected: " + reason);
        else setStatus("");
    }

    void AppUI::startSolve() {
        if (!net || isSolving.load()) return;
        if (solveThread.joinable()) solveThread.join();

        Network netCopy = *net;
        SolveOptions optCopy = opt;
        std::string src = source;
        int index = history.empty() ? 0 : history.back().index + 1;

        isSolving.store(true);
        solvePhase.store(1);
        setStatus("");
        solveThread = std::thread([this, netCopy, optCopy, src, index]() {
            SearchStats single, helper;
            Pressure p1 = maxPressure(netCopy, optCopy.timeBudget, optCopy, &single);
            solvePhase.store(2);
            Pressure p2 = maxPressureWithHelper(netCopy, optCopy.helperBudget, optCopy, &helper);
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                pending.push_back(CsvIO::encode(index, src, netCopy, optCopy, p1, p2, single.expanded + helper.expanded));
                pendingSingle = single;
                pendingHelper = helper;
            }
            solvePhase.store(0);
            isSolving.store(false);
        });
    }

    void AppUI::collectResults() {
        if (!isSolving.load() && solveThread.joinable()) {
            solveThread.join();
        }

        std::lock_guard<std::mutex> lock(pendingMutex);
        if (pending.empty()) return;
        for (auto& r : pending) history.push_back(std::move(r));
        pending.clear();
        lastSingle = pendingSingle;
        lastHelper = pendingHelper;
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    static bool InputText(const char* label, std::string& s) {
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%s", s.c_str());
        if (!ImGui::InputText(label, buf, sizeof(buf))) return false;
        s = buf;
        return true;
    }

    void AppUI::drawControls() {
        collectResults();

        ImGui::Begin("Controls");
        ImGui::Text("Input");
        InputText("Scan file", scanPath);
        if (ImGui::Button("Load scan")) {
            std::string reason;
            auto loaded = ScanIO::loadFile(scanPath, &reason);
            if (loaded) {
                records = std::move(*loaded);
                source = scanPath;
                rebuildNetwork();
            }
            else {
                setStatus("Load failed: " + reason);
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Save scan")) {
            if (!ScanIO::saveFile(scanPath, records)) setStatus("Cannot write " + scanPath);
        }

        ImGui::Separator();
        ImGui::Text("Random network");
        InputIntClamped("Valves", &gen.valves, 2, 60);
        InputIntClamped("With flow", &gen.interesting, 0, std::min(kMaxInteresting - 1, gen.valves - 1));
        InputIntClamped("Max flow", &gen.maxFlow, 1, 100);
        InputIntClamped("Extra tunnels", &gen.extraTunnels, 0, 100);
        ImGui::Checkbox("Start valve has flow", &gen.startHasFlow);
        uint64_t seedValue = gen.seed;
        if (ImGui::InputScalar("Seed", ImGuiDataType_U64, &seedValue)) {
            gen.seed = seedValue;
        }
        if (ImGui::Button("Generate")) {
            Generator g(gen);
            records = g.makeOne(opt.startValve);
            source = "generated:" + std::to_string(gen.seed);
            rebuildNetwork();
            ++gen.seed;
        }

        ImGui::Separator();
        ImGui::Text("Search");
        if (InputText("Start valve", opt.startValve)) rebuildNetwork();
        InputIntClamped("Budget (min)", &opt.timeBudget, 0, 200);
        InputIntClamped("Helper budget (min)", &opt.helperBudget, 0, 200);
        float ratio = (float)opt.helperPruneRatio;
        if (ImGui::SliderFloat("Table prune ratio", &ratio, 0.0f, 1.0f, "%.2f")) opt.helperPruneRatio = ratio;
        ImGui::SameLine();
        ImGui::TextDisabled("(?)");
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("The helper pass drops a branch only when its bound <= ratio * best. 0 disables pruning.");
        }
        InputIntClamped("Exhaustive below", &opt.exhaustiveBelow, 0, kMaxInteresting + 1);
        InputIntClamped("Threads", &opt.threads, 1, 64);

        bool busy = isSolving.load();
        if (busy || !net) ImGui::BeginDisabled();
        if (ImGui::Button("Solve")) startSolve();
        if (busy || !net) ImGui::EndDisabled();

        if (busy) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "%s", solvePhase.load() == 1 ? "Searching (alone)..." : "Searching (with helper)...");
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        if (!history.empty()) {
            const auto& last = history.back();
            ImGui::Separator();
            ImGui::Text("Alone, %d min: %lld", last.Budget, (long long)last.Pressure);
            ImGui::Text("With helper, %d min: %lld", last.HelperBudget, (long long)last.PressureWithHelper);
            ImGui::TextDisabled("alone: expanded %llu, pruned %llu", (unsigned long long)lastSingle.expanded, (unsigned long long)lastSingle.pruned);
            ImGui::TextDisabled("helper: expanded %llu, pruned %llu, masks %llu", (unsigned long long)lastHelper.expanded,
                (unsigned long long)lastHelper.pruned, (unsigned long long)lastHelper.tableEntries);
        }

        ImGui::End();
    }

    void AppUI::drawNetwork() {
        ImGui::Begin("Interesting valves");
        if (!net) { ImGui::Text("No valid network"); ImGui::End(); return; }
        ImGui::Text("%d valves, %d interesting (start %s)", (int)net->allNames.size(), net->size(), opt.startValve.c_str());

        if (net->empty()) { ImGui::End(); return; }
        const int k = net->size();
        if (ImGui::BeginTable("dist", k + 2, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingFixedFit)) {
            ImGui::TableSetupColumn("Valve");
            ImGui::TableSetupColumn("Flow");
            for (int j = 0; j < k; ++j) ImGui::TableSetupColumn(net->names[j].c_str());
            ImGui::TableHeadersRow();
            for (int i = 0; i < k; ++i) {
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                if (ImGui::Selectable(net->names[i].c_str(), selected == i)) selected = (selected == i) ? -1 : i;
                ImGui::TableNextColumn();
                ImGui::Text("%d", net->flow[i]);
                for (int j = 0; j < k; ++j) {
                    ImGui::TableNextColumn();
                    Dist d = net->dist.at(i, j);
                    if (d == kUnreachable) ImGui::TextDisabled("-");
                    else ImGui::Text("%d", int(d));
                }
            }
            ImGui::EndTable();
        }
        ImGui::End();
    }

    static ImU32 colorForFlow(int flow, int maxFlow) {
        if (flow <= 0) return IM_COL32(90, 90, 90, 255);
        float t = maxFlow > 0 ? std::min(1.0f, float(flow) / float(maxFlow)) : 1.0f;
        return IM_COL32(int(80 + 170 * t), int(180 - 100 * t), int(250 - 170 * t), 255);
    }

    void AppUI::drawGraph() {
        ImGui::Begin("Graph");
        if (!net || net->allNames.empty()) { ImGui::Text("No valid network"); ImGui::End(); return; }

        const int n = (int)net->allNames.size();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        ImVec2 avail = ImGui::GetContentRegionAvail();
        float radius = std::max(40.0f, std::min(avail.x, avail.y) * 0.5f - 30.0f);
        ImVec2 center(origin.x + radius + 30.0f, origin.y + radius + 30.0f);
        ImDrawList* dl = ImGui::GetWindowDrawList();

        std::vector<ImVec2> at(n);
        for (int i = 0; i < n; ++i) {
            float a = 6.2831853f * float(i) / float(n);
            at[i] = ImVec2(center.x + radius * std::cos(a), center.y + radius * std::sin(a));
        }

        int selectedFull = selected >= 0 ? net->keptFrom[selected] : -1;
        for (int i = 0; i < n; ++i) {
            for (int j : net->tunnels[i]) {
                if (j < i) continue;
                dl->AddLine(at[i], at[j], IM_COL32(120, 120, 120, 200), 1.5f);
            }
        }

        int maxFlow = 0;
        for (int f : net->flow) maxFlow = std::max(maxFlow, f);
        std::vector<int> flowFull(n, 0);
        for (int i = 0; i < net->size(); ++i) flowFull[net->keptFrom[i]] = net->flow[i];

        for (int i = 0; i < n; ++i) {
            float r = flowFull[i] > 0 ? 10.0f : 6.0f;
            dl->AddCircleFilled(at[i], r, colorForFlow(flowFull[i], maxFlow));
            if (i == net->keptFrom[net->start]) dl->AddCircle(at[i], r + 4.0f, IM_COL32(250, 220, 120, 255), 0, 2.0f);
            std::string label = net->allNames[i];
            if (selectedFull >= 0) {
                Dist d = net->allDist.at(selectedFull, i);
                label += d == kUnreachable ? " (-)" : " (" + std::to_string(int(d)) + ")";
            }
            dl->AddText(ImVec2(at[i].x + r + 2.0f, at[i].y - 7.0f), IM_COL32(220, 220, 220, 255), label.c_str());
        }

        ImGui::Dummy(ImVec2(2.0f * radius + 60.0f, 2.0f * radius + 60.0f));
        ImGui::End();
    }

    void AppUI::drawHistory() {
        ImGui::Begin("Results");

        InputText("Save CSV", savePath);
        if (ImGui::Button("Save")) {
            // renumber so the file keeps counting from its last row
            auto rowsExisting = CsvIO::load(savePath);
            int startIdx = rowsExisting.empty() ? 0 : (rowsExisting.back().index + 1);
            std::vector<CsvRow> rows = history;
            for (size_t i = 0; i < rows.size(); ++i) rows[i].index = startIdx + (int)i;
            if (!CsvIO::save(savePath, rows, true)) setStatus("Cannot write " + savePath);
        }

        InputText("Load CSV", loadPath);
        if (ImGui::Button("Load")) {
            history = CsvIO::load(loadPath);
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear Memory")) {
            history.clear();
        }

        if (ImGui::BeginTable("history", 7, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY)) {
            ImGui::TableSetupColumn("#");
            ImGui::TableSetupColumn("Source");
            ImGui::TableSetupColumn("Valves");
            ImGui::TableSetupColumn("Budget");
            ImGui::TableSetupColumn("Pressure");
            ImGui::TableSetupColumn("Helper");
            ImGui::TableSetupColumn("With helper");
            ImGui::TableHeadersRow();
            for (const auto& r : history) {
                ImGui::TableNextRow();
                ImGui::TableNextColumn(); ImGui::Text("%d", r.index);
                ImGui::TableNextColumn(); ImGui::TextUnformatted(r.source.c_str());
                ImGui::TableNextColumn(); ImGui::Text("%d/%d", r.Interesting, r.Valves);
                ImGui::TableNextColumn(); ImGui::Text("%d", r.Budget);
                ImGui::TableNextColumn(); ImGui::Text("%lld", (long long)r.Pressure);
                ImGui::TableNextColumn(); ImGui::Text("%d", r.HelperBudget);
                ImGui::TableNextColumn(); ImGui::Text("%lld", (long long)r.PressureWithHelper);
            }
            ImGui::EndTable();
        }
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            std::fprintf(stderr, "[SDL] init failed: %s\n", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Valve Planner", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
        if (!window) {
            std::fprintf(stderr, "[SDL] window failed: %s\n", SDL_GetError());
            SDL_Quit();
            return 1;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            std::fprintf(stderr, "[SDL] renderer failed: %s\n", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io = ImGui::GetIO(); (void)io;
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawControls();
            drawNetwork();
            drawGraph();
            drawHistory();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace vp
