// gui/app.cpp
// SDL2 + Dear ImGui viewer for the 6502 core (SDL_Renderer2 backend)
#include <filesystem>
#include <cstdio>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>

#include <SDL.h>

#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"  // SDL2 renderer v2 backend

#include "cpu.hpp"
#include "demo_program.hpp"
#include "disasm.hpp"
#include "loader.hpp"
#include "machine.hpp"
#include "options.hpp"

// Helper: give windows an initial position/size (first run only).
static inline void PlaceFirstUse(const ImVec2& pos, const ImVec2& size) {
    ImGui::SetNextWindowPos(pos, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(size, ImGuiCond_FirstUseEver);
}

static void memoryHexView(const Bus& bus, uint16_t start, int rows = 16, int cols = 16) {
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(6, 2));
    for (int r = 0; r < rows; ++r) {
        uint32_t base = static_cast<uint32_t>(start) + static_cast<uint32_t>(r) * cols;
        if (base >= Bus::MEM_SIZE) break;
        ImGui::Text("%04X:", (unsigned)base);
        ImGui::SameLine();
        for (int c = 0; c < cols; ++c) {
            uint32_t addr = base + (uint32_t)c;
            if (addr >= Bus::MEM_SIZE) break;
            ImGui::Text("%02X", bus.read(static_cast<uint16_t>(addr)));
            if (c != cols - 1) ImGui::SameLine();
        }
    }
    ImGui::PopStyleVar();
}

// 32x32 framebuffer drawn as filled squares into the current window
static void screenView(const Machine& m, const CPU& cpu, float cell) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    for (int y = 0; y < Machine::SCREEN_H; ++y) {
        for (int x = 0; x < Machine::SCREEN_W; ++x) {
            const Rgb c = Machine::palette(m.pixel(cpu, x, y));
            const ImVec2 a(origin.x + x * cell, origin.y + y * cell);
            dl->AddRectFilled(a, ImVec2(a.x + cell, a.y + cell), IM_COL32(c.r, c.g, c.b, 255));
        }
    }
    ImGui::Dummy(ImVec2(cell * Machine::SCREEN_W, cell * Machine::SCREEN_H));
}

int main(int argc, char** argv) {
    Machine m;
    std::string err;
    if (!parse_options(argc, argv, m.opt, err)) {
        std::fprintf(stderr, "[trace6502] %s\n%s", err.c_str(), usage(argv[0]).c_str());
        return 1;
    }
    if (m.opt.help) {
        std::printf("%s", usage(argv[0]).c_str());
        return 0;
    }

    // --- CPU init ---
    CPU cpu;
    LoadError le = m.opt.image.empty()
                       ? cpu.load(demo_program(), m.opt.origin)
                       : load_image(cpu, m.opt.image, m.opt.hex, m.opt.origin);
    if (le != LoadError::None) {
        std::fprintf(stderr, "[trace6502] cannot load '%s': %s\n", m.opt.image.c_str(), to_string(le));
        return 1;
    }
    cpu.tracing = m.opt.trace;
    cpu.trace_limit = m.opt.trace_limit;

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "trace6502",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1800, 1100,
        SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) { std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError()); SDL_Quit(); return 1; }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) { std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError()); SDL_DestroyWindow(window); SDL_Quit(); return 1; }

    // --- ImGui init ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 1.5f;

    // Try to load a local font next to the exe; otherwise use a larger default font
    {
        const char* kFont = "Roboto-Medium.ttf";
        if (std::filesystem::exists(kFont)) {
            io.Fonts->AddFontFromFileTTF(kFont, 20.0f);
        } else {
            ImFontConfig cfg; cfg.SizePixels = 18.0f;
            io.Fonts->AddFontDefault(&cfg);
        }
    }

    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForSDLRenderer failed\n");
        SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer)) {
        std::fprintf(stderr, "ImGui_ImplSDLRenderer2_Init failed\n");
        ImGui_ImplSDL2_Shutdown(); SDL_DestroyRenderer(renderer); SDL_DestroyWindow(window); SDL_Quit(); return 1;
    }

    bool running = true;
    bool autoRun = false;
    int  instrPerFrame = 200;
    uint16_t memBase = 0x0000;
    std::string status = "ready";

    // One instruction plus the per-step I/O; false when the CPU stopped.
    auto stepOnce = [&]() {
        if (cpu.halted) return false;
        if (std::optional<Fault> f = cpu.step()) {
            std::fprintf(stderr, "[cpu] %s\n", describe(*f).c_str());
            status = "stopped";
            autoRun = false;
            return false;
        }
        m.after_step(cpu);
        if (cpu.halted) status = "halted (BRK)";
        return true;
    };

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) running = false;
            if (event.type == SDL_WINDOWEVENT &&
                event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(window)) running = false;
            if (event.type == SDL_KEYDOWN && !io.WantTextInput) {
                switch (event.key.keysym.sym) {
                    case SDLK_w: m.press_key(KEY_W); break;
                    case SDLK_a: m.press_key(KEY_A); break;
                    case SDLK_s: m.press_key(KEY_S); break;
                    case SDLK_d: m.press_key(KEY_D); break;
                    case SDLK_ESCAPE: running = false; break;
                    default: break;
                }
            }
        }

        if (autoRun)
            for (int i = 0; i < instrPerFrame && stepOnce(); ++i) {}

        ImGui_ImplSDL2_NewFrame();
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui::NewFrame();

        // ---- Screen ----
        PlaceFirstUse({20,20}, {560,600});
        ImGui::Begin("Screen");
        ImGui::Text("video $%04X  input $%04X  random $%04X", m.opt.video, m.opt.input, m.opt.random);
        screenView(m, cpu, 16.0f);
        ImGui::Text("W/A/S/D latch a key (%zu queued)", m.pending_keys());
        ImGui::End();

        // ---- Controls ----
        PlaceFirstUse({600,20}, {760,160});
        ImGui::Begin("Controls");
        ImGui::Text("PC:%04X  cyc:%llu  %s", cpu.PC, (unsigned long long)cpu.bus.cycles, status.c_str());
        if (cpu.fault)
            ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.35f, 1.0f), "fault: %s", describe(*cpu.fault).c_str());
        if (ImGui::Button("Step")) stepOnce();
        ImGui::SameLine();
        ImGui::Checkbox("Run", &autoRun); ImGui::SameLine();
        ImGui::SetNextItemWidth(140); ImGui::InputInt("instr/frame", &instrPerFrame);
        if (instrPerFrame < 1) instrPerFrame = 1;
        ImGui::SameLine();
        if (ImGui::Button("Reset")) { cpu.reset(); status = "reset"; }
        ImGui::Checkbox("Trace", &cpu.tracing);
        ImGui::End();

        // ---- Registers & Flags ----
        PlaceFirstUse({600,200}, {760,180});
        ImGui::Begin("Registers & Flags");
        ImGui::Text("A:%02X  X:%02X  Y:%02X", cpu.regs.A, cpu.regs.X, cpu.regs.Y);
        ImGui::Text("PC:%04X  SP:%02X  P:%02X", cpu.PC, cpu.regs.SP, cpu.flags.pack());
        bool N = cpu.flags.N, V = cpu.flags.V, B = cpu.flags.B, D = cpu.flags.D;
        bool I = cpu.flags.I, Z = cpu.flags.Z, C = cpu.flags.C;
        ImGui::Separator(); ImGui::Text("Flags (read-only)");
        ImGui::Checkbox("N", &N); ImGui::SameLine();
        ImGui::Checkbox("V", &V); ImGui::SameLine();
        ImGui::Checkbox("B", &B); ImGui::SameLine();
        ImGui::Checkbox("D", &D); ImGui::SameLine();
        ImGui::Checkbox("I", &I); ImGui::SameLine();
        ImGui::Checkbox("Z", &Z); ImGui::SameLine();
        ImGui::Checkbox("C", &C);
        ImGui::End();

        // ---- Disassembly ----
        PlaceFirstUse({600,400}, {760,320});
        ImGui::Begin("Disassembly");
        {
            uint16_t pc = cpu.PC;
            for (int i = 0; i < 16; ++i) {
                int len = 1;
                const std::string line = disassemble(cpu.bus, pc, &len);
                if (i == 0) ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.3f, 1.0f), "> %s", line.c_str());
                else        ImGui::Text("  %s", line.c_str());
                pc = static_cast<uint16_t>(pc + len);
            }
        }
        ImGui::End();

        // ---- Memory ----
        PlaceFirstUse({1380,20}, {400,700});
        ImGui::Begin("Memory");
        static char baseBuf[8] = "0000";
        ImGui::SetNextItemWidth(180);
        if (ImGui::InputText("Base (hex)", baseBuf, IM_ARRAYSIZE(baseBuf),
            ImGuiInputTextFlags_CharsHexadecimal | ImGuiInputTextFlags_CharsNoBlank)) {
            uint16_t v = 0;
            if (parse_hex16(baseBuf, v)) memBase = v;
        }
        ImGui::BeginChild("hex", ImVec2(0, 420), true);
        memoryHexView(cpu.bus, memBase, 16, 16);
        ImGui::EndChild();
        // Four rows of page 1 from the row holding SP up; pushed bytes live above SP
        const uint16_t sp = static_cast<uint16_t>(CPU::STACK_BASE | cpu.regs.SP);
        const uint16_t stackRow = static_cast<uint16_t>(std::min<int>(sp & 0xFFF0, CPU::STACK_BASE + 0xC0));
        ImGui::Separator(); ImGui::Text("Stack  SP=%04X", sp);
        ImGui::BeginChild("stack", ImVec2(0, 180), true);
        memoryHexView(cpu.bus, stackRow, 4, 16);
        ImGui::EndChild();
        ImGui::End();

        // ---- Timeline ----
        PlaceFirstUse({20,640}, {1340,400});
        ImGui::Begin("Timeline");
        static int maxRows = 256; ImGui::SliderInt("Rows", &maxRows, 64, 2000);
        int total = static_cast<int>(cpu.timeline.size());
        int start = std::max(0, total - maxRows);
        ImGui::BeginChild("tl", ImVec2(0, 300), true);
        for (int i = start; i < total; ++i) {
            const auto& t = cpu.timeline[i];
            ImGui::Text("#%llu PC=%04X OP=%02X A=%02X X=%02X Y=%02X SP=%02X P=%02X ev=%zu",
                (unsigned long long)t.cycle, t.pc, t.opcode, t.a, t.x, t.y, t.sp, t.status,
                t.events.size());
            if (ImGui::IsItemClicked())
                for (const auto& e : t.events)
                    ImGui::BulletText("%s %s [%04X] = %02X  %s", phase_name(e.phase),
                        (e.dir == BusDir::Read ? "RD" : e.dir == BusDir::Write ? "WR" : "--"),
                        e.address, e.data, e.note.c_str());
        }
        ImGui::EndChild();
        ImGui::End();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 25, 25, 25, 255);
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
