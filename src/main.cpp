#include <algorithm>
#include <iostream>
#include <fstream>
#include <string>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <filesystem>

#include "Emulator.hpp"
#include "cpu/CPU.hpp"
#include "frontend/Config.hpp"
#include "frontend/Window.hpp"

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " <rom_file> [options]\n"
              << "\nOptions:\n"
              << "  --headless          Run without display\n"
              << "  --cycles <n>        Run for N T-cycles then exit (headless)\n"
              << "  --frames <n>        Run for N frames then exit (headless)\n"
              << "  --dump-screen <f>   Dump last complete frame to PGM file on exit\n"
              << "  --serial            Echo serial output to stdout\n"
              << "  --trace             Log every instruction to stderr\n"
              << "  --scale <n>         Window scale (1-8, default from dmgemu.ini or 3)\n"
              << "  --help              Show this help\n";
}

struct Args {
    std::string rom_path;
    std::string dump_screen_path;
    bool headless = false;
    bool serial = false;
    bool trace = false;
    uint64_t max_cycles = 0;
    uint64_t max_frames = 0;
    int scale = 0;  // 0 = from config
};

// Returns false when the program should exit (help or bad arguments)
bool ParseArgs(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        } else if (arg == "--headless") {
            args.headless = true;
        } else if (arg == "--serial") {
            args.serial = true;
        } else if (arg == "--trace") {
            args.trace = true;
        } else if (arg == "--cycles" && i + 1 < argc) {
            args.max_cycles = std::stoull(argv[++i]);
        } else if (arg == "--frames" && i + 1 < argc) {
            args.max_frames = std::stoull(argv[++i]);
        } else if (arg == "--dump-screen" && i + 1 < argc) {
            args.dump_screen_path = argv[++i];
        } else if (arg == "--scale" && i + 1 < argc) {
            args.scale = std::stoi(argv[++i]);
        } else if (arg[0] != '-') {
            args.rom_path = arg;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Dump framebuffer to PGM file (grayscale)
bool DumpScreen(const Emulator& emu, const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Failed to write screen dump: " << path << "\n";
        return false;
    }

    // PGM header: P5 (binary grayscale), 160x144, max value 255
    file << "P5\n" << PPU::SCREEN_WIDTH << " " << PPU::SCREEN_HEIGHT << "\n255\n";
    // Shade 0 = white, 3 = black
    for (uint8_t shade : emu.GetFramebuffer()) {
        file.put(static_cast<char>(255 - (shade & 0x03) * 85));
    }
    std::cout << "Screen dumped to: " << path << "\n";
    return true;
}

int RunHeadless(Emulator& emu, const Args& args) {
    // Neither limit given: about 7 seconds of emulated time
    uint64_t target_cycles = args.max_cycles;
    if (target_cycles == 0 && args.max_frames == 0) {
        target_cycles = 30000000;
    }

    size_t serial_printed = 0;
    uint64_t frames = 0;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (target_cycles > 0 && emu.GetTotalCycles() >= target_cycles) break;
        if (args.max_frames > 0 && frames >= args.max_frames) break;

        if (args.max_frames > 0) {
            emu.RunFrame();
            if (emu.IsFrameComplete()) {
                frames++;
            }
        } else {
            // Cycle budget: at most one frame's worth per pass
            uint64_t remaining = target_cycles - emu.GetTotalCycles();
            emu.StepCycles(static_cast<uint32_t>(std::min<uint64_t>(remaining, 70224)));
        }

        if (args.serial) {
            const std::string& output = emu.GetSerialOutput();
            if (output.size() > serial_printed) {
                std::cout << output.substr(serial_printed) << std::flush;
                serial_printed = output.size();
            }
        }
    }

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << "\nExecuted " << emu.GetTotalCycles() << " cycles (" << frames
              << " frames) in " << duration.count() << "ms\n";
    std::cout << "CPU State: " << emu.DumpCPUState() << "\n";

    if (args.serial && emu.GetSerialOutput().empty()) {
        std::cout << "No serial output received.\n";
    }

    if (!args.dump_screen_path.empty() && !DumpScreen(emu, args.dump_screen_path)) {
        return 1;
    }
    return 0;
}

void MapKeys(Emulator& emu, const Window& window) {
    emu.SetButton(Joypad::Button::RIGHT, window.IsKeyPressed(SDL_SCANCODE_RIGHT));
    emu.SetButton(Joypad::Button::LEFT, window.IsKeyPressed(SDL_SCANCODE_LEFT));
    emu.SetButton(Joypad::Button::UP, window.IsKeyPressed(SDL_SCANCODE_UP));
    emu.SetButton(Joypad::Button::DOWN, window.IsKeyPressed(SDL_SCANCODE_DOWN));
    emu.SetButton(Joypad::Button::A, window.IsKeyPressed(SDL_SCANCODE_Z));
    emu.SetButton(Joypad::Button::B, window.IsKeyPressed(SDL_SCANCODE_X));
    emu.SetButton(Joypad::Button::SELECT, window.IsKeyPressed(SDL_SCANCODE_RSHIFT));
    emu.SetButton(Joypad::Button::START, window.IsKeyPressed(SDL_SCANCODE_RETURN));
}

int RunGUI(Emulator& emu, Window& window, const Args& args) {
    std::cout << "Controls: Arrows = D-Pad, Z = A, X = B, RShift = Select, Enter = Start\n";
    std::cout << "Press ESC to quit\n\n";

    // 70224 T-cycles per frame at 4.194304 MHz = 16.742706 ms per frame
    constexpr auto FRAME_DURATION = std::chrono::nanoseconds(16742706);
    auto frame_start = std::chrono::steady_clock::now();
    size_t serial_printed = 0;

    while (window.ProcessEvents()) {
        MapKeys(emu, window);
        emu.RunFrame();
        window.RenderFrame(emu.GetFramebuffer());

        if (args.serial) {
            const std::string& output = emu.GetSerialOutput();
            if (output.size() > serial_printed) {
                std::cout << output.substr(serial_printed) << std::flush;
                serial_printed = output.size();
            }
        }

        // Software frame limiter in case VSYNC is unavailable
        auto frame_elapsed = std::chrono::steady_clock::now() - frame_start;
        if (frame_elapsed < FRAME_DURATION) {
            std::this_thread::sleep_for(FRAME_DURATION - frame_elapsed);
        }
        frame_start = std::chrono::steady_clock::now();
    }

    if (!args.dump_screen_path.empty() && !DumpScreen(emu, args.dump_screen_path)) {
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Args args;
    try {
        if (!ParseArgs(argc, argv, args)) {
            return 1;
        }
    } catch (const std::logic_error& e) {
        // std::stoull / std::stoi on a malformed number
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (args.rom_path.empty()) {
        std::cerr << "Error: No ROM file specified\n";
        PrintUsage(argv[0]);
        return 1;
    }

    Config& config = Config::Instance();
    config.Load();

    EmulatorOptions options;
    options.strict_vram_access = config.GetBool("strict_vram_access", false);
    options.trace = args.trace;

    Emulator emu(options);
    if (!emu.LoadROM(args.rom_path)) {
        return 1;
    }

    std::cout << emu.GetCartridgeInfo() << "\n";

    try {
        if (args.headless) {
            return RunHeadless(emu, args);
        }

        int scale = args.scale > 0 ? args.scale : config.GetInt("scale", 3);
        if (scale < 1) scale = 1;
        if (scale > 8) scale = 8;
        config.SetInt("scale", scale);

        Window window;
        if (!window.Init("dmgemu", scale, Window::ParsePalette(config.Get("palette", "gray")))) {
            return 1;
        }
        return RunGUI(emu, window, args);
    } catch (const IllegalOpcodeError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "CPU State: " << emu.DumpCPUState() << "\n";
        return 1;
    }
}
