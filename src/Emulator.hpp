#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "input/Joypad.hpp"
#include "ppu/PPU.hpp"

// Chips are only reachable through the board
class CPU;
class Timer;
class Serial;
class Bus;
class Memory;
class DMA;
class Cartridge;
class InterruptController;

/**
 * EmulatorOptions - knobs the frontend sets before Reset()
 */
struct EmulatorOptions {
    // Block VRAM in mode 3 and OAM in modes 2-3 instead of passing through
    bool strict_vram_access = false;
    // One line per instruction on stderr
    bool trace = false;
};

/**
 * Emulator - DMG board: one of each chip plus the traces between them
 *
 * - Owns every component and connects them through the Bus
 * - The CPU is the clock master: each of its bus accesses ticks DMA,
 *   PPU, Timer and Serial by the same number of T-cycles (4.194304 MHz)
 * - Peripheral interrupt lines are latched into the InterruptController
 *   after every tick and after every I/O write
 * - Holds no hardware behavior of its own
 */
class Emulator {
public:
    explicit Emulator(const EmulatorOptions& options = EmulatorOptions());
    ~Emulator();

    // === Initialization (like inserting a cartridge and powering on) ===
    // Both reset the machine on success
    bool LoadROM(const std::string& path);
    bool LoadROMData(std::vector<uint8_t> data);
    const std::string& GetLoadError() const;
    void Reset();

    // === Clock Distribution ===
    // Step by one CPU instruction (returns T-cycles consumed).
    // Throws IllegalOpcodeError on an unassigned opcode.
    uint8_t Step();

    // Step whole instructions until at least N T-cycles have elapsed
    void StepCycles(uint32_t cycles);

    // Run until the PPU enters VBlank, at most 70224 T-cycles
    void RunFrame();

    // === Display Output ===
    const PPU::Framebuffer& GetFramebuffer() const;
    bool IsFrameComplete() const;
    void ClearFrameComplete();

    // === Input ===
    void SetButton(Joypad::Button button, bool pressed);

    // === Serial Link (bytes sent by the program) ===
    const std::string& GetSerialOutput() const;

    // === Debug Access ===
    uint16_t GetPC() const;
    uint16_t GetSP() const;
    uint16_t GetAF() const;
    uint16_t GetBC() const;
    uint16_t GetDE() const;
    uint16_t GetHL() const;
    uint8_t GetPPUMode() const;
    uint8_t GetLY() const;
    uint64_t GetTotalCycles() const { return total_cycles; }
    std::string DumpCPUState() const;
    std::string GetCartridgeInfo() const;

    // Memory access through the bus without ticking the clock
    uint8_t DebugRead(uint16_t addr) const;
    void DebugWrite(uint16_t addr, uint8_t value);

private:
    EmulatorOptions options;

    // === Chips ===
    std::unique_ptr<CPU> cpu;
    std::unique_ptr<PPU> ppu;
    std::unique_ptr<Timer> timer;
    std::unique_ptr<Joypad> joypad;
    std::unique_ptr<Serial> serial;
    std::unique_ptr<Bus> bus;
    std::unique_ptr<Memory> memory;
    std::unique_ptr<DMA> dma;
    std::unique_ptr<Cartridge> cartridge;
    std::unique_ptr<InterruptController> interrupts;

    uint64_t total_cycles;

    // === Board Wiring ===
    void WireComponents();

    // Called for every bus access the CPU makes
    void TickComponents(uint8_t cycles);

    // Route interrupt signals from peripherals to the interrupt controller
    void UpdateInterrupts();

    // Copy the OAM DMA bytes due in this tick
    void ProcessDMA(uint8_t cycles);

    // === I/O Register Router ($FF00-$FF7F) ===
    uint8_t ReadIO(uint16_t addr) const;
    void WriteIO(uint16_t addr, uint8_t value);
};
