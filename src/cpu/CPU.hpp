#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

class InterruptController;

/**
 * IllegalOpcodeError - raised when the CPU fetches one of the eleven
 * unassigned SM83 opcodes. Real hardware locks up; continuing would
 * silently desynchronize the emulation, so the step is aborted.
 */
class IllegalOpcodeError : public std::runtime_error {
public:
    IllegalOpcodeError(uint16_t address, uint8_t opcode);

    uint16_t GetAddress() const { return address; }
    uint8_t GetOpcode() const { return opcode; }

private:
    uint16_t address;
    uint8_t opcode;
};

/**
 * SM83 CPU - Sharp LR35902 CPU Core
 *
 * Hardware Behavior:
 * - Runs at 4.194304 MHz (T-cycles), every memory access takes 4 T-cycles
 * - Sees memory only through the bus; does NOT know about PPU or Timer
 * - Consults the interrupt controller at each instruction boundary
 *
 * Timing:
 * - Each bus access ticks the rest of the system by 4 T-cycles through
 *   the tick callback, so peripherals observe writes at the M-cycle they
 *   happen rather than at the end of the instruction
 * - Step() returns the T-cycles actually ticked, which always equals the
 *   cost listed in the opcode table (taken cost for taken branches)
 */
class CPU {
public:
    CPU();

    // Reset to post-boot state (no boot ROM is run)
    void Reset();

    // Service one interrupt, idle one HALT/STOP slot, or execute one
    // instruction. Returns T-cycles consumed.
    // Throws IllegalOpcodeError on an unassigned opcode.
    uint8_t Step();

    // === Bus Connection ===
    using ReadCallback = std::function<uint8_t(uint16_t)>;
    using WriteCallback = std::function<void(uint16_t, uint8_t)>;
    using TickCallback = std::function<void(uint8_t)>;

    void ConnectBus(ReadCallback read, WriteCallback write, TickCallback tick = nullptr) {
        bus_read = read;
        bus_write = write;
        tick_callback = tick;
    }

    void ConnectInterrupts(InterruptController* controller) { interrupts = controller; }

    // === Register Access (for instruction implementations) ===
    uint8_t GetA() const { return a; }
    uint8_t GetF() const { return f; }
    uint8_t GetB() const { return b; }
    uint8_t GetC() const { return c; }
    uint8_t GetD() const { return d; }
    uint8_t GetE() const { return e; }
    uint8_t GetH() const { return h; }
    uint8_t GetL() const { return l; }
    uint16_t GetPC() const { return pc; }
    uint16_t GetSP() const { return sp; }
    uint16_t GetAF() const { return (static_cast<uint16_t>(a) << 8) | f; }
    uint16_t GetBC() const { return (static_cast<uint16_t>(b) << 8) | c; }
    uint16_t GetDE() const { return (static_cast<uint16_t>(d) << 8) | e; }
    uint16_t GetHL() const { return (static_cast<uint16_t>(h) << 8) | l; }

    void SetA(uint8_t v) { a = v; }
    void SetF(uint8_t v) { f = v & 0xF0; }  // Lower 4 bits always 0
    void SetB(uint8_t v) { b = v; }
    void SetC(uint8_t v) { c = v; }
    void SetD(uint8_t v) { d = v; }
    void SetE(uint8_t v) { e = v; }
    void SetH(uint8_t v) { h = v; }
    void SetL(uint8_t v) { l = v; }
    void SetPC(uint16_t v) { pc = v; }
    void SetSP(uint16_t v) { sp = v; }
    void SetAF(uint16_t v) { a = v >> 8; f = v & 0xF0; }
    void SetBC(uint16_t v) { b = v >> 8; c = v & 0xFF; }
    void SetDE(uint16_t v) { d = v >> 8; e = v & 0xFF; }
    void SetHL(uint16_t v) { h = v >> 8; l = v & 0xFF; }

    // Flag access
    bool GetFlagZ() const { return (f & FLAG_Z) != 0; }
    bool GetFlagN() const { return (f & FLAG_N) != 0; }
    bool GetFlagH() const { return (f & FLAG_H) != 0; }
    bool GetFlagC() const { return (f & FLAG_C) != 0; }
    void SetFlagZ(bool v) { if (v) f |= FLAG_Z; else f &= ~FLAG_Z; }
    void SetFlagN(bool v) { if (v) f |= FLAG_N; else f &= ~FLAG_N; }
    void SetFlagH(bool v) { if (v) f |= FLAG_H; else f &= ~FLAG_H; }
    void SetFlagC(bool v) { if (v) f |= FLAG_C; else f &= ~FLAG_C; }

    // === Execution State ===
    bool IsHalted() const { return halted; }
    bool IsStopped() const { return stopped; }
    bool GetIME() const { return ime; }
    void SetIME(bool v) { ime = v; }
    bool IsIMEScheduled() const { return ime_scheduled; }

    // Used by HALT/STOP/EI/DI implementations
    void EnterHalt();
    void EnterStop() { stopped = true; }
    void ScheduleIME() { ime_scheduled = true; }
    void CancelScheduledIME() { ime_scheduled = false; }

    // === Memory Operations (public for instruction use) ===
    uint8_t FetchByte();
    uint16_t FetchWord();
    uint8_t ReadByte(uint16_t addr);
    void WriteByte(uint16_t addr, uint8_t value);
    void Push(uint16_t value);
    uint16_t Pop();

    // Internal M-cycle with no memory access
    void InternalDelay() { pending_cycles += 4; }

    // Skip a byte without a bus access (STOP padding)
    void SkipByte() { pc++; }

    // Read memory without ticking (disassembly, traces)
    uint8_t PeekByte(uint16_t addr) const { return bus_read ? bus_read(addr) : 0xFF; }

    // === Debug ===
    void SetTraceEnabled(bool enabled) { trace_enabled = enabled; }
    std::string DumpState() const;

private:
    // === Registers ===
    uint8_t a, f;
    uint8_t b, c;
    uint8_t d, e;
    uint8_t h, l;
    uint16_t sp;
    uint16_t pc;

    // === Internal State ===
    bool ime;               // Interrupt master enable
    bool ime_scheduled;     // EI enables IME after the next instruction
    bool halted;            // Waiting for IE & IF != 0
    bool halt_bug;          // Next opcode fetch does not advance PC
    bool stopped;           // Waiting for a joypad request
    bool trace_enabled;

    // Bus callbacks (wired by Emulator)
    ReadCallback bus_read;
    WriteCallback bus_write;
    TickCallback tick_callback;
    InterruptController* interrupts = nullptr;

    // Cycles of the current memory access, flushed before the next one
    uint8_t pending_cycles = 0;
    // Cycles ticked during the current Step()
    uint8_t step_cycles = 0;

    static constexpr uint8_t FLAG_Z = 0x80;
    static constexpr uint8_t FLAG_N = 0x40;
    static constexpr uint8_t FLAG_H = 0x20;
    static constexpr uint8_t FLAG_C = 0x10;

    bool ServiceInterrupt();
    void Tick(uint8_t cycles);
    void FlushPendingCycles();
    void TraceInstruction() const;
};
