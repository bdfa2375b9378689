#include "CPU.hpp"
#include "Instructions.hpp"
#include "InterruptController.hpp"

#include <cstdio>
#include <iostream>

static std::string FormatIllegalOpcode(uint16_t address, uint8_t opcode) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "Illegal opcode $%02X at $%04X", opcode, address);
    return buffer;
}

IllegalOpcodeError::IllegalOpcodeError(uint16_t address, uint8_t opcode)
    : std::runtime_error(FormatIllegalOpcode(address, opcode))
    , address(address)
    , opcode(opcode)
{
}

CPU::CPU() {
    Reset();
}

void CPU::Reset() {
    // Post-boot state (DMG, boot ROM skipped)
    a = 0x01;
    f = 0xB0;  // Z=1, N=0, H=1, C=1
    b = 0x00;
    c = 0x13;
    d = 0x00;
    e = 0xD8;
    h = 0x01;
    l = 0x4D;
    sp = 0xFFFE;
    pc = 0x0100;

    ime = false;
    ime_scheduled = false;
    halted = false;
    halt_bug = false;
    stopped = false;
    trace_enabled = false;

    pending_cycles = 0;
    step_cycles = 0;
}

uint8_t CPU::Step() {
    step_cycles = 0;

    // Interrupt dispatch takes precedence over everything else
    if (ServiceInterrupt()) {
        return step_cycles;
    }

    if (stopped) {
        // STOP: oscillator halted until a button is pressed
        Tick(4);
        if (interrupts && interrupts->IsRequested(InterruptController::JOYPAD)) {
            stopped = false;
        }
        return step_cycles;
    }

    if (halted) {
        // HALT: clocks keep running, CPU idles one M-cycle at a time.
        // Wakes on any enabled request regardless of IME.
        Tick(4);
        if (interrupts && interrupts->HasPendingInterrupt()) {
            halted = false;
        }
        return step_cycles;
    }

    // EI takes effect after the instruction following it
    if (ime_scheduled) {
        ime = true;
        ime_scheduled = false;
    }

    if (trace_enabled) {
        TraceInstruction();
    }

    uint16_t opcode_address = pc;
    uint8_t opcode = FetchByte();

    if (halt_bug) {
        // PC fails to increment: the same byte is fetched again next time
        pc--;
        halt_bug = false;
    }

    const Instruction& instruction = GetInstruction(opcode);
    if (!instruction.execute) {
        FlushPendingCycles();
        throw IllegalOpcodeError(opcode_address, opcode);
    }

    instruction.execute(*this);
    FlushPendingCycles();

    return step_cycles;
}

/**
 * Interrupt Dispatch - 20 T-cycles (5 M-cycles)
 *
 * M1-M2: internal wait states
 * M3: push PC high byte
 * M4: push PC low byte
 * M5: acknowledge request, load vector into PC
 */
bool CPU::ServiceInterrupt() {
    if (!ime || !interrupts) {
        return false;
    }

    int8_t index = interrupts->GetHighestPriorityInterrupt();
    if (index < 0) {
        return false;
    }

    halted = false;
    ime = false;
    ime_scheduled = false;

    InternalDelay();
    InternalDelay();
    Push(pc);
    pc = interrupts->Acknowledge(static_cast<uint8_t>(index));
    InternalDelay();

    FlushPendingCycles();
    return true;
}

void CPU::EnterHalt() {
    // HALT bug: with IME clear and an interrupt already pending, HALT
    // exits immediately and the following opcode byte is read twice
    if (!ime && interrupts && interrupts->HasPendingInterrupt()) {
        halt_bug = true;
        return;
    }
    halted = true;
}

// === Memory Operations (use bus callbacks) ===

uint8_t CPU::FetchByte() {
    FlushPendingCycles();

    uint8_t value = bus_read ? bus_read(pc) : 0xFF;
    pc++;

    pending_cycles = 4;
    return value;
}

uint16_t CPU::FetchWord() {
    uint8_t lo = FetchByte();
    uint8_t hi = FetchByte();
    return (static_cast<uint16_t>(hi) << 8) | lo;
}

uint8_t CPU::ReadByte(uint16_t addr) {
    FlushPendingCycles();

    uint8_t value = bus_read ? bus_read(addr) : 0xFF;

    pending_cycles = 4;
    return value;
}

void CPU::WriteByte(uint16_t addr, uint8_t value) {
    FlushPendingCycles();

    if (bus_write) {
        bus_write(addr, value);
    }

    pending_cycles = 4;
}

void CPU::Push(uint16_t value) {
    sp--;
    WriteByte(sp, value >> 8);
    sp--;
    WriteByte(sp, value & 0xFF);
}

uint16_t CPU::Pop() {
    uint8_t lo = ReadByte(sp);
    sp++;
    uint8_t hi = ReadByte(sp);
    sp++;
    return (static_cast<uint16_t>(hi) << 8) | lo;
}

void CPU::Tick(uint8_t cycles) {
    step_cycles += cycles;
    if (tick_callback) {
        tick_callback(cycles);
    }
}

void CPU::FlushPendingCycles() {
    if (pending_cycles > 0) {
        Tick(pending_cycles);
    }
    pending_cycles = 0;
}

// === Debug ===

std::string CPU::DumpState() const {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer),
                  "AF=%04X BC=%04X DE=%04X HL=%04X SP=%04X PC=%04X IME=%d%s%s",
                  GetAF(), GetBC(), GetDE(), GetHL(), sp, pc, ime ? 1 : 0,
                  halted ? " HALT" : "", stopped ? " STOP" : "");
    return buffer;
}

void CPU::TraceInstruction() const {
    std::cerr << DumpState() << "  " << Disassemble(*this, pc) << "\n";
}
