/**
 * SM83 Instruction Implementation
 *
 * Key Principles:
 * 1. Each memory access (fetch, read, write) = 4 T-cycles
 * 2. Instruction timing = sum of all memory accesses + internal delays
 * 3. ALU operations happen during memory access cycles (no extra time)
 * 4. Conditional branches skip their internal delay when not taken
 *
 * The opcode fetch (4T) has already happened when a handler runs.
 */

#include "Instructions.hpp"
#include "CPU.hpp"

// === Operand Helpers ===

uint8_t ReadOperand8(CPU& cpu, uint8_t reg) {
    switch (reg) {
        case 0: return cpu.GetB();
        case 1: return cpu.GetC();
        case 2: return cpu.GetD();
        case 3: return cpu.GetE();
        case 4: return cpu.GetH();
        case 5: return cpu.GetL();
        case 6: return cpu.ReadByte(cpu.GetHL());  // (HL) - adds 4 T-cycles
        default: return cpu.GetA();
    }
}

void WriteOperand8(CPU& cpu, uint8_t reg, uint8_t value) {
    switch (reg) {
        case 0: cpu.SetB(value); break;
        case 1: cpu.SetC(value); break;
        case 2: cpu.SetD(value); break;
        case 3: cpu.SetE(value); break;
        case 4: cpu.SetH(value); break;
        case 5: cpu.SetL(value); break;
        case 6: cpu.WriteByte(cpu.GetHL(), value); break;  // (HL) - adds 4 T-cycles
        default: cpu.SetA(value); break;
    }
}

static uint16_t GetReg16(CPU& cpu, uint8_t reg) {
    switch (reg) {
        case 0: return cpu.GetBC();
        case 1: return cpu.GetDE();
        case 2: return cpu.GetHL();
        default: return cpu.GetSP();
    }
}

static void SetReg16(CPU& cpu, uint8_t reg, uint16_t value) {
    switch (reg) {
        case 0: cpu.SetBC(value); break;
        case 1: cpu.SetDE(value); break;
        case 2: cpu.SetHL(value); break;
        default: cpu.SetSP(value); break;
    }
}

static bool CheckCondition(const CPU& cpu, uint8_t cc) {
    switch (cc) {
        case 0: return !cpu.GetFlagZ();  // NZ
        case 1: return cpu.GetFlagZ();   // Z
        case 2: return !cpu.GetFlagC();  // NC
        default: return cpu.GetFlagC();  // C
    }
}

// === ALU Cores ===

static void AddToA(CPU& cpu, uint8_t value, bool with_carry) {
    uint8_t a = cpu.GetA();
    uint8_t carry = (with_carry && cpu.GetFlagC()) ? 1 : 0;
    uint16_t result = a + value + carry;

    cpu.SetA(result & 0xFF);
    cpu.SetFlagZ((result & 0xFF) == 0);
    cpu.SetFlagN(false);
    cpu.SetFlagH((a & 0x0F) + (value & 0x0F) + carry > 0x0F);
    cpu.SetFlagC(result > 0xFF);
}

// Shared by SUB, SBC and CP. Returns the 8-bit difference.
static uint8_t SubtractFromA(CPU& cpu, uint8_t value, bool with_carry) {
    uint8_t a = cpu.GetA();
    uint8_t carry = (with_carry && cpu.GetFlagC()) ? 1 : 0;
    int result = a - value - carry;

    cpu.SetFlagZ((result & 0xFF) == 0);
    cpu.SetFlagN(true);
    cpu.SetFlagH((a & 0x0F) < (value & 0x0F) + carry);
    cpu.SetFlagC(result < 0);
    return static_cast<uint8_t>(result & 0xFF);
}

static void SetLogicFlags(CPU& cpu, uint8_t result, bool half_carry) {
    cpu.SetA(result);
    cpu.SetFlagZ(result == 0);
    cpu.SetFlagN(false);
    cpu.SetFlagH(half_carry);
    cpu.SetFlagC(false);
}

// Signed immediate added to SP (ADD SP,r8 and LD HL,SP+r8).
// H and C come from the unsigned low byte addition; Z and N are cleared.
static uint16_t AddSignedToSP(CPU& cpu, int8_t offset) {
    uint16_t sp = cpu.GetSP();
    uint8_t unsigned_offset = static_cast<uint8_t>(offset);

    cpu.SetFlagZ(false);
    cpu.SetFlagN(false);
    cpu.SetFlagH(((sp & 0x0F) + (unsigned_offset & 0x0F)) > 0x0F);
    cpu.SetFlagC(((sp & 0xFF) + unsigned_offset) > 0xFF);
    return static_cast<uint16_t>(sp + offset);
}

// =============================================================================
// 8-BIT LOAD INSTRUCTIONS
// =============================================================================

// LD r,r' - 4 T-cycles, 8 with (HL) on either side
void LD_r_r(CPU& cpu, uint8_t dest, uint8_t src) {
    WriteOperand8(cpu, dest, ReadOperand8(cpu, src));
}

// LD r,n - 8 T-cycles; LD (HL),n - 12 T-cycles
void LD_r_n(CPU& cpu, uint8_t dest) {
    uint8_t n = cpu.FetchByte();
    WriteOperand8(cpu, dest, n);
}

void LD_A_BC(CPU& cpu) {
    cpu.SetA(cpu.ReadByte(cpu.GetBC()));
}

void LD_A_DE(CPU& cpu) {
    cpu.SetA(cpu.ReadByte(cpu.GetDE()));
}

// LD A,(nn) - 16 T-cycles (3 fetches + 1 read)
void LD_A_nn(CPU& cpu) {
    uint16_t addr = cpu.FetchWord();
    cpu.SetA(cpu.ReadByte(addr));
}

void LD_BC_A(CPU& cpu) {
    cpu.WriteByte(cpu.GetBC(), cpu.GetA());
}

void LD_DE_A(CPU& cpu) {
    cpu.WriteByte(cpu.GetDE(), cpu.GetA());
}

// LD (nn),A - 16 T-cycles
void LD_nn_A(CPU& cpu) {
    uint16_t addr = cpu.FetchWord();
    cpu.WriteByte(addr, cpu.GetA());
}

// LDH A,(n) - 12 T-cycles
void LDH_A_n(CPU& cpu) {
    uint8_t n = cpu.FetchByte();
    cpu.SetA(cpu.ReadByte(0xFF00 + n));
}

void LDH_n_A(CPU& cpu) {
    uint8_t n = cpu.FetchByte();
    cpu.WriteByte(0xFF00 + n, cpu.GetA());
}

// LDH A,(C) - 8 T-cycles
void LDH_A_C(CPU& cpu) {
    cpu.SetA(cpu.ReadByte(0xFF00 + cpu.GetC()));
}

void LDH_C_A(CPU& cpu) {
    cpu.WriteByte(0xFF00 + cpu.GetC(), cpu.GetA());
}

void LD_A_HLI(CPU& cpu) {
    cpu.SetA(cpu.ReadByte(cpu.GetHL()));
    cpu.SetHL(cpu.GetHL() + 1);
}

void LD_A_HLD(CPU& cpu) {
    cpu.SetA(cpu.ReadByte(cpu.GetHL()));
    cpu.SetHL(cpu.GetHL() - 1);
}

void LD_HLI_A(CPU& cpu) {
    cpu.WriteByte(cpu.GetHL(), cpu.GetA());
    cpu.SetHL(cpu.GetHL() + 1);
}

void LD_HLD_A(CPU& cpu) {
    cpu.WriteByte(cpu.GetHL(), cpu.GetA());
    cpu.SetHL(cpu.GetHL() - 1);
}

// =============================================================================
// 16-BIT LOAD INSTRUCTIONS
// =============================================================================

// LD rr,nn - 12 T-cycles (3 fetches)
void LD_rr_nn(CPU& cpu, uint8_t reg) {
    SetReg16(cpu, reg, cpu.FetchWord());
}

// LD (nn),SP - 20 T-cycles (3 fetches + 2 writes)
void LD_nn_SP(CPU& cpu) {
    uint16_t addr = cpu.FetchWord();
    cpu.WriteByte(addr, cpu.GetSP() & 0xFF);
    cpu.WriteByte(static_cast<uint16_t>(addr + 1), cpu.GetSP() >> 8);
}

// LD SP,HL - 8 T-cycles (1 fetch + 1 internal)
void LD_SP_HL(CPU& cpu) {
    cpu.SetSP(cpu.GetHL());
    cpu.InternalDelay();
}

// LD HL,SP+n - 12 T-cycles (2 fetches + 1 internal)
void LD_HL_SP_n(CPU& cpu) {
    int8_t n = static_cast<int8_t>(cpu.FetchByte());
    cpu.SetHL(AddSignedToSP(cpu, n));
    cpu.InternalDelay();
}

// PUSH rr - 16 T-cycles (1 fetch + 1 internal + 2 writes)
void PUSH_rr(CPU& cpu, uint8_t reg) {
    uint16_t value = (reg == 3) ? cpu.GetAF() : GetReg16(cpu, reg);
    cpu.InternalDelay();
    cpu.Push(value);
}

// POP rr - 12 T-cycles (1 fetch + 2 reads)
void POP_rr(CPU& cpu, uint8_t reg) {
    uint16_t value = cpu.Pop();
    if (reg == 3) {
        cpu.SetAF(value);  // Low nibble of F is masked
    } else {
        SetReg16(cpu, reg, value);
    }
}

// =============================================================================
// 8-BIT ALU INSTRUCTIONS
// =============================================================================

void ADD_A_r(CPU& cpu, uint8_t src) { AddToA(cpu, ReadOperand8(cpu, src), false); }
void ADD_A_n(CPU& cpu) { AddToA(cpu, cpu.FetchByte(), false); }
void ADC_A_r(CPU& cpu, uint8_t src) { AddToA(cpu, ReadOperand8(cpu, src), true); }
void ADC_A_n(CPU& cpu) { AddToA(cpu, cpu.FetchByte(), true); }

void SUB_r(CPU& cpu, uint8_t src) { cpu.SetA(SubtractFromA(cpu, ReadOperand8(cpu, src), false)); }
void SUB_n(CPU& cpu) { cpu.SetA(SubtractFromA(cpu, cpu.FetchByte(), false)); }
void SBC_A_r(CPU& cpu, uint8_t src) { cpu.SetA(SubtractFromA(cpu, ReadOperand8(cpu, src), true)); }
void SBC_A_n(CPU& cpu) { cpu.SetA(SubtractFromA(cpu, cpu.FetchByte(), true)); }

void AND_r(CPU& cpu, uint8_t src) { SetLogicFlags(cpu, cpu.GetA() & ReadOperand8(cpu, src), true); }
void AND_n(CPU& cpu) { SetLogicFlags(cpu, cpu.GetA() & cpu.FetchByte(), true); }
void XOR_r(CPU& cpu, uint8_t src) { SetLogicFlags(cpu, cpu.GetA() ^ ReadOperand8(cpu, src), false); }
void XOR_n(CPU& cpu) { SetLogicFlags(cpu, cpu.GetA() ^ cpu.FetchByte(), false); }
void OR_r(CPU& cpu, uint8_t src) { SetLogicFlags(cpu, cpu.GetA() | ReadOperand8(cpu, src), false); }
void OR_n(CPU& cpu) { SetLogicFlags(cpu, cpu.GetA() | cpu.FetchByte(), false); }

// CP - SUB without storing the result
void CP_r(CPU& cpu, uint8_t src) { SubtractFromA(cpu, ReadOperand8(cpu, src), false); }
void CP_n(CPU& cpu) { SubtractFromA(cpu, cpu.FetchByte(), false); }

// INC r - 4 T-cycles, INC (HL) - 12 (read + write). C not affected.
void INC_r(CPU& cpu, uint8_t reg) {
    uint8_t value = ReadOperand8(cpu, reg);
    uint8_t result = value + 1;
    WriteOperand8(cpu, reg, result);

    cpu.SetFlagZ(result == 0);
    cpu.SetFlagN(false);
    cpu.SetFlagH((value & 0x0F) == 0x0F);
}

// DEC r - 4 T-cycles, DEC (HL) - 12. C not affected.
void DEC_r(CPU& cpu, uint8_t reg) {
    uint8_t value = ReadOperand8(cpu, reg);
    uint8_t result = value - 1;
    WriteOperand8(cpu, reg, result);

    cpu.SetFlagZ(result == 0);
    cpu.SetFlagN(true);
    cpu.SetFlagH((value & 0x0F) == 0x00);
}

// DAA - Decimal Adjust Accumulator
void DAA(CPU& cpu) {
    uint8_t a = cpu.GetA();
    uint8_t correction = 0;
    bool set_carry = false;

    if (cpu.GetFlagH() || (!cpu.GetFlagN() && (a & 0x0F) > 9)) {
        correction |= 0x06;
    }

    if (cpu.GetFlagC() || (!cpu.GetFlagN() && a > 0x99)) {
        correction |= 0x60;
        set_carry = true;
    }

    if (cpu.GetFlagN()) {
        a -= correction;
    } else {
        a += correction;
    }

    cpu.SetA(a);
    cpu.SetFlagZ(a == 0);
    cpu.SetFlagH(false);
    cpu.SetFlagC(set_carry);
}

void CPL(CPU& cpu) {
    cpu.SetA(~cpu.GetA());
    cpu.SetFlagN(true);
    cpu.SetFlagH(true);
}

void SCF(CPU& cpu) {
    cpu.SetFlagN(false);
    cpu.SetFlagH(false);
    cpu.SetFlagC(true);
}

void CCF(CPU& cpu) {
    cpu.SetFlagN(false);
    cpu.SetFlagH(false);
    cpu.SetFlagC(!cpu.GetFlagC());
}

// =============================================================================
// 16-BIT ALU INSTRUCTIONS
// =============================================================================

// ADD HL,rr - 8 T-cycles (1 fetch + 1 internal). Z not affected.
void ADD_HL_rr(CPU& cpu, uint8_t reg) {
    uint16_t hl = cpu.GetHL();
    uint16_t value = GetReg16(cpu, reg);
    uint32_t result = hl + value;

    cpu.SetHL(result & 0xFFFF);
    cpu.SetFlagN(false);
    cpu.SetFlagH((hl & 0x0FFF) + (value & 0x0FFF) > 0x0FFF);
    cpu.SetFlagC(result > 0xFFFF);
    cpu.InternalDelay();
}

// ADD SP,n - 16 T-cycles (2 fetches + 2 internal)
void ADD_SP_n(CPU& cpu) {
    int8_t n = static_cast<int8_t>(cpu.FetchByte());
    uint16_t result = AddSignedToSP(cpu, n);
    cpu.InternalDelay();
    cpu.InternalDelay();
    cpu.SetSP(result);
}

// INC rr / DEC rr - 8 T-cycles (1 fetch + 1 internal), no flags
void INC_rr(CPU& cpu, uint8_t reg) {
    SetReg16(cpu, reg, GetReg16(cpu, reg) + 1);
    cpu.InternalDelay();
}

void DEC_rr(CPU& cpu, uint8_t reg) {
    SetReg16(cpu, reg, GetReg16(cpu, reg) - 1);
    cpu.InternalDelay();
}

// =============================================================================
// ACCUMULATOR ROTATES (Z always cleared, unlike the CB forms)
// =============================================================================

static void SetAccumulatorRotate(CPU& cpu, uint8_t result, bool carry) {
    cpu.SetA(result);
    cpu.SetFlagZ(false);
    cpu.SetFlagN(false);
    cpu.SetFlagH(false);
    cpu.SetFlagC(carry);
}

void RLCA(CPU& cpu) {
    uint8_t a = cpu.GetA();
    SetAccumulatorRotate(cpu, static_cast<uint8_t>((a << 1) | (a >> 7)), (a & 0x80) != 0);
}

void RLA(CPU& cpu) {
    uint8_t a = cpu.GetA();
    SetAccumulatorRotate(cpu, static_cast<uint8_t>((a << 1) | (cpu.GetFlagC() ? 1 : 0)), (a & 0x80) != 0);
}

void RRCA(CPU& cpu) {
    uint8_t a = cpu.GetA();
    SetAccumulatorRotate(cpu, static_cast<uint8_t>((a >> 1) | (a << 7)), (a & 0x01) != 0);
}

void RRA(CPU& cpu) {
    uint8_t a = cpu.GetA();
    SetAccumulatorRotate(cpu, static_cast<uint8_t>((a >> 1) | (cpu.GetFlagC() ? 0x80 : 0)), (a & 0x01) != 0);
}

// =============================================================================
// CONTROL FLOW
// =============================================================================

// JP nn - 16 T-cycles (3 fetches + 1 internal)
void JP_nn(CPU& cpu) {
    uint16_t addr = cpu.FetchWord();
    cpu.InternalDelay();
    cpu.SetPC(addr);
}

// JP cc,nn - 16/12 T-cycles
void JP_cc_nn(CPU& cpu, uint8_t cc) {
    uint16_t addr = cpu.FetchWord();
    if (CheckCondition(cpu, cc)) {
        cpu.InternalDelay();
        cpu.SetPC(addr);
    }
}

// JP (HL) - 4 T-cycles
void JP_HL(CPU& cpu) {
    cpu.SetPC(cpu.GetHL());
}

// JR n - 12 T-cycles (2 fetches + 1 internal)
void JR_n(CPU& cpu) {
    int8_t offset = static_cast<int8_t>(cpu.FetchByte());
    cpu.InternalDelay();
    cpu.SetPC(static_cast<uint16_t>(cpu.GetPC() + offset));
}

// JR cc,n - 12/8 T-cycles
void JR_cc_n(CPU& cpu, uint8_t cc) {
    int8_t offset = static_cast<int8_t>(cpu.FetchByte());
    if (CheckCondition(cpu, cc)) {
        cpu.InternalDelay();
        cpu.SetPC(static_cast<uint16_t>(cpu.GetPC() + offset));
    }
}

// CALL nn - 24 T-cycles (3 fetches + 1 internal + 2 writes)
void CALL_nn(CPU& cpu) {
    uint16_t addr = cpu.FetchWord();
    cpu.InternalDelay();
    cpu.Push(cpu.GetPC());
    cpu.SetPC(addr);
}

// CALL cc,nn - 24/12 T-cycles
void CALL_cc_nn(CPU& cpu, uint8_t cc) {
    uint16_t addr = cpu.FetchWord();
    if (CheckCondition(cpu, cc)) {
        cpu.InternalDelay();
        cpu.Push(cpu.GetPC());
        cpu.SetPC(addr);
    }
}

// RET - 16 T-cycles (1 fetch + 2 reads + 1 internal)
void RET(CPU& cpu) {
    uint16_t addr = cpu.Pop();
    cpu.InternalDelay();
    cpu.SetPC(addr);
}

// RET cc - 20/8 T-cycles (condition check costs an internal cycle)
void RET_cc(CPU& cpu, uint8_t cc) {
    cpu.InternalDelay();
    if (CheckCondition(cpu, cc)) {
        RET(cpu);
    }
}

// RETI - 16 T-cycles, IME set immediately (no EI delay)
void RETI(CPU& cpu) {
    RET(cpu);
    cpu.SetIME(true);
}

// RST n - 16 T-cycles (1 fetch + 1 internal + 2 writes)
void RST(CPU& cpu, uint8_t vec) {
    cpu.InternalDelay();
    cpu.Push(cpu.GetPC());
    cpu.SetPC(vec);
}

// =============================================================================
// MISC
// =============================================================================

void NOP(CPU&) {
}

// HALT - 4 T-cycles. See CPU::EnterHalt for the HALT bug.
void HALT(CPU& cpu) {
    cpu.EnterHalt();
}

// STOP - 4 T-cycles. Two bytes long; the padding byte is skipped
// without a bus access.
void STOP(CPU& cpu) {
    cpu.SkipByte();
    cpu.EnterStop();
}

// DI - immediate, also cancels a pending EI
void DI(CPU& cpu) {
    cpu.SetIME(false);
    cpu.CancelScheduledIME();
}

// EI - IME becomes set after the next instruction
void EI(CPU& cpu) {
    cpu.ScheduleIME();
}

// $CB prefix - fetch the second opcode byte and dispatch
void PREFIX_CB(CPU& cpu) {
    ExecuteCBOpcode(cpu, cpu.FetchByte());
}
