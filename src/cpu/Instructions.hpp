#pragma once

#include <cstdint>
#include <string>

/**
 * SM83 Instruction Definitions
 *
 * Every opcode is described by a table entry: mnemonic, encoded length,
 * T-cycle cost and the function that performs it. The CPU never switches
 * on opcode values; it looks the descriptor up and calls it.
 *
 * Hardware Accuracy Notes:
 * - Each memory access = 4 T-cycles
 * - Instruction timing is the SUM of all memory accesses and internal delays
 * - The table cost is what Step() reports; the handlers produce exactly
 *   that many ticks through their bus accesses
 *
 * Conditional instructions (not taken / taken):
 * - JP cc,nn:   12 / 16
 * - JR cc,n:     8 / 12
 * - CALL cc,nn: 12 / 24
 * - RET cc:      8 / 20
 *
 * Register encoding: 0=B, 1=C, 2=D, 3=E, 4=H, 5=L, 6=(HL), 7=A
 * 16-bit encoding:   0=BC, 1=DE, 2=HL, 3=SP (AF for PUSH/POP)
 * Condition codes:   0=NZ, 1=Z, 2=NC, 3=C
 */

class CPU;

using InstructionHandler = void (*)(CPU& cpu);

struct Instruction {
    const char* mnemonic;
    uint8_t length;             // Bytes including the opcode
    uint8_t cycles;             // T-cycles (branch not taken)
    uint8_t cycles_taken;       // T-cycles when a conditional branch is taken, 0 if unconditional
    InstructionHandler execute; // nullptr for unassigned opcodes
};

enum class CBOperation : uint8_t {
    RLC, RRC, RL, RR, SLA, SRA, SWAP, SRL, BIT, RES, SET
};

struct CBInstruction {
    CBOperation operation;
    uint8_t bit;                // BIT/RES/SET only
    uint8_t reg;                // Register encoding, 6 = (HL)
    uint8_t cycles;             // Includes the $CB prefix fetch
    std::string mnemonic;
};

// === Table Lookup ===
const Instruction& GetInstruction(uint8_t opcode);
const CBInstruction& GetCBInstruction(uint8_t opcode);
bool IsIllegalOpcode(uint8_t opcode);

// Disassemble the instruction at addr without ticking the bus
std::string Disassemble(const CPU& cpu, uint16_t addr);

// CB-prefix executor (opcode = byte after $CB)
void ExecuteCBOpcode(CPU& cpu, uint8_t opcode);

// === Operand Helpers (shared by base and CB instructions) ===
uint8_t ReadOperand8(CPU& cpu, uint8_t reg);
void WriteOperand8(CPU& cpu, uint8_t reg, uint8_t value);

// === 8-bit Loads ===
void LD_r_r(CPU& cpu, uint8_t dest, uint8_t src);
void LD_r_n(CPU& cpu, uint8_t dest);
void LD_A_BC(CPU& cpu);
void LD_A_DE(CPU& cpu);
void LD_A_nn(CPU& cpu);
void LD_BC_A(CPU& cpu);
void LD_DE_A(CPU& cpu);
void LD_nn_A(CPU& cpu);
void LDH_A_n(CPU& cpu);
void LDH_n_A(CPU& cpu);
void LDH_A_C(CPU& cpu);
void LDH_C_A(CPU& cpu);
void LD_A_HLI(CPU& cpu);
void LD_A_HLD(CPU& cpu);
void LD_HLI_A(CPU& cpu);
void LD_HLD_A(CPU& cpu);

// === 16-bit Loads ===
void LD_rr_nn(CPU& cpu, uint8_t reg);
void LD_nn_SP(CPU& cpu);
void LD_SP_HL(CPU& cpu);
void LD_HL_SP_n(CPU& cpu);
void PUSH_rr(CPU& cpu, uint8_t reg);
void POP_rr(CPU& cpu, uint8_t reg);

// === 8-bit ALU ===
// Register forms take a register encoding, immediate forms fetch d8
void ADD_A_r(CPU& cpu, uint8_t src);
void ADD_A_n(CPU& cpu);
void ADC_A_r(CPU& cpu, uint8_t src);
void ADC_A_n(CPU& cpu);
void SUB_r(CPU& cpu, uint8_t src);
void SUB_n(CPU& cpu);
void SBC_A_r(CPU& cpu, uint8_t src);
void SBC_A_n(CPU& cpu);
void AND_r(CPU& cpu, uint8_t src);
void AND_n(CPU& cpu);
void XOR_r(CPU& cpu, uint8_t src);
void XOR_n(CPU& cpu);
void OR_r(CPU& cpu, uint8_t src);
void OR_n(CPU& cpu);
void CP_r(CPU& cpu, uint8_t src);
void CP_n(CPU& cpu);
void INC_r(CPU& cpu, uint8_t reg);
void DEC_r(CPU& cpu, uint8_t reg);
void DAA(CPU& cpu);
void CPL(CPU& cpu);
void SCF(CPU& cpu);
void CCF(CPU& cpu);

// === 16-bit ALU ===
void ADD_HL_rr(CPU& cpu, uint8_t reg);
void ADD_SP_n(CPU& cpu);
void INC_rr(CPU& cpu, uint8_t reg);
void DEC_rr(CPU& cpu, uint8_t reg);

// === Accumulator Rotates ===
void RLCA(CPU& cpu);
void RLA(CPU& cpu);
void RRCA(CPU& cpu);
void RRA(CPU& cpu);

// === Control Flow ===
void JP_nn(CPU& cpu);
void JP_cc_nn(CPU& cpu, uint8_t cc);
void JP_HL(CPU& cpu);
void JR_n(CPU& cpu);
void JR_cc_n(CPU& cpu, uint8_t cc);
void CALL_nn(CPU& cpu);
void CALL_cc_nn(CPU& cpu, uint8_t cc);
void RET(CPU& cpu);
void RET_cc(CPU& cpu, uint8_t cc);
void RETI(CPU& cpu);
void RST(CPU& cpu, uint8_t vec);

// === Misc ===
void NOP(CPU& cpu);
void HALT(CPU& cpu);
void STOP(CPU& cpu);
void DI(CPU& cpu);
void EI(CPU& cpu);
void PREFIX_CB(CPU& cpu);
