/**
 * SM83 Opcode Table
 *
 * One descriptor per base opcode: mnemonic, length in bytes, T-cycle cost
 * (not taken / taken for conditionals) and handler. Operand placeholders in
 * mnemonics: d8/d16 immediate data, a8 high-page offset, a16 address,
 * r8 signed relative offset.
 *
 * The eleven unassigned opcodes have no handler. Fetching one is fatal.
 */

#include "Instructions.hpp"
#include "CPU.hpp"

#include <array>
#include <cstdio>

static const std::array<Instruction, 256> OPCODE_TABLE = {{
    // $00-$0F
    { "NOP", 1, 4, 0, [](CPU& c) { NOP(c); } },
    { "LD BC,d16", 3, 12, 0, [](CPU& c) { LD_rr_nn(c, 0); } },
    { "LD (BC),A", 1, 8, 0, [](CPU& c) { LD_BC_A(c); } },
    { "INC BC", 1, 8, 0, [](CPU& c) { INC_rr(c, 0); } },
    { "INC B", 1, 4, 0, [](CPU& c) { INC_r(c, 0); } },
    { "DEC B", 1, 4, 0, [](CPU& c) { DEC_r(c, 0); } },
    { "LD B,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 0); } },
    { "RLCA", 1, 4, 0, [](CPU& c) { RLCA(c); } },
    { "LD (a16),SP", 3, 20, 0, [](CPU& c) { LD_nn_SP(c); } },
    { "ADD HL,BC", 1, 8, 0, [](CPU& c) { ADD_HL_rr(c, 0); } },
    { "LD A,(BC)", 1, 8, 0, [](CPU& c) { LD_A_BC(c); } },
    { "DEC BC", 1, 8, 0, [](CPU& c) { DEC_rr(c, 0); } },
    { "INC C", 1, 4, 0, [](CPU& c) { INC_r(c, 1); } },
    { "DEC C", 1, 4, 0, [](CPU& c) { DEC_r(c, 1); } },
    { "LD C,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 1); } },
    { "RRCA", 1, 4, 0, [](CPU& c) { RRCA(c); } },

    // $10-$1F
    { "STOP", 2, 4, 0, [](CPU& c) { STOP(c); } },
    { "LD DE,d16", 3, 12, 0, [](CPU& c) { LD_rr_nn(c, 1); } },
    { "LD (DE),A", 1, 8, 0, [](CPU& c) { LD_DE_A(c); } },
    { "INC DE", 1, 8, 0, [](CPU& c) { INC_rr(c, 1); } },
    { "INC D", 1, 4, 0, [](CPU& c) { INC_r(c, 2); } },
    { "DEC D", 1, 4, 0, [](CPU& c) { DEC_r(c, 2); } },
    { "LD D,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 2); } },
    { "RLA", 1, 4, 0, [](CPU& c) { RLA(c); } },
    { "JR r8", 2, 12, 0, [](CPU& c) { JR_n(c); } },
    { "ADD HL,DE", 1, 8, 0, [](CPU& c) { ADD_HL_rr(c, 1); } },
    { "LD A,(DE)", 1, 8, 0, [](CPU& c) { LD_A_DE(c); } },
    { "DEC DE", 1, 8, 0, [](CPU& c) { DEC_rr(c, 1); } },
    { "INC E", 1, 4, 0, [](CPU& c) { INC_r(c, 3); } },
    { "DEC E", 1, 4, 0, [](CPU& c) { DEC_r(c, 3); } },
    { "LD E,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 3); } },
    { "RRA", 1, 4, 0, [](CPU& c) { RRA(c); } },

    // $20-$2F
    { "JR NZ,r8", 2, 8, 12, [](CPU& c) { JR_cc_n(c, 0); } },
    { "LD HL,d16", 3, 12, 0, [](CPU& c) { LD_rr_nn(c, 2); } },
    { "LD (HL+),A", 1, 8, 0, [](CPU& c) { LD_HLI_A(c); } },
    { "INC HL", 1, 8, 0, [](CPU& c) { INC_rr(c, 2); } },
    { "INC H", 1, 4, 0, [](CPU& c) { INC_r(c, 4); } },
    { "DEC H", 1, 4, 0, [](CPU& c) { DEC_r(c, 4); } },
    { "LD H,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 4); } },
    { "DAA", 1, 4, 0, [](CPU& c) { DAA(c); } },
    { "JR Z,r8", 2, 8, 12, [](CPU& c) { JR_cc_n(c, 1); } },
    { "ADD HL,HL", 1, 8, 0, [](CPU& c) { ADD_HL_rr(c, 2); } },
    { "LD A,(HL+)", 1, 8, 0, [](CPU& c) { LD_A_HLI(c); } },
    { "DEC HL", 1, 8, 0, [](CPU& c) { DEC_rr(c, 2); } },
    { "INC L", 1, 4, 0, [](CPU& c) { INC_r(c, 5); } },
    { "DEC L", 1, 4, 0, [](CPU& c) { DEC_r(c, 5); } },
    { "LD L,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 5); } },
    { "CPL", 1, 4, 0, [](CPU& c) { CPL(c); } },

    // $30-$3F
    { "JR NC,r8", 2, 8, 12, [](CPU& c) { JR_cc_n(c, 2); } },
    { "LD SP,d16", 3, 12, 0, [](CPU& c) { LD_rr_nn(c, 3); } },
    { "LD (HL-),A", 1, 8, 0, [](CPU& c) { LD_HLD_A(c); } },
    { "INC SP", 1, 8, 0, [](CPU& c) { INC_rr(c, 3); } },
    { "INC (HL)", 1, 12, 0, [](CPU& c) { INC_r(c, 6); } },
    { "DEC (HL)", 1, 12, 0, [](CPU& c) { DEC_r(c, 6); } },
    { "LD (HL),d8", 2, 12, 0, [](CPU& c) { LD_r_n(c, 6); } },
    { "SCF", 1, 4, 0, [](CPU& c) { SCF(c); } },
    { "JR C,r8", 2, 8, 12, [](CPU& c) { JR_cc_n(c, 3); } },
    { "ADD HL,SP", 1, 8, 0, [](CPU& c) { ADD_HL_rr(c, 3); } },
    { "LD A,(HL-)", 1, 8, 0, [](CPU& c) { LD_A_HLD(c); } },
    { "DEC SP", 1, 8, 0, [](CPU& c) { DEC_rr(c, 3); } },
    { "INC A", 1, 4, 0, [](CPU& c) { INC_r(c, 7); } },
    { "DEC A", 1, 4, 0, [](CPU& c) { DEC_r(c, 7); } },
    { "LD A,d8", 2, 8, 0, [](CPU& c) { LD_r_n(c, 7); } },
    { "CCF", 1, 4, 0, [](CPU& c) { CCF(c); } },

    // $40-$4F
    { "LD B,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 0); } },
    { "LD B,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 1); } },
    { "LD B,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 2); } },
    { "LD B,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 3); } },
    { "LD B,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 4); } },
    { "LD B,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 5); } },
    { "LD B,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 0, 6); } },
    { "LD B,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 0, 7); } },
    { "LD C,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 0); } },
    { "LD C,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 1); } },
    { "LD C,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 2); } },
    { "LD C,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 3); } },
    { "LD C,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 4); } },
    { "LD C,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 5); } },
    { "LD C,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 1, 6); } },
    { "LD C,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 1, 7); } },

    // $50-$5F
    { "LD D,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 0); } },
    { "LD D,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 1); } },
    { "LD D,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 2); } },
    { "LD D,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 3); } },
    { "LD D,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 4); } },
    { "LD D,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 5); } },
    { "LD D,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 2, 6); } },
    { "LD D,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 2, 7); } },
    { "LD E,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 0); } },
    { "LD E,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 1); } },
    { "LD E,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 2); } },
    { "LD E,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 3); } },
    { "LD E,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 4); } },
    { "LD E,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 5); } },
    { "LD E,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 3, 6); } },
    { "LD E,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 3, 7); } },

    // $60-$6F
    { "LD H,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 0); } },
    { "LD H,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 1); } },
    { "LD H,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 2); } },
    { "LD H,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 3); } },
    { "LD H,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 4); } },
    { "LD H,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 5); } },
    { "LD H,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 4, 6); } },
    { "LD H,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 4, 7); } },
    { "LD L,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 0); } },
    { "LD L,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 1); } },
    { "LD L,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 2); } },
    { "LD L,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 3); } },
    { "LD L,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 4); } },
    { "LD L,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 5); } },
    { "LD L,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 5, 6); } },
    { "LD L,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 5, 7); } },

    // $70-$7F
    { "LD (HL),B", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 0); } },
    { "LD (HL),C", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 1); } },
    { "LD (HL),D", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 2); } },
    { "LD (HL),E", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 3); } },
    { "LD (HL),H", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 4); } },
    { "LD (HL),L", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 5); } },
    { "HALT", 1, 4, 0, [](CPU& c) { HALT(c); } },
    { "LD (HL),A", 1, 8, 0, [](CPU& c) { LD_r_r(c, 6, 7); } },
    { "LD A,B", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 0); } },
    { "LD A,C", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 1); } },
    { "LD A,D", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 2); } },
    { "LD A,E", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 3); } },
    { "LD A,H", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 4); } },
    { "LD A,L", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 5); } },
    { "LD A,(HL)", 1, 8, 0, [](CPU& c) { LD_r_r(c, 7, 6); } },
    { "LD A,A", 1, 4, 0, [](CPU& c) { LD_r_r(c, 7, 7); } },

    // $80-$8F
    { "ADD A,B", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 0); } },
    { "ADD A,C", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 1); } },
    { "ADD A,D", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 2); } },
    { "ADD A,E", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 3); } },
    { "ADD A,H", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 4); } },
    { "ADD A,L", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 5); } },
    { "ADD A,(HL)", 1, 8, 0, [](CPU& c) { ADD_A_r(c, 6); } },
    { "ADD A,A", 1, 4, 0, [](CPU& c) { ADD_A_r(c, 7); } },
    { "ADC A,B", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 0); } },
    { "ADC A,C", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 1); } },
    { "ADC A,D", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 2); } },
    { "ADC A,E", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 3); } },
    { "ADC A,H", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 4); } },
    { "ADC A,L", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 5); } },
    { "ADC A,(HL)", 1, 8, 0, [](CPU& c) { ADC_A_r(c, 6); } },
    { "ADC A,A", 1, 4, 0, [](CPU& c) { ADC_A_r(c, 7); } },

    // $90-$9F
    { "SUB B", 1, 4, 0, [](CPU& c) { SUB_r(c, 0); } },
    { "SUB C", 1, 4, 0, [](CPU& c) { SUB_r(c, 1); } },
    { "SUB D", 1, 4, 0, [](CPU& c) { SUB_r(c, 2); } },
    { "SUB E", 1, 4, 0, [](CPU& c) { SUB_r(c, 3); } },
    { "SUB H", 1, 4, 0, [](CPU& c) { SUB_r(c, 4); } },
    { "SUB L", 1, 4, 0, [](CPU& c) { SUB_r(c, 5); } },
    { "SUB (HL)", 1, 8, 0, [](CPU& c) { SUB_r(c, 6); } },
    { "SUB A", 1, 4, 0, [](CPU& c) { SUB_r(c, 7); } },
    { "SBC A,B", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 0); } },
    { "SBC A,C", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 1); } },
    { "SBC A,D", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 2); } },
    { "SBC A,E", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 3); } },
    { "SBC A,H", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 4); } },
    { "SBC A,L", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 5); } },
    { "SBC A,(HL)", 1, 8, 0, [](CPU& c) { SBC_A_r(c, 6); } },
    { "SBC A,A", 1, 4, 0, [](CPU& c) { SBC_A_r(c, 7); } },

    // $A0-$AF
    { "AND B", 1, 4, 0, [](CPU& c) { AND_r(c, 0); } },
    { "AND C", 1, 4, 0, [](CPU& c) { AND_r(c, 1); } },
    { "AND D", 1, 4, 0, [](CPU& c) { AND_r(c, 2); } },
    { "AND E", 1, 4, 0, [](CPU& c) { AND_r(c, 3); } },
    { "AND H", 1, 4, 0, [](CPU& c) { AND_r(c, 4); } },
    { "AND L", 1, 4, 0, [](CPU& c) { AND_r(c, 5); } },
    { "AND (HL)", 1, 8, 0, [](CPU& c) { AND_r(c, 6); } },
    { "AND A", 1, 4, 0, [](CPU& c) { AND_r(c, 7); } },
    { "XOR B", 1, 4, 0, [](CPU& c) { XOR_r(c, 0); } },
    { "XOR C", 1, 4, 0, [](CPU& c) { XOR_r(c, 1); } },
    { "XOR D", 1, 4, 0, [](CPU& c) { XOR_r(c, 2); } },
    { "XOR E", 1, 4, 0, [](CPU& c) { XOR_r(c, 3); } },
    { "XOR H", 1, 4, 0, [](CPU& c) { XOR_r(c, 4); } },
    { "XOR L", 1, 4, 0, [](CPU& c) { XOR_r(c, 5); } },
    { "XOR (HL)", 1, 8, 0, [](CPU& c) { XOR_r(c, 6); } },
    { "XOR A", 1, 4, 0, [](CPU& c) { XOR_r(c, 7); } },

    // $B0-$BF
    { "OR B", 1, 4, 0, [](CPU& c) { OR_r(c, 0); } },
    { "OR C", 1, 4, 0, [](CPU& c) { OR_r(c, 1); } },
    { "OR D", 1, 4, 0, [](CPU& c) { OR_r(c, 2); } },
    { "OR E", 1, 4, 0, [](CPU& c) { OR_r(c, 3); } },
    { "OR H", 1, 4, 0, [](CPU& c) { OR_r(c, 4); } },
    { "OR L", 1, 4, 0, [](CPU& c) { OR_r(c, 5); } },
    { "OR (HL)", 1, 8, 0, [](CPU& c) { OR_r(c, 6); } },
    { "OR A", 1, 4, 0, [](CPU& c) { OR_r(c, 7); } },
    { "CP B", 1, 4, 0, [](CPU& c) { CP_r(c, 0); } },
    { "CP C", 1, 4, 0, [](CPU& c) { CP_r(c, 1); } },
    { "CP D", 1, 4, 0, [](CPU& c) { CP_r(c, 2); } },
    { "CP E", 1, 4, 0, [](CPU& c) { CP_r(c, 3); } },
    { "CP H", 1, 4, 0, [](CPU& c) { CP_r(c, 4); } },
    { "CP L", 1, 4, 0, [](CPU& c) { CP_r(c, 5); } },
    { "CP (HL)", 1, 8, 0, [](CPU& c) { CP_r(c, 6); } },
    { "CP A", 1, 4, 0, [](CPU& c) { CP_r(c, 7); } },

    // $C0-$CF
    { "RET NZ", 1, 8, 20, [](CPU& c) { RET_cc(c, 0); } },
    { "POP BC", 1, 12, 0, [](CPU& c) { POP_rr(c, 0); } },
    { "JP NZ,a16", 3, 12, 16, [](CPU& c) { JP_cc_nn(c, 0); } },
    { "JP a16", 3, 16, 0, [](CPU& c) { JP_nn(c); } },
    { "CALL NZ,a16", 3, 12, 24, [](CPU& c) { CALL_cc_nn(c, 0); } },
    { "PUSH BC", 1, 16, 0, [](CPU& c) { PUSH_rr(c, 0); } },
    { "ADD A,d8", 2, 8, 0, [](CPU& c) { ADD_A_n(c); } },
    { "RST 00H", 1, 16, 0, [](CPU& c) { RST(c, 0x00); } },
    { "RET Z", 1, 8, 20, [](CPU& c) { RET_cc(c, 1); } },
    { "RET", 1, 16, 0, [](CPU& c) { RET(c); } },
    { "JP Z,a16", 3, 12, 16, [](CPU& c) { JP_cc_nn(c, 1); } },
    { "PREFIX CB", 1, 4, 0, [](CPU& c) { PREFIX_CB(c); } },
    { "CALL Z,a16", 3, 12, 24, [](CPU& c) { CALL_cc_nn(c, 1); } },
    { "CALL a16", 3, 24, 0, [](CPU& c) { CALL_nn(c); } },
    { "ADC A,d8", 2, 8, 0, [](CPU& c) { ADC_A_n(c); } },
    { "RST 08H", 1, 16, 0, [](CPU& c) { RST(c, 0x08); } },

    // $D0-$DF
    { "RET NC", 1, 8, 20, [](CPU& c) { RET_cc(c, 2); } },
    { "POP DE", 1, 12, 0, [](CPU& c) { POP_rr(c, 1); } },
    { "JP NC,a16", 3, 12, 16, [](CPU& c) { JP_cc_nn(c, 2); } },
    { "ILLEGAL_D3", 1, 4, 0, nullptr },
    { "CALL NC,a16", 3, 12, 24, [](CPU& c) { CALL_cc_nn(c, 2); } },
    { "PUSH DE", 1, 16, 0, [](CPU& c) { PUSH_rr(c, 1); } },
    { "SUB d8", 2, 8, 0, [](CPU& c) { SUB_n(c); } },
    { "RST 10H", 1, 16, 0, [](CPU& c) { RST(c, 0x10); } },
    { "RET C", 1, 8, 20, [](CPU& c) { RET_cc(c, 3); } },
    { "RETI", 1, 16, 0, [](CPU& c) { RETI(c); } },
    { "JP C,a16", 3, 12, 16, [](CPU& c) { JP_cc_nn(c, 3); } },
    { "ILLEGAL_DB", 1, 4, 0, nullptr },
    { "CALL C,a16", 3, 12, 24, [](CPU& c) { CALL_cc_nn(c, 3); } },
    { "ILLEGAL_DD", 1, 4, 0, nullptr },
    { "SBC A,d8", 2, 8, 0, [](CPU& c) { SBC_A_n(c); } },
    { "RST 18H", 1, 16, 0, [](CPU& c) { RST(c, 0x18); } },

    // $E0-$EF
    { "LDH (a8),A", 2, 12, 0, [](CPU& c) { LDH_n_A(c); } },
    { "POP HL", 1, 12, 0, [](CPU& c) { POP_rr(c, 2); } },
    { "LD (C),A", 1, 8, 0, [](CPU& c) { LDH_C_A(c); } },
    { "ILLEGAL_E3", 1, 4, 0, nullptr },
    { "ILLEGAL_E4", 1, 4, 0, nullptr },
    { "PUSH HL", 1, 16, 0, [](CPU& c) { PUSH_rr(c, 2); } },
    { "AND d8", 2, 8, 0, [](CPU& c) { AND_n(c); } },
    { "RST 20H", 1, 16, 0, [](CPU& c) { RST(c, 0x20); } },
    { "ADD SP,r8", 2, 16, 0, [](CPU& c) { ADD_SP_n(c); } },
    { "JP (HL)", 1, 4, 0, [](CPU& c) { JP_HL(c); } },
    { "LD (a16),A", 3, 16, 0, [](CPU& c) { LD_nn_A(c); } },
    { "ILLEGAL_EB", 1, 4, 0, nullptr },
    { "ILLEGAL_EC", 1, 4, 0, nullptr },
    { "ILLEGAL_ED", 1, 4, 0, nullptr },
    { "XOR d8", 2, 8, 0, [](CPU& c) { XOR_n(c); } },
    { "RST 28H", 1, 16, 0, [](CPU& c) { RST(c, 0x28); } },

    // $F0-$FF
    { "LDH A,(a8)", 2, 12, 0, [](CPU& c) { LDH_A_n(c); } },
    { "POP AF", 1, 12, 0, [](CPU& c) { POP_rr(c, 3); } },
    { "LD A,(C)", 1, 8, 0, [](CPU& c) { LDH_A_C(c); } },
    { "DI", 1, 4, 0, [](CPU& c) { DI(c); } },
    { "ILLEGAL_F4", 1, 4, 0, nullptr },
    { "PUSH AF", 1, 16, 0, [](CPU& c) { PUSH_rr(c, 3); } },
    { "OR d8", 2, 8, 0, [](CPU& c) { OR_n(c); } },
    { "RST 30H", 1, 16, 0, [](CPU& c) { RST(c, 0x30); } },
    { "LD HL,SP+r8", 2, 12, 0, [](CPU& c) { LD_HL_SP_n(c); } },
    { "LD SP,HL", 1, 8, 0, [](CPU& c) { LD_SP_HL(c); } },
    { "LD A,(a16)", 3, 16, 0, [](CPU& c) { LD_A_nn(c); } },
    { "EI", 1, 4, 0, [](CPU& c) { EI(c); } },
    { "ILLEGAL_FC", 1, 4, 0, nullptr },
    { "ILLEGAL_FD", 1, 4, 0, nullptr },
    { "CP d8", 2, 8, 0, [](CPU& c) { CP_n(c); } },
    { "RST 38H", 1, 16, 0, [](CPU& c) { RST(c, 0x38); } },
}};

const Instruction& GetInstruction(uint8_t opcode) {
    return OPCODE_TABLE[opcode];
}

bool IsIllegalOpcode(uint8_t opcode) {
    return OPCODE_TABLE[opcode].execute == nullptr;
}

static void ReplaceOperand(std::string& text, const char* placeholder, const std::string& value) {
    size_t pos = text.find(placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, std::char_traits<char>::length(placeholder), value);
    }
}

std::string Disassemble(const CPU& cpu, uint16_t addr) {
    uint8_t opcode = cpu.PeekByte(addr);

    if (opcode == 0xCB) {
        uint8_t cb_opcode = cpu.PeekByte(static_cast<uint16_t>(addr + 1));
        return GetCBInstruction(cb_opcode).mnemonic;
    }

    const Instruction& instruction = GetInstruction(opcode);
    std::string text = instruction.mnemonic;
    uint8_t lo = cpu.PeekByte(static_cast<uint16_t>(addr + 1));
    uint8_t hi = cpu.PeekByte(static_cast<uint16_t>(addr + 2));
    char buffer[16];

    if (instruction.length == 3) {
        std::snprintf(buffer, sizeof(buffer), "$%04X", (hi << 8) | lo);
        ReplaceOperand(text, "d16", buffer);
        ReplaceOperand(text, "a16", buffer);
    } else if (instruction.length == 2) {
        if (text.find("r8") != std::string::npos) {
            // Relative jumps show the target, SP offsets show the signed value
            int8_t offset = static_cast<int8_t>(lo);
            if (text.compare(0, 2, "JR") == 0) {
                std::snprintf(buffer, sizeof(buffer), "$%04X",
                              static_cast<uint16_t>(addr + 2 + offset));
            } else {
                std::snprintf(buffer, sizeof(buffer), "%d", offset);
            }
            ReplaceOperand(text, "r8", buffer);
        } else if (text.find("a8") != std::string::npos) {
            std::snprintf(buffer, sizeof(buffer), "$FF%02X", lo);
            ReplaceOperand(text, "a8", buffer);
        } else {
            std::snprintf(buffer, sizeof(buffer), "$%02X", lo);
            ReplaceOperand(text, "d8", buffer);
        }
    }

    return text;
}
