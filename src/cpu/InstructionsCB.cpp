/**
 * SM83 CB-Prefix Instructions
 *
 * The 256 CB opcodes are fully regular:
 *   bits 7-6: group (0 = rotate/shift, 1 = BIT, 2 = RES, 3 = SET)
 *   bits 5-3: rotate/shift kind or bit index
 *   bits 2-0: register encoding (6 = (HL))
 *
 * Timing (including the $CB prefix fetch):
 * - r operand:        8 T-cycles
 * - (HL) read-modify: 16 T-cycles
 * - BIT b,(HL):       12 T-cycles (no write back)
 */

#include "Instructions.hpp"
#include "CPU.hpp"

#include <array>

static const char* const REGISTER_NAMES[8] = { "B", "C", "D", "E", "H", "L", "(HL)", "A" };
static const char* const SHIFT_NAMES[8] = { "RLC", "RRC", "RL", "RR", "SLA", "SRA", "SWAP", "SRL" };

static std::array<CBInstruction, 256> BuildCBTable() {
    std::array<CBInstruction, 256> table;

    for (int opcode = 0; opcode < 256; opcode++) {
        uint8_t group = static_cast<uint8_t>(opcode >> 6);
        uint8_t y = static_cast<uint8_t>((opcode >> 3) & 0x07);
        uint8_t reg = static_cast<uint8_t>(opcode & 0x07);

        CBInstruction& entry = table[opcode];
        entry.reg = reg;
        entry.bit = y;

        switch (group) {
            case 0:
                entry.operation = static_cast<CBOperation>(y);
                entry.bit = 0;
                entry.mnemonic = std::string(SHIFT_NAMES[y]) + " " + REGISTER_NAMES[reg];
                break;
            case 1:
                entry.operation = CBOperation::BIT;
                entry.mnemonic = "BIT " + std::to_string(y) + "," + REGISTER_NAMES[reg];
                break;
            case 2:
                entry.operation = CBOperation::RES;
                entry.mnemonic = "RES " + std::to_string(y) + "," + REGISTER_NAMES[reg];
                break;
            default:
                entry.operation = CBOperation::SET;
                entry.mnemonic = "SET " + std::to_string(y) + "," + REGISTER_NAMES[reg];
                break;
        }

        if (reg != 6) {
            entry.cycles = 8;
        } else {
            entry.cycles = (entry.operation == CBOperation::BIT) ? 12 : 16;
        }
    }

    return table;
}

const CBInstruction& GetCBInstruction(uint8_t opcode) {
    static const std::array<CBInstruction, 256> table = BuildCBTable();
    return table[opcode];
}

// Rotate/shift result with Z from the result, N=H=0
static uint8_t ApplyShift(CPU& cpu, CBOperation operation, uint8_t value) {
    uint8_t result = 0;
    bool carry = false;

    switch (operation) {
        case CBOperation::RLC:
            carry = (value & 0x80) != 0;
            result = static_cast<uint8_t>((value << 1) | (value >> 7));
            break;
        case CBOperation::RRC:
            carry = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (value << 7));
            break;
        case CBOperation::RL:
            carry = (value & 0x80) != 0;
            result = static_cast<uint8_t>((value << 1) | (cpu.GetFlagC() ? 1 : 0));
            break;
        case CBOperation::RR:
            carry = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (cpu.GetFlagC() ? 0x80 : 0));
            break;
        case CBOperation::SLA:
            carry = (value & 0x80) != 0;
            result = static_cast<uint8_t>(value << 1);
            break;
        case CBOperation::SRA:
            // Arithmetic shift keeps bit 7
            carry = (value & 0x01) != 0;
            result = static_cast<uint8_t>((value >> 1) | (value & 0x80));
            break;
        case CBOperation::SWAP:
            result = static_cast<uint8_t>((value << 4) | (value >> 4));
            break;
        case CBOperation::SRL:
            carry = (value & 0x01) != 0;
            result = static_cast<uint8_t>(value >> 1);
            break;
        default:
            break;
    }

    cpu.SetFlagZ(result == 0);
    cpu.SetFlagN(false);
    cpu.SetFlagH(false);
    cpu.SetFlagC(carry);
    return result;
}

void ExecuteCBOpcode(CPU& cpu, uint8_t opcode) {
    const CBInstruction& instruction = GetCBInstruction(opcode);
    uint8_t value = ReadOperand8(cpu, instruction.reg);

    switch (instruction.operation) {
        case CBOperation::BIT:
            // C not affected
            cpu.SetFlagZ((value & (1 << instruction.bit)) == 0);
            cpu.SetFlagN(false);
            cpu.SetFlagH(true);
            break;
        case CBOperation::RES:
            WriteOperand8(cpu, instruction.reg, static_cast<uint8_t>(value & ~(1 << instruction.bit)));
            break;
        case CBOperation::SET:
            WriteOperand8(cpu, instruction.reg, static_cast<uint8_t>(value | (1 << instruction.bit)));
            break;
        default:
            WriteOperand8(cpu, instruction.reg, ApplyShift(cpu, instruction.operation, value));
            break;
    }
}
