/**
 * CPU core tests: instruction timing against the opcode table, register
 * effects of a few representative instructions, and fatal opcodes.
 *
 * The CPU runs against a flat 64KB memory with no peripherals attached.
 */

#include "cpu/CPU.hpp"
#include "cpu/Instructions.hpp"

#include <gtest/gtest.h>
#include <array>
#include <initializer_list>

class CPUTest : public ::testing::Test {
protected:
    CPU cpu;
    std::array<uint8_t, 0x10000> memory{};
    uint32_t ticked = 0;

    void SetUp() override {
        memory.fill(0);
        ticked = 0;
        cpu.ConnectBus(
            [this](uint16_t addr) { return memory[addr]; },
            [this](uint16_t addr, uint8_t value) { memory[addr] = value; },
            [this](uint8_t cycles) { ticked += cycles; }
        );
        cpu.Reset();
    }

    void Load(uint16_t addr, std::initializer_list<uint8_t> bytes) {
        for (uint8_t b : bytes) {
            memory[addr++] = b;
        }
    }
};

// ============================================================================
// Post-boot State
// ============================================================================

TEST_F(CPUTest, Reset_SetsPostBootRegisters) {
    EXPECT_EQ(cpu.GetAF(), 0x01B0);
    EXPECT_EQ(cpu.GetBC(), 0x0013);
    EXPECT_EQ(cpu.GetDE(), 0x00D8);
    EXPECT_EQ(cpu.GetHL(), 0x014D);
    EXPECT_EQ(cpu.GetSP(), 0xFFFE);
    EXPECT_EQ(cpu.GetPC(), 0x0100);
    EXPECT_FALSE(cpu.GetIME());
}

// ============================================================================
// Timing
// ============================================================================

TEST_F(CPUTest, EveryBaseOpcode_ReturnsTableCost) {
    for (int opcode = 0; opcode < 256; opcode++) {
        if (opcode == 0xCB || IsIllegalOpcode(static_cast<uint8_t>(opcode))) {
            continue;
        }

        SetUp();
        memory[0x0100] = static_cast<uint8_t>(opcode);
        // F = 0: NZ and NC hold, Z and C do not
        cpu.SetF(0x00);

        const Instruction& instruction = GetInstruction(static_cast<uint8_t>(opcode));
        uint8_t expected = instruction.cycles;
        if (instruction.cycles_taken != 0 && ((opcode >> 3) & 1) == 0) {
            expected = instruction.cycles_taken;
        }

        uint8_t cycles = cpu.Step();
        EXPECT_EQ(cycles, expected) << "opcode $" << std::hex << opcode
                                    << " (" << instruction.mnemonic << ")";
        EXPECT_EQ(ticked, cycles) << "opcode $" << std::hex << opcode;
    }
}

TEST_F(CPUTest, EveryCBOpcode_ReturnsTableCost) {
    for (int opcode = 0; opcode < 256; opcode++) {
        SetUp();
        memory[0x0100] = 0xCB;
        memory[0x0101] = static_cast<uint8_t>(opcode);

        uint8_t cycles = cpu.Step();
        EXPECT_EQ(cycles, GetCBInstruction(static_cast<uint8_t>(opcode)).cycles)
            << "CB opcode $" << std::hex << opcode;
        EXPECT_EQ(cpu.GetPC(), 0x0102);
    }
}

TEST_F(CPUTest, ConditionalBranches_CostExtraWhenTaken) {
    struct Case {
        uint8_t opcode;
        uint8_t not_taken;
        uint8_t taken;
    };
    const Case cases[] = {
        { 0x20, 8, 12 },    // JR NZ
        { 0xC2, 12, 16 },   // JP NZ
        { 0xC4, 12, 24 },   // CALL NZ
        { 0xC0, 8, 20 },    // RET NZ
    };

    for (const Case& c : cases) {
        SetUp();
        memory[0x0100] = c.opcode;
        cpu.SetF(0x80);  // Z set: NZ fails
        EXPECT_EQ(cpu.Step(), c.not_taken) << std::hex << int(c.opcode);

        SetUp();
        memory[0x0100] = c.opcode;
        cpu.SetF(0x00);
        EXPECT_EQ(cpu.Step(), c.taken) << std::hex << int(c.opcode);
    }
}

// ============================================================================
// Instruction Effects
// ============================================================================

TEST_F(CPUTest, JR_Backwards_LandsOnTarget) {
    Load(0x0100, { 0x18, 0xFE });  // JR -2
    cpu.Step();
    EXPECT_EQ(cpu.GetPC(), 0x0100);
}

TEST_F(CPUTest, CALL_RET_RoundTrip) {
    Load(0x0100, { 0xCD, 0x00, 0x20 });  // CALL $2000
    Load(0x2000, { 0xC9 });              // RET

    EXPECT_EQ(cpu.Step(), 24);
    EXPECT_EQ(cpu.GetPC(), 0x2000);
    EXPECT_EQ(cpu.GetSP(), 0xFFFC);
    EXPECT_EQ(memory[0xFFFD], 0x01);
    EXPECT_EQ(memory[0xFFFC], 0x03);

    EXPECT_EQ(cpu.Step(), 16);
    EXPECT_EQ(cpu.GetPC(), 0x0103);
    EXPECT_EQ(cpu.GetSP(), 0xFFFE);
}

TEST_F(CPUTest, ADD_SetsHalfCarryAndCarry) {
    cpu.SetA(0x8F);
    Load(0x0100, { 0xC6, 0x81 });  // ADD A,$81
    cpu.Step();
    EXPECT_EQ(cpu.GetA(), 0x10);
    EXPECT_FALSE(cpu.GetFlagZ());
    EXPECT_FALSE(cpu.GetFlagN());
    EXPECT_TRUE(cpu.GetFlagH());
    EXPECT_TRUE(cpu.GetFlagC());
}

TEST_F(CPUTest, SUB_ToZero_SetsZeroAndSubtract) {
    cpu.SetA(0x3E);
    Load(0x0100, { 0xD6, 0x3E });  // SUB $3E
    cpu.Step();
    EXPECT_EQ(cpu.GetA(), 0x00);
    EXPECT_TRUE(cpu.GetFlagZ());
    EXPECT_TRUE(cpu.GetFlagN());
    EXPECT_FALSE(cpu.GetFlagH());
    EXPECT_FALSE(cpu.GetFlagC());
}

TEST_F(CPUTest, DAA_AdjustsBCDAddition) {
    cpu.SetA(0x45);
    cpu.SetF(0x00);
    Load(0x0100, { 0xC6, 0x38, 0x27 });  // ADD A,$38; DAA
    cpu.Step();
    cpu.Step();
    EXPECT_EQ(cpu.GetA(), 0x83);
    EXPECT_FALSE(cpu.GetFlagC());
}

TEST_F(CPUTest, POP_AF_MasksLowNibble) {
    memory[0xFFFC] = 0xFF;
    memory[0xFFFD] = 0x12;
    cpu.SetSP(0xFFFC);
    Load(0x0100, { 0xF1 });  // POP AF
    cpu.Step();
    EXPECT_EQ(cpu.GetAF(), 0x12F0);
}

TEST_F(CPUTest, CB_SWAP_And_BIT) {
    cpu.SetB(0xA5);
    Load(0x0100, { 0xCB, 0x30,     // SWAP B
                   0xCB, 0x78 });  // BIT 7,B
    cpu.Step();
    EXPECT_EQ(cpu.GetB(), 0x5A);
    EXPECT_FALSE(cpu.GetFlagZ());
    cpu.Step();
    EXPECT_TRUE(cpu.GetFlagZ());  // Bit 7 of $5A is clear
    EXPECT_TRUE(cpu.GetFlagH());
}

TEST_F(CPUTest, CB_RES_HL_WritesMemory) {
    cpu.SetHL(0xC000);
    memory[0xC000] = 0xFF;
    Load(0x0100, { 0xCB, 0x86 });  // RES 0,(HL)
    EXPECT_EQ(cpu.Step(), 16);
    EXPECT_EQ(memory[0xC000], 0xFE);
}

TEST_F(CPUTest, STOP_SkipsPaddingByte) {
    Load(0x0100, { 0x10, 0x00 });
    EXPECT_EQ(cpu.Step(), 4);
    EXPECT_TRUE(cpu.IsStopped());
    EXPECT_EQ(cpu.GetPC(), 0x0102);
}

// ============================================================================
// Fatal Opcodes
// ============================================================================

TEST_F(CPUTest, IllegalOpcode_ThrowsWithAddressAndOpcode) {
    const uint8_t illegal[] = { 0xD3, 0xDB, 0xDD, 0xE3, 0xE4, 0xEB, 0xEC, 0xED, 0xF4, 0xFC, 0xFD };

    for (uint8_t opcode : illegal) {
        SetUp();
        memory[0x0100] = opcode;
        try {
            cpu.Step();
            FAIL() << "no exception for $" << std::hex << int(opcode);
        } catch (const IllegalOpcodeError& e) {
            EXPECT_EQ(e.GetAddress(), 0x0100);
            EXPECT_EQ(e.GetOpcode(), opcode);
        }
    }
}

TEST_F(CPUTest, IllegalOpcode_TableHasElevenHoles) {
    int count = 0;
    for (int opcode = 0; opcode < 256; opcode++) {
        if (IsIllegalOpcode(static_cast<uint8_t>(opcode))) count++;
    }
    EXPECT_EQ(count, 11);
}

// ============================================================================
// Disassembly
// ============================================================================

TEST_F(CPUTest, Disassemble_SubstitutesOperands) {
    Load(0x0100, { 0xC3, 0x50, 0x01 });
    EXPECT_EQ(Disassemble(cpu, 0x0100), "JP $0150");

    Load(0x0200, { 0x3E, 0x42 });
    EXPECT_EQ(Disassemble(cpu, 0x0200), "LD A,$42");

    Load(0x0300, { 0x18, 0xFE });
    EXPECT_EQ(Disassemble(cpu, 0x0300), "JR $0300");

    Load(0x0400, { 0xCB, 0x7C });
    EXPECT_EQ(Disassemble(cpu, 0x0400), "BIT 7,H");
}
