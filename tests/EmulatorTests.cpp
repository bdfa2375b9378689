/**
 * End-to-end tests: synthetic cartridges run on the fully wired machine.
 *
 * Every program starts at $0150 (the header entry point jumps there) and
 * ends in a tight JR loop so the machine can be run for any number of
 * cycles afterwards.
 */

#include "Emulator.hpp"
#include "cpu/CPU.hpp"
#include "TestROM.hpp"

#include <gtest/gtest.h>

class EmulatorTest : public ::testing::Test {
protected:
    Emulator emu;

    void Load(const TestROM& rom) {
        ASSERT_TRUE(emu.LoadROMData(rom.Build())) << emu.GetLoadError();
    }

    uint8_t Pixel(int x, int y) const {
        return emu.GetFramebuffer()[y * PPU::SCREEN_WIDTH + x];
    }
};

// ============================================================================
// Power-on State
// ============================================================================

TEST_F(EmulatorTest, Reset_PostBootState) {
    Load(TestROM());
    EXPECT_EQ(emu.GetPC(), 0x0100);
    EXPECT_EQ(emu.GetSP(), 0xFFFE);
    EXPECT_EQ(emu.GetAF(), 0x01B0);
    EXPECT_EQ(emu.GetTotalCycles(), 0u);
    EXPECT_EQ(emu.DebugRead(0xFF40), 0x91);
    EXPECT_EQ(emu.DebugRead(0xFF0F), 0xE1);
    EXPECT_EQ(emu.DebugRead(0xFFFF), 0x00);
    EXPECT_EQ(emu.DebugRead(0xFF04), 0xAB);
}

TEST_F(EmulatorTest, LoadROMData_RejectsBadImage) {
    std::vector<uint8_t> data = TestROM().Build();
    data[0x14D] ^= 0x01;
    EXPECT_FALSE(emu.LoadROMData(data));
    EXPECT_FALSE(emu.GetLoadError().empty());
}

TEST_F(EmulatorTest, UnmappedIO_ReadsFF) {
    Load(TestROM());
    EXPECT_EQ(emu.DebugRead(0xFF10), 0xFF);  // Sound registers are not connected
    EXPECT_EQ(emu.DebugRead(0xFF4C), 0xFF);
    EXPECT_EQ(emu.DebugRead(0xFF7F), 0xFF);
}

// ============================================================================
// CPU + WRAM
// ============================================================================

TEST_F(EmulatorTest, CounterLoop_IncrementsWRAMDeterministically) {
    TestROM rom;
    rom.Program({
        0x21, 0x00, 0xC0,   // LD HL,$C000
        0x34,               // loop: INC (HL)
        0x18, 0xFD,         // JR loop
    });
    Load(rom);

    // Entry NOP + JP (20) + LD HL (12), then 24 cycles per iteration
    emu.StepCycles(32 + 24 * 1000);
    EXPECT_EQ(emu.GetTotalCycles(), 32u + 24u * 1000u);
    EXPECT_EQ(emu.DebugRead(0xC000), 1000 % 256);
    EXPECT_EQ(emu.GetPC(), 0x0153);

    // The echo region sees the same counter
    EXPECT_EQ(emu.DebugRead(0xE000), 1000 % 256);
}

TEST_F(EmulatorTest, StepCycles_EndsOnInstructionBoundary) {
    TestROM rom;
    rom.Program({
        0x21, 0x00, 0xC0,   // LD HL,$C000
        0x34,               // loop: INC (HL)
        0x18, 0xFD,         // JR loop
    });
    Load(rom);

    emu.StepCycles(33);  // Lands inside INC (HL)
    EXPECT_EQ(emu.GetTotalCycles(), 44u);
    EXPECT_EQ(emu.DebugRead(0xC000), 1);
}

// ============================================================================
// PPU
// ============================================================================

TEST_F(EmulatorTest, BackgroundAndWindow_RenderExpectedScanline) {
    TestROM rom;
    rom.Program({
        0xAF,               // XOR A
        0xE0, 0x40,         // LDH (LCDC),A    LCD off while VRAM is set up

        // Tile 1: every row lo=$0F hi=$33 -> colors 0,0,2,2,1,1,3,3
        0x21, 0x10, 0x80,   // LD HL,$8010
        0x06, 0x08,         // LD B,8
        0x3E, 0x0F,         // t1: LD A,$0F
        0x22,               // LD (HL+),A
        0x3E, 0x33,         // LD A,$33
        0x22,               // LD (HL+),A
        0x05,               // DEC B
        0x20, 0xF7,         // JR NZ,t1

        // Tile 2 (HL = $8020): solid color 1
        0x06, 0x08,         // LD B,8
        0x3E, 0xFF,         // t2: LD A,$FF
        0x22,               // LD (HL+),A
        0xAF,               // XOR A
        0x22,               // LD (HL+),A
        0x05,               // DEC B
        0x20, 0xF8,         // JR NZ,t2

        // BG map row 0 -> tile 1
        0x21, 0x00, 0x98,   // LD HL,$9800
        0x06, 0x20,         // LD B,32
        0x3E, 0x01,         // LD A,1
        0x22,               // m1: LD (HL+),A
        0x05,               // DEC B
        0x20, 0xFC,         // JR NZ,m1

        // Window map row 0 -> tile 2
        0x21, 0x00, 0x9C,   // LD HL,$9C00
        0x06, 0x20,         // LD B,32
        0x3E, 0x02,         // LD A,2
        0x22,               // m2: LD (HL+),A
        0x05,               // DEC B
        0x20, 0xFC,         // JR NZ,m2

        0x3E, 0xE4,         // LD A,$E4
        0xE0, 0x47,         // LDH (BGP),A
        0xAF,               // XOR A
        0xE0, 0x4A,         // LDH (WY),A
        0x3E, 0x57,         // LD A,87
        0xE0, 0x4B,         // LDH (WX),A      window starts at screen x 80

        // LCD on, window map $9C00, window on, $8000 tile data, BG on
        0x3E, 0xF1,         // LD A,$F1
        0xE0, 0x40,         // LDH (LCDC),A
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    for (int i = 0; i < 3; i++) {
        emu.RunFrame();
    }
    ASSERT_TRUE(emu.IsFrameComplete());

    const uint8_t pattern[8] = { 0, 0, 2, 2, 1, 1, 3, 3 };
    for (int x = 0; x < PPU::SCREEN_WIDTH; x++) {
        uint8_t expected = x < 80 ? pattern[x % 8] : 1;
        EXPECT_EQ(Pixel(x, 0), expected) << "x=" << x;
    }

    // Tile rows repeat down the first tile row
    EXPECT_EQ(Pixel(2, 7), 2);
    EXPECT_EQ(Pixel(100, 7), 1);
}

TEST_F(EmulatorTest, RunFrame_CompletesOneFrame) {
    TestROM rom;
    rom.Program({ 0x18, 0xFE });
    Load(rom);

    emu.RunFrame();
    EXPECT_TRUE(emu.IsFrameComplete());
    EXPECT_EQ(emu.GetLY(), 144);
    EXPECT_EQ(emu.GetPPUMode(), 1);

    uint64_t first = emu.GetTotalCycles();
    emu.RunFrame();
    uint64_t second = emu.GetTotalCycles() - first;
    EXPECT_GE(second, 70224u - 12u);
    EXPECT_LE(second, 70224u + 12u);
}

TEST_F(EmulatorTest, RunFrame_BoundedWhileLCDOff) {
    TestROM rom;
    rom.Program({
        0xAF,               // XOR A
        0xE0, 0x40,         // LDH (LCDC),A
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    emu.RunFrame();
    EXPECT_FALSE(emu.IsFrameComplete());
    EXPECT_LT(emu.GetTotalCycles(), 70224u + 16u);
    EXPECT_EQ(emu.GetLY(), 0);
}

// ============================================================================
// Cartridge
// ============================================================================

TEST_F(EmulatorTest, MBC1_Bank5ReadThroughCPU) {
    TestROM rom(0x01, 0x03);  // MBC1, 256KB
    rom.Bytes(5 * 0x4000, { 0xAB, 0xCD });
    rom.Bytes(1 * 0x4000, { 0x11, 0x22 });
    rom.Program({
        0x3E, 0x05,         // LD A,5
        0xEA, 0x00, 0x20,   // LD ($2000),A
        0xFA, 0x00, 0x40,   // LD A,($4000)
        0xEA, 0x00, 0xC0,   // LD ($C000),A
        0xFA, 0x01, 0x40,   // LD A,($4001)
        0xEA, 0x01, 0xC0,   // LD ($C001),A
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    EXPECT_EQ(emu.DebugRead(0x4000), 0x11);

    emu.StepCycles(200);
    EXPECT_EQ(emu.DebugRead(0xC000), 0xAB);
    EXPECT_EQ(emu.DebugRead(0xC001), 0xCD);
    EXPECT_EQ(emu.DebugRead(0x4000), 0xAB);
}

// ============================================================================
// Interrupts
// ============================================================================

TEST_F(EmulatorTest, TimerInterrupt_RunsHandler) {
    TestROM rom;
    rom.Bytes(0x0050, {
        0x21, 0x00, 0xC0,   // LD HL,$C000
        0x34,               // INC (HL)
        0xD9,               // RETI
    });
    rom.Program({
        0x3E, 0x04,         // LD A,$04
        0xE0, 0xFF,         // LDH (IE),A
        0xAF,               // XOR A
        0xE0, 0x0F,         // LDH (IF),A
        0xE0, 0x06,         // LDH (TMA),A
        0xE0, 0x05,         // LDH (TIMA),A
        0x3E, 0x05,         // LD A,$05        262144 Hz
        0xE0, 0x07,         // LDH (TAC),A
        0xFB,               // EI
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    // One overflow every 256 * 16 cycles
    emu.StepCycles(10 * 4096);
    uint8_t count = emu.DebugRead(0xC000);
    EXPECT_GE(count, 9);
    EXPECT_LE(count, 10);
}

TEST_F(EmulatorTest, HaltWakesOnVBlank) {
    TestROM rom;
    rom.Program({
        0x3E, 0x01,         // LD A,$01
        0xE0, 0xFF,         // LDH (IE),A
        0xAF,               // XOR A
        0xE0, 0x0F,         // LDH (IF),A
        0x76,               // HALT
        0x3E, 0x42,         // LD A,$42
        0xEA, 0x00, 0xC0,   // LD ($C000),A
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    emu.StepCycles(1000);
    EXPECT_EQ(emu.DebugRead(0xC000), 0x00);

    emu.StepCycles(144 * 456);
    EXPECT_EQ(emu.DebugRead(0xC000), 0x42);
    EXPECT_EQ(emu.DebugRead(0xFF0F) & 0x01, 0x01);  // IME off: request stays pending
}

TEST_F(EmulatorTest, Joypad_PressRaisesInterrupt) {
    Load(TestROM());
    emu.DebugWrite(0xFF0F, 0x00);
    emu.DebugWrite(0xFF00, 0x10);

    emu.SetButton(Joypad::Button::START, true);
    EXPECT_EQ(emu.DebugRead(0xFF00), 0xD7);
    EXPECT_EQ(emu.DebugRead(0xFF0F) & 0x10, 0x10);
}

// ============================================================================
// Serial and DMA
// ============================================================================

TEST_F(EmulatorTest, Serial_ProgramOutputIsLogged) {
    TestROM rom;
    rom.Program({
        0x3E, 'O',          // LD A,'O'
        0xE0, 0x01,         // LDH (SB),A
        0x3E, 0x81,         // LD A,$81
        0xE0, 0x02,         // LDH (SC),A
        0xF0, 0x02,         // w1: LDH A,(SC)
        0xCB, 0x7F,         // BIT 7,A
        0x20, 0xFA,         // JR NZ,w1
        0x3E, 'K',          // LD A,'K'
        0xE0, 0x01,         // LDH (SB),A
        0x3E, 0x81,         // LD A,$81
        0xE0, 0x02,         // LDH (SC),A
        0xF0, 0x02,         // w2: LDH A,(SC)
        0xCB, 0x7F,         // BIT 7,A
        0x20, 0xFA,         // JR NZ,w2
        0x18, 0xFE,         // JR $
    });
    Load(rom);

    emu.StepCycles(20000);
    EXPECT_EQ(emu.GetSerialOutput(), "OK");
    EXPECT_EQ(emu.DebugRead(0xFF0F) & 0x08, 0x08);
}

TEST_F(EmulatorTest, OAMDMA_CopiesWRAMPage) {
    TestROM rom;
    rom.Program({
        0x3E, 0xC1,         // LD A,$C1
        0xE0, 0x46,         // LDH (DMA),A
        0x18, 0xFE,         // JR $
    });
    Load(rom);
    for (uint16_t i = 0; i < 160; i++) {
        emu.DebugWrite(static_cast<uint16_t>(0xC100 + i), static_cast<uint8_t>(i ^ 0x5A));
    }

    emu.StepCycles(1000);
    EXPECT_EQ(emu.DebugRead(0xFF46), 0xC1);
    for (uint16_t i = 0; i < 160; i++) {
        EXPECT_EQ(emu.DebugRead(static_cast<uint16_t>(0xFE00 + i)), i ^ 0x5A) << "byte " << i;
    }
}

// ============================================================================
// Fatal Opcodes
// ============================================================================

TEST_F(EmulatorTest, IllegalOpcode_StopsExecution) {
    TestROM rom;
    rom.Program({ 0x00, 0xDD });
    Load(rom);

    try {
        emu.StepCycles(100);
        FAIL() << "expected IllegalOpcodeError";
    } catch (const IllegalOpcodeError& e) {
        EXPECT_EQ(e.GetAddress(), 0x0151);
        EXPECT_EQ(e.GetOpcode(), 0xDD);
    }
}
