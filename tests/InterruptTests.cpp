/**
 * Interrupt dispatch tests: priority, acknowledge, EI/DI timing and
 * HALT wake-up behavior, with the CPU wired to a real InterruptController.
 */

#include "cpu/CPU.hpp"
#include "cpu/InterruptController.hpp"

#include <gtest/gtest.h>
#include <array>
#include <initializer_list>

class InterruptTest : public ::testing::Test {
protected:
    CPU cpu;
    InterruptController interrupts;
    std::array<uint8_t, 0x10000> memory{};

    void SetUp() override {
        memory.fill(0);
        cpu.ConnectBus(
            [this](uint16_t addr) { return memory[addr]; },
            [this](uint16_t addr, uint8_t value) { memory[addr] = value; }
        );
        cpu.ConnectInterrupts(&interrupts);
        cpu.Reset();
        interrupts.Reset();
        interrupts.WriteIF(0x00);
    }

    void Load(uint16_t addr, std::initializer_list<uint8_t> bytes) {
        for (uint8_t b : bytes) {
            memory[addr++] = b;
        }
    }
};

// ============================================================================
// Controller Registers
// ============================================================================

TEST_F(InterruptTest, Reset_RequestsVBlankOnly) {
    interrupts.Reset();
    EXPECT_EQ(interrupts.ReadIF(), 0xE1);
    EXPECT_EQ(interrupts.ReadIE(), 0x00);
}

TEST_F(InterruptTest, IF_UpperBitsReadAsOne) {
    interrupts.WriteIF(0xFF);
    EXPECT_EQ(interrupts.ReadIF(), 0xFF);
    interrupts.WriteIF(0x00);
    EXPECT_EQ(interrupts.ReadIF(), 0xE0);
}

TEST_F(InterruptTest, IE_AllBitsReadWrite) {
    interrupts.WriteIE(0xA5);
    EXPECT_EQ(interrupts.ReadIE(), 0xA5);
}

TEST_F(InterruptTest, HighestPriority_IsLowestBit) {
    interrupts.WriteIE(0x1F);
    interrupts.RequestInterrupt(InterruptController::JOYPAD);
    interrupts.RequestInterrupt(InterruptController::TIMER);
    EXPECT_EQ(interrupts.GetHighestPriorityInterrupt(), 2);

    interrupts.WriteIE(InterruptController::JOYPAD);
    EXPECT_EQ(interrupts.GetHighestPriorityInterrupt(), 4);

    interrupts.WriteIE(0x00);
    EXPECT_EQ(interrupts.GetHighestPriorityInterrupt(), -1);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(InterruptTest, Dispatch_JumpsToVectorAndClearsOneBit) {
    cpu.SetIME(true);
    interrupts.WriteIE(0x1F);
    interrupts.RequestInterrupt(InterruptController::STAT);
    interrupts.RequestInterrupt(InterruptController::SERIAL);

    EXPECT_EQ(cpu.Step(), 20);
    EXPECT_EQ(cpu.GetPC(), 0x0048);
    EXPECT_FALSE(cpu.GetIME());
    EXPECT_EQ(interrupts.ReadIF() & 0x1F, InterruptController::SERIAL);

    // Return address pushed
    EXPECT_EQ(cpu.GetSP(), 0xFFFC);
    EXPECT_EQ(memory[0xFFFD], 0x01);
    EXPECT_EQ(memory[0xFFFC], 0x00);
}

TEST_F(InterruptTest, Dispatch_EachSourceHasItsVector) {
    const uint16_t vectors[] = { 0x0040, 0x0048, 0x0050, 0x0058, 0x0060 };

    for (uint8_t index = 0; index < 5; index++) {
        SetUp();
        cpu.SetIME(true);
        interrupts.WriteIE(0x1F);
        interrupts.RequestInterrupt(static_cast<uint8_t>(1 << index));
        cpu.Step();
        EXPECT_EQ(cpu.GetPC(), vectors[index]);
        EXPECT_EQ(interrupts.ReadIF() & 0x1F, 0);
    }
}

TEST_F(InterruptTest, Dispatch_RequiresIME) {
    interrupts.WriteIE(0x1F);
    interrupts.RequestInterrupt(InterruptController::VBLANK);
    cpu.Step();  // NOP
    EXPECT_EQ(cpu.GetPC(), 0x0101);
    EXPECT_EQ(interrupts.ReadIF() & 0x1F, InterruptController::VBLANK);
}

TEST_F(InterruptTest, Dispatch_RequiresIE) {
    cpu.SetIME(true);
    interrupts.RequestInterrupt(InterruptController::TIMER);
    cpu.Step();
    EXPECT_EQ(cpu.GetPC(), 0x0101);
}

TEST_F(InterruptTest, RETI_ReturnsAndEnablesIME) {
    cpu.SetIME(true);
    interrupts.WriteIE(InterruptController::VBLANK);
    interrupts.RequestInterrupt(InterruptController::VBLANK);
    Load(0x0040, { 0xD9 });  // RETI

    cpu.Step();
    EXPECT_EQ(cpu.GetPC(), 0x0040);
    EXPECT_EQ(cpu.Step(), 16);
    EXPECT_EQ(cpu.GetPC(), 0x0100);
    EXPECT_TRUE(cpu.GetIME());
}

// ============================================================================
// EI / DI
// ============================================================================

TEST_F(InterruptTest, EI_TakesEffectAfterNextInstruction) {
    interrupts.WriteIE(InterruptController::TIMER);
    interrupts.RequestInterrupt(InterruptController::TIMER);
    Load(0x0100, { 0xFB, 0x00, 0x00 });  // EI; NOP; NOP

    cpu.Step();  // EI
    EXPECT_FALSE(cpu.GetIME());
    EXPECT_TRUE(cpu.IsIMEScheduled());
    EXPECT_EQ(cpu.GetPC(), 0x0101);

    cpu.Step();  // NOP runs before the interrupt
    EXPECT_TRUE(cpu.GetIME());
    EXPECT_EQ(cpu.GetPC(), 0x0102);

    EXPECT_EQ(cpu.Step(), 20);
    EXPECT_EQ(cpu.GetPC(), 0x0050);
}

TEST_F(InterruptTest, DI_CancelsPendingEI) {
    interrupts.WriteIE(InterruptController::TIMER);
    interrupts.RequestInterrupt(InterruptController::TIMER);
    Load(0x0100, { 0xFB, 0xF3, 0x00, 0x00 });  // EI; DI; NOP; NOP

    cpu.Step();  // EI
    cpu.Step();  // DI
    EXPECT_FALSE(cpu.IsIMEScheduled());
    cpu.Step();
    cpu.Step();
    EXPECT_FALSE(cpu.GetIME());
    EXPECT_EQ(cpu.GetPC(), 0x0104);
}

// ============================================================================
// HALT
// ============================================================================

TEST_F(InterruptTest, HALT_IdlesUntilRequest) {
    interrupts.WriteIE(InterruptController::TIMER);
    Load(0x0100, { 0x76, 0x3C });  // HALT; INC A

    cpu.Step();
    EXPECT_TRUE(cpu.IsHalted());
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(cpu.Step(), 4);
        EXPECT_TRUE(cpu.IsHalted());
    }

    interrupts.RequestInterrupt(InterruptController::TIMER);
    cpu.Step();
    EXPECT_FALSE(cpu.IsHalted());
}

TEST_F(InterruptTest, HALT_WithIMEClear_ResumesWithoutDispatch) {
    interrupts.WriteIE(InterruptController::TIMER);
    cpu.SetA(0x01);
    Load(0x0100, { 0x76, 0x3C });  // HALT; INC A

    cpu.Step();
    interrupts.RequestInterrupt(InterruptController::TIMER);
    cpu.Step();  // Wake
    cpu.Step();  // INC A
    EXPECT_EQ(cpu.GetA(), 0x02);
    EXPECT_EQ(cpu.GetPC(), 0x0102);
    EXPECT_EQ(interrupts.ReadIF() & 0x1F, InterruptController::TIMER);
}

TEST_F(InterruptTest, HALT_WithIMESet_DispatchesOnWake) {
    cpu.SetIME(true);
    interrupts.WriteIE(InterruptController::VBLANK);
    Load(0x0100, { 0x76 });

    cpu.Step();
    EXPECT_TRUE(cpu.IsHalted());
    interrupts.RequestInterrupt(InterruptController::VBLANK);
    EXPECT_EQ(cpu.Step(), 20);
    EXPECT_FALSE(cpu.IsHalted());
    EXPECT_EQ(cpu.GetPC(), 0x0040);
    // Return address is the instruction after HALT
    EXPECT_EQ(memory[0xFFFC], 0x01);
    EXPECT_EQ(memory[0xFFFD], 0x01);
}

TEST_F(InterruptTest, HALTBug_ExecutesNextByteTwice) {
    interrupts.WriteIE(InterruptController::TIMER);
    interrupts.RequestInterrupt(InterruptController::TIMER);
    cpu.SetA(0x01);
    Load(0x0100, { 0x76, 0x3C, 0x00 });  // HALT; INC A; NOP

    cpu.Step();
    EXPECT_FALSE(cpu.IsHalted());
    cpu.Step();
    cpu.Step();
    EXPECT_EQ(cpu.GetA(), 0x03);
    EXPECT_EQ(cpu.GetPC(), 0x0102);
}

// ============================================================================
// STOP
// ============================================================================

TEST_F(InterruptTest, STOP_WakesOnJoypadRequest) {
    Load(0x0100, { 0x10, 0x00, 0x00 });

    cpu.Step();
    EXPECT_TRUE(cpu.IsStopped());

    interrupts.RequestInterrupt(InterruptController::TIMER);
    cpu.Step();
    EXPECT_TRUE(cpu.IsStopped());

    interrupts.RequestInterrupt(InterruptController::JOYPAD);
    cpu.Step();
    EXPECT_FALSE(cpu.IsStopped());
    cpu.Step();
    EXPECT_EQ(cpu.GetPC(), 0x0103);
}
