#pragma once

#include <cstdint>

/**
 * InterruptController - Interrupt Flag and Enable Registers
 *
 * Hardware Behavior:
 * - IF register ($FF0F) - pending requests, one bit per source
 * - IE register ($FFFF) - which sources may be serviced
 * - Peripherals only ever set request bits; the CPU clears exactly one
 *   bit when it services that source
 *
 * Interrupt bits (priority order, highest first):
 * - Bit 0: VBlank  -> $0040
 * - Bit 1: LCD STAT -> $0048
 * - Bit 2: Timer   -> $0050
 * - Bit 3: Serial  -> $0058
 * - Bit 4: Joypad  -> $0060
 */
class InterruptController {
public:
    InterruptController();

    void Reset();

    // === Interrupt Bit Definitions ===
    static constexpr uint8_t VBLANK  = 0x01;
    static constexpr uint8_t STAT    = 0x02;
    static constexpr uint8_t TIMER   = 0x04;
    static constexpr uint8_t SERIAL  = 0x08;
    static constexpr uint8_t JOYPAD  = 0x10;

    // === IF Register ($FF0F) ===
    uint8_t ReadIF() const { return interrupt_flag | 0xE0; }  // Upper bits always 1
    void WriteIF(uint8_t value) { interrupt_flag = value & 0x1F; }

    // === IE Register ($FFFF) ===
    // All 8 bits of IE are R/W
    uint8_t ReadIE() const { return interrupt_enable; }
    void WriteIE(uint8_t value) { interrupt_enable = value; }

    // === Request (peripheral side) ===
    void RequestInterrupt(uint8_t bit) { interrupt_flag |= (bit & 0x1F); }

    // === Acknowledge (CPU side) ===
    // Clears the request bit for the given source index (0-4) and returns
    // the vector address the CPU must jump to.
    uint16_t Acknowledge(uint8_t index);

    // Requested AND enabled
    uint8_t GetPendingInterrupts() const {
        return interrupt_flag & interrupt_enable & 0x1F;
    }
    bool HasPendingInterrupt() const { return GetPendingInterrupts() != 0; }
    bool IsRequested(uint8_t bit) const { return (interrupt_flag & bit) != 0; }

    // Returns the highest priority pending interrupt (0-4), or -1 if none
    int8_t GetHighestPriorityInterrupt() const;

    // Vector address for a source index (0-4)
    static uint16_t GetInterruptVector(uint8_t index) {
        return static_cast<uint16_t>(0x0040 + index * 8);
    }

private:
    uint8_t interrupt_flag;     // IF ($FF0F)
    uint8_t interrupt_enable;   // IE ($FFFF)
};
