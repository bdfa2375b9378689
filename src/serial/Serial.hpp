#pragma once

#include <cstdint>
#include <string>

/**
 * Serial - Serial Transfer Hardware
 *
 * Hardware Behavior:
 * - SB ($FF01) holds the byte being shifted, MSB first
 * - SC ($FF02) bit 7 starts a transfer, bit 0 selects the internal clock
 * - Internal clock runs at 8192 Hz: 512 T-cycles per bit
 * - No link partner is attached, so the incoming line is always high
 *   and every transfer shifts in 1s (SB ends up as $FF)
 * - Raises the serial interrupt when the eighth bit has been shifted
 *
 * Test ROMs print their results by writing a character to SB and
 * starting a transfer; each started byte is appended to the output log.
 */
class Serial {
public:
    Serial();

    void Reset();

    // Advance serial by specified T-cycles
    void Step(uint8_t cycles);

    // === Register Interface ===
    uint8_t ReadRegister(uint16_t addr) const;
    void WriteRegister(uint16_t addr, uint8_t value);

    // === Interrupt Signal ===
    bool IsInterruptRequested() const { return interrupt_requested; }
    void ClearInterrupt() { interrupt_requested = false; }

    // === Output Log ===
    const std::string& GetOutput() const { return output; }
    void ClearOutput() { output.clear(); }

    bool IsTransferActive() const { return bits_left > 0; }

private:
    uint8_t sb;     // $FF01 - Serial transfer data
    uint8_t sc;     // $FF02 - Serial transfer control

    uint16_t bit_timer;     // T-cycles towards the next bit
    uint8_t bits_left;      // 8 on start, 0 when idle

    bool interrupt_requested;
    std::string output;

    bool IsInternalClock() const { return sc & 0x01; }
    void StartTransfer();
    void ShiftInBit();

    static constexpr uint16_t CYCLES_PER_BIT = 512;
};
