#pragma once

#include <cstdint>

/**
 * TimerControl - TAC ($FF07) as a value type
 *
 * Bit 2: enable, bits 1-0: clock select. The selected clock is a bit of
 * the internal 16-bit divider; TIMA ticks on that bit's falling edge.
 */
struct TimerControl {
    uint8_t raw = 0;

    bool IsEnabled() const { return (raw & 0x04) != 0; }
    uint8_t GetClockSelect() const { return raw & 0x03; }

    // Divider bit whose falling edge clocks TIMA
    //   00: bit 9 (4096 Hz, every 1024 T-cycles)
    //   01: bit 3 (262144 Hz, every 16)
    //   10: bit 5 (65536 Hz, every 64)
    //   11: bit 7 (16384 Hz, every 256)
    uint16_t GetDividerMask() const {
        static constexpr uint16_t MASKS[4] = { 1 << 9, 1 << 3, 1 << 5, 1 << 7 };
        return MASKS[GetClockSelect()];
    }

    // TIMA input signal: enable AND selected divider bit
    bool GetSignal(uint16_t divider) const {
        return IsEnabled() && (divider & GetDividerMask()) != 0;
    }
};

/**
 * Timer - DIV and TIMA Timer Hardware
 *
 * Hardware Behavior:
 * - DIV is the upper 8 bits of a 16-bit counter that increments every T-cycle
 * - TIMA increments on the falling edge of (enable AND selected divider bit),
 *   so writes to DIV or TAC can produce an extra increment
 * - On overflow TIMA reads $00 for one M-cycle, then TMA is loaded and the
 *   timer interrupt is requested
 * - Does NOT know about CPU - only outputs an interrupt signal
 *
 * Reload sequence (advanced once per M-cycle):
 * - COUNTING:   normal operation
 * - OVERFLOWED: TIMA wrapped to $00; a TIMA write here cancels the reload
 * - RELOADED:   TMA copied, interrupt raised; TIMA writes are ignored and
 *               TMA writes also land in TIMA
 */
class Timer {
public:
    Timer();

    void Reset();

    // Advance timer by specified T-cycles
    void Step(uint8_t cycles);

    // === Register Interface ($FF04-$FF07) ===
    uint8_t ReadRegister(uint16_t addr) const;
    void WriteRegister(uint16_t addr, uint8_t value);

    // === Interrupt Signal ===
    bool IsInterruptRequested() const { return interrupt_requested; }
    void ClearInterrupt() { interrupt_requested = false; }

    uint16_t GetDivider() const { return divider; }

private:
    enum class ReloadState : uint8_t {
        COUNTING,
        OVERFLOWED,
        RELOADED
    };

    uint16_t divider;   // DIV is bits 8-15
    uint8_t tima;       // $FF05
    uint8_t tma;        // $FF06
    TimerControl tac;   // $FF07

    ReloadState reload_state;
    bool interrupt_requested;

    void AdvanceReload();
    void IncrementCounter();
};
