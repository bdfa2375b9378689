#pragma once

#include <array>
#include <cstdint>

/**
 * Joypad - Button Input Hardware
 *
 * Hardware Behavior:
 * - 8 buttons wired as a 2x4 matrix onto lines P10-P13
 * - P14 (bit 4) low selects the direction group, P15 (bit 5) low the action group
 * - Lines are active-low: a pressed button in a selected group reads 0
 * - Any line falling from 1 to 0 raises the joypad interrupt
 * - Does NOT know about CPU - only the register and the button inputs
 */
class Joypad {
public:
    enum class Button : uint8_t {
        A = 0,
        B = 1,
        SELECT = 2,
        START = 3,
        RIGHT = 4,
        LEFT = 5,
        UP = 6,
        DOWN = 7
    };

    Joypad();

    void Reset();

    // === Register Interface ($FF00) ===
    uint8_t ReadRegister() const { return 0xC0 | select | GetInputLines(); }
    void WriteRegister(uint8_t value);

    // === Button Input (from the host backend) ===
    void SetButton(Button button, bool pressed);
    bool IsPressed(Button button) const { return buttons[static_cast<uint8_t>(button)]; }

    // === Interrupt Signal ===
    bool IsInterruptRequested() const { return interrupt_requested; }
    void ClearInterrupt() { interrupt_requested = false; }

private:
    uint8_t select;                 // Bits 4-5 as last written
    std::array<bool, 8> buttons;    // true = pressed
    bool interrupt_requested;

    // P10-P13 as seen through the current select bits
    uint8_t GetInputLines() const;

    // Raise the interrupt if any line went high -> low
    void CheckFallingEdge(uint8_t old_lines);
};
