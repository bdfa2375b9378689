#include "Joypad.hpp"

Joypad::Joypad() {
    Reset();
}

void Joypad::Reset() {
    select = 0x30;  // Neither group selected
    buttons.fill(false);
    interrupt_requested = false;
}

uint8_t Joypad::GetInputLines() const {
    uint8_t lines = 0x0F;

    // Direction group: RIGHT, LEFT, UP, DOWN on bits 0-3
    if (!(select & 0x10)) {
        for (uint8_t i = 0; i < 4; i++) {
            if (buttons[4 + i]) lines &= static_cast<uint8_t>(~(1 << i));
        }
    }

    // Action group: A, B, SELECT, START on bits 0-3
    if (!(select & 0x20)) {
        for (uint8_t i = 0; i < 4; i++) {
            if (buttons[i]) lines &= static_cast<uint8_t>(~(1 << i));
        }
    }

    return lines;
}

void Joypad::CheckFallingEdge(uint8_t old_lines) {
    if (old_lines & ~GetInputLines() & 0x0F) {
        interrupt_requested = true;
    }
}

void Joypad::WriteRegister(uint8_t value) {
    uint8_t old_lines = GetInputLines();
    select = value & 0x30;  // Only bits 4-5 are writable
    CheckFallingEdge(old_lines);
}

void Joypad::SetButton(Button button, bool pressed) {
    uint8_t old_lines = GetInputLines();
    buttons[static_cast<uint8_t>(button)] = pressed;
    CheckFallingEdge(old_lines);
}
