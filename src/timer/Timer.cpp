#include "Timer.hpp"

Timer::Timer() {
    Reset();
}

void Timer::Reset() {
    // Post-boot DIV on DMG is $AB with the low byte mid-count
    divider = 0xABCC;
    tima = 0;
    tma = 0;
    tac.raw = 0;
    reload_state = ReloadState::COUNTING;
    interrupt_requested = false;
}

void Timer::Step(uint8_t cycles) {
    for (uint8_t i = 0; i < cycles; i++) {
        bool old_signal = tac.GetSignal(divider);
        divider++;

        // Reload sequence moves once per M-cycle
        if ((divider & 0x03) == 0) {
            AdvanceReload();
        }

        if (old_signal && !tac.GetSignal(divider)) {
            IncrementCounter();
        }
    }
}

void Timer::AdvanceReload() {
    switch (reload_state) {
        case ReloadState::OVERFLOWED:
            tima = tma;
            interrupt_requested = true;
            reload_state = ReloadState::RELOADED;
            break;
        case ReloadState::RELOADED:
            reload_state = ReloadState::COUNTING;
            break;
        case ReloadState::COUNTING:
            break;
    }
}

void Timer::IncrementCounter() {
    tima++;
    if (tima == 0) {
        // TIMA holds $00 until the next M-cycle boundary
        reload_state = ReloadState::OVERFLOWED;
    }
}

uint8_t Timer::ReadRegister(uint16_t addr) const {
    switch (addr) {
        case 0xFF04: return static_cast<uint8_t>(divider >> 8);
        case 0xFF05: return tima;
        case 0xFF06: return tma;
        case 0xFF07: return tac.raw | 0xF8;  // Upper bits always 1
        default: return 0xFF;
    }
}

void Timer::WriteRegister(uint16_t addr, uint8_t value) {
    switch (addr) {
        case 0xFF04: {
            // Any write clears the whole divider. If the selected bit was
            // high, the falling edge increments TIMA.
            bool old_signal = tac.GetSignal(divider);
            divider = 0;
            if (old_signal) {
                IncrementCounter();
            }
            break;
        }

        case 0xFF05:
            if (reload_state == ReloadState::RELOADED) {
                break;  // TMA was just copied, write lost
            }
            tima = value;
            if (reload_state == ReloadState::OVERFLOWED) {
                reload_state = ReloadState::COUNTING;  // Reload cancelled
            }
            break;

        case 0xFF06:
            tma = value;
            if (reload_state == ReloadState::RELOADED) {
                tima = value;
            }
            break;

        case 0xFF07: {
            // Disabling or switching the clock can drop the signal too
            bool old_signal = tac.GetSignal(divider);
            tac.raw = value & 0x07;
            if (old_signal && !tac.GetSignal(divider)) {
                IncrementCounter();
            }
            break;
        }
    }
}
