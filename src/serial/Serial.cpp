#include "Serial.hpp"

Serial::Serial() {
    Reset();
}

void Serial::Reset() {
    sb = 0;
    sc = 0;
    bit_timer = 0;
    bits_left = 0;
    interrupt_requested = false;
    output.clear();
}

// External clock with nobody on the other end never ticks
void Serial::Step(uint8_t cycles) {
    if (bits_left == 0 || !IsInternalClock()) return;

    bit_timer += cycles;
    while (bits_left > 0 && bit_timer >= CYCLES_PER_BIT) {
        bit_timer -= CYCLES_PER_BIT;
        ShiftInBit();
    }
}

void Serial::StartTransfer() {
    output += static_cast<char>(sb);
    bits_left = 8;
    bit_timer = 0;
}

// Line idles high, so a 1 comes in as the MSB goes out
void Serial::ShiftInBit() {
    sb = static_cast<uint8_t>((sb << 1) | 0x01);
    if (--bits_left == 0) {
        sc &= 0x7F;
        interrupt_requested = true;
    }
}

uint8_t Serial::ReadRegister(uint16_t addr) const {
    if (addr == 0xFF01) return sb;
    if (addr == 0xFF02) return static_cast<uint8_t>(sc | 0x7E);
    return 0xFF;
}

void Serial::WriteRegister(uint16_t addr, uint8_t value) {
    if (addr == 0xFF01) {
        // SB is latched while shifting
        if (!IsTransferActive()) sb = value;
        return;
    }
    if (addr != 0xFF02) return;

    sc = value & 0x81;
    if ((value & 0x80) && !IsTransferActive()) {
        StartTransfer();
    }
}
