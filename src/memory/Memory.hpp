#pragma once

#include <cstdint>
#include <array>

/**
 * Memory - On-board RAM (WRAM, HRAM)
 *
 * Plain storage chips with no side effects. Echo RAM ($E000-$FDFF) is
 * folded onto WRAM by the bus before it gets here.
 */
class Memory {
public:
    static constexpr uint16_t WRAM_SIZE = 0x2000;  // $C000-$DFFF
    static constexpr uint16_t HRAM_SIZE = 0x7F;    // $FF80-$FFFE

    Memory();

    void Reset();

    uint8_t ReadWRAM(uint16_t addr) const { return wram[addr & (WRAM_SIZE - 1)]; }
    void WriteWRAM(uint16_t addr, uint8_t value) { wram[addr & (WRAM_SIZE - 1)] = value; }

    uint8_t ReadHRAM(uint16_t addr) const { return hram[(addr - 0xFF80) % HRAM_SIZE]; }
    void WriteHRAM(uint16_t addr, uint8_t value) { hram[(addr - 0xFF80) % HRAM_SIZE] = value; }

private:
    std::array<uint8_t, WRAM_SIZE> wram;
    std::array<uint8_t, HRAM_SIZE> hram;
};
