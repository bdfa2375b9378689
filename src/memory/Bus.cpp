#include "Bus.hpp"

uint8_t Bus::Read(uint16_t addr) const {
    if (addr < 0x8000) return ReadFrom(cart_read, addr);
    if (addr < 0xA000) return ReadFrom(vram_read, addr);
    if (addr < 0xC000) return ReadFrom(cart_read, addr);
    if (addr < 0xE000) return ReadFrom(wram_read, addr);
    if (addr < 0xFE00) return ReadFrom(wram_read, addr - 0x2000);  // Echo

    if (addr < 0xFEA0) {
        if (IsOAMBlocked()) return OPEN_BUS;
        return ReadFrom(oam_read, addr);
    }

    if (addr < 0xFF00) return OPEN_BUS;  // Unusable
    if (addr < 0xFF80) return ReadFrom(io_read, addr);
    if (addr < 0xFFFF) return ReadFrom(hram_read, addr);
    return ReadFrom(ie_read, addr);
}

void Bus::Write(uint16_t addr, uint8_t value) {
    // ROM is never written; the cartridge treats these as MBC register writes
    if (addr < 0x8000) { WriteTo(cart_write, addr, value); return; }
    if (addr < 0xA000) { WriteTo(vram_write, addr, value); return; }
    if (addr < 0xC000) { WriteTo(cart_write, addr, value); return; }
    if (addr < 0xE000) { WriteTo(wram_write, addr, value); return; }
    if (addr < 0xFE00) { WriteTo(wram_write, addr - 0x2000, value); return; }

    if (addr < 0xFEA0) {
        if (!IsOAMBlocked()) {
            WriteTo(oam_write, addr, value);
        }
        return;
    }

    if (addr < 0xFF00) return;  // Unusable
    if (addr < 0xFF80) { WriteTo(io_write, addr, value); return; }
    if (addr < 0xFFFF) { WriteTo(hram_write, addr, value); return; }
    WriteTo(ie_write, addr, value);
}

uint8_t Bus::DMARead(uint16_t addr) const {
    if (addr < 0x8000) return ReadFrom(cart_read, addr);
    if (addr < 0xA000) return ReadFrom(vram_read, addr);
    if (addr < 0xC000) return ReadFrom(cart_read, addr);
    // $C000-$FFFF: DMG DMA sees WRAM for the whole upper range
    return ReadFrom(wram_read, addr & ~0x2000);
}
