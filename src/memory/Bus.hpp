#pragma once

#include <cstdint>
#include <functional>

/**
 * Bus - Memory Bus / Address Decoder
 *
 * Hardware Behavior:
 * - Decodes the 16-bit address and routes the access to exactly one device
 * - Holds no memory of its own, just the wiring
 *
 * Memory map:
 * - $0000-$3FFF  Cartridge ROM bank 0 (writes go to MBC registers)
 * - $4000-$7FFF  Cartridge ROM switchable bank (writes go to MBC registers)
 * - $8000-$9FFF  VRAM
 * - $A000-$BFFF  Cartridge RAM
 * - $C000-$DFFF  WRAM
 * - $E000-$FDFF  Echo of $C000-$DDFF
 * - $FE00-$FE9F  OAM
 * - $FEA0-$FEFF  Unusable: reads $FF, writes ignored
 * - $FF00-$FF7F  I/O registers
 * - $FF80-$FFFE  HRAM
 * - $FFFF        IE register
 *
 * A region with nothing connected reads as open bus ($FF).
 */
class Bus {
public:
    using ReadCallback = std::function<uint8_t(uint16_t addr)>;
    using WriteCallback = std::function<void(uint16_t addr, uint8_t value)>;
    using BlockCallback = std::function<bool()>;

    static constexpr uint8_t OPEN_BUS = 0xFF;

    uint8_t Read(uint16_t addr) const;
    void Write(uint16_t addr, uint8_t value);

    // === Device Connection ===

    // Cartridge ROM/RAM ($0000-$7FFF, $A000-$BFFF)
    void ConnectCartridge(ReadCallback read, WriteCallback write) {
        cart_read = read;
        cart_write = write;
    }

    // Video RAM ($8000-$9FFF)
    void ConnectVRAM(ReadCallback read, WriteCallback write) {
        vram_read = read;
        vram_write = write;
    }

    // Work RAM ($C000-$DFFF, echo $E000-$FDFF)
    void ConnectWRAM(ReadCallback read, WriteCallback write) {
        wram_read = read;
        wram_write = write;
    }

    // OAM ($FE00-$FE9F)
    void ConnectOAM(ReadCallback read, WriteCallback write) {
        oam_read = read;
        oam_write = write;
    }

    // I/O Registers ($FF00-$FF7F)
    void ConnectIO(ReadCallback read, WriteCallback write) {
        io_read = read;
        io_write = write;
    }

    // High RAM ($FF80-$FFFE)
    void ConnectHRAM(ReadCallback read, WriteCallback write) {
        hram_read = read;
        hram_write = write;
    }

    // Interrupt Enable ($FFFF)
    void ConnectIE(ReadCallback read, WriteCallback write) {
        ie_read = read;
        ie_write = write;
    }

    // OAM DMA owns OAM while it runs; CPU accesses to OAM are blocked
    void ConnectDMA(BlockCallback is_blocking_oam) {
        dma_blocking_oam = is_blocking_oam;
    }

    // Source read for OAM DMA: same decoding, ignoring the OAM block,
    // with $E000-$FFFF folded onto WRAM
    uint8_t DMARead(uint16_t addr) const;

private:
    ReadCallback cart_read;
    WriteCallback cart_write;
    ReadCallback vram_read;
    WriteCallback vram_write;
    ReadCallback wram_read;
    WriteCallback wram_write;
    ReadCallback oam_read;
    WriteCallback oam_write;
    ReadCallback io_read;
    WriteCallback io_write;
    ReadCallback hram_read;
    WriteCallback hram_write;
    ReadCallback ie_read;
    WriteCallback ie_write;
    BlockCallback dma_blocking_oam;

    static uint8_t ReadFrom(const ReadCallback& device, uint16_t addr) {
        return device ? device(addr) : OPEN_BUS;
    }

    static void WriteTo(const WriteCallback& device, uint16_t addr, uint8_t value) {
        if (device) device(addr, value);
    }

    bool IsOAMBlocked() const { return dma_blocking_oam && dma_blocking_oam(); }
};
