#pragma once

#include <cstdint>
#include <vector>
#include <string>

/**
 * Cartridge - Game Cartridge Interface
 *
 * Hardware Behavior:
 * - ROM storage (read-only game data), mapped at $0000-$7FFF
 * - Optional external RAM, mapped at $A000-$BFFF
 * - Optional MBC1 bank controller: writes to the ROM range program it
 * - Does NOT know about CPU - only responds to address/data signals
 *
 * Supported cartridge types:
 * - $00 ROM ONLY (32KB, no banking)
 * - $01-$03 MBC1 (up to 2MB ROM, 32KB RAM)
 */
class Cartridge {
public:
    Cartridge();

    // Load a ROM image. On failure prints an "Error:" line, keeps the
    // message in GetLoadError() and leaves the cartridge unloaded.
    bool LoadROM(const std::string& path);
    bool LoadROMData(std::vector<uint8_t> data);

    const std::string& GetLoadError() const { return load_error; }

    // === Cartridge Pins ===
    uint8_t Read(uint16_t addr) const;
    void Write(uint16_t addr, uint8_t value);

    // === Cartridge Info (parsed from the ROM header) ===
    const std::string& GetTitle() const { return title; }
    uint8_t GetCartridgeType() const { return cartridge_type; }
    uint8_t GetROMSizeCode() const { return rom_size_code; }
    uint8_t GetRAMSizeCode() const { return ram_size_code; }
    uint16_t GetROMBankCount() const { return rom_bank_count; }
    size_t GetRAMSize() const { return ram.size(); }
    bool HasMBC1() const { return has_mbc1; }
    bool IsLoaded() const { return rom_loaded; }

    std::string GetDetailedInfo() const;

    // === Banking State (debug) ===
    uint16_t GetCurrentROMBank() const;
    uint8_t GetCurrentRAMBank() const;
    bool IsRAMEnabled() const { return ram_enabled; }
    bool IsRAMBankingMode() const { return banking_mode; }

    // x = x - rom[i] - 1 over $0134-$014C
    static uint8_t ComputeHeaderChecksum(const std::vector<uint8_t>& data);

    static constexpr size_t HEADER_END = 0x150;
    static constexpr size_t ROM_BANK_SIZE = 0x4000;
    static constexpr size_t RAM_BANK_SIZE = 0x2000;

private:
    std::vector<uint8_t> rom;
    std::vector<uint8_t> ram;

    // === MBC1 Registers ===
    bool ram_enabled;       // $0000-$1FFF: $xA enables
    uint8_t bank_low;       // $2000-$3FFF: 5 bits
    uint8_t bank_high;      // $4000-$5FFF: 2 bits
    bool banking_mode;      // $6000-$7FFF: 0 = ROM banking, 1 = RAM banking

    // === ROM Header Info ===
    std::string title;
    uint8_t cartridge_type;
    uint8_t rom_size_code;
    uint8_t ram_size_code;
    uint16_t rom_bank_count;
    bool has_mbc1;
    bool header_checksum_valid;
    bool rom_loaded;

    std::string load_error;

    void ResetBanking();
    bool Fail(const std::string& message);
    void WriteMBC1(uint16_t addr, uint8_t value);
    uint32_t GetRAMOffset(uint16_t addr) const;
};
