#include "Cartridge.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iterator>

static const char* GetCartridgeTypeName(uint8_t type) {
    switch (type) {
        case 0x00: return "ROM ONLY";
        case 0x01: return "MBC1";
        case 0x02: return "MBC1+RAM";
        case 0x03: return "MBC1+RAM+BATTERY";
        default: return "UNKNOWN";
    }
}

// RAM size lookup, -1 for codes that do not exist
static long GetRAMSizeFromCode(uint8_t code) {
    switch (code) {
        case 0x00: return 0;
        case 0x01: return 2048;         // 2KB (unofficial)
        case 0x02: return 8192;         // 8KB
        case 0x03: return 32768;        // 32KB (4 banks)
        case 0x04: return 131072;       // 128KB (16 banks)
        case 0x05: return 65536;        // 64KB (8 banks)
        default: return -1;
    }
}

static std::string FormatSize(size_t bytes) {
    if (bytes == 0) {
        return "None";
    }
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / 1024 / 1024) + " MB";
    }
    return std::to_string(bytes / 1024) + " KB";
}

Cartridge::Cartridge()
    : cartridge_type(0)
    , rom_size_code(0)
    , ram_size_code(0)
    , rom_bank_count(0)
    , has_mbc1(false)
    , header_checksum_valid(false)
    , rom_loaded(false)
{
    ResetBanking();
}

void Cartridge::ResetBanking() {
    ram_enabled = false;
    bank_low = 1;
    bank_high = 0;
    banking_mode = false;
}

bool Cartridge::Fail(const std::string& message) {
    load_error = message;
    std::cerr << "Error: " << message << "\n";
    return false;
}

uint8_t Cartridge::ComputeHeaderChecksum(const std::vector<uint8_t>& data) {
    uint8_t x = 0;
    for (size_t addr = 0x134; addr <= 0x14C && addr < data.size(); addr++) {
        x = static_cast<uint8_t>(x - data[addr] - 1);
    }
    return x;
}

bool Cartridge::LoadROM(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Fail("ROM file not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Fail("Failed to open ROM file: " + path);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Fail("Failed to read ROM data: " + path);
    }

    return LoadROMData(std::move(data));
}

bool Cartridge::LoadROMData(std::vector<uint8_t> data) {
    rom_loaded = false;
    load_error.clear();

    if (data.size() < HEADER_END) {
        return Fail("ROM too small (" + std::to_string(data.size()) +
                    " bytes, header needs 336)");
    }

    uint8_t type = data[0x147];
    if (type > 0x03) {
        std::ostringstream ss;
        ss << "Unsupported cartridge type $" << std::hex << std::uppercase
           << std::setw(2) << std::setfill('0') << static_cast<int>(type)
           << " (only ROM ONLY and MBC1 are supported)";
        return Fail(ss.str());
    }

    uint8_t rom_code = data[0x148];
    if (rom_code > 0x06) {
        return Fail("Invalid ROM size code " + std::to_string(rom_code));
    }

    long ram_size = GetRAMSizeFromCode(data[0x149]);
    if (ram_size < 0) {
        return Fail("Invalid RAM size code " + std::to_string(data[0x149]));
    }

    size_t expected_size = static_cast<size_t>(32768) << rom_code;
    if (data.size() < expected_size) {
        return Fail("ROM truncated (" + std::to_string(data.size()) + " < " +
                    std::to_string(expected_size) + " bytes)");
    }
    if (data.size() > expected_size) {
        std::cerr << "Warning: ROM larger than header indicates ("
                  << data.size() << " > " << expected_size << ")\n";
    }

    uint8_t checksum = ComputeHeaderChecksum(data);
    if (checksum != data[0x14D]) {
        std::ostringstream ss;
        ss << "Header checksum mismatch (computed $" << std::hex << std::uppercase
           << std::setw(2) << std::setfill('0') << static_cast<int>(checksum)
           << ", header $" << std::setw(2) << static_cast<int>(data[0x14D]) << ")";
        return Fail(ss.str());
    }

    rom = std::move(data);

    // Title: $0134-$0143, NUL padded
    title.clear();
    for (size_t i = 0x134; i <= 0x143 && rom[i] != 0; ++i) {
        char c = static_cast<char>(rom[i]);
        if (c >= 32 && c < 127) {
            title += c;
        }
    }

    cartridge_type = type;
    rom_size_code = rom_code;
    ram_size_code = rom[0x149];
    // Banks past the declared size are never mapped
    rom_bank_count = static_cast<uint16_t>(2u << rom_code);
    has_mbc1 = (type != 0x00);
    header_checksum_valid = true;

    // ROM ONLY boards carry no RAM chip
    ram.assign(has_mbc1 ? static_cast<size_t>(ram_size) : 0, 0x00);

    ResetBanking();
    rom_loaded = true;
    return true;
}

// === Cartridge Header Info for Display ===

std::string Cartridge::GetDetailedInfo() const {
    if (!rom_loaded) {
        return "No ROM loaded";
    }

    std::ostringstream ss;
    ss << std::left;
    ss << std::setw(10) << "Title:" << title << "\n";
    ss << std::setw(10) << "Type:" << GetCartridgeTypeName(cartridge_type) << "\n";
    ss << std::setw(10) << "ROM:" << FormatSize(rom.size())
       << " (" << rom_bank_count << " banks)\n";
    ss << std::setw(10) << "RAM:" << FormatSize(ram.size());
    if (!ram.empty()) {
        ss << " (" << std::max<size_t>(1, ram.size() / RAM_BANK_SIZE) << " banks)";
    }
    ss << "\n";
    ss << std::setw(10) << "Checksum:" << (header_checksum_valid ? "VALID" : "INVALID")
       << " ($" << std::right << std::hex << std::uppercase << std::setw(2)
       << std::setfill('0') << static_cast<int>(rom[0x14D]) << ")\n";
    return ss.str();
}

// === Memory Access ===

uint8_t Cartridge::Read(uint16_t addr) const {
    if (!rom_loaded) {
        return 0xFF;
    }

    if (addr < 0x4000) {
        // Fixed window is always bank 0
        return rom[addr];
    }

    if (addr < 0x8000) {
        uint32_t offset = static_cast<uint32_t>(GetCurrentROMBank()) * ROM_BANK_SIZE + (addr - 0x4000);
        return offset < rom.size() ? rom[offset] : 0xFF;
    }

    if (addr >= 0xA000 && addr < 0xC000) {
        if (!ram_enabled || ram.empty()) {
            return 0xFF;
        }
        return ram[GetRAMOffset(addr)];
    }

    return 0xFF;
}

void Cartridge::Write(uint16_t addr, uint8_t value) {
    if (!rom_loaded) {
        return;
    }

    if (addr < 0x8000) {
        // ROM ONLY: writes to ROM go nowhere
        if (has_mbc1) {
            WriteMBC1(addr, value);
        }
        return;
    }

    if (addr >= 0xA000 && addr < 0xC000) {
        if (ram_enabled && !ram.empty()) {
            ram[GetRAMOffset(addr)] = value;
        }
    }
}

/**
 * MBC1 register writes
 *
 * $0000-$1FFF: RAM enable ($0A in the low nibble enables, anything else disables)
 * $2000-$3FFF: BANK1, lower 5 bits of the ROM bank
 * $4000-$5FFF: BANK2, 2 bits: ROM bank bits 5-6 or RAM bank
 * $6000-$7FFF: mode select (bit 0)
 */
void Cartridge::WriteMBC1(uint16_t addr, uint8_t value) {
    if (addr < 0x2000) {
        ram_enabled = ((value & 0x0F) == 0x0A);
    } else if (addr < 0x4000) {
        bank_low = value & 0x1F;
    } else if (addr < 0x6000) {
        bank_high = value & 0x03;
    } else {
        banking_mode = (value & 0x01) != 0;
    }
}

uint16_t Cartridge::GetCurrentROMBank() const {
    if (!has_mbc1 || rom_bank_count == 0) {
        return 1;
    }

    // BANK1 = 0 reads as 1: bank 0 can't be mapped into the switchable window
    uint16_t bank = bank_low == 0 ? 1 : bank_low;
    if (!banking_mode) {
        bank |= static_cast<uint16_t>(bank_high) << 5;
    }
    return bank % rom_bank_count;
}

uint8_t Cartridge::GetCurrentRAMBank() const {
    return banking_mode ? bank_high : 0;
}

uint32_t Cartridge::GetRAMOffset(uint16_t addr) const {
    uint32_t offset = static_cast<uint32_t>(GetCurrentRAMBank()) * RAM_BANK_SIZE + (addr - 0xA000);
    // 2KB and 8KB chips mirror across the window
    return offset % static_cast<uint32_t>(ram.size());
}
