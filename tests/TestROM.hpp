#pragma once

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

/**
 * TestROM - builds synthetic cartridge images for the test suite
 *
 * The image always has a consistent header: title, cartridge type, size
 * codes and a correct header checksum. The entry point at $0100 jumps to
 * $0150 where Program() places its code.
 */
class TestROM {
public:
    explicit TestROM(uint8_t cartridge_type = 0x00, uint8_t rom_size_code = 0x00,
                     uint8_t ram_size_code = 0x00)
        : image(static_cast<size_t>(32768) << rom_size_code, 0x00)
    {
        // Entry: NOP; JP $0150
        image[0x100] = 0x00;
        image[0x101] = 0xC3;
        image[0x102] = 0x50;
        image[0x103] = 0x01;

        const char* title = "DMGCORE TEST";
        std::memcpy(&image[0x134], title, std::strlen(title));

        image[0x147] = cartridge_type;
        image[0x148] = rom_size_code;
        image[0x149] = ram_size_code;
    }

    // Code starting at $0150
    TestROM& Program(std::initializer_list<uint8_t> bytes) {
        return Bytes(0x150, bytes);
    }

    TestROM& Bytes(size_t offset, std::initializer_list<uint8_t> bytes) {
        for (uint8_t b : bytes) {
            image[offset++] = b;
        }
        return *this;
    }

    TestROM& Fill(size_t offset, size_t count, uint8_t value) {
        for (size_t i = 0; i < count; i++) {
            image[offset + i] = value;
        }
        return *this;
    }

    // Image with the header checksum at $014D filled in
    std::vector<uint8_t> Build() const {
        std::vector<uint8_t> result = image;
        uint8_t x = 0;
        for (size_t addr = 0x134; addr <= 0x14C; addr++) {
            x = static_cast<uint8_t>(x - result[addr] - 1);
        }
        result[0x14D] = x;
        return result;
    }

private:
    std::vector<uint8_t> image;
};
