#pragma once

#include <cstdint>
#include <array>
#include <stdexcept>

/**
 * LCDControl - $FF40 as a value type
 *
 * Bit 7: LCD enable
 * Bit 6: Window tile map ($9800 / $9C00)
 * Bit 5: Window enable
 * Bit 4: BG/Window tile data ($8800 signed / $8000 unsigned)
 * Bit 3: BG tile map ($9800 / $9C00)
 * Bit 2: OBJ size (8x8 / 8x16)
 * Bit 1: OBJ enable
 * Bit 0: BG/Window enable (DMG: off blanks both layers to color 0)
 */
struct LCDControl {
    uint8_t raw = 0;

    bool IsLCDEnabled() const { return raw & 0x80; }
    uint16_t GetWindowTileMap() const { return (raw & 0x40) ? 0x9C00 : 0x9800; }
    bool IsWindowEnabled() const { return raw & 0x20; }
    bool UsesUnsignedTileData() const { return raw & 0x10; }
    uint16_t GetBGTileMap() const { return (raw & 0x08) ? 0x9C00 : 0x9800; }
    uint8_t GetSpriteHeight() const { return (raw & 0x04) ? 16 : 8; }
    bool IsSpritesEnabled() const { return raw & 0x02; }
    bool IsBGEnabled() const { return raw & 0x01; }

    // Address of the first byte of a BG/Window tile
    uint16_t GetTileDataAddress(uint8_t tile) const {
        if (UsesUnsignedTileData()) {
            return static_cast<uint16_t>(0x8000 + tile * 16);
        }
        return static_cast<uint16_t>(0x9000 + static_cast<int8_t>(tile) * 16);
    }
};

/**
 * SpriteAttributes - OAM byte 3 as a value type
 *
 * Bit 7: BG priority (1 = behind BG colors 1-3)
 * Bit 6: Y flip
 * Bit 5: X flip
 * Bit 4: Palette (OBP0 / OBP1)
 */
struct SpriteAttributes {
    uint8_t raw = 0;

    bool IsBehindBG() const { return raw & 0x80; }
    bool IsYFlipped() const { return raw & 0x40; }
    bool IsXFlipped() const { return raw & 0x20; }
    uint8_t GetPaletteIndex() const { return (raw >> 4) & 1; }
};

// One OAM entry selected for the current scanline
struct SpriteEntry {
    uint8_t y;          // Screen Y + 16
    uint8_t x;          // Screen X + 8
    uint8_t tile;
    SpriteAttributes attributes;
    uint8_t oam_index;
};

/**
 * PPU - Picture Processing Unit (scanline renderer)
 *
 * Hardware Behavior:
 * - Operates on dot clock (same as T-cycle: 4.194304 MHz)
 * - Cycles through modes: OAM Scan -> Pixel Transfer -> HBlank -> VBlank
 * - Each visible line is rendered in one go at the start of Pixel Transfer
 *
 * Timing:
 * - Scanline: 456 dots total
 * - Mode 2 (OAM Scan): 80 dots
 * - Mode 3 (Pixel Transfer): 172 dots + SCX fine scroll + 6 per sprite
 * - Mode 0 (HBlank): remainder to 456
 * - Mode 1 (VBlank): lines 144-153 (4560 dots)
 *
 * Sprites: at most 10 per line, chosen by ascending X, ties broken by
 * OAM index. The earliest sprite in that order owns a pixel.
 */
class PPU {
public:
    static constexpr int SCREEN_WIDTH = 160;
    static constexpr int SCREEN_HEIGHT = 144;
    static constexpr uint8_t MAX_SPRITES_PER_LINE = 10;

    using Framebuffer = std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT>;

    PPU();

    // Post-boot state: LCD on, LCDC=$91, BGP=$FC
    void Reset();

    // Advance PPU by specified T-cycles (1 dot = 1 T-cycle)
    void Step(uint8_t cycles);

    // === Register Interface (memory-mapped I/O) ===
    uint8_t ReadRegister(uint16_t addr) const;
    void WriteRegister(uint16_t addr, uint8_t value);

    // === VRAM Interface ($8000-$9FFF) ===
    uint8_t ReadVRAM(uint16_t addr) const;
    void WriteVRAM(uint16_t addr, uint8_t value);

    // === OAM Interface ($FE00-$FE9F) ===
    uint8_t ReadOAM(uint16_t addr) const;
    void WriteOAM(uint16_t addr, uint8_t value);
    void DMAWriteOAM(uint8_t index, uint8_t value);

    // Block CPU access to VRAM in mode 3 and OAM in modes 2-3.
    // Off by default: all accesses pass through.
    void SetStrictAccess(bool strict) { strict_access = strict; }

    // === Interrupt Signals ===
    bool IsVBlankInterruptRequested() const { return vblank_irq; }
    bool IsStatInterruptRequested() const { return stat_irq; }
    void ClearVBlankInterrupt() { vblank_irq = false; }
    void ClearStatInterrupt() { stat_irq = false; }

    // === Display Output ===
    // Shades 0-3 after palette mapping. Only replaced at VBlank entry.
    const Framebuffer& GetFramebuffer() const { return front_buffer; }
    bool IsFrameComplete() const { return frame_complete; }
    void ClearFrameComplete() { frame_complete = false; }

    // === State Query ===
    uint8_t GetMode() const { return mode; }
    uint8_t GetLY() const { return ly; }
    uint16_t GetDot() const { return dot_counter; }
    uint8_t GetLineSpriteCount() const { return sprite_count; }
    const SpriteEntry& GetLineSprite(uint8_t index) const {
        if (index >= sprite_count) {
            throw std::out_of_range("Line sprite index past the selected sprites");
        }
        return line_sprites[index];
    }

private:
    enum Mode : uint8_t {
        HBLANK = 0,
        VBLANK = 1,
        OAM_SCAN = 2,
        PIXEL_TRANSFER = 3
    };

    static constexpr uint16_t DOTS_PER_LINE = 456;
    static constexpr uint16_t OAM_SCAN_DOTS = 80;
    static constexpr uint16_t MIN_TRANSFER_DOTS = 172;
    static constexpr uint8_t VBLANK_START_LINE = 144;
    static constexpr uint8_t LAST_LINE = 153;

    // === Internal State ===
    Mode mode;
    uint16_t dot_counter;       // Dots within current scanline (0-455)
    uint16_t transfer_dots;     // Length of this line's mode 3
    uint8_t ly;                 // Current scanline (0-153)
    uint8_t window_line;        // Window internal line counter
    bool strict_access;

    // === Registers ===
    LCDControl lcdc;    // $FF40 - LCD Control
    uint8_t stat;       // $FF41 - LCD Status (bits 2-6)
    uint8_t scy;        // $FF42 - Scroll Y
    uint8_t scx;        // $FF43 - Scroll X
    uint8_t lyc;        // $FF45 - LY Compare
    uint8_t bgp;        // $FF47 - BG Palette
    uint8_t obp0;       // $FF48 - Object Palette 0
    uint8_t obp1;       // $FF49 - Object Palette 1
    uint8_t wy;         // $FF4A - Window Y
    uint8_t wx;         // $FF4B - Window X

    // === Memory ===
    std::array<uint8_t, 8192> vram;
    std::array<uint8_t, 160> oam;

    // === Framebuffers ===
    Framebuffer back_buffer;    // Being drawn
    Framebuffer front_buffer;   // Last complete frame

    // === Interrupt Flags ===
    bool vblank_irq;
    bool stat_irq;
    bool frame_complete;
    bool stat_line;             // Previous STAT interrupt line state

    // === Scanline Sprites ===
    std::array<SpriteEntry, MAX_SPRITES_PER_LINE> line_sprites;
    uint8_t sprite_count;

    // === Mode Transitions ===
    void SetMode(Mode new_mode);
    void StartPixelTransfer();
    void NextLine();
    void EnterVBlank();

    // === Rendering ===
    void SelectSprites();
    void RenderScanline();
    void RenderSprites(const std::array<uint8_t, SCREEN_WIDTH>& bg_colors);
    uint8_t GetTilePixel(uint16_t tile_map, uint8_t x, uint8_t y) const;
    uint8_t VRAMByte(uint16_t addr) const { return vram[addr - 0x8000]; }

    // === Utility ===
    void CheckStatInterrupt();
    bool IsVRAMBlocked() const;
    bool IsOAMBlocked() const;
};
