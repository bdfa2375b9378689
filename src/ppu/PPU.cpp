#include "PPU.hpp"

#include <algorithm>

PPU::PPU() {
    strict_access = false;
    Reset();
}

void PPU::Reset() {
    mode = OAM_SCAN;
    dot_counter = 0;
    transfer_dots = MIN_TRANSFER_DOTS;
    ly = 0;
    window_line = 0;

    // Registers - post-boot state (boot ROM not run)
    lcdc.raw = 0x91;
    stat = 0;
    scy = 0;
    scx = 0;
    lyc = 0;
    bgp = 0xFC;
    obp0 = 0xFF;
    obp1 = 0xFF;
    wy = 0;
    wx = 0;

    // Memory
    vram.fill(0);
    oam.fill(0);
    back_buffer.fill(0);
    front_buffer.fill(0);

    // Interrupts
    vblank_irq = false;
    stat_irq = false;
    frame_complete = false;
    stat_line = false;

    sprite_count = 0;

    CheckStatInterrupt();
}

void PPU::Step(uint8_t cycles) {
    if (!lcdc.IsLCDEnabled()) {
        return;
    }

    for (int i = 0; i < cycles; i++) {
        dot_counter++;

        switch (mode) {
            case OAM_SCAN:
                if (dot_counter == OAM_SCAN_DOTS) {
                    StartPixelTransfer();
                }
                break;
            case PIXEL_TRANSFER:
                if (dot_counter == OAM_SCAN_DOTS + transfer_dots) {
                    SetMode(HBLANK);
                }
                break;
            case HBLANK:
            case VBLANK:
                if (dot_counter == DOTS_PER_LINE) {
                    NextLine();
                }
                break;
        }
    }
}

// === Mode Transitions ===

void PPU::SetMode(Mode new_mode) {
    mode = new_mode;
    CheckStatInterrupt();
}

void PPU::StartPixelTransfer() {
    SelectSprites();

    // Fine scroll discards pixels, each sprite stalls the fetcher
    transfer_dots = static_cast<uint16_t>(MIN_TRANSFER_DOTS + (scx & 7) + 6 * sprite_count);

    RenderScanline();
    SetMode(PIXEL_TRANSFER);
}

void PPU::NextLine() {
    dot_counter = 0;
    ly++;

    if (ly == VBLANK_START_LINE) {
        EnterVBlank();
    } else if (ly > LAST_LINE) {
        ly = 0;
        window_line = 0;
        SetMode(OAM_SCAN);
    } else if (ly < VBLANK_START_LINE) {
        SetMode(OAM_SCAN);
    } else {
        // LY changed inside VBlank: only the coincidence can change
        CheckStatInterrupt();
    }
}

void PPU::EnterVBlank() {
    front_buffer = back_buffer;
    frame_complete = true;
    vblank_irq = true;
    SetMode(VBLANK);
}

// === Rendering ===

/**
 * OAM scan: every entry whose rows cover LY is a candidate. Candidates are
 * ordered by X with OAM index breaking ties, and the first 10 are kept.
 */
void PPU::SelectSprites() {
    std::array<SpriteEntry, 40> candidates;
    uint8_t candidate_count = 0;
    uint8_t height = lcdc.GetSpriteHeight();

    for (uint8_t i = 0; i < 40; i++) {
        uint8_t y = oam[i * 4];
        int top = static_cast<int>(y) - 16;
        if (ly >= top && ly < top + height) {
            SpriteEntry& entry = candidates[candidate_count++];
            entry.y = y;
            entry.x = oam[i * 4 + 1];
            entry.tile = oam[i * 4 + 2];
            entry.attributes.raw = oam[i * 4 + 3];
            entry.oam_index = i;
        }
    }

    std::stable_sort(candidates.begin(), candidates.begin() + candidate_count,
                     [](const SpriteEntry& a, const SpriteEntry& b) { return a.x < b.x; });

    sprite_count = std::min(candidate_count, MAX_SPRITES_PER_LINE);
    std::copy(candidates.begin(), candidates.begin() + sprite_count, line_sprites.begin());
}

// 2-bit color index of one pixel of the BG/Window layer
uint8_t PPU::GetTilePixel(uint16_t tile_map, uint8_t x, uint8_t y) const {
    uint8_t tile = VRAMByte(static_cast<uint16_t>(tile_map + (y / 8) * 32 + (x / 8)));
    uint16_t row_addr = static_cast<uint16_t>(lcdc.GetTileDataAddress(tile) + (y % 8) * 2);

    uint8_t lo = VRAMByte(row_addr);
    uint8_t hi = VRAMByte(row_addr + 1);
    uint8_t bit = 7 - (x % 8);
    return static_cast<uint8_t>((((hi >> bit) & 1) << 1) | ((lo >> bit) & 1));
}

void PPU::RenderScanline() {
    std::array<uint8_t, SCREEN_WIDTH> bg_colors;
    uint8_t* row = &back_buffer[ly * SCREEN_WIDTH];

    // DMG: LCDC bit 0 off blanks the window too
    bool window_visible = lcdc.IsBGEnabled() && lcdc.IsWindowEnabled() &&
                          ly >= wy && wx <= 166;
    bool window_drawn = false;

    for (int x = 0; x < SCREEN_WIDTH; x++) {
        uint8_t color = 0;

        if (lcdc.IsBGEnabled()) {
            if (window_visible && x + 7 >= wx) {
                color = GetTilePixel(lcdc.GetWindowTileMap(),
                                     static_cast<uint8_t>(x + 7 - wx), window_line);
                window_drawn = true;
            } else {
                color = GetTilePixel(lcdc.GetBGTileMap(),
                                     static_cast<uint8_t>(x + scx),
                                     static_cast<uint8_t>(ly + scy));
            }
        }

        bg_colors[x] = color;
        row[x] = (bgp >> (color * 2)) & 3;
    }

    // The window counter only advances on lines that showed the window
    if (window_drawn) {
        window_line++;
    }

    if (lcdc.IsSpritesEnabled()) {
        RenderSprites(bg_colors);
    }
}

void PPU::RenderSprites(const std::array<uint8_t, SCREEN_WIDTH>& bg_colors) {
    uint8_t* row = &back_buffer[ly * SCREEN_WIDTH];
    uint8_t height = lcdc.GetSpriteHeight();

    for (int x = 0; x < SCREEN_WIDTH; x++) {
        for (uint8_t i = 0; i < sprite_count; i++) {
            const SpriteEntry& sprite = line_sprites[i];
            int left = static_cast<int>(sprite.x) - 8;
            if (x < left || x >= left + 8) {
                continue;
            }

            uint8_t line = static_cast<uint8_t>(ly + 16 - sprite.y);
            if (sprite.attributes.IsYFlipped()) {
                line = static_cast<uint8_t>(height - 1 - line);
            }

            // 8x16: bit 0 of the tile index is ignored
            uint8_t tile = sprite.tile;
            if (height == 16) {
                tile &= 0xFE;
            }

            // Sprites always use $8000 unsigned addressing
            uint16_t row_addr = static_cast<uint16_t>(0x8000 + tile * 16 + line * 2);
            uint8_t lo = VRAMByte(row_addr);
            uint8_t hi = VRAMByte(row_addr + 1);

            uint8_t column = static_cast<uint8_t>(x - left);
            uint8_t bit = sprite.attributes.IsXFlipped() ? column : 7 - column;
            uint8_t color = static_cast<uint8_t>((((hi >> bit) & 1) << 1) | ((lo >> bit) & 1));

            // Transparent: the next sprite in priority order may show
            if (color == 0) {
                continue;
            }

            // The highest-priority opaque sprite decides, even when it hides behind BG
            if (!sprite.attributes.IsBehindBG() || bg_colors[x] == 0) {
                uint8_t palette = sprite.attributes.GetPaletteIndex() ? obp1 : obp0;
                row[x] = (palette >> (color * 2)) & 3;
            }
            break;
        }
    }
}

// === STAT Interrupt ===
// The STAT line is the OR of all enabled sources; the interrupt fires
// only on its rising edge, so overlapping sources raise one request.
void PPU::CheckStatInterrupt() {
    if (!lcdc.IsLCDEnabled()) {
        return;
    }

    bool lyc_match = (ly == lyc);
    if (lyc_match) {
        stat |= 0x04;
    } else {
        stat &= ~0x04;
    }

    bool line = (stat & 0x40) && lyc_match;
    switch (mode) {
        case HBLANK:    line |= (stat & 0x08) != 0; break;
        case VBLANK:    line |= (stat & 0x10) != 0; break;
        case OAM_SCAN:  line |= (stat & 0x20) != 0; break;
        default: break;
    }

    if (line && !stat_line) {
        stat_irq = true;
    }
    stat_line = line;
}

// === Registers ===

uint8_t PPU::ReadRegister(uint16_t addr) const {
    switch (addr) {
        case 0xFF40: return lcdc.raw;
        case 0xFF41: return 0x80 | (stat & 0x7C) | mode;  // Bit 7 always 1
        case 0xFF42: return scy;
        case 0xFF43: return scx;
        case 0xFF44: return ly;
        case 0xFF45: return lyc;
        case 0xFF47: return bgp;
        case 0xFF48: return obp0;
        case 0xFF49: return obp1;
        case 0xFF4A: return wy;
        case 0xFF4B: return wx;
        default: return 0xFF;
    }
}

void PPU::WriteRegister(uint16_t addr, uint8_t value) {
    switch (addr) {
        case 0xFF40: {
            bool was_enabled = lcdc.IsLCDEnabled();
            lcdc.raw = value;

            if (was_enabled && !lcdc.IsLCDEnabled()) {
                // LCD off: LY held at 0, mode 0, VRAM/OAM open
                ly = 0;
                dot_counter = 0;
                mode = HBLANK;
                stat_line = false;
            } else if (!was_enabled && lcdc.IsLCDEnabled()) {
                ly = 0;
                dot_counter = 0;
                window_line = 0;
                SetMode(OAM_SCAN);
            }
            break;
        }
        case 0xFF41:
            // Bits 0-2 are read-only
            stat = (stat & 0x04) | (value & 0x78);
            CheckStatInterrupt();
            break;
        case 0xFF42: scy = value; break;
        case 0xFF43: scx = value; break;
        case 0xFF44: break;  // LY is read-only
        case 0xFF45:
            lyc = value;
            CheckStatInterrupt();
            break;
        case 0xFF47: bgp = value; break;
        case 0xFF48: obp0 = value; break;
        case 0xFF49: obp1 = value; break;
        case 0xFF4A: wy = value; break;
        case 0xFF4B: wx = value; break;
        default: break;
    }
}

// === VRAM/OAM Access ===

bool PPU::IsVRAMBlocked() const {
    return strict_access && lcdc.IsLCDEnabled() && mode == PIXEL_TRANSFER;
}

bool PPU::IsOAMBlocked() const {
    return strict_access && lcdc.IsLCDEnabled() &&
           (mode == OAM_SCAN || mode == PIXEL_TRANSFER);
}

uint8_t PPU::ReadVRAM(uint16_t addr) const {
    if (IsVRAMBlocked()) {
        return 0xFF;
    }
    return vram[addr - 0x8000];
}

void PPU::WriteVRAM(uint16_t addr, uint8_t value) {
    if (!IsVRAMBlocked()) {
        vram[addr - 0x8000] = value;
    }
}

uint8_t PPU::ReadOAM(uint16_t addr) const {
    if (IsOAMBlocked()) {
        return 0xFF;
    }
    return oam[addr - 0xFE00];
}

void PPU::WriteOAM(uint16_t addr, uint8_t value) {
    if (!IsOAMBlocked()) {
        oam[addr - 0xFE00] = value;
    }
}

void PPU::DMAWriteOAM(uint8_t index, uint8_t value) {
    if (index < 160) oam[index] = value;
}
