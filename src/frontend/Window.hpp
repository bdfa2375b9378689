#pragma once

#include <SDL2/SDL.h>
#include <string>
#include <array>

#include "ppu/PPU.hpp"

/**
 * Frontend Window - SDL2 Window and Rendering
 *
 * Handles:
 * - Window creation and management
 * - Framebuffer display (160x144 scaled)
 * - Keyboard state for the joypad mapping
 * - Window position persisted through Config
 */
class Window {
public:
    enum class Palette {
        GRAY,
        GREEN
    };

    Window();
    ~Window();

    // Initialize SDL2 and create window
    bool Init(const std::string& title, int scale, Palette palette);

    // Display framebuffer (shades 0-3)
    void RenderFrame(const PPU::Framebuffer& framebuffer);

    // Handle events, returns false if quit requested
    bool ProcessEvents();

    bool IsKeyPressed(SDL_Scancode key) const;

    // Save window position/size to Config
    void SaveWindowState();

    static Palette ParsePalette(const std::string& name);

private:
    SDL_Window* window;
    SDL_Renderer* renderer;
    SDL_Texture* texture;

    int scale;
    const uint32_t* palette_colors;

    std::array<bool, SDL_NUM_SCANCODES> keys_current;

    // ARGB8888, lightest to darkest
    static constexpr uint32_t GRAY_PALETTE[4] = {
        0xFFFFFFFF,
        0xFFAAAAAA,
        0xFF555555,
        0xFF000000
    };
    static constexpr uint32_t GREEN_PALETTE[4] = {
        0xFFD2E6A6,
        0xFF8CAD63,
        0xFF396139,
        0xFF101808
    };

    // Pixel buffer for texture update
    std::array<uint32_t, PPU::SCREEN_WIDTH * PPU::SCREEN_HEIGHT> pixels;

    bool quit_requested;
};
