#include "Window.hpp"
#include "Config.hpp"

#include <iostream>

constexpr uint32_t Window::GRAY_PALETTE[4];
constexpr uint32_t Window::GREEN_PALETTE[4];

Window::Window()
    : window(nullptr)
    , renderer(nullptr)
    , texture(nullptr)
    , scale(3)
    , palette_colors(GRAY_PALETTE)
    , quit_requested(false)
{
    keys_current.fill(false);
    pixels.fill(GRAY_PALETTE[0]);
}

Window::~Window() {
    SaveWindowState();
    if (texture) SDL_DestroyTexture(texture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) SDL_DestroyWindow(window);
    SDL_Quit();
}

Window::Palette Window::ParsePalette(const std::string& name) {
    return name == "green" ? Palette::GREEN : Palette::GRAY;
}

bool Window::Init(const std::string& title, int window_scale, Palette palette) {
    scale = window_scale;
    palette_colors = (palette == Palette::GREEN) ? GREEN_PALETTE : GRAY_PALETTE;

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "Error: SDL_Init failed: " << SDL_GetError() << "\n";
        return false;
    }

    // Load saved position or use centered
    int x = Config::Instance().GetInt("window_x", SDL_WINDOWPOS_CENTERED);
    int y = Config::Instance().GetInt("window_y", SDL_WINDOWPOS_CENTERED);

    window = SDL_CreateWindow(
        title.c_str(), x, y,
        PPU::SCREEN_WIDTH * scale, PPU::SCREEN_HEIGHT * scale,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!window) {
        std::cerr << "Error: SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

    if (!renderer) {
        std::cerr << "Error: SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        return false;
    }

    SDL_RenderSetLogicalSize(renderer, PPU::SCREEN_WIDTH, PPU::SCREEN_HEIGHT);

    texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        PPU::SCREEN_WIDTH, PPU::SCREEN_HEIGHT
    );

    if (!texture) {
        std::cerr << "Error: SDL_CreateTexture failed: " << SDL_GetError() << "\n";
        return false;
    }

    return true;
}

void Window::SaveWindowState() {
    if (!window) return;

    int x, y;
    SDL_GetWindowPosition(window, &x, &y);
    Config::Instance().SetInt("window_x", x);
    Config::Instance().SetInt("window_y", y);
    Config::Instance().Save();
}

void Window::RenderFrame(const PPU::Framebuffer& framebuffer) {
    for (size_t i = 0; i < framebuffer.size(); i++) {
        pixels[i] = palette_colors[framebuffer[i] & 0x03];
    }

    SDL_UpdateTexture(texture, nullptr, pixels.data(), PPU::SCREEN_WIDTH * sizeof(uint32_t));
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

bool Window::ProcessEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                quit_requested = true;
                break;
            case SDL_KEYDOWN:
                if (event.key.keysym.scancode == SDL_SCANCODE_ESCAPE) {
                    quit_requested = true;
                }
                keys_current[event.key.keysym.scancode] = true;
                break;
            case SDL_KEYUP:
                keys_current[event.key.keysym.scancode] = false;
                break;
            default:
                break;
        }
    }
    return !quit_requested;
}

bool Window::IsKeyPressed(SDL_Scancode key) const {
    return keys_current[key];
}
