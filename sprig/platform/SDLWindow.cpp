#include "SDLWindow.h"

#include <array>
#include <optional>
#include <utility>

#include <SDL_image.h>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../input/InputState.h"
#include "SDLRenderDevice.h"

namespace Sprig {

namespace {
constexpr std::array<std::pair<SDL_Keycode, InputKey>, 11> kKeyMap{{
    {SDLK_LEFT, InputKey::Left},
    {SDLK_a, InputKey::Left},
    {SDLK_RIGHT, InputKey::Right},
    {SDLK_d, InputKey::Right},
    {SDLK_UP, InputKey::Up},
    {SDLK_w, InputKey::Up},
    {SDLK_DOWN, InputKey::Down},
    {SDLK_s, InputKey::Down},
    {SDLK_SPACE, InputKey::Fire},
    {SDLK_p, InputKey::Pause},
    {SDLK_PAUSE, InputKey::Pause},
}};

std::optional<InputKey> lookupKey(SDL_Keycode sym) {
    for (const auto& [code, key] : kKeyMap) {
        if (code == sym) return key;
    }
    return std::nullopt;
}
}  // namespace

SDLWindow::~SDLWindow() {
    if (renderer_) SDL_DestroyRenderer(renderer_);
    if (window_) SDL_DestroyWindow(window_);
    if (imageReady_) IMG_Quit();
    SDL_Quit();
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }

    // PNG is what the asset manifest ships; BMP stays available through SDL itself.
    imageReady_ = (IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG) != 0;
    if (!imageReady_) {
        logWarn(std::string("IMG_Init failed, PNG sprites unavailable: ") + IMG_GetError());
    }

    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, config.width,
                               config.height, SDL_WINDOW_SHOWN);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    Uint32 flags = SDL_RENDERER_ACCELERATED;
    if (config.vsync) flags |= SDL_RENDERER_PRESENTVSYNC;
    renderer_ = SDL_CreateRenderer(window_, -1, flags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }
    SDL_RenderSetLogicalSize(renderer_, config.width, config.height);

    isOpen_ = true;
    logInfo("SDLWindow " + std::to_string(config.width) + "x" + std::to_string(config.height) + " ready.");
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::setTitle(const std::string& title) {
    if (window_) SDL_SetWindowTitle(window_, title.c_str());
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                isOpen_ = false;
                app.requestQuit("window closed");
                break;
            case SDL_WINDOWEVENT:
                if (evt.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                    input.releaseAll();
                }
                break;
            case SDL_KEYDOWN:
                if (evt.key.keysym.sym == SDLK_ESCAPE) {
                    isOpen_ = false;
                    app.requestQuit("escape pressed");
                } else if (auto key = lookupKey(evt.key.keysym.sym)) {
                    if (!evt.key.repeat) input.markPressed(*key);
                    input.setKeyDown(*key, true);
                }
                break;
            case SDL_KEYUP:
                if (auto key = lookupKey(evt.key.keysym.sym)) {
                    input.setKeyDown(*key, false);
                }
                break;
            default:
                break;
        }
    }
}

}  // namespace Sprig
