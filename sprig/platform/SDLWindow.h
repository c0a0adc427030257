// SDL2 window and renderer pair; also brings SDL_image up for texture loading.
#pragma once

#include <SDL.h>

#include "Window.h"

namespace Sprig {

class SDLWindow final : public Window {
public:
    SDLWindow() = default;
    ~SDLWindow() override;

    SDLWindow(const SDLWindow&) = delete;
    SDLWindow& operator=(const SDLWindow&) = delete;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, InputState& input) override;
    void setTitle(const std::string& title) override;
    bool isOpen() const override { return isOpen_; }

private:
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};  // handed to SDLRenderDevice, destroyed here
    bool imageReady_{false};
    bool isOpen_{false};
};

}  // namespace Sprig
