// Host window: owns the native surface, feeds input, hands out the render device.
#pragma once

#include <memory>
#include <string>

#include "../core/EngineConfig.h"

namespace Sprig {

class Application;
class InputState;
class RenderDevice;

class Window {
public:
    virtual ~Window() = default;

    virtual bool initialize(const WindowConfig& config) = 0;
    // Drains pending events into input; a close request ends the application loop.
    virtual void pollEvents(Application& app, InputState& input) = 0;
    virtual std::unique_ptr<RenderDevice> createRenderDevice() = 0;
    virtual void setTitle(const std::string& title) = 0;
    virtual bool isOpen() const = 0;
};

using WindowPtr = std::unique_ptr<Window>;

}  // namespace Sprig
