// Host loop: polls input, then drives Root::update and Root::draw once per frame.
#pragma once

#include <string>

#include "ApplicationListener.h"
#include "EngineConfig.h"
#include "Time.h"
#include "../input/InputState.h"
#include "../platform/Window.h"
#include "../render/RenderDevice.h"
#include "../scene/Root.h"

namespace Sprig {

class Application {
public:
    // Upper bound on the delta handed to Root::update by run().
    static constexpr double kMaxFrameDelta = 0.25;

    Application(ApplicationListener& listener, WindowPtr window, EngineConfig config = {});
    ~Application();

    bool initialize();
    void run();
    // Runs a single frame with a fixed delta; used by headless runs and tests.
    void step(double deltaSeconds);
    void requestQuit(const std::string& reason);

    bool running() const { return running_; }
    Root& root() { return root_; }
    const InputState& input() const { return input_; }
    Window& window() { return *window_; }
    RenderDevice& renderer() { return *renderDevice_; }
    const EngineConfig& config() const { return config_; }
    const TimeStep& time() const { return timeStep_; }

private:
    ApplicationListener& listener_;
    WindowPtr window_;
    EngineConfig config_;
    bool running_{false};
    bool initialized_{false};
    TimeStep timeStep_{};
    InputState input_{};
    RenderDevicePtr renderDevice_;
    Root root_;
};

}  // namespace Sprig
