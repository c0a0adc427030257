#include "Application.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include "Logger.h"

namespace Sprig {

Application::Application(ApplicationListener& listener, WindowPtr window, EngineConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {
    Logger::setMinLevel(config_.logLevel);
    root_.setBackgroundColour(config_.backgroundColour);
}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_.window)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    if (!running_) {
        logError("Application listener failed to initialize.");
    }
    return running_;
}

void Application::step(double deltaSeconds) {
    timeStep_.deltaSeconds = deltaSeconds;
    timeStep_.elapsedSeconds += deltaSeconds;
    ++timeStep_.frame;

    window_->pollEvents(*this, input_);
    root_.update(static_cast<float>(deltaSeconds));
    root_.draw(*renderDevice_);
    renderDevice_->present();
    input_.nextFrame();
}

void Application::run() {
    using Clock = std::chrono::steady_clock;
    using Seconds = std::chrono::duration<double>;
    const Seconds frameBudget{config_.targetFps > 0.0 ? 1.0 / config_.targetFps : 0.0};

    auto frameStart = Clock::now();
    while (running_ && window_->isOpen()) {
        const auto now = Clock::now();
        // A stall (debugger, window drag) must not teleport sprites or burn lifetimes in one tick.
        const double dt = std::min(Seconds(now - frameStart).count(), kMaxFrameDelta);
        frameStart = now;

        step(dt);

        const auto busy = Clock::now() - frameStart;
        if (busy < frameBudget) {
            std::this_thread::sleep_for(frameBudget - busy);
        }
    }

    logInfo("Main loop stopped after " + std::to_string(timeStep_.frame) + " frames (" +
            std::to_string(timeStep_.elapsedSeconds) + " s simulated).");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Sprig
