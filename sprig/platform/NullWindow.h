// Headless window for tests and CI: no surface, closes itself after frameBudget polls.
#pragma once

#include <string>

#include "Window.h"

namespace Sprig {

class NullWindow final : public Window {
public:
    explicit NullWindow(unsigned long long frameBudget = 1) : frameBudget_(frameBudget) {}

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, InputState& input) override;
    void setTitle(const std::string& title) override { title_ = title; }
    bool isOpen() const override { return isOpen_; }

    const std::string& title() const { return title_; }
    unsigned long long framesPolled() const { return framesPolled_; }

private:
    unsigned long long frameBudget_;
    unsigned long long framesPolled_{0};
    std::string title_;
    bool isOpen_{false};
};

}  // namespace Sprig
