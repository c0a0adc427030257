#include "NullWindow.h"

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Sprig {

bool NullWindow::initialize(const WindowConfig& config) {
    title_ = config.title;
    isOpen_ = frameBudget_ > 0;
    logInfo("Headless run of '" + title_ + "' for " + std::to_string(frameBudget_) + " frames.");
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() { return std::make_unique<NullRenderDevice>(); }

void NullWindow::pollEvents(Application& app, InputState& /*input*/) {
    if (!isOpen_) {
        return;
    }
    if (++framesPolled_ >= frameBudget_) {
        isOpen_ = false;
        app.requestQuit("frame budget spent");
    }
}

}  // namespace Sprig
