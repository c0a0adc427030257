// Game-side lifecycle interface driven by Application.
#pragma once

namespace Sprig {

class Application;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    // Builds the scene. Returning false aborts startup.
    virtual bool onInitialize(Application& app) = 0;
    virtual void onShutdown() = 0;
};

}  // namespace Sprig
