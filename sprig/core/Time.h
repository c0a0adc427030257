// Time structures used by the main loop.
#pragma once

namespace Sprig {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
    unsigned long long frame{0};
};

}  // namespace Sprig
