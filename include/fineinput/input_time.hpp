#pragma once

namespace fineinput {

/// Frame timing passed to modifiers, conditions and actions
struct InputTime {
    float delta = 0.0f;     ///< Seconds since the previous frame
    double elapsed = 0.0;   ///< Seconds since the first frame

    /// Timing for the next frame after advancing by dt seconds
    [[nodiscard]] InputTime advanced(float dt) const {
        return InputTime{dt, elapsed + static_cast<double>(dt)};
    }
};

}  // namespace fineinput
