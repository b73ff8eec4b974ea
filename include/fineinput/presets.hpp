#pragma once

/**
 * @file presets.hpp
 * @brief Composite bindings that map several buttons or axes to one vector
 *
 * Each preset expands to per-input bindings whose modifiers turn a press
 * (converted to the action's dimension, so it arrives as +X) into a unit
 * direction:
 *
 *   Cardinal       north +Y, east +X, south -Y, west -X
 *   Bidirectional  positive +X, negative -X
 *   Axial          x axis as X, y axis as Y
 *   Spatial        forward -Z, backward +Z, left -X, right +X, up +Y, down -Y
 *   Ordinal        Cardinal plus diagonals (+-1, +-1)
 *
 * Bind the preset to an action of the matching dimension (Axis2D for
 * Cardinal/Axial/Ordinal, Axis3D for Spatial, Axis1D for Bidirectional).
 */

#include "fineinput/input_binding.hpp"

#include <vector>

namespace fineinput {

struct Cardinal {
    RawInput north;
    RawInput east;
    RawInput south;
    RawInput west;

    [[nodiscard]] static Cardinal wasdKeys();
    [[nodiscard]] static Cardinal arrowKeys();
    [[nodiscard]] static Cardinal dpadButtons();

    [[nodiscard]] std::vector<InputBinding> bindings() const;
};

struct Bidirectional {
    RawInput positive;
    RawInput negative;

    [[nodiscard]] std::vector<InputBinding> bindings() const;
};

struct Axial {
    RawInput x;
    RawInput y;

    [[nodiscard]] static Axial leftStick();
    [[nodiscard]] static Axial rightStick();

    [[nodiscard]] std::vector<InputBinding> bindings() const;
};

struct Spatial {
    RawInput forward;
    RawInput backward;
    RawInput left;
    RawInput right;
    RawInput up;
    RawInput down;

    /// WASD for the plane, Space up and Left Shift down
    [[nodiscard]] static Spatial wasdSpaceShift();

    [[nodiscard]] std::vector<InputBinding> bindings() const;
};

struct Ordinal {
    RawInput north;
    RawInput northEast;
    RawInput east;
    RawInput southEast;
    RawInput south;
    RawInput southWest;
    RawInput west;
    RawInput northWest;

    /// Numpad 8/9/6/3/2/1/4/7
    [[nodiscard]] static Ordinal numpadKeys();

    /// Vi-style k/u/l/n/j/b/h/y
    [[nodiscard]] static Ordinal hjklyubn();

    [[nodiscard]] std::vector<InputBinding> bindings() const;
};

}  // namespace fineinput
