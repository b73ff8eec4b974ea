#include "fineinput/mod_keys.hpp"
#include "fineinput/input_snapshot.hpp"

#include <bit>

namespace fineinput {

namespace {

struct ModKeyEntry {
    uint8_t bit;
    KeyCode left;
    KeyCode right;
    const char* name;
};

// Fixed display and iteration order
constexpr ModKeyEntry MOD_KEY_TABLE[] = {
    {ModKeys::CONTROL_BIT, KeyCode::ControlLeft, KeyCode::ControlRight, "Ctrl"},
    {ModKeys::SHIFT_BIT,   KeyCode::ShiftLeft,   KeyCode::ShiftRight,   "Shift"},
    {ModKeys::ALT_BIT,     KeyCode::AltLeft,     KeyCode::AltRight,     "Alt"},
    {ModKeys::SUPER_BIT,   KeyCode::SuperLeft,   KeyCode::SuperRight,   "Super"},
};

}  // namespace

ModKeys ModKeys::pressed(const InputSnapshot& snapshot) {
    ModKeys result;
    for (const auto& entry : MOD_KEY_TABLE) {
        if (snapshot.keyPressed(entry.left) || snapshot.keyPressed(entry.right)) {
            result |= ModKeys(entry.bit);
        }
    }
    return result;
}

ModKeys ModKeys::fromKey(KeyCode key) {
    for (const auto& entry : MOD_KEY_TABLE) {
        if (key == entry.left || key == entry.right) {
            return ModKeys(entry.bit);
        }
    }
    return ModKeys();
}

int ModKeys::count() const {
    return std::popcount(bits_);
}

std::vector<std::array<KeyCode, 2>> ModKeys::keys() const {
    std::vector<std::array<KeyCode, 2>> result;
    for (const auto& entry : MOD_KEY_TABLE) {
        if (bits_ & entry.bit) {
            result.push_back({entry.left, entry.right});
        }
    }
    return result;
}

std::string ModKeys::toString() const {
    std::string result;
    for (const auto& entry : MOD_KEY_TABLE) {
        if (!(bits_ & entry.bit)) {
            continue;
        }
        if (!result.empty()) {
            result += " + ";
        }
        result += entry.name;
    }
    return result;
}

}  // namespace fineinput
