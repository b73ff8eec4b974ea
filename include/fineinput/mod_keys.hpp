#pragma once

/**
 * @file mod_keys.hpp
 * @brief Keyboard modifier set (Control, Shift, Alt, Super)
 *
 * Each logical modifier covers both its left and right physical key.
 * Plain value type; no process-wide key state.
 */

#include "fineinput/input_codes.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace fineinput {

class InputSnapshot;

class ModKeys {
public:
    static constexpr uint8_t CONTROL_BIT = 0b0001;
    static constexpr uint8_t SHIFT_BIT   = 0b0010;
    static constexpr uint8_t ALT_BIT     = 0b0100;
    static constexpr uint8_t SUPER_BIT   = 0b1000;
    static constexpr uint8_t ALL_BITS    = 0b1111;

    constexpr ModKeys() = default;

    [[nodiscard]] static constexpr ModKeys empty() { return ModKeys(0); }
    [[nodiscard]] static constexpr ModKeys all() { return ModKeys(ALL_BITS); }
    [[nodiscard]] static constexpr ModKeys control() { return ModKeys(CONTROL_BIT); }
    [[nodiscard]] static constexpr ModKeys shift() { return ModKeys(SHIFT_BIT); }
    [[nodiscard]] static constexpr ModKeys alt() { return ModKeys(ALT_BIT); }
    [[nodiscard]] static constexpr ModKeys super() { return ModKeys(SUPER_BIT); }

    /// Build from raw bits; bits outside ALL_BITS are dropped
    [[nodiscard]] static constexpr ModKeys fromBits(uint8_t bits) {
        return ModKeys(static_cast<uint8_t>(bits & ALL_BITS));
    }

    /// Modifiers currently held in the snapshot (either key of a pair counts)
    [[nodiscard]] static ModKeys pressed(const InputSnapshot& snapshot);

    /// Logical modifier for a physical key, empty if the key is not a modifier
    [[nodiscard]] static ModKeys fromKey(KeyCode key);

    [[nodiscard]] constexpr uint8_t bits() const { return bits_; }
    [[nodiscard]] constexpr bool isEmpty() const { return bits_ == 0; }
    [[nodiscard]] constexpr bool contains(ModKeys other) const {
        return (bits_ & other.bits_) == other.bits_;
    }
    [[nodiscard]] constexpr bool intersects(ModKeys other) const {
        return (bits_ & other.bits_) != 0;
    }

    /// Number of set modifiers
    [[nodiscard]] int count() const;

    /// Left/right key pairs for the set bits, in Control, Shift, Alt, Super order
    [[nodiscard]] std::vector<std::array<KeyCode, 2>> keys() const;

    /// "Ctrl + Shift + Alt + Super" order; empty set renders as ""
    [[nodiscard]] std::string toString() const;

    constexpr ModKeys operator|(ModKeys o) const { return ModKeys(static_cast<uint8_t>(bits_ | o.bits_)); }
    constexpr ModKeys operator&(ModKeys o) const { return ModKeys(static_cast<uint8_t>(bits_ & o.bits_)); }
    constexpr ModKeys operator^(ModKeys o) const { return ModKeys(static_cast<uint8_t>(bits_ ^ o.bits_)); }
    constexpr ModKeys operator~() const { return ModKeys(static_cast<uint8_t>(~bits_ & ALL_BITS)); }
    constexpr ModKeys& operator|=(ModKeys o) { bits_ = static_cast<uint8_t>(bits_ | o.bits_); return *this; }
    constexpr ModKeys& operator&=(ModKeys o) { bits_ = static_cast<uint8_t>(bits_ & o.bits_); return *this; }

    constexpr bool operator==(const ModKeys&) const = default;

private:
    constexpr explicit ModKeys(uint8_t bits) : bits_(bits) {}

    uint8_t bits_ = 0;
};

}  // namespace fineinput

template<>
struct std::hash<fineinput::ModKeys> {
    size_t operator()(const fineinput::ModKeys& keys) const noexcept {
        return std::hash<uint8_t>{}(keys.bits());
    }
};
