#pragma once

/**
 * @file config.hpp
 * @brief Evaluator defaults loaded from a config file
 *
 * Config keys (all optional):
 *   input.actuation_threshold: 0.5
 *   input.hold_time: 0.5
 *   input.tap_release_time: 0.2
 *   input.pulse_interval: 0.1
 *   input.dead_zone.lower: 0.2
 *   input.dead_zone.upper: 1.0
 *   input.debug_logging: false
 */

#include <filesystem>
#include <optional>

namespace fineinput {

class ConfigFile;

struct InputSettings {
    float actuationThreshold = 0.5f;
    float holdTime = 0.5f;
    float tapReleaseTime = 0.2f;
    float pulseInterval = 0.1f;
    float deadZoneLower = 0.2f;
    float deadZoneUpper = 1.0f;
    bool debugLogging = false;

    /// Read settings from a parsed file. Missing keys keep their defaults;
    /// keys with a value of the wrong type keep the default and log a warning.
    [[nodiscard]] static InputSettings fromConfig(const ConfigFile& config);

    /// Load from a path; nullopt if the file can't be read
    [[nodiscard]] static std::optional<InputSettings> load(const std::filesystem::path& path);

    /// Write every setting into the file (existing lines are updated in place)
    void writeTo(ConfigFile& config) const;

    /// Apply process-wide effects (debug logging flag)
    void apply() const;
};

}  // namespace fineinput
