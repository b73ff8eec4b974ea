#include "fineinput/config.hpp"
#include "fineinput/config_file.hpp"
#include "fineinput/log.hpp"

#include <string>

namespace fineinput {

namespace {

constexpr const char* KEY_ACTUATION = "input.actuation_threshold";
constexpr const char* KEY_HOLD_TIME = "input.hold_time";
constexpr const char* KEY_TAP_RELEASE = "input.tap_release_time";
constexpr const char* KEY_PULSE_INTERVAL = "input.pulse_interval";
constexpr const char* KEY_DEAD_ZONE_LOWER = "input.dead_zone.lower";
constexpr const char* KEY_DEAD_ZONE_UPPER = "input.dead_zone.upper";
constexpr const char* KEY_DEBUG_LOGGING = "input.debug_logging";

void readFloat(const ConfigFile& config, const char* key, float& out) {
    auto value = config.value(key);
    if (!value) {
        return;
    }
    if (auto* d = std::get_if<double>(&*value)) {
        out = static_cast<float>(*d);
    } else if (auto* i = std::get_if<int64_t>(&*value)) {
        out = static_cast<float>(*i);
    } else {
        log::warn(std::string("Config key ") + key + " expects a number, keeping default");
    }
}

void readBool(const ConfigFile& config, const char* key, bool& out) {
    auto value = config.value(key);
    if (!value) {
        return;
    }
    if (auto* b = std::get_if<bool>(&*value)) {
        out = *b;
    } else {
        log::warn(std::string("Config key ") + key + " expects true/false, keeping default");
    }
}

}  // namespace

InputSettings InputSettings::fromConfig(const ConfigFile& config) {
    InputSettings settings;
    readFloat(config, KEY_ACTUATION, settings.actuationThreshold);
    readFloat(config, KEY_HOLD_TIME, settings.holdTime);
    readFloat(config, KEY_TAP_RELEASE, settings.tapReleaseTime);
    readFloat(config, KEY_PULSE_INTERVAL, settings.pulseInterval);
    readFloat(config, KEY_DEAD_ZONE_LOWER, settings.deadZoneLower);
    readFloat(config, KEY_DEAD_ZONE_UPPER, settings.deadZoneUpper);
    readBool(config, KEY_DEBUG_LOGGING, settings.debugLogging);
    return settings;
}

std::optional<InputSettings> InputSettings::load(const std::filesystem::path& path) {
    ConfigFile config;
    if (!config.load(path)) {
        log::warn("Can't read input config " + path.string());
        return std::nullopt;
    }
    return fromConfig(config);
}

void InputSettings::writeTo(ConfigFile& config) const {
    config.set(KEY_ACTUATION, static_cast<double>(actuationThreshold));
    config.set(KEY_HOLD_TIME, static_cast<double>(holdTime));
    config.set(KEY_TAP_RELEASE, static_cast<double>(tapReleaseTime));
    config.set(KEY_PULSE_INTERVAL, static_cast<double>(pulseInterval));
    config.set(KEY_DEAD_ZONE_LOWER, static_cast<double>(deadZoneLower));
    config.set(KEY_DEAD_ZONE_UPPER, static_cast<double>(deadZoneUpper));
    config.set(KEY_DEBUG_LOGGING, debugLogging);
}

void InputSettings::apply() const {
    log::setDebugEnabled(debugLogging);
}

}  // namespace fineinput
