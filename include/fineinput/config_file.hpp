#pragma once

/**
 * @file config_file.hpp
 * @brief "key: value" config file parsing with comment preservation
 *
 * Format:
 *   # comment
 *   input.actuation_threshold: 0.5
 *   input.debug_logging: false
 *
 * Values are typed on load: true/false/yes/no are bools, decimal or 0x hex
 * integers are ints, other numbers are floats, anything else is a string.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace fineinput {

using ConfigValue = std::variant<bool, int64_t, double, std::string>;

// ============================================================================
// ConfigFile - A configuration file that preserves structure when modified
// ============================================================================
//
// Comments, blank lines and key order survive a load/set/save cycle. When
// a value is modified only that line changes; new keys are appended.
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse from in-memory text (no associated path)
    void parse(std::string_view content);

    // Save to the loaded path / a different path (creates directories)
    [[nodiscard]] bool save();
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    /// Raw typed value, nullopt if the key is absent or has no value
    [[nodiscard]] std::optional<ConfigValue> value(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;

    /// Ints are widened to double
    [[nodiscard]] double getFloat(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, double value);
    void set(std::string_view key, bool value);

    // Remove a key (comments out the line rather than deleting)
    void remove(std::string_view key);

    // Header comment written when the file has no content yet
    void setHeader(std::string_view header) { header_ = header; }

    /// Text as it would be written by save()
    [[nodiscard]] std::string toString() const;

private:
    struct Line {
        std::string content;      // Original line content
        std::string key;          // Key if this is a key-value line
        size_t valueStart = 0;    // Position where value starts (after ": ")
        bool isKeyValue = false;
    };

    [[nodiscard]] static ConfigValue parseValue(std::string_view text);
    [[nodiscard]] static std::string formatValue(const ConfigValue& value);

    void setImpl(std::string_view key, ConfigValue value);
    [[nodiscard]] int findLine(std::string_view key) const;

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;
    std::unordered_map<std::string, ConfigValue> values_;
    std::string header_;
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace fineinput
