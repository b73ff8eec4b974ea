#pragma once

/**
 * @file input_manager.hpp
 * @brief Owns input contexts and drives one evaluation pass per frame
 *
 * Contexts are evaluated in registration order and share one InputReader,
 * so input consumed by an earlier context (e.g. "menu") is hidden from
 * later ones (e.g. "gameplay"). Register the context that should win first.
 *
 * Deactivating a context resets its actions to None. Reactivating it arms
 * requireReset on bindings that ask for it, so a key still held from before
 * doesn't fire the action again.
 */

#include "fineinput/config.hpp"
#include "fineinput/input_context.hpp"
#include "fineinput/input_snapshot.hpp"
#include "fineinput/input_time.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fineinput {

class InputManager {
public:
    explicit InputManager(InputSettings settings = {});

    InputManager(const InputManager&) = delete;
    InputManager& operator=(const InputManager&) = delete;

    [[nodiscard]] const InputSettings& settings() const { return settings_; }

    /// Register a new context (evaluated after those already registered).
    /// The context inherits the manager's settings.
    /// @throws std::invalid_argument if the name is empty or already used
    InputContext& addContext(std::string name, bool active = true);

    /// Destroy a context and its bindings; false if unknown
    bool removeContext(std::string_view name);

    [[nodiscard]] InputContext* context(std::string_view name);
    [[nodiscard]] const InputContext* context(std::string_view name) const;
    [[nodiscard]] size_t contextCount() const { return entries_.size(); }

    /// Enable or disable a context; false if unknown
    bool setActive(std::string_view name, bool active);
    [[nodiscard]] bool isActive(std::string_view name) const;

    /// Evaluate every active context against this frame's snapshot
    void update(const InputSnapshot& snapshot, float deltaSeconds);

    /// Timing of the last update
    [[nodiscard]] const InputTime& time() const { return time_; }

private:
    struct Entry {
        std::unique_ptr<InputContext> context;
        bool active = true;
    };

    [[nodiscard]] Entry* findEntry(std::string_view name);
    [[nodiscard]] const Entry* findEntry(std::string_view name) const;

    InputSettings settings_;
    std::vector<Entry> entries_;
    InputTime time_;
};

}  // namespace fineinput
