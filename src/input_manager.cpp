#include "fineinput/input_manager.hpp"
#include "fineinput/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fineinput {

InputManager::InputManager(InputSettings settings)
    : settings_(settings)
{
}

InputContext& InputManager::addContext(std::string name, bool active) {
    if (name.empty()) {
        throw std::invalid_argument("Input context name must not be empty");
    }
    if (findEntry(name)) {
        throw std::invalid_argument("Input context `" + name + "` is already registered");
    }

    log::debug("Adding input context `" + name + "`");
    entries_.push_back(Entry{std::make_unique<InputContext>(std::move(name), settings_), active});
    return *entries_.back().context;
}

bool InputManager::removeContext(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.context->name() == name; });
    if (it == entries_.end()) {
        return false;
    }
    log::debug("Removing input context `" + std::string(name) + "`");
    entries_.erase(it);
    return true;
}

InputManager::Entry* InputManager::findEntry(std::string_view name) {
    for (auto& entry : entries_) {
        if (entry.context->name() == name) {
            return &entry;
        }
    }
    return nullptr;
}

const InputManager::Entry* InputManager::findEntry(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.context->name() == name) {
            return &entry;
        }
    }
    return nullptr;
}

InputContext* InputManager::context(std::string_view name) {
    Entry* entry = findEntry(name);
    return entry ? entry->context.get() : nullptr;
}

const InputContext* InputManager::context(std::string_view name) const {
    const Entry* entry = findEntry(name);
    return entry ? entry->context.get() : nullptr;
}

bool InputManager::setActive(std::string_view name, bool active) {
    Entry* entry = findEntry(name);
    if (!entry) {
        return false;
    }
    if (entry->active == active) {
        return true;
    }

    entry->active = active;
    // Reset also re-arms requireReset for the next activation
    entry->context->resetActions();
    log::debug("Input context `" + std::string(name) + "` " + (active ? "activated" : "deactivated"));
    return true;
}

bool InputManager::isActive(std::string_view name) const {
    const Entry* entry = findEntry(name);
    return entry && entry->active;
}

void InputManager::update(const InputSnapshot& snapshot, float deltaSeconds) {
    time_ = time_.advanced(deltaSeconds);

    InputReader reader(snapshot);
    for (auto& entry : entries_) {
        if (entry.active) {
            entry.context->update(reader, time_);
        }
    }
}

}  // namespace fineinput
