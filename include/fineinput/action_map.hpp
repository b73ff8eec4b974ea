#pragma once

/**
 * @file action_map.hpp
 * @brief Declaration-ordered view of the actions evaluated so far in a pass
 *
 * Built incrementally while a context evaluates its bindings, so a lookup
 * only sees actions declared (and evaluated) before the caller. Entries are
 * non-owning; the owning bindings must outlive the map's use.
 */

#include "fineinput/action.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fineinput {

class ActionMap {
public:
    /// Add (or replace) an action under its name
    void insert(const Action& action);

    /// Action by name, nullptr if not present
    [[nodiscard]] const Action* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }
    [[nodiscard]] size_t size() const { return ordered_.size(); }
    [[nodiscard]] bool empty() const { return ordered_.empty(); }

    void clear();

    /// Actions in insertion order
    [[nodiscard]] const std::vector<const Action*>& actions() const { return ordered_; }

private:
    // Lets find() take a string_view without building a std::string
    struct NameHash {
        using is_transparent = void;
        size_t operator()(std::string_view name) const { return std::hash<std::string_view>{}(name); }
    };

    std::vector<const Action*> ordered_;
    std::unordered_map<std::string, size_t, NameHash, std::equal_to<>> index_;
};

}  // namespace fineinput
