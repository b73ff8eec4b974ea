#include "fineinput/action_map.hpp"

namespace fineinput {

void ActionMap::insert(const Action& action) {
    auto [it, inserted] = index_.try_emplace(action.name(), ordered_.size());
    if (inserted) {
        ordered_.push_back(&action);
    } else {
        ordered_[it->second] = &action;
    }
}

const Action* ActionMap::find(std::string_view name) const {
    auto it = index_.find(name);
    return it != index_.end() ? ordered_[it->second] : nullptr;
}

void ActionMap::clear() {
    ordered_.clear();
    index_.clear();
}

}  // namespace fineinput
