#include "world_registry.hpp"

#include <algorithm>

namespace voxrelay::server {

namespace {
const std::unordered_set<PlayerId> kNoMembers;
}

bool WorldRegistry::add_world(const std::string& name, Vec3 spawn) {
    auto [it, inserted] = worlds_.try_emplace(name);
    if (!inserted) return false;

    it->second.name = name;
    it->second.spawn = spawn;

    if (defaultWorld_.empty()) {
        defaultWorld_ = name;
    }
    return true;
}

World* WorldRegistry::find(const std::string& name) {
    auto it = worlds_.find(name);
    return (it != worlds_.end()) ? &it->second : nullptr;
}

const World* WorldRegistry::find(const std::string& name) const {
    auto it = worlds_.find(name);
    return (it != worlds_.end()) ? &it->second : nullptr;
}

const std::unordered_set<PlayerId>& WorldRegistry::members(const std::string& name) const {
    const World* world = find(name);
    return world ? world->members : kNoMembers;
}

bool WorldRegistry::add_member(const std::string& world, const PlayerId& id) {
    World* w = find(world);
    if (!w) return false;
    return w->members.insert(id).second;
}

bool WorldRegistry::remove_member(const std::string& world, const PlayerId& id) {
    World* w = find(world);
    if (!w) return false;
    return w->members.erase(id) > 0;
}

std::vector<std::string> WorldRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(worlds_.size());
    for (const auto& [name, world] : worlds_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void WorldRegistry::clear_members() {
    for (auto& [name, world] : worlds_) {
        world.members.clear();
    }
}

} // namespace voxrelay::server
