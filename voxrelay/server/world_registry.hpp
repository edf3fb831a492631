#pragma once

#include <voxrelay/core/types.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace voxrelay::server {

// ============================================================================
// World
// ============================================================================

struct World {
    std::string name;
    Vec3 spawn;

    // Only ids that are present in the SessionRegistry
    std::unordered_set<PlayerId> members;
};

// ============================================================================
// WorldRegistry - World name -> spawn point and membership
// ============================================================================

class WorldRegistry {
public:
    /// Register a world. The first world added becomes the default world.
    /// @return false if a world with that name already exists.
    bool add_world(const std::string& name, Vec3 spawn);

    World* find(const std::string& name);
    const World* find(const std::string& name) const;

    /// Members of a world; empty for an unknown world.
    const std::unordered_set<PlayerId>& members(const std::string& name) const;

    bool add_member(const std::string& world, const PlayerId& id);
    bool remove_member(const std::string& world, const PlayerId& id);

    /// Name of the world new players join (empty if none registered).
    const std::string& default_world() const { return defaultWorld_; }

    std::vector<std::string> names() const;
    std::size_t size() const { return worlds_.size(); }

    /// Drop all memberships; worlds themselves stay registered.
    void clear_members();

private:
    std::unordered_map<std::string, World> worlds_;
    std::string defaultWorld_;
};

} // namespace voxrelay::server
