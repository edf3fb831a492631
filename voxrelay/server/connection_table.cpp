#include "connection_table.hpp"

#include <algorithm>

namespace voxrelay::server {

Connection& ConnectionTable::add(ConnectionId id) {
    Connection& conn = connections_[id];
    conn = Connection{};
    conn.id = id;
    return conn;
}

Connection* ConnectionTable::find(ConnectionId id) {
    auto it = connections_.find(id);
    return (it != connections_.end()) ? &it->second : nullptr;
}

const Connection* ConnectionTable::find(ConnectionId id) const {
    auto it = connections_.find(id);
    return (it != connections_.end()) ? &it->second : nullptr;
}

bool ConnectionTable::remove(ConnectionId id) {
    return connections_.erase(id) > 0;
}

std::vector<ConnectionId> ConnectionTable::ids() const {
    std::vector<ConnectionId> out;
    out.reserve(connections_.size());
    for (const auto& [id, conn] : connections_) {
        out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<ConnectionId> ConnectionTable::admins() const {
    std::vector<ConnectionId> out;
    for (const auto& [id, conn] : connections_) {
        if (conn.admin) {
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace voxrelay::server
