#include "local_transport.hpp"

namespace voxrelay::transport {

// ============================================================================
// LocalClientTransport
// ============================================================================

void LocalClientTransport::send(std::span<const std::uint8_t> data) {
    if (!open_) return;

    if (auto srv = server_.lock()) {
        srv->push_event({LocalServerTransport::EventType::Receive, id_,
                         std::vector<std::uint8_t>(data.begin(), data.end())});
    }
}

bool LocalClientTransport::try_recv(std::vector<std::uint8_t>& out) {
    std::lock_guard lock(mutex_);
    if (incoming_.empty()) return false;
    out = std::move(incoming_.front());
    incoming_.pop();
    return true;
}

std::size_t LocalClientTransport::pending() const {
    std::lock_guard lock(mutex_);
    return incoming_.size();
}

void LocalClientTransport::close() {
    if (!open_.exchange(false)) return;

    if (auto srv = server_.lock()) {
        srv->push_event({LocalServerTransport::EventType::Disconnect, id_, {}});
    }
}

void LocalClientTransport::drop() {
    open_ = false;
}

void LocalClientTransport::receive(std::vector<std::uint8_t> data) {
    std::lock_guard lock(mutex_);
    incoming_.push(std::move(data));
}

// ============================================================================
// LocalServerTransport
// ============================================================================

std::shared_ptr<LocalServerTransport> LocalServerTransport::create() {
    return std::shared_ptr<LocalServerTransport>(new LocalServerTransport());
}

std::shared_ptr<LocalClientTransport> LocalServerTransport::connect_client() {
    std::shared_ptr<LocalClientTransport> client;
    {
        std::lock_guard lock(mutex_);
        ConnectionId id = nextConnectionId_++;
        client = std::shared_ptr<LocalClientTransport>(
            new LocalClientTransport(id, weak_from_this()));
        clients_[id] = client;
        events_.push({EventType::Connect, id, {}});
    }
    return client;
}

bool LocalServerTransport::send(ConnectionId id, std::span<const std::uint8_t> data) {
    auto client = find_client(id);
    if (!client || !client->is_connected()) return false;

    client->receive(std::vector<std::uint8_t>(data.begin(), data.end()));
    return true;
}

void LocalServerTransport::poll(std::uint32_t /*timeoutMs*/) {
    std::queue<Event> events;
    {
        std::lock_guard lock(mutex_);
        std::swap(events, events_);
    }

    while (!events.empty()) {
        Event& ev = events.front();
        switch (ev.type) {
            case EventType::Connect:
                if (find_client(ev.id) && onConnect) {
                    onConnect(ev.id);
                }
                break;

            case EventType::Receive:
                if (find_client(ev.id) && onReceive) {
                    onReceive(ev.id, ev.data);
                }
                break;

            case EventType::Disconnect: {
                bool known = false;
                {
                    std::lock_guard lock(mutex_);
                    known = clients_.erase(ev.id) > 0;
                }
                if (known && onDisconnect) {
                    onDisconnect(ev.id);
                }
                break;
            }
        }
        events.pop();
    }
}

void LocalServerTransport::disconnect(ConnectionId id) {
    std::shared_ptr<LocalClientTransport> client;
    {
        std::lock_guard lock(mutex_);
        auto it = clients_.find(id);
        if (it == clients_.end()) return;
        client = std::move(it->second);
        clients_.erase(it);
    }

    // Data already delivered to the inbox stays readable
    client->open_ = false;

    if (onDisconnect) {
        onDisconnect(id);
    }
}

bool LocalServerTransport::is_open(ConnectionId id) const {
    auto client = find_client(id);
    return client && client->is_connected();
}

void LocalServerTransport::push_event(Event event) {
    std::lock_guard lock(mutex_);
    events_.push(std::move(event));
}

std::shared_ptr<LocalClientTransport> LocalServerTransport::find_client(ConnectionId id) const {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(id);
    return (it != clients_.end()) ? it->second : nullptr;
}

} // namespace voxrelay::transport
