#pragma once

#include "server_interface.hpp"
#include <voxrelay/transport/transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace voxrelay {

// ============================================================================
// RelayEngine - Runs an IServerApp with a fixed tick loop
// ============================================================================

class RelayEngine : public IServerServices {
public:
    struct Config {
        float tickRate = 30.0f;
        bool logging = true;
        LogLevel minLevel = LogLevel::Info;
    };

    RelayEngine();
    explicit RelayEngine(const Config& config);
    ~RelayEngine() override;

    /// Set the transport (must be called before run).
    void set_transport(std::shared_ptr<transport::IServerTransport> transport);

    /// Run the tick loop on the current thread (blocking) until stop().
    void run(IServerApp& app);

    /// Request shutdown (can be called from another thread).
    void stop();

    bool is_running() const { return running_; }

    /// Queue work for the loop thread; runs before the next app tick.
    void post(std::function<void()> task);

    // --- IServerServices implementation ---

    bool send(ConnectionId id, std::span<const std::uint8_t> data) override;
    void disconnect(ConnectionId id) override;
    bool is_open(ConnectionId id) const override;

    Tick current_tick() const override { return tick_; }
    float tick_rate() const override { return config_.tickRate; }
    std::uint64_t uptime_seconds() const override;

    void log(LogLevel level, std::string_view msg) override;

private:
    void tick_loop(IServerApp& app);
    void run_posted();

    Config config_;
    float tickDt_;

    std::shared_ptr<transport::IServerTransport> transport_;

    std::atomic<bool> running_{false};
    std::atomic<Tick> tick_{0};
    std::chrono::steady_clock::time_point startedAt_{};

    std::mutex postMutex_;
    std::vector<std::function<void()>> posted_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline RelayEngine::RelayEngine()
    : RelayEngine(Config{})
{
}

inline RelayEngine::RelayEngine(const Config& config)
    : config_(config)
    , tickDt_(1.0f / (config.tickRate > 0.0f ? config.tickRate : 30.0f))
{
    if (config_.tickRate <= 0.0f) {
        config_.tickRate = 30.0f;
    }
}

inline RelayEngine::~RelayEngine() {
    stop();
}

inline void RelayEngine::set_transport(std::shared_ptr<transport::IServerTransport> transport) {
    transport_ = std::move(transport);
}

inline void RelayEngine::run(IServerApp& app) {
    if (!transport_) {
        log(LogLevel::Error, "No transport set");
        return;
    }

    running_ = true;
    startedAt_ = std::chrono::steady_clock::now();

    // Setup transport callbacks
    transport_->onConnect = [this, &app](ConnectionId id) {
        log(LogLevel::Debug, "Connection opened: " + std::to_string(id));
        app.on_connect(id);
    };

    transport_->onDisconnect = [this, &app](ConnectionId id) {
        log(LogLevel::Debug, "Connection closed: " + std::to_string(id));
        app.on_disconnect(id);
    };

    transport_->onReceive = [&app](ConnectionId id, std::span<const std::uint8_t> data) {
        app.on_message(id, data);
    };

    app.on_init(*this);
    log(LogLevel::Info, "Server started at " + std::to_string(static_cast<int>(config_.tickRate)) + " TPS");

    tick_loop(app);

    // Control requests that raced the stop still run
    run_posted();

    app.on_shutdown();

    transport_->onConnect = nullptr;
    transport_->onDisconnect = nullptr;
    transport_->onReceive = nullptr;

    log(LogLevel::Info, "Server stopped");
}

inline void RelayEngine::stop() {
    running_ = false;
}

inline void RelayEngine::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(postMutex_);
    posted_.push_back(std::move(task));
}

inline bool RelayEngine::send(ConnectionId id, std::span<const std::uint8_t> data) {
    return transport_ ? transport_->send(id, data) : false;
}

inline void RelayEngine::disconnect(ConnectionId id) {
    if (transport_) {
        transport_->disconnect(id);
    }
}

inline bool RelayEngine::is_open(ConnectionId id) const {
    return transport_ ? transport_->is_open(id) : false;
}

inline std::uint64_t RelayEngine::uptime_seconds() const {
    if (startedAt_ == std::chrono::steady_clock::time_point{}) return 0;

    auto elapsed = std::chrono::steady_clock::now() - startedAt_;
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

inline void RelayEngine::log(LogLevel level, std::string_view msg) {
    if (!config_.logging) return;
    if (level < config_.minLevel) return;

    const char* prefix = "";
    switch (level) {
        case LogLevel::Debug:   prefix = "[DEBUG] "; break;
        case LogLevel::Info:    prefix = "[INFO]  "; break;
        case LogLevel::Warning: prefix = "[WARN]  "; break;
        case LogLevel::Error:   prefix = "[ERROR] "; break;
    }

    std::printf("%s%.*s\n", prefix, static_cast<int>(msg.size()), msg.data());
    std::fflush(stdout);
}

inline void RelayEngine::run_posted() {
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(postMutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        if (task) {
            task();
        }
    }
}

inline void RelayEngine::tick_loop(IServerApp& app) {
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;

    const Duration tickDuration(tickDt_);
    auto nextTick = Clock::now();

    while (running_) {
        auto now = Clock::now();

        if (now >= nextTick) {
            // Poll network
            transport_->poll(0);

            run_posted();

            app.on_tick(tickDt_);
            ++tick_;

            nextTick += std::chrono::duration_cast<Clock::duration>(tickDuration);

            // If we're behind, catch up (but don't spiral)
            if (now > nextTick) {
                nextTick = now + std::chrono::duration_cast<Clock::duration>(tickDuration);
            }
        } else {
            std::this_thread::sleep_until(nextTick);
        }
    }
}

} // namespace voxrelay
