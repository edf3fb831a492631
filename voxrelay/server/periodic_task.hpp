#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace voxrelay::server {

// ============================================================================
// PeriodicTask - Fixed-interval job driven by the server tick
// ============================================================================

/// Fires on the thread that calls advance(). A cancelled task stops firing.
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, float intervalSeconds, Callback callback)
        : name_(std::move(name))
        , interval_(intervalSeconds)
        , callback_(std::move(callback)) {
    }

    /// Add elapsed time; fires at most once per call. A long stall does not
    /// cause a burst of catch-up runs.
    void advance(float dt) {
        if (cancelled_ || interval_ <= 0.0f) return;

        elapsed_ += dt;
        if (elapsed_ < interval_) return;

        elapsed_ = 0.0f;
        ++runs_;
        if (callback_) {
            callback_();
        }
    }

    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

    const std::string& name() const { return name_; }
    float interval() const { return interval_; }
    std::uint64_t runs() const { return runs_; }

private:
    std::string name_;
    float interval_{0.0f};
    float elapsed_{0.0f};
    Callback callback_;
    bool cancelled_{false};
    std::uint64_t runs_{0};
};

} // namespace voxrelay::server
