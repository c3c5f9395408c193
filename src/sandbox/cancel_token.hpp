#pragma once

#include <atomic>

namespace warden::sandbox {

// One-shot cooperative cancellation flag shared between the party that
// requests cancellation and the work that observes it.
class CancelToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace warden::sandbox
