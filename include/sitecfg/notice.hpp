#pragma once

#include <atomic>
#include <functional>

namespace sitecfg {

// Runs an action at most once across every resolution sharing this
// notifier, including resolutions running on different threads.
class OnceNotifier {
public:
    explicit OnceNotifier(std::function<void()> action);

    OnceNotifier(const OnceNotifier&) = delete;
    OnceNotifier& operator=(const OnceNotifier&) = delete;

    // True only for the call that ran the action
    bool fire();
    bool fired() const { return fired_.load(); }

    // Re-arm, so the next fire() runs the action again
    void reset() { fired_.store(false); }

private:
    std::function<void()> action_;
    std::atomic<bool> fired_{false};
};

// The warning shown the first time a configuration enables experimental
// features
void warn_experimental_features();

} // namespace sitecfg
