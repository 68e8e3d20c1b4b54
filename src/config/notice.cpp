#include <sitecfg/notice.hpp>
#include <sitecfg/log.hpp>

namespace sitecfg {

OnceNotifier::OnceNotifier(std::function<void()> action)
    : action_(std::move(action)) {}

bool OnceNotifier::fire() {
    if (fired_.exchange(true)) return false;
    if (action_) action_();
    return true;
}

void warn_experimental_features() {
    log::warn("%s", log::bold("You have enabled experimental feature(s).").c_str());
    log::warn("Experimental features are not covered by semver, and may cause "
              "unexpected or broken application behavior. Use them at your own risk.");
}

} // namespace sitecfg
