#include "profile_registry.hpp"
#include "../errors.hpp"
#include "burst_user_profile.hpp"
#include "chat_user_profile.hpp"
#include "heavy_user_profile.hpp"
#include "site_user_profile.hpp"
#include "stress_user_profile.hpp"

ProfileRegistry ProfileRegistry::with_builtins() {
    ProfileRegistry registry;
    registry.add("chat", make_chat_user_profile);
    registry.add("heavy", make_heavy_user_profile);
    registry.add("burst", make_burst_user_profile);
    registry.add("site", make_site_user_profile);
    registry.add("stress", make_stress_user_profile);
    registry.add("premium", make_premium_user_profile);
    return registry;
}

void ProfileRegistry::add(const std::string& name, Factory factory) {
    factories_[name] = std::move(factory);
}

ProfilePtr ProfileRegistry::create(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& n : names()) known += (known.empty() ? "" : ", ") + n;
        throw ConfigurationError("unknown profile '" + name + "' (known: " + known + ")");
    }
    return it->second();
}

std::vector<std::string> ProfileRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
}
