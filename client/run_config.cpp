#include "run_config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

ParsedUrl parse_base_url(const std::string& url) {
    ParsedUrl parsed;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        throw ConfigurationError("target host '" + url + "' has no scheme (expected http:// or https://)");
    }
    parsed.scheme = url.substr(0, sep);
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw ConfigurationError("unsupported scheme '" + parsed.scheme + "' in target host");
    }

    std::string rest = url.substr(sep + 3);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    if (rest.find('/') != std::string::npos) {
        throw ConfigurationError("target host '" + url + "' must not contain a path");
    }

    std::string port_text;
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = rest.substr(0, colon);
        port_text = rest.substr(colon + 1);
    } else {
        parsed.host = rest;
    }
    if (parsed.host.empty()) {
        throw ConfigurationError("target host '" + url + "' has an empty host name");
    }

    if (port_text.empty()) {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    } else {
        size_t used = 0;
        int port = 0;
        try {
            port = std::stoi(port_text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != port_text.size() || port < 1 || port > 65535) {
            throw ConfigurationError("invalid port '" + port_text + "' in target host");
        }
        parsed.port = port;
    }
    return parsed;
}

const char* to_string(StopMode mode) {
    return mode == StopMode::Immediate ? "immediate" : "graceful";
}

StopMode parse_stop_mode(const std::string& text) {
    if (text == "graceful") return StopMode::Graceful;
    if (text == "immediate") return StopMode::Immediate;
    throw ConfigurationError("unknown stop mode '" + text + "' (graceful, immediate)");
}

std::vector<PopulationSpec> distribute_users(const std::string& profile_list, int total_users,
                                             double total_spawn_rate) {
    if (total_users < 0) {
        throw ConfigurationError("user count must not be negative");
    }
    if (!std::isfinite(total_spawn_rate) || total_spawn_rate <= 0.0) {
        throw ConfigurationError("spawn rate must be a positive number");
    }

    std::vector<PopulationSpec> pops;
    std::vector<size_t> implicit;
    long long explicit_users = 0;

    std::stringstream ss(profile_list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        PopulationSpec p;
        auto colon = item.find(':');
        p.profile = item.substr(0, colon);
        if (p.profile.empty()) {
            throw ConfigurationError("empty profile name in '" + profile_list + "'");
        }
        if (colon == std::string::npos) {
            implicit.push_back(pops.size());
        } else {
            try {
                p.users = std::stoi(item.substr(colon + 1));
            } catch (const std::exception&) {
                throw ConfigurationError("invalid user count in '" + item + "'");
            }
            if (p.users < 0) {
                throw ConfigurationError("negative user count in '" + item + "'");
            }
            explicit_users += p.users;
        }
        pops.push_back(p);
    }

    if (pops.empty()) {
        throw ConfigurationError("no profiles given");
    }
    if (explicit_users > total_users) {
        throw ConfigurationError("profile user counts (" + std::to_string(explicit_users)
                                 + ") exceed the total of " + std::to_string(total_users));
    }

    if (!implicit.empty()) {
        int remaining = total_users - static_cast<int>(explicit_users);
        int share = remaining / static_cast<int>(implicit.size());
        int extra = remaining % static_cast<int>(implicit.size());
        for (size_t i = 0; i < implicit.size(); ++i) {
            pops[implicit[i]].users = share + (static_cast<int>(i) < extra ? 1 : 0);
        }
    }

    int assigned = 0;
    for (const auto& p : pops) assigned += p.users;
    for (auto& p : pops) {
        p.spawn_rate = assigned == 0
            ? total_spawn_rate
            : total_spawn_rate * static_cast<double>(p.users) / static_cast<double>(assigned);
    }
    return pops;
}

std::set<std::string> split_tags(const std::string& csv) {
    std::set<std::string> tags;
    std::stringstream ss(csv);
    std::string tag;
    while (std::getline(ss, tag, ',')) {
        if (!tag.empty()) tags.insert(tag);
    }
    return tags;
}

std::vector<Stage> parse_stages(const std::string& csv) {
    std::vector<Stage> stages;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto colon = item.find(':');
        if (colon == std::string::npos) {
            throw ConfigurationError("stage '" + item + "' must look like SEC:USERS");
        }
        double seconds = 0.0;
        Stage stage;
        try {
            size_t used = 0;
            seconds = std::stod(item.substr(0, colon), &used);
            if (used != colon) throw std::invalid_argument(item);
            stage.target = std::stoi(item.substr(colon + 1), &used);
            if (used != item.size() - colon - 1) throw std::invalid_argument(item);
        } catch (const std::exception&) {
            throw ConfigurationError("invalid stage '" + item + "'");
        }
        if (!std::isfinite(seconds) || seconds <= 0.0) {
            throw ConfigurationError("stage '" + item + "' needs a positive duration");
        }
        if (stage.target < 0) {
            throw ConfigurationError("stage '" + item + "' has a negative user target");
        }
        stage.duration = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        stages.push_back(stage);
    }
    if (stages.empty()) {
        throw ConfigurationError("no stages given");
    }
    return stages;
}

std::vector<int> split_population(int total, const std::vector<int>& weights) {
    std::vector<int> shares(weights.size(), 0);
    if (weights.empty() || total <= 0) return shares;

    long long weight_sum = 0;
    for (int w : weights) weight_sum += std::max(w, 0);

    int assigned = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        shares[i] = weight_sum == 0
            ? total / static_cast<int>(weights.size())
            : static_cast<int>(static_cast<long long>(total) * std::max(weights[i], 0) / weight_sum);
        assigned += shares[i];
    }
    for (size_t i = 0; assigned < total; i = (i + 1) % shares.size()) {
        if (weight_sum == 0 || weights[i] > 0) {
            shares[i]++;
            assigned++;
        }
    }
    return shares;
}

std::chrono::milliseconds total_duration(const std::vector<Stage>& stages) {
    std::chrono::milliseconds sum{0};
    for (const auto& s : stages) sum += s.duration;
    return sum;
}
