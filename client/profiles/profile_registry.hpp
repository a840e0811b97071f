#pragma once

#include "../behavior_profile.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Name -> factory map of the profiles the command line can ask for.
 */
class ProfileRegistry {
public:
    using Factory = std::function<ProfilePtr()>;

    // Registry holding every built-in profile.
    static ProfileRegistry with_builtins();

    void add(const std::string& name, Factory factory);

    /**
     * @throws ConfigurationError for an unknown name.
     */
    ProfilePtr create(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, Factory> factories_;
};
