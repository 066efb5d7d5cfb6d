#pragma once

#include <string>

namespace vidscan::core {

struct Credentials {
    std::string username;
    std::string password;

    [[nodiscard]] bool isValid() const { return !username.empty(); }

    /**
     * @brief Returns the username with the password masked, for logging.
     */
    [[nodiscard]] std::string masked() const {
        return username + ":" + std::string(password.size(), '*');
    }

    bool operator==(const Credentials& other) const = default;
};

} // namespace vidscan::core
