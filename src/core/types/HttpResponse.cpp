#include "core/types/HttpResponse.hpp"

#include <algorithm>
#include <cctype>

namespace vidscan::core {

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vidscan::core
