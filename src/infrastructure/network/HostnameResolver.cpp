#include "infrastructure/network/HostnameResolver.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace vidscan::infra {

std::string HostnameResolver::reverseLookup(const std::string& address) {
    struct sockaddr_in sa {};
    sa.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &sa.sin_addr) != 1) {
        return address;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa), host, sizeof(host),
                         nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        spdlog::trace("No reverse DNS name for {}: {}", address, gai_strerror(rc));
        return address;
    }
    return host;
}

} // namespace vidscan::infra
