#pragma once
#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace transport
{

struct Endpoint
{
    sockaddr_storage addr{};
    socklen_t        len{0};

    static Endpoint from(const sockaddr *sa, socklen_t len);
    // numeric IPv4/IPv6 literal only, no DNS
    static Endpoint from_ip(const std::string &ip, std::uint16_t port);

    const sockaddr *sa() const { return reinterpret_cast<const sockaddr *>(&addr); }
    bool            valid() const { return len > 0; }
    std::uint16_t   port() const;
    std::string     to_string() const;  // "1.2.3.4:567" / "[::1]:567"

    bool operator==(const Endpoint &o) const;
    bool operator!=(const Endpoint &o) const { return !(*this == o); }
};

// getaddrinfo(); IPv4 results are preferred over IPv6.
bool resolve(const std::string &host,
             std::uint16_t      port,
             int                socktype,
             Endpoint          &out,
             std::string       *err = nullptr);

}  // namespace transport
