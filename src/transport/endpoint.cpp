#include <arpa/inet.h>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>

#include "transport/endpoint.hpp"
#include "util/log.hpp"

namespace transport
{

Endpoint Endpoint::from(const sockaddr *sa, socklen_t len)
{
    Endpoint e;
    if (!sa || len == 0 || len > sizeof(e.addr))
        return e;
    std::memcpy(&e.addr, sa, len);
    e.len = len;
    return e;
}

Endpoint Endpoint::from_ip(const std::string &ip, std::uint16_t port)
{
    Endpoint     e;
    sockaddr_in  v4{};
    sockaddr_in6 v6{};
    if (inet_pton(AF_INET, ip.c_str(), &v4.sin_addr) == 1)
    {
        v4.sin_family = AF_INET;
        v4.sin_port   = htons(port);
        return from(reinterpret_cast<const sockaddr *>(&v4), sizeof v4);
    }
    if (inet_pton(AF_INET6, ip.c_str(), &v6.sin6_addr) == 1)
    {
        v6.sin6_family = AF_INET6;
        v6.sin6_port   = htons(port);
        return from(reinterpret_cast<const sockaddr *>(&v6), sizeof v6);
    }
    return e;
}

std::uint16_t Endpoint::port() const
{
    if (addr.ss_family == AF_INET)
        return ntohs(reinterpret_cast<const sockaddr_in *>(&addr)->sin_port);
    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_port);
    return 0;
}

std::string Endpoint::to_string() const
{
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET)
    {
        auto *v4 = reinterpret_cast<const sockaddr_in *>(&addr);
        inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof buf);
        return std::string(buf) + ":" + std::to_string(port());
    }
    if (addr.ss_family == AF_INET6)
    {
        auto *v6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
        inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof buf);
        return "[" + std::string(buf) + "]:" + std::to_string(port());
    }
    return "(none)";
}

bool Endpoint::operator==(const Endpoint &o) const
{
    if (addr.ss_family != o.addr.ss_family)
        return false;
    if (addr.ss_family == AF_INET)
    {
        auto *a = reinterpret_cast<const sockaddr_in *>(&addr);
        auto *b = reinterpret_cast<const sockaddr_in *>(&o.addr);
        return a->sin_port == b->sin_port && a->sin_addr.s_addr == b->sin_addr.s_addr;
    }
    if (addr.ss_family == AF_INET6)
    {
        auto *a = reinterpret_cast<const sockaddr_in6 *>(&addr);
        auto *b = reinterpret_cast<const sockaddr_in6 *>(&o.addr);
        return a->sin6_port == b->sin6_port &&
               std::memcmp(&a->sin6_addr, &b->sin6_addr, sizeof a->sin6_addr) == 0;
    }
    return len == o.len && std::memcmp(&addr, &o.addr, len) == 0;
}

bool resolve(const std::string &host,
             std::uint16_t      port,
             int                socktype,
             Endpoint          &out,
             std::string       *err)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = socktype;

    addrinfo   *res  = nullptr;
    std::string serv = std::to_string(port);
    int         rc   = ::getaddrinfo(host.c_str(), serv.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
        if (err)
            *err = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
        LOG_ERROR("getaddrinfo(%s) failed: %s", host.c_str(), ::gai_strerror(rc));
        return false;
    }

    const addrinfo *pick = nullptr;
    for (const addrinfo *p = res; p; p = p->ai_next)
    {
        if (p->ai_family == AF_INET)
        {
            pick = p;
            break;
        }
        if (!pick)
            pick = p;
    }
    out = Endpoint::from(pick->ai_addr, pick->ai_addrlen);
    ::freeaddrinfo(res);

    LOG_DEBUG("resolved %s -> %s", host.c_str(), out.to_string().c_str());
    return out.valid();
}

}  // namespace transport
