#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

namespace
{

bool parse_uint(const char *s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    // strtoul would skip leading blanks and take a sign
    if (!s || !*s || *s == '-' || *s == '+' || std::isspace(static_cast<unsigned char>(*s)))
        return false;
    char *end = nullptr;
    errno     = 0;
    unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = v;
    return true;
}

void set_err(std::string *err, std::string msg)
{
    if (err)
        *err = std::move(msg);
}

}  // namespace

const char *transport_name(TransportKind t)
{
    return t == TransportKind::Udp ? "udp" : "tcp";
}

void print_usage(const char *prog)
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  %s -t <tcp|udp> -s <host> [-p <port>] [-d <timeout>] [-r <retries>] [-v]\n"
                 "\n"
                 "Options:\n"
                 "  -t <tcp|udp>   transport protocol (required)\n"
                 "  -s <host>      server hostname or IP address (required)\n"
                 "  -p <port>      server port (default %u)\n"
                 "  -d <timeout>   UDP confirmation timeout in ms (default %u)\n"
                 "  -r <retries>   maximum UDP retransmissions (default %u)\n"
                 "  -v             verbose protocol logging on stderr\n"
                 "  -h             show this help\n",
                 prog ? prog : "wirechat", (unsigned)constants::DEFAULT_PORT,
                 (unsigned)constants::DEFAULT_TIMEOUT_MS, (unsigned)constants::DEFAULT_RETRIES);
}

std::optional<Config> parse_args(int argc, const char *const *argv, std::string *err)
{
    Config cfg;
    bool   have_transport = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            cfg.help = true;
            return cfg;
        }
        if (a == "-v")
        {
            cfg.verbose = true;
            continue;
        }
        if (a != "-t" && a != "-s" && a != "-p" && a != "-d" && a != "-r")
        {
            set_err(err, "unknown argument: " + a);
            return std::nullopt;
        }
        if (i + 1 >= argc)
        {
            set_err(err, "missing value for " + a);
            return std::nullopt;
        }
        const char *val = argv[++i];

        unsigned long n = 0;
        if (a == "-t")
        {
            const std::string t = val;
            if (t == "tcp")
                cfg.transport = TransportKind::Tcp;
            else if (t == "udp")
                cfg.transport = TransportKind::Udp;
            else
            {
                set_err(err, "transport must be 'tcp' or 'udp', got '" + t + "'");
                return std::nullopt;
            }
            have_transport = true;
        }
        else if (a == "-s")
        {
            cfg.host = val;
        }
        else if (a == "-p")
        {
            if (!parse_uint(val, 1, std::numeric_limits<std::uint16_t>::max(), n))
            {
                set_err(err, std::string("invalid port: ") + val);
                return std::nullopt;
            }
            cfg.port = static_cast<std::uint16_t>(n);
        }
        else if (a == "-d")
        {
            if (!parse_uint(val, 1, std::numeric_limits<std::uint16_t>::max(), n))
            {
                set_err(err, std::string("invalid timeout: ") + val);
                return std::nullopt;
            }
            cfg.timeout_ms = static_cast<std::uint16_t>(n);
        }
        else
        {
            if (!parse_uint(val, 0, std::numeric_limits<std::uint8_t>::max(), n))
            {
                set_err(err, std::string("invalid retransmission count: ") + val);
                return std::nullopt;
            }
            cfg.retries = static_cast<std::uint8_t>(n);
        }
    }

    if (!have_transport)
    {
        set_err(err, "transport (-t) is required");
        return std::nullopt;
    }
    if (cfg.host.empty())
    {
        set_err(err, "server address (-s) is required");
        return std::nullopt;
    }

    LOG_DEBUG("config: transport=%s host=%s port=%u timeout=%ums retries=%u",
              transport_name(cfg.transport), cfg.host.c_str(), (unsigned)cfg.port,
              (unsigned)cfg.timeout_ms, (unsigned)cfg.retries);
    return cfg;
}

}  // namespace config
