#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace config
{

enum class TransportKind
{
    Tcp,
    Udp
};

// Built once from argv and handed to every component by const reference.
struct Config
{
    TransportKind transport = TransportKind::Tcp;
    std::string   host;
    std::uint16_t port       = constants::DEFAULT_PORT;
    std::uint16_t timeout_ms = constants::DEFAULT_TIMEOUT_MS;
    std::uint8_t  retries    = constants::DEFAULT_RETRIES;
    bool          verbose    = false;
    bool          help       = false;  // -h given; other fields are not validated
};

// nullopt on bad arguments, with the reason in *err
std::optional<Config> parse_args(int argc, const char *const *argv, std::string *err);

void print_usage(const char *prog);

const char *transport_name(TransportKind t);

}  // namespace config
