#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
using std::chrono::milliseconds;

// CLI defaults
inline constexpr std::uint16_t DEFAULT_PORT       = 4567;
inline constexpr std::uint16_t DEFAULT_TIMEOUT_MS = 250;
inline constexpr std::uint8_t  DEFAULT_RETRIES    = 3;

// Field limits
inline constexpr std::size_t MAX_USERNAME     = 20;
inline constexpr std::size_t MAX_CHANNEL      = 20;
inline constexpr std::size_t MAX_SECRET       = 128;
inline constexpr std::size_t MAX_DISPLAY_NAME = 20;
inline constexpr std::size_t MAX_CONTENT      = 60000;

// longest legal stream frame: "MSG FROM <dn> IS <content>\r\n" plus slack
inline constexpr std::size_t MAX_LINE = MAX_CONTENT + MAX_DISPLAY_NAME + 64;
// one UDP datagram can never be larger than this
inline constexpr std::size_t MAX_DATAGRAM = 65535;

inline constexpr std::string_view DEFAULT_CHANNEL       = "default";
inline constexpr std::string_view FALLBACK_DISPLAY_NAME = "client";

// Reply timeouts
inline constexpr milliseconds AUTH_REPLY_TIMEOUT{15000};
inline constexpr milliseconds JOIN_REPLY_TIMEOUT{5000};

// Transport timing
inline constexpr milliseconds CONNECT_TIMEOUT{5000};
inline constexpr milliseconds RECV_POLL_TICK{100};

// Shutdown stage budgets
inline constexpr milliseconds SHUTDOWN_BYE_BUDGET{1000};
inline constexpr milliseconds SHUTDOWN_FLUSH_GRACE{500};
inline constexpr milliseconds SHUTDOWN_DISCONNECT_BUDGET{1000};
inline constexpr milliseconds SHUTDOWN_TOTAL_BUDGET{3000};

}  // namespace constants
