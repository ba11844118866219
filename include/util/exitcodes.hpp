#pragma once

namespace exitc
{
inline constexpr int ok        = 0;
inline constexpr int bad_args  = 2;
inline constexpr int no_server = 3;  // resolve/connect failed or connection lost
inline constexpr int protocol  = 4;  // peer sent something we could not accept
}  // namespace exitc
