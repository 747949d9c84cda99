#pragma once

namespace exitc
{

inline constexpr int ok             = 0;
inline constexpr int bad_args       = 2;
inline constexpr int io_error       = 3;
inline constexpr int oversize_input = 4;
inline constexpr int encode_failure = 5;
inline constexpr int incomplete     = 6;
inline constexpr int cover_short    = 7;
inline constexpr int bad_config     = 8;

}  // namespace exitc
