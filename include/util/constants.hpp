#pragma once
#include <cstdint>
#include <string_view>

namespace constants
{

// Environment overrides (CLI options take precedence)
inline constexpr std::string_view ENV_QR_VERSION = "QRSTEGO_QR_VERSION";
inline constexpr std::string_view ENV_ECC        = "QRSTEGO_ECC";
inline constexpr std::string_view ENV_SCALE      = "QRSTEGO_SCALE";
inline constexpr std::string_view ENV_BORDER     = "QRSTEGO_BORDER";
inline constexpr std::string_view ENV_FPS        = "QRSTEGO_FPS";
inline constexpr std::string_view ENV_FOURCC     = "QRSTEGO_FOURCC";
inline constexpr std::string_view ENV_LOG_LEVEL  = "QRSTEGO_LOG_LEVEL";

// Defaults: largest QR version at medium error correction, 4px modules,
// standard 4-module quiet zone, lossless FFV1.
inline constexpr int              DEFAULT_QR_VERSION = 40;
inline constexpr char             DEFAULT_ECC        = 'M';
inline constexpr int              DEFAULT_SCALE      = 4;
inline constexpr int              DEFAULT_BORDER     = 4;
inline constexpr double           DEFAULT_FPS        = 30.0;
inline constexpr std::string_view DEFAULT_FOURCC     = "FFV1";

}  // namespace constants
