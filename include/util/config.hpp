#pragma once
#include <cstdint>
#include <limits>
#include <string>

#include "util/constants.hpp"
#include "util/log.hpp"

namespace qrstego
{

struct Config
{
    int           qr_version   = constants::DEFAULT_QR_VERSION;  // 1..40
    char          ecc          = constants::DEFAULT_ECC;         // L, M, Q or H
    int           module_scale = constants::DEFAULT_SCALE;       // pixels per module
    int           border       = constants::DEFAULT_BORDER;      // quiet zone, in modules
    double        fps          = constants::DEFAULT_FPS;         // used when there is no cover
    std::string   fourcc{constants::DEFAULT_FOURCC};
    Level         log_level = Level::Warning;
    std::uint32_t max_chunks = std::numeric_limits<std::uint32_t>::max();
};

// Apply one named setting ("qr-version", "ecc", "scale", "border", "fps",
// "fourcc", "log-level"). Returns false and fills err on an unknown name or
// an out-of-range value; cfg is left untouched in that case.
bool apply_option(Config &cfg, const std::string &name, const std::string &value, std::string &err);

// Read QRSTEGO_* variables on top of cfg.
bool load_env(Config &cfg, std::string &err);

}  // namespace qrstego
