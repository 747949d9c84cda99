#include <cctype>
#include <cstdlib>
#include <string>

#include "util/config.hpp"

namespace qrstego
{

namespace
{

bool parse_int(const std::string &s, int lo, int hi, int &out)
{
    if (s.empty())
        return false;
    char *end = nullptr;
    long  v   = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v < lo || v > hi)
        return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_fps(const std::string &s, double &out)
{
    if (s.empty())
        return false;
    char  *end = nullptr;
    double v   = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0' || !(v > 0.0) || v > 1000.0)
        return false;
    out = v;
    return true;
}

}  // namespace

bool apply_option(Config &cfg, const std::string &name, const std::string &value, std::string &err)
{
    if (name == "qr-version")
    {
        if (!parse_int(value, 1, 40, cfg.qr_version))
        {
            err = "qr-version must be in 1..40, got '" + value + "'";
            return false;
        }
        return true;
    }
    if (name == "ecc")
    {
        const char c = value.size() == 1
                           ? static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])))
                           : '\0';
        if (c != 'L' && c != 'M' && c != 'Q' && c != 'H')
        {
            err = "ecc must be one of L, M, Q, H, got '" + value + "'";
            return false;
        }
        cfg.ecc = c;
        return true;
    }
    if (name == "scale")
    {
        if (!parse_int(value, 1, 64, cfg.module_scale))
        {
            err = "scale must be in 1..64, got '" + value + "'";
            return false;
        }
        return true;
    }
    if (name == "border")
    {
        if (!parse_int(value, 0, 64, cfg.border))
        {
            err = "border must be in 0..64, got '" + value + "'";
            return false;
        }
        return true;
    }
    if (name == "fps")
    {
        if (!parse_fps(value, cfg.fps))
        {
            err = "fps must be a positive number, got '" + value + "'";
            return false;
        }
        return true;
    }
    if (name == "fourcc")
    {
        if (value.size() != 4)
        {
            err = "fourcc must be exactly 4 characters, got '" + value + "'";
            return false;
        }
        cfg.fourcc = value;
        return true;
    }
    if (name == "log-level")
    {
        cfg.log_level = level_from_name(value.c_str());
        return true;
    }
    err = "unknown option '" + name + "'";
    return false;
}

bool load_env(Config &cfg, std::string &err)
{
    struct EnvOpt
    {
        std::string_view var;
        const char      *name;
    };
    static const EnvOpt table[] = {
        {constants::ENV_QR_VERSION, "qr-version"}, {constants::ENV_ECC, "ecc"},
        {constants::ENV_SCALE, "scale"},           {constants::ENV_BORDER, "border"},
        {constants::ENV_FPS, "fps"},               {constants::ENV_FOURCC, "fourcc"},
        {constants::ENV_LOG_LEVEL, "log-level"},
    };

    for (const auto &e : table)
    {
        const char *v = std::getenv(std::string(e.var).c_str());
        if (!v || !*v)
            continue;
        if (!apply_option(cfg, e.name, v, err))
        {
            err = std::string(e.var) + ": " + err;
            return false;
        }
    }
    return true;
}

}  // namespace qrstego
