#include <string>

#include "util/status.hpp"

namespace qrstego
{

std::string format_indices(const std::vector<std::uint32_t> &idx, std::size_t max_shown)
{
    std::string       out;
    const std::size_t shown = idx.size() < max_shown ? idx.size() : max_shown;
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (i)
            out += ", ";
        out += std::to_string(idx[i]);
    }
    if (idx.size() > shown)
        out += ", ... (+" + std::to_string(idx.size() - shown) + " more)";
    return out;
}

}  // namespace qrstego
