#include <cstring>

#include "media/image.hpp"

namespace media
{

Image to_bgr(const Image &src)
{
    if (src.channels != 1)
        return src;
    Image out(src.width, src.height, 3);
    for (std::size_t i = 0; i < src.pixels.size(); ++i)
    {
        out.pixels[3 * i + 0] = src.pixels[i];
        out.pixels[3 * i + 1] = src.pixels[i];
        out.pixels[3 * i + 2] = src.pixels[i];
    }
    return out;
}

bool paste_centered(Image &dst, const Image &src)
{
    if (dst.empty() || src.empty())
        return false;
    if (src.width > dst.width || src.height > dst.height)
        return false;
    if ((dst.channels != 1 && dst.channels != 3) || (src.channels != 1 && src.channels != 3))
        return false;
    if (dst.channels == 1 && src.channels == 3)
        return false;  // no colour -> gray conversion

    Image        converted;
    const Image *pp = &src;
    if (src.channels != dst.channels)
    {
        converted = to_bgr(src);
        pp        = &converted;
    }
    const Image &p = *pp;

    const int x0 = (dst.width - p.width) / 2;
    const int y0 = (dst.height - p.height) / 2;
    for (int y = 0; y < p.height; ++y)
        std::memcpy(dst.at(x0, y0 + y), p.at(0, y), p.row_bytes());
    return true;
}

}  // namespace media
