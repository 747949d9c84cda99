#pragma once
#include <cstddef>

namespace media
{

// Byte-mode data capacity, in bytes, of a QR code of the given version (1..40)
// and error-correction level ('L', 'M', 'Q', 'H'). 0 for invalid arguments.
std::size_t qr_byte_capacity(int version, char ecc);

// Side length in modules, without quiet zone
constexpr int qr_modules(int version)
{
    return version * 4 + 17;
}

}  // namespace media
