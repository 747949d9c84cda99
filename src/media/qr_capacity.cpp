#include <cstdint>

#include "media/qr_capacity.hpp"

namespace media
{

namespace
{

// Total error-correction codewords per version, rows L, M, Q, H
const std::uint16_t ECC_CODEWORDS[4][40] = {
    {  7, 10, 15, 20, 26,  36,  40,  48,  60,  72,  80,  96, 104, 120, 132, 144, 168, 180, 196, 224, 224, 252, 270, 300,  312,  336,  360,  390,  420,  450,  480,  510,  540,  570,  570,  600,  630,  660,  720,  750},
    { 10, 16, 26, 36, 48,  64,  72,  88, 110, 130, 150, 176, 198, 216, 240, 280, 308, 338, 364, 416, 442, 476, 504, 560,  588,  644,  700,  728,  784,  812,  868,  924,  980, 1036, 1064, 1120, 1204, 1260, 1316, 1372},
    { 13, 22, 36, 52, 72,  96, 108, 132, 160, 192, 224, 260, 288, 320, 360, 408, 448, 504, 546, 600, 644, 690, 750, 810,  870,  952, 1020, 1050, 1140, 1200, 1290, 1350, 1440, 1530, 1590, 1680, 1770, 1860, 1950, 2040},
    { 17, 28, 44, 64, 88, 112, 130, 156, 192, 224, 264, 308, 352, 384, 432, 480, 532, 588, 650, 700, 750, 816, 900, 960, 1050, 1110, 1200, 1260, 1350, 1440, 1530, 1620, 1710, 1800, 1890, 1980, 2100, 2220, 2310, 2430},
};

// Modules available for data + ECC after function patterns
const std::uint16_t RAW_DATA_MODULES[40] = {
      208, 359, 567, 807, 1079, 1383, 1568, 1936, 2336, 2768, 3232, 3728, 4256, 4651, 5243, 5867, 6523,
     7211, 7931, 8683, 9252, 10068, 10916, 11796, 12708, 13652, 14628, 15371, 16411, 17483, 18587,
    19723, 20891, 22091, 23008, 24272, 25568, 26896, 28256, 29648
};

int ecc_row(char ecc)
{
    switch (ecc)
    {
        case 'L':
        case 'l':
            return 0;
        case 'M':
        case 'm':
            return 1;
        case 'Q':
        case 'q':
            return 2;
        case 'H':
        case 'h':
            return 3;
    }
    return -1;
}

}  // namespace

std::size_t qr_byte_capacity(int version, char ecc)
{
    const int row = ecc_row(ecc);
    if (version < 1 || version > 40 || row < 0)
        return 0;

    const std::size_t data_codewords =
        RAW_DATA_MODULES[version - 1] / 8 - ECC_CODEWORDS[row][version - 1];
    // 4-bit mode indicator + character count (8 bits up to v9, 16 bits after)
    const std::size_t overhead_bits = 4 + (version <= 9 ? 8 : 16);
    return (data_codewords * 8 - overhead_bits) / 8;
}

}  // namespace media
