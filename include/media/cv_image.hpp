#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "media/image.hpp"

namespace media
{

// Non-owning view; valid while img is alive and unchanged
inline cv::Mat as_mat(const Image &img)
{
    return cv::Mat(img.height, img.width, CV_8UC(img.channels),
                   const_cast<std::uint8_t *>(img.pixels.data()));
}

// Copies an 8-bit gray, BGR or BGRA Mat. Returns false for other layouts.
inline bool from_mat(const cv::Mat &m, Image &out)
{
    if (m.empty() || m.depth() != CV_8U)
        return false;

    cv::Mat src = m;
    if (m.channels() == 4)
        cv::cvtColor(m, src, cv::COLOR_BGRA2BGR);
    else if (m.channels() != 1 && m.channels() != 3)
        return false;
    if (!src.isContinuous())
        src = src.clone();

    out.width    = src.cols;
    out.height   = src.rows;
    out.channels = src.channels();
    out.pixels.assign(src.data, src.data + src.total() * src.elemSize());
    return true;
}

}  // namespace media
