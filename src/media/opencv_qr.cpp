#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include "crypto/digest.hpp"
#include "media/cv_image.hpp"
#include "media/opencv_qr.hpp"
#include "media/qr_capacity.hpp"

namespace media
{

static cv::QRCodeEncoder::CorrectionLevel correction_level(char ecc)
{
    switch (ecc)
    {
        case 'L':
            return cv::QRCodeEncoder::CORRECT_LEVEL_L;
        case 'Q':
            return cv::QRCodeEncoder::CORRECT_LEVEL_Q;
        case 'H':
            return cv::QRCodeEncoder::CORRECT_LEVEL_H;
        default:
            return cv::QRCodeEncoder::CORRECT_LEVEL_M;
    }
}

QrCodeEncoder::QrCodeEncoder(int version, char ecc, int scale, int border,
                             const qrstego::Logger &log)
    : version_(version), ecc_(ecc), scale_(scale > 0 ? scale : 1), border_(border >= 0 ? border : 0),
      log_(log)
{
    // largest binary input whose padded base64 text still fits in byte mode
    capacity_ = 3 * (qr_byte_capacity(version_, ecc_) / 4);
}

bool QrCodeEncoder::render(const Bytes &bytes, Image &out)
{
    if (bytes.size() > capacity_)
    {
        LOG_ERROR(log_, "%zu bytes exceed QR capacity %zu (version %d, ecc %c)", bytes.size(),
                  capacity_, version_, ecc_);
        return false;
    }

    const std::string text = digest::to_base64(bytes.data(), bytes.size());
    cv::Mat           qr;
    try
    {
        cv::QRCodeEncoder::Params p;
        p.version          = version_;
        p.correction_level = correction_level(ecc_);
        p.mode             = cv::QRCodeEncoder::MODE_BYTE;
        cv::Ptr<cv::QRCodeEncoder> enc = cv::QRCodeEncoder::create(p);
        enc->encode(text, qr);
    }
    catch (const cv::Exception &e)
    {
        LOG_ERROR(log_, "QR encode failed: %s", e.what());
        return false;
    }

    if (qr.empty() || qr.rows != qr.cols || qr.rows < qr_modules(version_))
    {
        LOG_ERROR(log_, "unexpected QR matrix %dx%d for version %d", qr.cols, qr.rows, version_);
        return false;
    }
    if (qr.channels() != 1)
        cv::cvtColor(qr, qr, cv::COLOR_BGR2GRAY);
    if (qr.depth() != CV_8U)
        qr.convertTo(qr, CV_8U);

    // one module -> scale x scale pixels, then the white quiet zone
    cv::Mat scaled, framed;
    cv::resize(qr, scaled, cv::Size(), scale_, scale_, cv::INTER_NEAREST);
    const int pad = border_ * scale_;
    cv::copyMakeBorder(scaled, framed, pad, pad, pad, pad, cv::BORDER_CONSTANT, cv::Scalar(255));

    if (!from_mat(framed, out))
    {
        LOG_ERROR(log_, "cannot convert rendered QR image");
        return false;
    }
    LOG_DEBUG(log_, "rendered %zu bytes as %dx%d QR image", bytes.size(), out.width, out.height);
    return true;
}

QrCodeScanner::QrCodeScanner(const qrstego::Logger &log)
    : detector_(std::make_unique<cv::QRCodeDetector>()), log_(log)
{
}

QrCodeScanner::~QrCodeScanner() = default;

std::optional<Bytes> QrCodeScanner::scan(const Image &frame)
{
    if (frame.empty())
        return std::nullopt;

    std::string text;
    try
    {
        text = detector_->detectAndDecode(as_mat(frame));
    }
    catch (const cv::Exception &e)
    {
        LOG_DEBUG(log_, "QR detection failed: %s", e.what());
        return std::nullopt;
    }
    if (text.empty())
        return std::nullopt;

    auto bytes = digest::from_base64(text);
    if (!bytes)
    {
        LOG_DEBUG(log_, "QR code is not base64 (%zu chars), ignoring", text.size());
        return std::nullopt;
    }
    return bytes;
}

}  // namespace media
