#pragma once
#include <cstddef>
#include <memory>

#include "media/icodec.hpp"
#include "util/log.hpp"

namespace cv
{
class QRCodeDetector;
}

namespace media
{

// QR rendering with cv::QRCodeEncoder. Bytes travel as base64 text in byte
// mode at a fixed version, so every rendered image has the same size. Each
// module becomes scale x scale pixels, with border modules of white around it.
class QrCodeEncoder final : public ICodeEncoder
{
  public:
    QrCodeEncoder(int version, char ecc, int scale, int border, const qrstego::Logger &log);

    std::size_t capacity() const override { return capacity_; }
    bool        render(const Bytes &bytes, Image &out) override;
    std::string name() const override { return "opencv-qr"; }

  private:
    int                    version_;
    char                   ecc_;
    int                    scale_;
    int                    border_;
    std::size_t            capacity_;
    const qrstego::Logger &log_;
};

// QR detection and decoding with cv::QRCodeDetector
class QrCodeScanner final : public ICodeScanner
{
  public:
    explicit QrCodeScanner(const qrstego::Logger &log);
    ~QrCodeScanner() override;

    std::optional<Bytes> scan(const Image &frame) override;
    std::string          name() const override { return "opencv-qr"; }

  private:
    std::unique_ptr<cv::QRCodeDetector> detector_;
    const qrstego::Logger              &log_;
};

}  // namespace media
