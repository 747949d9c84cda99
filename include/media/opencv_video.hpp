#pragma once
#include <memory>
#include <string>

#include "media/ivideo.hpp"
#include "util/log.hpp"

namespace cv
{
class VideoCapture;
class VideoWriter;
}  // namespace cv

namespace media
{

// Writes to "<dir>/.<stem>.partial<ext>" and renames onto the destination in
// commit(). The extension is kept so OpenCV still picks the right container.
class VideoFileWriter final : public IVideoWriter
{
  public:
    VideoFileWriter(std::string fourcc, const qrstego::Logger &log);
    ~VideoFileWriter() override;

    bool open(const std::string &path, const VideoInfo &info) override;
    bool append(const Image &frame) override;
    bool commit() override;
    void discard() override;

    static std::string partial_path(const std::string &path);

  private:
    std::string                      fourcc_;
    const qrstego::Logger           &log_;
    std::unique_ptr<cv::VideoWriter> writer_;
    std::string                      path_;
    std::string                      tmp_path_;
    VideoInfo                        info_;
    long                             written_ = 0;
};

class VideoFileReader final : public IVideoReader
{
  public:
    explicit VideoFileReader(const qrstego::Logger &log);
    ~VideoFileReader() override;

    bool      open(const std::string &path) override;
    VideoInfo info() const override { return info_; }
    bool      next(Image &frame) override;
    void      close() override;

  private:
    const qrstego::Logger            &log_;
    std::unique_ptr<cv::VideoCapture> cap_;
    VideoInfo                         info_;
};

}  // namespace media
