#include <filesystem>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <system_error>
#include <utility>

#include "media/cv_image.hpp"
#include "media/opencv_video.hpp"

namespace fs = std::filesystem;

namespace media
{

VideoFileWriter::VideoFileWriter(std::string fourcc, const qrstego::Logger &log)
    : fourcc_(std::move(fourcc)), log_(log)
{
}

VideoFileWriter::~VideoFileWriter()
{
    discard();
}

std::string VideoFileWriter::partial_path(const std::string &path)
{
    const fs::path p(path);
    const fs::path name =
        "." + p.stem().string() + ".partial" + p.extension().string();
    return (p.parent_path() / name).string();
}

bool VideoFileWriter::open(const std::string &path, const VideoInfo &info)
{
    discard();
    if (fourcc_.size() != 4 || info.width <= 0 || info.height <= 0 || !(info.fps > 0.0))
    {
        LOG_ERROR(log_, "invalid writer settings (fourcc '%s', %dx%d @ %.2f fps)",
                  fourcc_.c_str(), info.width, info.height, info.fps);
        return false;
    }

    path_     = path;
    tmp_path_ = partial_path(path);
    info_     = info;
    written_  = 0;

    const int cc = cv::VideoWriter::fourcc(fourcc_[0], fourcc_[1], fourcc_[2], fourcc_[3]);
    try
    {
        writer_ = std::make_unique<cv::VideoWriter>(tmp_path_, cc, info.fps,
                                                    cv::Size(info.width, info.height), true);
    }
    catch (const cv::Exception &e)
    {
        LOG_ERROR(log_, "cannot create video writer: %s", e.what());
        writer_.reset();
        return false;
    }
    if (!writer_->isOpened())
    {
        LOG_ERROR(log_, "cannot open %s for writing (fourcc %s)", tmp_path_.c_str(),
                  fourcc_.c_str());
        discard();
        return false;
    }
    LOG_DEBUG(log_, "writing %dx%d @ %.2f fps to %s", info.width, info.height, info.fps,
              tmp_path_.c_str());
    return true;
}

bool VideoFileWriter::append(const Image &frame)
{
    if (!writer_)
        return false;
    if (frame.width != info_.width || frame.height != info_.height)
    {
        LOG_ERROR(log_, "frame %ld is %dx%d, video is %dx%d", written_, frame.width, frame.height,
                  info_.width, info_.height);
        return false;
    }

    const Image bgr = to_bgr(frame);
    try
    {
        writer_->write(as_mat(bgr));
    }
    catch (const cv::Exception &e)
    {
        LOG_ERROR(log_, "writing frame %ld failed: %s", written_, e.what());
        return false;
    }
    written_++;
    return true;
}

bool VideoFileWriter::commit()
{
    if (!writer_)
        return false;
    writer_->release();
    writer_.reset();

    std::error_code ec;
    fs::rename(tmp_path_, path_, ec);
    if (ec)
    {
        LOG_ERROR(log_, "cannot move %s to %s: %s", tmp_path_.c_str(), path_.c_str(),
                  ec.message().c_str());
        fs::remove(tmp_path_, ec);
        tmp_path_.clear();
        return false;
    }
    LOG_INFO(log_, "wrote %ld frames to %s", written_, path_.c_str());
    tmp_path_.clear();
    return true;
}

void VideoFileWriter::discard()
{
    if (writer_)
    {
        writer_->release();
        writer_.reset();
    }
    if (!tmp_path_.empty())
    {
        std::error_code ec;
        fs::remove(tmp_path_, ec);
        if (ec)
            LOG_WARN(log_, "cannot remove %s: %s", tmp_path_.c_str(), ec.message().c_str());
        tmp_path_.clear();
    }
}

VideoFileReader::VideoFileReader(const qrstego::Logger &log) : log_(log) {}

VideoFileReader::~VideoFileReader()
{
    close();
}

bool VideoFileReader::open(const std::string &path)
{
    close();
    try
    {
        cap_ = std::make_unique<cv::VideoCapture>(path);
    }
    catch (const cv::Exception &e)
    {
        LOG_ERROR(log_, "cannot create video capture: %s", e.what());
        cap_.reset();
        return false;
    }
    if (!cap_->isOpened())
    {
        LOG_ERROR(log_, "cannot open video %s", path.c_str());
        cap_.reset();
        return false;
    }

    info_.width  = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_WIDTH));
    info_.height = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_HEIGHT));
    info_.fps    = cap_->get(cv::CAP_PROP_FPS);
    // container frame counts are estimates at best; <= 0 means unknown
    const double n    = cap_->get(cv::CAP_PROP_FRAME_COUNT);
    info_.frame_count = n > 0 ? static_cast<long>(n) : -1;
    LOG_INFO(log_, "opened %s: %dx%d @ %.2f fps, %ld frames", path.c_str(), info_.width,
             info_.height, info_.fps, info_.frame_count);
    return true;
}

bool VideoFileReader::next(Image &frame)
{
    if (!cap_)
        return false;
    cv::Mat m;
    try
    {
        if (!cap_->read(m) || m.empty())
            return false;
    }
    catch (const cv::Exception &e)
    {
        LOG_WARN(log_, "reading frame failed: %s", e.what());
        return false;
    }
    if (!from_mat(m, frame))
    {
        LOG_WARN(log_, "unsupported frame layout (type %d)", m.type());
        return false;
    }
    return true;
}

void VideoFileReader::close()
{
    if (cap_)
    {
        cap_->release();
        cap_.reset();
    }
    info_ = VideoInfo{};
}

}  // namespace media
