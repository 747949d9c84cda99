#include <cstdio>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "app/decoder.hpp"
#include "app/encoder.hpp"
#include "media/opencv_qr.hpp"
#include "media/opencv_video.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/fileio.hpp"
#include "util/log.hpp"
#include "util/status.hpp"

namespace
{

struct Args
{
    std::string                                      video;
    std::string                                      binary;
    std::string                                      output;
    bool                                             verbose = false;
    std::vector<std::pair<std::string, std::string>> settings;  // --name value
};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  qrstego encode -v <cover video> -b <binary> -o <output video> [options]\n"
                         "  qrstego decode -v <video> -o <output binary> [options]\n"
                         "\n"
                         "Options:\n"
                         "  --verbose               informational messages\n"
                         "  --log-level <level>     debug, info, warn, error\n"
                         "  --qr-version <1-40>     QR version (default 40)\n"
                         "  --ecc <L|M|Q|H>         error correction level (default M)\n"
                         "  --scale <n>             pixels per QR module (default 4)\n"
                         "  --border <n>            quiet zone in modules (default 4)\n"
                         "  --fps <n>               frame rate without a cover (default 30)\n"
                         "  --fourcc <code>         output codec (default FFV1)\n");
}

static bool is_setting(const std::string &a)
{
    static const char *names[] = {"--log-level", "--qr-version", "--ecc",   "--scale",
                                  "--border",    "--fps",        "--fourcc"};
    for (const char *n : names)
    {
        if (a == n)
            return true;
    }
    return false;
}

static int parse_args(int argc, char **argv, int start, Args &out)
{
    for (int i = start; i < argc; ++i)
    {
        std::string a = argv[i];
        auto        value = [&](std::string &dst) -> bool {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "error: %s needs a value\n", a.c_str());
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (a == "-v" || a == "--video")
        {
            if (!value(out.video))
                return exitc::bad_args;
        }
        else if (a == "-b" || a == "--binary")
        {
            if (!value(out.binary))
                return exitc::bad_args;
        }
        else if (a == "-o" || a == "--output")
        {
            if (!value(out.output))
                return exitc::bad_args;
        }
        else if (a == "--verbose")
        {
            out.verbose = true;
        }
        else if (is_setting(a))
        {
            std::string v;
            if (!value(v))
                return exitc::bad_args;
            out.settings.emplace_back(a.substr(2), v);
        }
        else
        {
            std::fprintf(stderr, "error: unknown argument: %s\n", a.c_str());
            return exitc::bad_args;
        }
    }
    return exitc::ok;
}

static int report(const qrstego::Status &st)
{
    if (st.ok())
        return exitc::ok;
    std::fprintf(stderr, "error: %s: %s\n", qrstego::errc_name(st.code), st.message.c_str());
    return qrstego::exit_code(st);
}

static int run_encode(const Args &args, const qrstego::Config &cfg, const qrstego::Logger &log)
{
    if (args.video.empty() || args.binary.empty() || args.output.empty())
    {
        print_usage();
        std::fprintf(stderr, "error: encode needs -v, -b and -o\n");
        return exitc::bad_args;
    }
    if (!fileio::is_file(args.video))
    {
        std::fprintf(stderr, "error: the cover video does not exist: %s\n", args.video.c_str());
        return exitc::io_error;
    }
    if (fileio::same_file(args.output, args.video))
    {
        std::fprintf(stderr, "error: output video is the same file as the cover video\n");
        return exitc::bad_args;
    }

    std::vector<std::uint8_t> payload;
    std::string               err;
    if (!fileio::read_file(args.binary, payload, err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return exitc::io_error;
    }
    LOG_INFO(log, "binary file: %s (%zu bytes)", args.binary.c_str(), payload.size());

    media::VideoFileReader cover(log);
    if (!cover.open(args.video))
    {
        std::fprintf(stderr, "error: cannot open cover video %s\n", args.video.c_str());
        return exitc::io_error;
    }

    media::QrCodeEncoder   enc(cfg.qr_version, cfg.ecc, cfg.module_scale, cfg.border, log);
    media::VideoFileWriter writer(cfg.fourcc, log);
    app::FrameEncoder      fe(enc, writer, cfg, log);

    const qrstego::Status st = fe.encode(payload, args.output, &cover);
    if (st.ok())
        LOG_INFO(log, "done, output video is %s", args.output.c_str());
    return report(st);
}

static int run_decode(const Args &args, const qrstego::Logger &log)
{
    if (args.video.empty() || args.output.empty())
    {
        print_usage();
        std::fprintf(stderr, "error: decode needs -v and -o\n");
        return exitc::bad_args;
    }
    if (!args.binary.empty())
    {
        std::fprintf(stderr, "error: decode does not take -b\n");
        return exitc::bad_args;
    }
    if (!fileio::is_file(args.video))
    {
        std::fprintf(stderr, "error: the video file does not exist: %s\n", args.video.c_str());
        return exitc::io_error;
    }
    if (fileio::same_file(args.output, args.video))
    {
        std::fprintf(stderr, "error: output file is the same file as the video\n");
        return exitc::bad_args;
    }

    media::VideoFileReader reader(log);
    if (!reader.open(args.video))
    {
        std::fprintf(stderr, "error: cannot open video %s\n", args.video.c_str());
        return exitc::io_error;
    }
    media::QrCodeScanner scanner(log);

    std::vector<std::uint8_t> payload;
    const qrstego::Status     st = app::decode_payload(reader, scanner, log, payload);
    reader.close();
    if (!st.ok())
        return report(st);

    std::string err;
    if (!fileio::write_file_atomic(args.output, payload, err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return exitc::io_error;
    }
    LOG_INFO(log, "wrote %zu bytes to %s", payload.size(), args.output.c_str());
    return exitc::ok;
}

}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
    {
        print_usage();
        return exitc::ok;
    }

    // defaults, then QRSTEGO_* environment, then command-line options
    qrstego::Config cfg;
    std::string     err;
    if (!qrstego::load_env(cfg, err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return exitc::bad_config;
    }

    Args args;
    if (int rc = parse_args(argc, argv, 2, args); rc != exitc::ok)
    {
        print_usage();
        return rc;
    }
    for (const auto &[name, value] : args.settings)
    {
        if (!qrstego::apply_option(cfg, name, value, err))
        {
            std::fprintf(stderr, "error: %s\n", err.c_str());
            return exitc::bad_args;
        }
    }
    if (args.verbose && (int)cfg.log_level > (int)qrstego::Level::Info)
        cfg.log_level = qrstego::Level::Info;

    qrstego::Logger log;
    log.level = cfg.log_level;

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"encode", [&]() -> int { return run_encode(args, cfg, log); }},
        {"decode", [&]() -> int { return run_decode(args, log); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG(log, "Running command: %s", cmd.c_str());
    return it->second();
}
