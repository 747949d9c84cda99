#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "util/fileio.hpp"

namespace fs = std::filesystem;

namespace fileio
{

bool read_file(const std::string &path, std::vector<std::uint8_t> &out, std::string &err)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        err = "not a regular file: " + path;
        return false;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        err = "cannot open " + path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        err = "read error on " + path;
        return false;
    }
    return true;
}

bool write_file_atomic(const std::string               &path,
                       const std::vector<std::uint8_t> &data,
                       std::string                     &err)
{
    const fs::path    p(path);
    const std::string tmp = (p.parent_path() / ("." + p.filename().string() + ".partial")).string();
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            err = "cannot create " + tmp;
            return false;
        }
        if (!data.empty())
            ofs.write(reinterpret_cast<const char *>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
        {
            err = "write error on " + tmp;
            std::error_code ec;
            fs::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        err = "cannot move " + tmp + " to " + path + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool is_file(const std::string &path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool same_file(const std::string &a, const std::string &b)
{
    std::error_code ec;
    const bool      eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

}  // namespace fileio
