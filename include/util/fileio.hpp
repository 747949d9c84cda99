#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace fileio
{

bool read_file(const std::string &path, std::vector<std::uint8_t> &out, std::string &err);

// Write to a temporary sibling, then rename over path
bool write_file_atomic(const std::string               &path,
                       const std::vector<std::uint8_t> &data,
                       std::string                     &err);

bool is_file(const std::string &path);

// True if both paths exist and name the same file
bool same_file(const std::string &a, const std::string &b);

}  // namespace fileio
