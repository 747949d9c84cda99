#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "media/image.hpp"

namespace media
{

using Bytes = std::vector<std::uint8_t>;

// Renders one framed chunk as a visual code
struct ICodeEncoder
{
    // Largest byte string render() accepts
    virtual std::size_t capacity() const                      = 0;
    virtual bool        render(const Bytes &bytes, Image &out) = 0;  // false if over capacity
    virtual std::string name() const { return ""; }
    virtual ~ICodeEncoder() = default;
};

// Finds at most one code in a frame
struct ICodeScanner
{
    virtual std::optional<Bytes> scan(const Image &frame) = 0;
    virtual std::string          name() const { return ""; }
    virtual ~ICodeScanner() = default;
};

}  // namespace media
