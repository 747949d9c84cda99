#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "util/exitcodes.hpp"

namespace qrstego
{

enum class Errc
{
    Ok = 0,
    OversizeInput,       // payload needs more chunks than the index limit allows
    EncodeFailure,       // code encoder rejected a framed chunk
    CorruptChunk,        // checksum mismatch (absorbed by the reassembler)
    IncompleteRecovery,  // indices missing after a full scan
    CoverTooShort,       // cover video has fewer frames than chunks
    IoError,
    BadConfig
};

inline const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::Ok:
            return "Ok";
        case Errc::OversizeInput:
            return "OversizeInput";
        case Errc::EncodeFailure:
            return "EncodeFailure";
        case Errc::CorruptChunk:
            return "CorruptChunk";
        case Errc::IncompleteRecovery:
            return "IncompleteRecovery";
        case Errc::CoverTooShort:
            return "CoverTooShort";
        case Errc::IoError:
            return "IoError";
        case Errc::BadConfig:
            return "BadConfig";
    }
    return "?";
}

struct Status
{
    Errc                       code{Errc::Ok};
    std::string                message;
    std::vector<std::uint32_t> missing;             // IncompleteRecovery only
    bool                       total_known{false};  // IncompleteRecovery only

    bool ok() const { return code == Errc::Ok; }

    static Status success() { return Status{}; }
    static Status error(Errc c, std::string msg)
    {
        Status s;
        s.code    = c;
        s.message = std::move(msg);
        return s;
    }
};

inline int exit_code(const Status &s)
{
    switch (s.code)
    {
        case Errc::Ok:
            return exitc::ok;
        case Errc::OversizeInput:
            return exitc::oversize_input;
        case Errc::EncodeFailure:
            return exitc::encode_failure;
        case Errc::CorruptChunk:
        case Errc::IncompleteRecovery:
            return exitc::incomplete;
        case Errc::CoverTooShort:
            return exitc::cover_short;
        case Errc::IoError:
            return exitc::io_error;
        case Errc::BadConfig:
            return exitc::bad_config;
    }
    return exitc::io_error;
}

// "3, 7, 8, ... (+N more)" for log lines; the full list stays in Status::missing
std::string format_indices(const std::vector<std::uint32_t> &idx, std::size_t max_shown = 32);

}  // namespace qrstego
