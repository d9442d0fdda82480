#pragma once

#include <cstdint>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace costbridge::process {

// A bidirectional, newline-framed text stream.
class LineChannel {
public:
    virtual ~LineChannel() = default;

    // Writes `line` plus a terminating newline and flushes.
    virtual core::errors::Status write_line(const std::string& line) = 0;

    // Blocks until one full line (without the newline) is available or
    // `timeout_ms` expires. A timeout of 0 waits forever.
    virtual core::errors::Result<std::string> read_line(std::uint32_t timeout_ms) = 0;

    virtual bool is_open() const = 0;
};

}  // namespace costbridge::process
