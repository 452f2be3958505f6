#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace genup {

// Pull-style byte source. Read() returns the number of bytes placed in `out`,
// 0 at end of input, or -1 on error.
class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    // Known length of the whole input, if any.
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

} // namespace genup
