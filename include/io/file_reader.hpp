#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace genup {

constexpr std::uint64_t kDefaultReadLimit = 64ULL * 1024 * 1024;

class FileReader final : public IReader {
public:
    static Result Open(const std::string& path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Drains `reader` into `out`. Fails on a read error or when more than `limit` bytes arrive.
Result ReadAllToString(IReader& reader, std::string& out, std::uint64_t limit = kDefaultReadLimit);

// Reads a whole file; a path ending in ".gz" is inflated transparently.
Result ReadFileToString(const std::string& path, std::string& out);

} // namespace genup
