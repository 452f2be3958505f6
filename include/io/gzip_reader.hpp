#pragma once

#include "io/io.hpp"

#include <array>
#include <memory>
#include <string>
#include <zlib.h>

namespace genup {

// Inflates a gzip stream pulled from `source`. Failures are sticky: once Read()
// returns -1 it keeps doing so and Error() says why.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;
    ~GzipReader() override;

    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Error() const { return error_; }

  private:
    ssize_t Fail(std::string what);

    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    bool inflating_ = false;
    bool finished_ = false;
    std::string error_;
    std::array<std::uint8_t, 16 * 1024> chunk_{};
};

} // namespace genup
