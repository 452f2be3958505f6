#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace genup {

// write(2) until all of `in` is out, retrying EINTR. `name` labels errors.
Result WriteFully(int fd, std::span<const std::uint8_t> in, const std::string& name);
Result WriteFully(int fd, std::string_view in, const std::string& name);

class FileWriter {
  public:
    enum class Mode { Truncate, Append };

    static Result Open(std::string path, FileWriter& out, Mode mode = Mode::Truncate);

    Result WriteAll(std::span<const std::uint8_t> in);
    Result WriteAll(std::string_view in);
    Result Sync();
    Result Close() { return fd_.Close().Within(path_); }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace genup
