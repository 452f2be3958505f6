#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace genup {

// mkstemp file that is unlinked when the object dies. Carries revision
// payloads to external builders.
class TempFile {
public:
    // `prefix` is a path prefix such as "/tmp/genup-revision"; "-XXXXXX" is
    // appended and filled in by mkstemp.
    static Result Create(const std::string& prefix, TempFile& out);

    TempFile() = default;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept
        : path_(std::exchange(other.path_, {})), fd_(std::move(other.fd_)) {}
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile() { Remove(); }

    // Writes everything, fsyncs and closes. The file stays until destruction.
    Result WriteAndClose(std::string_view contents);

    const std::string& Path() const { return path_; }

private:
    void Remove();

    std::string path_;
    Fd fd_;
};

} // namespace genup
