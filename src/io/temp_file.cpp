#include "io/temp_file.hpp"

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

namespace genup {

Result TempFile::Create(const std::string& prefix, TempFile& out) {
    std::string path = prefix + "-XXXXXX";
    const int fd = ::mkostemp(path.data(), O_CLOEXEC);
    if (fd < 0)
        return Result::FromErrno(errno, "mkostemp " + prefix);
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = std::move(path);
    return Result::Ok();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::exchange(other.path_, {});
        fd_ = std::move(other.fd_);
    }
    return *this;
}

Result TempFile::WriteAndClose(std::string_view contents) {
    if (!fd_.Valid())
        return Result::Fail(EBADF, "temp file is not open");
    if (auto r = WriteFully(fd_.Get(), contents, path_); !r.ok)
        return r;
    if (::fsync(fd_.Get()) != 0)
        return Result::FromErrno(errno, "fsync " + path_);
    return fd_.Close().Within(path_);
}

void TempFile::Remove() {
    fd_.Reset();
    if (!path_.empty()) {
        (void)::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace genup
