#include "io/gzip_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>

namespace genup {

GzipReader::GzipReader(std::unique_ptr<IReader> source) : source_(std::move(source)) {}

GzipReader::~GzipReader() {
    if (inflating_)
        inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string what) {
    error_ = std::move(what);
    errno = EIO;
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (!error_.empty())
        return Fail(error_);
    if (finished_ || out.empty())
        return 0;
    if (!inflating_) {
        // 16 + MAX_WBITS: gzip framing only, no raw zlib streams.
        if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK)
            return Fail("cannot initialise zlib");
        inflating_ = true;
    }

    const uInt want = static_cast<uInt>(std::min<size_t>(out.size(), UINT_MAX));
    strm_.next_out = out.data();
    strm_.avail_out = want;

    // Loop until at least one byte comes out or the stream ends.
    while (strm_.avail_out == want) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(chunk_);
            if (n < 0)
                return Fail("read error in compressed input");
            if (n == 0)
                return Fail("truncated gzip stream");
            strm_.next_in = chunk_.data();
            strm_.avail_in = static_cast<uInt>(n);
        }
        const int rc = inflate(&strm_, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            finished_ = true;
            break;
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR)
            return Fail(std::string("corrupt gzip data: ") + (strm_.msg ? strm_.msg : "inflate failed"));
    }
    return static_cast<ssize_t>(want - strm_.avail_out);
}

} // namespace genup
