#pragma once

#include "util/result.hpp"

#include <string>

namespace genup {

// Replaces `path` with `contents` so that readers see either the previous file
// or the complete new one: write "<path>.tmp", fsync, rename(), fsync the directory.
class AtomicFile {
  public:
    static Result Write(const std::string& path, const std::string& contents);
};

// Creates `dir` and any missing parents.
Result EnsureDirectory(const std::string& dir);

} // namespace genup
