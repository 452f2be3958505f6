#pragma once

#include "model/session.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace genup {

// Append-only audit log of finished sessions for one target:
//   <dir>/<started-at-millis>-<session-id>.json
class SessionArchive {
  public:
    explicit SessionArchive(std::string dir);

    Result Append(const UpdateSession& session);

    // Newest first. Unreadable entries are skipped with a warning.
    std::expected<std::vector<UpdateSession>, std::string> ListRecent(std::size_t limit) const;

    // Writes every archived session into a gzip-compressed tar at `out_path`.
    Result ExportBundle(const std::string& out_path) const;

    const std::string& Dir() const { return dir_; }

  private:
    std::expected<std::vector<std::string>, std::string> EntryNames() const;

    std::string dir_;
};

} // namespace genup
