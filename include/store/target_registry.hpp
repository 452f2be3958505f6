#pragma once

#include "store/generation_store.hpp"
#include "store/session_archive.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace genup {

// Everything persistent about one target system. `session_mu` serialises update
// sessions for the target; the store has its own lock for individual operations.
struct TargetState {
    TargetState(std::string id, std::string dir, std::shared_ptr<GenerationStore::IBackend> backend);

    const std::string target_id;
    const std::string dir;
    GenerationStore store;
    SessionArchive archive;
    std::mutex session_mu;
};

class TargetRegistry {
  public:
    using BackendFactory =
        std::function<std::shared_ptr<GenerationStore::IBackend>(const std::string& target_dir)>;

    explicit TargetRegistry(std::string state_dir);
    TargetRegistry(std::string state_dir, BackendFactory backend_factory);

    // Opens (and loads) the target on first use; later calls return the same instance.
    std::expected<std::shared_ptr<TargetState>, std::string> Get(const std::string& target_id);

    std::string TargetDir(const std::string& target_id) const;
    static bool IsValidTargetId(std::string_view target_id);

  private:
    std::string state_dir_;
    BackendFactory backend_factory_;
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<TargetState>> targets_;
};

} // namespace genup
