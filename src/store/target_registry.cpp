#include "store/target_registry.hpp"

#include "io/atomic_file.hpp"
#include "store/file_store_backend.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <filesystem>

namespace genup {

namespace fs = std::filesystem;

TargetState::TargetState(std::string id,
                         std::string target_dir,
                         std::shared_ptr<GenerationStore::IBackend> backend)
    : target_id(std::move(id)),
      dir(std::move(target_dir)),
      store(std::move(backend)),
      archive((fs::path(dir) / "sessions").string()) {}

TargetRegistry::TargetRegistry(std::string state_dir)
    : TargetRegistry(std::move(state_dir), [](const std::string& target_dir) {
          return std::make_shared<FileStoreBackend>(target_dir);
      }) {}

TargetRegistry::TargetRegistry(std::string state_dir, BackendFactory backend_factory)
    : state_dir_(std::move(state_dir)), backend_factory_(std::move(backend_factory)) {}

bool TargetRegistry::IsValidTargetId(std::string_view target_id) {
    if (target_id.empty() || target_id == "." || target_id == "..") return false;
    for (const char c : target_id) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') return false;
    }
    return true;
}

std::string TargetRegistry::TargetDir(const std::string& target_id) const {
    return (fs::path(state_dir_) / target_id).string();
}

std::expected<std::shared_ptr<TargetState>, std::string> TargetRegistry::Get(const std::string& target_id) {
    if (!IsValidTargetId(target_id)) {
        return std::unexpected("invalid target id: '" + target_id + "'");
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = targets_.find(target_id); it != targets_.end()) {
        return it->second;
    }

    const std::string dir = TargetDir(target_id);
    auto dr = EnsureDirectory(dir);
    if (!dr.is_ok()) return std::unexpected(dr.msg);

    auto state = std::make_shared<TargetState>(target_id, dir, backend_factory_(dir));
    auto lr = state->store.Load();
    if (!lr.is_ok()) {
        return std::unexpected("target " + target_id + ": " + lr.msg);
    }

    LogDebug("Opened target %s at %s", target_id.c_str(), dir.c_str());
    targets_.emplace(target_id, state);
    return state;
}

} // namespace genup
