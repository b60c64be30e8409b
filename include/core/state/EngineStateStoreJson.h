#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include "core/contracts/IEngineStateStore.h"

namespace perpscalp {
namespace core {

// Whole-file JSON snapshot, replaced atomically through a temp file.
class EngineStateStoreJson : public IEngineStateStore {
public:
    explicit EngineStateStoreJson(std::filesystem::path file_path);

    std::optional<EngineStateSnapshot> load() override;
    bool save(const EngineStateSnapshot& snapshot) override;
    bool lastLoadCorrupt() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    bool last_load_corrupt_ = false;
};

} // namespace core
} // namespace perpscalp
