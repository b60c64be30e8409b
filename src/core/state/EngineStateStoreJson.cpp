#include "core/state/EngineStateStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace perpscalp {
namespace core {

EngineStateStoreJson::EngineStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<EngineStateSnapshot> EngineStateStoreJson::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_load_corrupt_ = false;

    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Engine state {} exists but cannot be opened", file_path_.string());
        last_load_corrupt_ = true;
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Engine state {} is corrupt: {}", file_path_.string(), e.what());
        last_load_corrupt_ = true;
        return std::nullopt;
    }
    if (!raw.is_object()) {
        LOG_ERROR("Engine state {} is not a JSON object", file_path_.string());
        last_load_corrupt_ = true;
        return std::nullopt;
    }

    EngineStateSnapshot snapshot;
    try {
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        snapshot.risk_state = raw.value("risk_state", nlohmann::json::object());
        snapshot.positions = raw.value("positions", nlohmann::json::array());
        snapshot.manual_review = raw.value("manual_review", nlohmann::json::array());
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("Engine state {} has malformed fields: {}", file_path_.string(), e.what());
        last_load_corrupt_ = true;
        return std::nullopt;
    }
    if (!snapshot.risk_state.is_object() || !snapshot.positions.is_array() ||
        !snapshot.manual_review.is_array()) {
        LOG_ERROR("Engine state {} has the wrong shape", file_path_.string());
        last_load_corrupt_ = true;
        return std::nullopt;
    }
    return snapshot;
}

bool EngineStateStoreJson::lastLoadCorrupt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_load_corrupt_;
}

bool EngineStateStoreJson::save(const EngineStateSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["risk_state"] = snapshot.risk_state;
    raw["positions"] = snapshot.positions;
    raw["manual_review"] = snapshot.manual_review;

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    ec.clear();
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse rename over an existing file.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Engine state save failed: {}", ec.message());
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace perpscalp
