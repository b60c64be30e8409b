#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <optional>

namespace perpscalp {
namespace core {

namespace {
std::optional<nlohmann::json> parseRow(const std::string& row, const std::filesystem::path& path) {
    try {
        return nlohmann::json::parse(row);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Skipping malformed journal row in {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        if (auto line = parseRow(row, file_path_)) {
            last_seq_ = (std::max)(last_seq_, parseSeq(*line));
        }
    }
}

bool EventJournalJsonl::append(const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = notification.ts_ms;
    line["type"] = notificationTypeToString(notification.type);
    line["symbol"] = notification.symbol;
    line["error"] = errorKindToString(notification.error);
    line["message"] = notification.message;
    line["payload"] = notification.payload;

    out << line.dump() << "\n";
    if (!out.good()) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        auto line = parseRow(row, file_path_);
        if (!line) {
            continue;
        }

        const auto seq = parseSeq(*line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line->value("ts_ms", 0LL);
        event.type = notificationTypeFromString(line->value("type", std::string("STATUS")));
        event.symbol = line->value("symbol", std::string());
        event.error = line->value("error", std::string());
        event.message = line->value("message", std::string());
        event.payload = line->value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace perpscalp
