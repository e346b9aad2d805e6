#include "models/transfer_session.hpp"
#include <algorithm>
#include <atomic>

namespace zipline::models {

namespace {

int64_t to_millis(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::string plural(int64_t n, const char* one, const char* many) {
    return std::to_string(n) + " " + (n == 1 ? one : many);
}

} // namespace

double TransferSession::progress_percentage() const {
    if (total_size <= 0) return status == TransferStatus::COMPLETED ? 100.0 : 0.0;
    double pct = static_cast<double>(transferred_size) * 100.0 / static_cast<double>(total_size);
    return std::clamp(pct, 0.0, 100.0);
}

const char* to_string(TransferStatus status) {
    switch (status) {
    case TransferStatus::PENDING: return "pending";
    case TransferStatus::WAITING_FOR_ACCEPTANCE: return "waiting_for_acceptance";
    case TransferStatus::IN_PROGRESS: return "in_progress";
    case TransferStatus::COMPLETED: return "completed";
    case TransferStatus::FAILED: return "failed";
    case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string next_session_id() {
    static std::atomic<int64_t> last{0};
    int64_t now = to_millis(std::chrono::system_clock::now());
    int64_t prev = last.load();
    int64_t candidate;
    do {
        candidate = std::max(now, prev + 1);
    } while (!last.compare_exchange_weak(prev, candidate));
    return std::to_string(candidate);
}

std::string describe(const std::vector<TransferItem>& items) {
    if (items.size() == 1) {
        return items[0].type == ItemType::TEXT ? "Text snippet" : items[0].name;
    }

    int64_t files = 0, folders = 0, texts = 0;
    for (const auto& item : items) {
        switch (item.type) {
        case ItemType::FILE: ++files; break;
        case ItemType::FOLDER: ++folders; break;
        case ItemType::TEXT: ++texts; break;
        }
    }

    std::string out;
    auto add = [&out](const std::string& part) {
        if (!out.empty()) out += ", ";
        out += part;
    };
    if (files) add(plural(files, "file", "files"));
    if (folders) add(plural(folders, "folder", "folders"));
    if (texts) add(plural(texts, "text message", "text messages"));
    return out;
}

void to_json(nlohmann::json& j, const TransferItem& item) {
    j = nlohmann::json{
        {"type", item.type},
        {"name", item.name},
        {"size", item.size},
        {"status", item.status},
    };
    if (!item.path.empty()) j["path"] = item.path;
    if (item.type == ItemType::TEXT) j["text_content"] = item.text_content;
}

void from_json(const nlohmann::json& j, TransferItem& item) {
    j.at("type").get_to(item.type);
    j.at("name").get_to(item.name);
    j.at("size").get_to(item.size);
    item.status = j.value("status", TransferStatus::PENDING);
    item.path = j.value("path", "");
    item.text_content = j.value("text_content", "");
}

void to_json(nlohmann::json& j, const TransferSession& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"peer", s.peer},
        {"items", s.items},
        {"direction", s.direction},
        {"status", s.status},
        {"total_size", s.total_size},
        {"total_files", s.total_files},
        {"transferred_size", s.transferred_size},
        {"completed_files", s.completed_files},
        {"current_file_name", s.current_file_name},
        {"save_directory", s.save_directory},
        {"started_at", to_millis(s.started_at)},
    };
    j["error"] = s.error ? nlohmann::json(*s.error) : nlohmann::json(nullptr);
    if (s.data_transfer_started_at) j["data_transfer_started_at"] = to_millis(*s.data_transfer_started_at);
    if (s.completed_at) j["completed_at"] = to_millis(*s.completed_at);
}

void from_json(const nlohmann::json& j, TransferSession& s) {
    j.at("id").get_to(s.id);
    j.at("peer").get_to(s.peer);
    s.items = j.value("items", std::vector<TransferItem>{});
    j.at("direction").get_to(s.direction);
    j.at("status").get_to(s.status);
    s.total_size = j.value("total_size", int64_t{0});
    s.total_files = j.value("total_files", int64_t{0});
    s.transferred_size = j.value("transferred_size", int64_t{0});
    s.completed_files = j.value("completed_files", int64_t{0});
    s.current_file_name = j.value("current_file_name", "");
    s.save_directory = j.value("save_directory", "");
    s.started_at = from_millis(j.value("started_at", int64_t{0}));

    s.error.reset();
    if (j.contains("error") && j["error"].is_string()) s.error = j["error"].get<std::string>();
    s.data_transfer_started_at.reset();
    if (j.contains("data_transfer_started_at"))
        s.data_transfer_started_at = from_millis(j["data_transfer_started_at"].get<int64_t>());
    s.completed_at.reset();
    if (j.contains("completed_at"))
        s.completed_at = from_millis(j["completed_at"].get<int64_t>());
}

} // namespace zipline::models
