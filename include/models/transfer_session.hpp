#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models/peer.hpp"

namespace zipline::models {

enum class ItemType { FILE, FOLDER, TEXT };

enum class TransferStatus {
    PENDING,
    WAITING_FOR_ACCEPTANCE,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class TransferDirection { SENDING, RECEIVING };

NLOHMANN_JSON_SERIALIZE_ENUM(ItemType, {
    {ItemType::FILE, "file"},
    {ItemType::FOLDER, "folder"},
    {ItemType::TEXT, "text"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TransferStatus, {
    {TransferStatus::PENDING, "pending"},
    {TransferStatus::WAITING_FOR_ACCEPTANCE, "waiting_for_acceptance"},
    {TransferStatus::IN_PROGRESS, "in_progress"},
    {TransferStatus::COMPLETED, "completed"},
    {TransferStatus::FAILED, "failed"},
    {TransferStatus::CANCELLED, "cancelled"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TransferDirection, {
    {TransferDirection::SENDING, "sending"},
    {TransferDirection::RECEIVING, "receiving"},
})

struct TransferItem {
    ItemType type = ItemType::FILE;
    std::string name;          // forward-slash relative path on the wire
    int64_t size = 0;          // -1 for folders, UTF-8 byte length for text
    std::string path;          // sender side only
    std::string text_content;  // text only
    TransferStatus status = TransferStatus::PENDING;
};

using TimePoint = std::chrono::system_clock::time_point;

struct TransferSession {
    std::string id;
    Peer peer;
    std::vector<TransferItem> items;
    TransferDirection direction = TransferDirection::SENDING;
    TransferStatus status = TransferStatus::PENDING;

    int64_t total_size = 0;
    int64_t total_files = 0;
    int64_t transferred_size = 0;
    int64_t completed_files = 0;
    std::string current_file_name;
    double current_speed = 0.0;    // bytes per second
    std::optional<std::string> error;
    std::string save_directory;    // receiving side

    TimePoint started_at{};
    std::optional<TimePoint> data_transfer_started_at;
    std::optional<TimePoint> completed_at;

    bool is_terminal() const {
        return status == TransferStatus::COMPLETED || status == TransferStatus::FAILED ||
               status == TransferStatus::CANCELLED;
    }

    double progress_percentage() const;
};

const char* to_string(TransferStatus status);

// Unique, monotonically increasing millisecond timestamp string.
std::string next_session_id();

// "N files, M folders, K text messages", or the single item's name.
std::string describe(const std::vector<TransferItem>& items);

void to_json(nlohmann::json& j, const TransferItem& item);
void from_json(const nlohmann::json& j, TransferItem& item);
void to_json(nlohmann::json& j, const TransferSession& s);
void from_json(const nlohmann::json& j, TransferSession& s);

} // namespace zipline::models
