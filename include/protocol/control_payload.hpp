#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zipline::protocol {

// JSON body of transfer_request / accept / decline / cancel datagrams.
// For a request, total_files, total_size and description are set.
// For accept, data is the receiver's chosen save path hint; for decline
// and cancel it is the reason.
struct ControlPayload {
    std::string signature;
    std::string transfer_id;
    std::optional<int64_t> total_files;
    std::optional<int64_t> total_size;
    std::optional<std::string> description;
    std::vector<std::string> file_names;
    std::optional<std::string> data;
};

void to_json(nlohmann::json& j, const ControlPayload& p);

// Throws nlohmann::json::exception when signature or transfer_id is missing.
void from_json(const nlohmann::json& j, ControlPayload& p);

} // namespace zipline::protocol
