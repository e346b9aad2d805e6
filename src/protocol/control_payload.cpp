#include "protocol/control_payload.hpp"

namespace zipline::protocol {

void to_json(nlohmann::json& j, const ControlPayload& p) {
    j = nlohmann::json{{"signature", p.signature}, {"transfer_id", p.transfer_id}};
    if (p.total_files) j["total_files"] = *p.total_files;
    if (p.total_size) j["total_size"] = *p.total_size;
    if (p.description) j["description"] = *p.description;
    if (!p.file_names.empty()) j["file_names"] = p.file_names;
    if (p.data) j["data"] = *p.data;
}

void from_json(const nlohmann::json& j, ControlPayload& p) {
    j.at("signature").get_to(p.signature);
    j.at("transfer_id").get_to(p.transfer_id);

    p.total_files.reset();
    p.total_size.reset();
    p.description.reset();
    p.data.reset();
    p.file_names.clear();

    if (j.contains("total_files") && j["total_files"].is_number_integer())
        p.total_files = j["total_files"].get<int64_t>();
    if (j.contains("total_size") && j["total_size"].is_number_integer())
        p.total_size = j["total_size"].get<int64_t>();
    if (j.contains("description") && j["description"].is_string())
        p.description = j["description"].get<std::string>();
    if (j.contains("file_names") && j["file_names"].is_array())
        p.file_names = j["file_names"].get<std::vector<std::string>>();
    if (j.contains("data") && j["data"].is_string())
        p.data = j["data"].get<std::string>();
}

} // namespace zipline::protocol
