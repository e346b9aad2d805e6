#pragma once

#include <string>

namespace zipline::protocol {

// Signatures look like "User at Host (Platform)" or "Host (Platform)",
// optionally followed by "|ADAPTER|<name>[|TYPE|<type>]".
struct SignatureInfo {
    std::string user;
    std::string host;
    std::string platform;
    std::string adapter_name;
    std::string adapter_type;
    std::string display;       // signature with adapter markers removed
};

std::string build_signature(const std::string& user, const std::string& host,
                            const std::string& platform);

std::string with_adapter(const std::string& signature, const std::string& adapter_name,
                         const std::string& adapter_type = "");

std::string strip_adapter_markers(const std::string& signature);

SignatureInfo parse_signature(const std::string& signature);

} // namespace zipline::protocol
