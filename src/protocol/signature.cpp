#include "protocol/signature.hpp"

namespace zipline::protocol {

namespace {

const std::string kAdapterMarker = "|ADAPTER|";
const std::string kTypeMarker = "|TYPE|";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string build_signature(const std::string& user, const std::string& host,
                            const std::string& platform) {
    std::string sig = user.empty() ? host : user + " at " + host;
    if (!platform.empty()) sig += " (" + platform + ")";
    return sig;
}

std::string with_adapter(const std::string& signature, const std::string& adapter_name,
                         const std::string& adapter_type) {
    if (adapter_name.empty()) return signature;
    std::string sig = strip_adapter_markers(signature) + kAdapterMarker + adapter_name;
    if (!adapter_type.empty()) sig += kTypeMarker + adapter_type;
    return sig;
}

std::string strip_adapter_markers(const std::string& signature) {
    size_t pos = signature.find(kAdapterMarker);
    return pos == std::string::npos ? signature : signature.substr(0, pos);
}

SignatureInfo parse_signature(const std::string& signature) {
    SignatureInfo info;

    size_t adapter_pos = signature.find(kAdapterMarker);
    if (adapter_pos != std::string::npos) {
        std::string tail = signature.substr(adapter_pos + kAdapterMarker.size());
        size_t type_pos = tail.find(kTypeMarker);
        if (type_pos != std::string::npos) {
            info.adapter_name = tail.substr(0, type_pos);
            info.adapter_type = tail.substr(type_pos + kTypeMarker.size());
        } else {
            info.adapter_name = tail;
        }
    }

    info.display = trim(strip_adapter_markers(signature));
    info.platform = "Unknown";

    std::string rest = info.display;
    size_t at = rest.find(" at ");
    if (at != std::string::npos) {
        info.user = trim(rest.substr(0, at));
        rest = trim(rest.substr(at + 4));
    }

    size_t paren = rest.rfind(" (");
    if (paren != std::string::npos && !rest.empty() && rest.back() == ')') {
        info.host = trim(rest.substr(0, paren));
        std::string platform = trim(rest.substr(paren + 2, rest.size() - paren - 3));
        if (!platform.empty()) info.platform = platform;
    } else {
        info.host = rest;
    }
    return info;
}

} // namespace zipline::protocol
