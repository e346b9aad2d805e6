#include "system_info.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <cctype>
#include <cstdlib>

namespace zipline {
namespace system_info {

std::string user_name() {
    const char* env = std::getenv("USERNAME");
    if (!env || !*env) env = std::getenv("USER");
    if (!env || !*env) return "Unknown";

    std::string name(env);
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

std::string host_name() {
    boost::system::error_code ec;
    std::string host = boost::asio::ip::host_name(ec);
    if (ec || host.empty()) {
        const char* env = std::getenv("COMPUTERNAME");
        if (!env || !*env) env = std::getenv("HOSTNAME");
        return env && *env ? std::string(env) : std::string("Unknown");
    }
    return host;
}

std::string platform_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__ANDROID__)
    return "Android";
#elif defined(__APPLE__)
    return "Apple";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

} // namespace system_info
} // namespace zipline
