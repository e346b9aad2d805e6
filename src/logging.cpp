#include "logging.hpp"
#include <spdlog/spdlog.h>

namespace zipline {

void init_logging(const std::string& level) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace zipline
