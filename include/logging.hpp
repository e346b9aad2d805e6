#pragma once

#include <string>

namespace zipline {

// Configure the default spdlog logger. level is one of
// trace, debug, info, warn, error, off.
void init_logging(const std::string& level = "info");

} // namespace zipline
