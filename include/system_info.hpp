#pragma once

#include <string>

namespace zipline {
namespace system_info {

// Login name with the first letter capitalised, "Unknown" when unset.
std::string user_name();

std::string host_name();

// Windows, Apple, Linux, Android or Unknown.
std::string platform_name();

} // namespace system_info
} // namespace zipline
