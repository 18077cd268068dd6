#pragma once

#include <string>
#include <string_view>

namespace quartermaster::common {

inline constexpr auto kLogPattern =
    std::string_view{"%H:%M:%S.%e [%^%l%$] [%n] %v"};

/// Install the process-wide async logger: a colored console sink plus a file
/// sink when `log_file` is not empty.
void init_logging(std::string_view level, const std::string& log_file);

}  // namespace quartermaster::common
