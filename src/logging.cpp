#include "pixresize/logging.hpp"

#include "log.hpp"

namespace pr {

void set_log_level(LogLevel level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] %^[%l]%$ [%s:%# %!] %v");

    switch (level) {
    case LogLevel::Trace:   spdlog::set_level(spdlog::level::trace); break;
    case LogLevel::Debug:   spdlog::set_level(spdlog::level::debug); break;
    case LogLevel::Info:    spdlog::set_level(spdlog::level::info); break;
    case LogLevel::Warning: spdlog::set_level(spdlog::level::warn); break;
    case LogLevel::Error:   spdlog::set_level(spdlog::level::err); break;
    case LogLevel::Off:
    default:
        spdlog::set_level(spdlog::level::off);
        break;
    }
}

} // namespace pr
