#pragma once

namespace pr {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

// 設定 pixresize 的 log 等級（透過 spdlog 的 default logger）
void set_log_level(LogLevel level);

} // namespace pr
