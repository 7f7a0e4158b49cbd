#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace pr {

// 目標寬高都 <= 0：設定錯誤，重試沒有意義
class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& message)
        : std::invalid_argument(message) {}
};

// 縮放過程中的任何失敗，以 std::throw_with_nested 包住原本的例外
class ImageProcessingException : public std::runtime_error {
public:
    ImageProcessingException(const std::string& message, std::string operation)
        : std::runtime_error(message), operation_(std::move(operation)) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace pr
