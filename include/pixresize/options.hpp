#pragma once

#include <string>

#include "pixresize/filters.hpp"
#include "pixresize/geometry.hpp"
#include "pixresize/image.hpp"
#include "pixresize/resampler.hpp"

namespace pr {

// ------------------------------------------------------------
// 文字參數 → enum（不分大小寫，無效值丟 std::invalid_argument）
// ------------------------------------------------------------
ResizeMode           parse_resize_mode(const std::string& s);
AnchorPosition       parse_anchor_position(const std::string& s);
Resampler            parse_resampler(const std::string& s);
Backend              parse_backend(const std::string& s);
AnimationProcessMode parse_animation_process_mode(const std::string& s);

const char* to_string(ResizeMode mode);
const char* to_string(AnchorPosition anchor);
const char* to_string(Resampler algorithm);

} // namespace pr
