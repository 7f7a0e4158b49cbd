#include "pixresize/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "pixresize/errors.hpp"
#include "log.hpp"

namespace pr {

// 轉回 int 前先檢查範圍，超出 int 的尺寸 / 位移視為設定錯誤
static inline int to_int_checked(double v) {
    if (!(v >= static_cast<double>(std::numeric_limits<int>::min()) &&
          v <= static_cast<double>(std::numeric_limits<int>::max()))) {
        throw InvalidGeometry("Computed dimension " + std::to_string(v) + " is out of range.");
    }
    return static_cast<int>(v);
}

// 四捨五入到偶數（0.5 → 0、1.5 → 2）
static inline int round_even(double v) {
    return to_int_checked(std::nearbyint(v));
}

static inline int ceil_int(double v) {
    return to_int_checked(std::ceil(v));
}

// ======================
//  Anchor 對齊表
// ======================

AnchorAlignment anchor_alignment(AnchorPosition anchor) {
    switch (anchor) {
    case AnchorPosition::Top:         return {AxisAlign::Center, AxisAlign::Start};
    case AnchorPosition::Bottom:      return {AxisAlign::Center, AxisAlign::End};
    case AnchorPosition::Left:        return {AxisAlign::Start,  AxisAlign::Center};
    case AnchorPosition::Right:       return {AxisAlign::End,    AxisAlign::Center};
    case AnchorPosition::TopLeft:     return {AxisAlign::Start,  AxisAlign::Start};
    case AnchorPosition::TopRight:    return {AxisAlign::End,    AxisAlign::Start};
    case AnchorPosition::BottomLeft:  return {AxisAlign::Start,  AxisAlign::End};
    case AnchorPosition::BottomRight: return {AxisAlign::End,    AxisAlign::End};
    case AnchorPosition::Center:
    default:
        return {AxisAlign::Center, AxisAlign::Center};
    }
}

int scaled_offset(AxisAlign align, float free_space) {
    switch (align) {
    case AxisAlign::Start:
        return 0;
    case AxisAlign::End:
        return round_even(free_space);
    case AxisAlign::Center:
    default:
        return round_even(free_space / 2.0f);
    }
}

int placement_offset(AxisAlign align, int canvas, int content) {
    switch (align) {
    case AxisAlign::Start:
        return 0;
    case AxisAlign::End:
        return canvas - content;
    case AxisAlign::Center:
    default:
        return (canvas - content) / 2;
    }
}

// ======================
//  各模式
// ======================

// Crop：裁切中心（fraction of source）→ offset，夾在 [target - scaled, 0]
static int center_offset(float center, int source_dim, int target_dim, float ratio) {
    const float center_ratio = -(ratio * source_dim) * center;
    int offset = round_even(center_ratio + (target_dim / 2.0f));

    const int min_offset = round_even(target_dim - (source_dim * ratio));
    if (offset > 0) offset = 0;
    if (offset < min_offset) offset = min_offset;
    return offset;
}

static TargetBounds crop_bounds(Size source, const ResizeLayer& layer,
                                int width, int height) {
    const int sw = source.width;
    const int sh = source.height;

    int target_x = 0;
    int target_y = 0;
    int target_w = width;
    int target_h = height;

    const float percent_h = std::abs(height / static_cast<float>(sh));
    const float percent_w = std::abs(width / static_cast<float>(sw));
    const AnchorAlignment align = anchor_alignment(layer.anchor);

    if (percent_h < percent_w) {
        // 寬度決定比例，垂直方向裁切
        const float ratio = percent_w;
        if (layer.center) {
            target_y = center_offset(layer.center->y, sh, height, ratio);
        } else {
            target_y = scaled_offset(align.vertical, height - (sh * ratio));
        }
        target_h = ceil_int(sh * percent_w);
    } else {
        // 高度決定比例，水平方向裁切
        const float ratio = percent_h;
        if (layer.center) {
            target_x = center_offset(layer.center->x, sw, width, ratio);
        } else {
            target_x = scaled_offset(align.horizontal, width - (sw * ratio));
        }
        target_w = ceil_int(sw * percent_h);
    }

    // 輸出尺寸跟 rect 尺寸可以不同
    return {Size{width, height}, Rect{target_x, target_y, target_w, target_h}};
}

static TargetBounds pad_bounds(Size source, const ResizeLayer& layer,
                               int width, int height) {
    const int sw = source.width;
    const int sh = source.height;

    int target_x = 0;
    int target_y = 0;
    int target_w = width;
    int target_h = height;

    const float percent_h = std::abs(height / static_cast<float>(sh));
    const float percent_w = std::abs(width / static_cast<float>(sw));
    const AnchorAlignment align = anchor_alignment(layer.anchor);

    if (percent_h < percent_w) {
        // 高度決定比例，左右留白
        const float ratio = percent_h;
        target_w = round_even(sw * percent_h);
        target_x = scaled_offset(align.horizontal, width - (sw * ratio));
    } else {
        // 寬度決定比例，上下留白
        const float ratio = percent_w;
        target_h = round_even(sh * percent_w);
        target_y = scaled_offset(align.vertical, height - (sh * ratio));
    }

    return {Size{width, height}, Rect{target_x, target_y, target_w, target_h}};
}

static TargetBounds box_pad_bounds(Size source, const ResizeLayer& layer,
                                   int width, int height) {
    const int sw = source.width;
    const int sh = source.height;

    if (width <= 0 || height <= 0) {
        return {source, Rect{0, 0, sw, sh}};
    }

    const float percent_h = std::abs(height / static_cast<float>(sh));
    const float percent_w = std::abs(width / static_cast<float>(sw));

    const int box_h = height > 0 ? height : round_even(sh * percent_w);
    const int box_w = width > 0 ? width : round_even(sw * percent_h);

    // 只有兩邊都放大時才走 box pad，否則交給 Pad
    if (!(sw < box_w && sh < box_h)) {
        return pad_bounds(source, layer, width, height);
    }

    int dest_x = 0;
    int dest_y = 0;
    if (layer.anchor_point) {
        dest_x = std::clamp(layer.anchor_point->x, 0, box_w - sw);
        dest_y = std::clamp(layer.anchor_point->y, 0, box_h - sh);
    } else {
        const AnchorAlignment align = anchor_alignment(layer.anchor);
        dest_x = placement_offset(align.horizontal, box_w, sw);
        dest_y = placement_offset(align.vertical, box_h, sh);
    }

    return {Size{box_w, box_h}, Rect{dest_x, dest_y, sw, sh}};
}

static TargetBounds max_bounds(Size source, int width, int height) {
    int target_w = width;
    int target_h = height;

    const float percent_h = std::abs(height / static_cast<float>(source.height));
    const float percent_w = std::abs(width / static_cast<float>(source.width));

    // 一定要先轉 float 才有足夠精度
    const float ratio = height / static_cast<float>(width);
    const float source_ratio = source.height / static_cast<float>(source.width);

    if (source_ratio < ratio) {
        target_h = round_even(source.height * percent_w);
    } else {
        target_w = round_even(source.width * percent_h);
    }

    return {Size{target_w, target_h}, Rect{0, 0, target_w, target_h}};
}

static TargetBounds min_bounds(Size source, int width, int height) {
    const int sw = source.width;
    const int sh = source.height;
    int target_w = width;
    int target_h = height;

    // 不放大
    if (width > sw || height > sh) {
        return {source, Rect{0, 0, sw, sh}};
    }

    // 找離目標比較近的那一邊
    const int width_diff = sw - width;
    const int height_diff = sh - height;

    if (width_diff < height_diff) {
        const float source_ratio = static_cast<float>(sh) / sw;
        target_h = round_even(width * source_ratio);
    } else if (width_diff > height_diff) {
        const float source_ratio_inverse = static_cast<float>(sw) / sh;
        target_w = round_even(height * source_ratio_inverse);
    } else if (height > width) {
        const float percent_w = std::abs(width / static_cast<float>(sw));
        target_h = round_even(sh * percent_w);
    } else {
        const float percent_h = std::abs(height / static_cast<float>(sh));
        target_w = round_even(sw * percent_h);
    }

    return {Size{target_w, target_h}, Rect{0, 0, target_w, target_h}};
}

// ======================
//  Public APIs
// ======================

Size resolve_target_size(Size source, int width, int height) {
    if (width <= 0 && height <= 0) {
        throw InvalidGeometry("Target width " + std::to_string(width) + " and height " +
                              std::to_string(height) + " must be greater than zero.");
    }
    if (source.width <= 0 || source.height <= 0) {
        throw std::invalid_argument("resolve_target_size: invalid source size");
    }

    // 比例推不出來時至少保留 1 px
    constexpr int kMin = 1;
    if (width == 0 && height > 0) {
        width = std::max(kMin, round_even(static_cast<double>(source.width) * height / source.height));
    }
    if (height == 0 && width > 0) {
        height = std::max(kMin, round_even(static_cast<double>(source.height) * width / source.width));
    }
    return Size{width, height};
}

TargetBounds calculate_target_location_and_bounds(Size source,
                                                  const ResizeLayer& layer,
                                                  int width,
                                                  int height) {
    const Size target = resolve_target_size(source, width, height);
    width = target.width;
    height = target.height;

    TargetBounds bounds;
    switch (layer.mode) {
    case ResizeMode::Crop:
        bounds = crop_bounds(source, layer, width, height);
        break;
    case ResizeMode::Pad:
        bounds = pad_bounds(source, layer, width, height);
        break;
    case ResizeMode::BoxPad:
        bounds = box_pad_bounds(source, layer, width, height);
        break;
    case ResizeMode::Max:
        bounds = max_bounds(source, width, height);
        break;
    case ResizeMode::Min:
        bounds = min_bounds(source, width, height);
        break;
    case ResizeMode::Stretch:
    default:
        bounds = {Size{width, height}, Rect{0, 0, width, height}};
        break;
    }

    PR_LOG_TRACE("bounds {}x{} -> size {}x{}, rect ({}, {}, {}, {})",
                 source.width, source.height,
                 bounds.size.width, bounds.size.height,
                 bounds.rect.x, bounds.rect.y, bounds.rect.width, bounds.rect.height);
    return bounds;
}

// ======================
//  ResizeLayer 比較 / hash
// ======================

bool operator==(const ResizeLayer& a, const ResizeLayer& b) {
    return a.size == b.size &&
           a.mode == b.mode &&
           a.anchor == b.anchor &&
           a.upscale == b.upscale &&
           a.center == b.center &&
           a.max_size == b.max_size &&
           a.restricted_sizes == b.restricted_sizes &&
           a.anchor_point == b.anchor_point;
}

} // namespace pr

namespace {

inline void hash_combine(std::size_t& seed, std::size_t v) {
    seed ^= v + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t std::hash<pr::ResizeLayer>::operator()(const pr::ResizeLayer& layer) const noexcept {
    std::size_t seed = 0;
    const std::hash<int> hi;
    const std::hash<float> hf;

    hash_combine(seed, hi(layer.size.width));
    hash_combine(seed, hi(layer.size.height));
    hash_combine(seed, hi(static_cast<int>(layer.mode)));
    hash_combine(seed, hi(static_cast<int>(layer.anchor)));
    hash_combine(seed, std::hash<bool>()(layer.upscale));

    hash_combine(seed, layer.center.has_value());
    if (layer.center) {
        hash_combine(seed, hf(layer.center->x));
        hash_combine(seed, hf(layer.center->y));
    }
    hash_combine(seed, layer.max_size.has_value());
    if (layer.max_size) {
        hash_combine(seed, hi(layer.max_size->width));
        hash_combine(seed, hi(layer.max_size->height));
    }
    for (const pr::Size& s : layer.restricted_sizes) {
        hash_combine(seed, hi(s.width));
        hash_combine(seed, hi(s.height));
    }
    hash_combine(seed, layer.anchor_point.has_value());
    if (layer.anchor_point) {
        hash_combine(seed, hi(layer.anchor_point->x));
        hash_combine(seed, hi(layer.anchor_point->y));
    }
    return seed;
}
