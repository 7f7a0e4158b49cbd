#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace pr {

struct Size {
    int width = 0;
    int height = 0;
};

struct Point {
    int x = 0;
    int y = 0;
};

struct PointF {
    float x = 0.f;
    float y = 0.f;
};

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
};

inline bool operator==(const Size& a, const Size& b) { return a.width == b.width && a.height == b.height; }
inline bool operator!=(const Size& a, const Size& b) { return !(a == b); }
inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }
inline bool operator==(const PointF& a, const PointF& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const PointF& a, const PointF& b) { return !(a == b); }
inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

// ------------------------------------------------------------
// 縮放模式
// ------------------------------------------------------------
enum class ResizeMode {
    Pad,      // 等比縮放到容器內，多出的部分留白
    Stretch,  // 直接拉伸到目標尺寸
    Crop,     // 等比縮放到蓋滿容器，多出的部分裁掉
    Max,      // 等比縮放到容器內，輸出尺寸跟著內容走（不留白）
    Min,      // 縮到短邊等於目標為止，只縮小不放大
    BoxPad,   // 放大時不縮放原圖，只把原圖放進較大的畫布；縮小時同 Pad
};

enum class AnchorPosition {
    Center,
    Top,
    Bottom,
    Left,
    Right,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

// ------------------------------------------------------------
// 縮放設定
// ------------------------------------------------------------
struct ResizeLayer {
    ResizeLayer() = default;

    explicit ResizeLayer(Size size,
                         ResizeMode mode = ResizeMode::Pad,
                         AnchorPosition anchor = AnchorPosition::Center,
                         bool upscale = true,
                         std::optional<PointF> center = std::nullopt,
                         std::optional<Size> max_size = std::nullopt,
                         std::vector<Size> restricted_sizes = {},
                         std::optional<Point> anchor_point = std::nullopt)
        : size(size),
          mode(mode),
          anchor(anchor),
          upscale(upscale),
          center(center),
          max_size(max_size),
          restricted_sizes(std::move(restricted_sizes)),
          anchor_point(anchor_point) {}

    Size size;                              // 0 代表由另一邊依比例推算
    ResizeMode mode = ResizeMode::Pad;
    AnchorPosition anchor = AnchorPosition::Center;
    bool upscale = true;                    // BoxPad 一律視為 true
    std::optional<PointF> center;           // Crop 用：裁切中心（以原圖比例表示）
    std::optional<Size> max_size;           // 任一邊 <= 0 代表不限制
    std::vector<Size> restricted_sizes;     // 非空時輸出尺寸必須命中其中之一
    std::optional<Point> anchor_point;      // BoxPad 用：絕對放置位置
};

bool operator==(const ResizeLayer& a, const ResizeLayer& b);
inline bool operator!=(const ResizeLayer& a, const ResizeLayer& b) { return !(a == b); }

// ------------------------------------------------------------
// Anchor 對齊表：每個 AnchorPosition 對應水平 / 垂直各一種對齊
// ------------------------------------------------------------
enum class AxisAlign {
    Start,
    Center,
    End,
};

struct AnchorAlignment {
    AxisAlign horizontal;
    AxisAlign vertical;
};

AnchorAlignment anchor_alignment(AnchorPosition anchor);

// Crop / Pad：free = target - source * ratio（可為負），結果四捨五入
int scaled_offset(AxisAlign align, float free_space);

// BoxPad：整數空間，置中時取整數除法
int placement_offset(AxisAlign align, int canvas, int content);

// ------------------------------------------------------------
// 計算結果：size 為輸出畫布，rect 為內容在畫布上的位置
// ------------------------------------------------------------
struct TargetBounds {
    Size size;
    Rect rect;
};

// width / height 其中一個為 0 時先依原圖比例推算；兩者都 <= 0 丟 InvalidGeometry
Size resolve_target_size(Size source, int width, int height);

TargetBounds calculate_target_location_and_bounds(Size source,
                                                  const ResizeLayer& layer,
                                                  int width,
                                                  int height);

} // namespace pr

namespace std {

template <>
struct hash<pr::ResizeLayer> {
    std::size_t operator()(const pr::ResizeLayer& layer) const noexcept;
};

} // namespace std
