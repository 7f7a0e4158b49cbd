#pragma once

#include "pixresize/color.hpp"

namespace pr {

// ------------------------------------------------------------
// 後端：Single 為單執行緒，OpenMP 以 row 為單位平行
// ------------------------------------------------------------
enum class Backend {
    Auto = 0,
    Single = 1,
    OpenMP = 2,
};

inline Backend normalize_backend(Backend b) {
#ifdef PR_HAS_OPENMP
    return b;
#else
    if (b == Backend::OpenMP) return Backend::Single;
    return b;
#endif
}

// Auto → 有 OpenMP 就用 OpenMP，否則 Single
inline Backend resolve_backend(Backend b) {
    b = normalize_backend(b);
    if (b == Backend::Auto) {
#ifdef PR_HAS_OPENMP
        return Backend::OpenMP;
#else
        return Backend::Single;
#endif
    }
    return b;
}

// ------------------------------------------------------------
// 小視窗 box blur（row-major，w x h 個 ColorF，原地修改）
// 先水平再垂直，每個 pass 平均 [i - radius, i + radius]，超出視窗的部分不計
// ------------------------------------------------------------
void box_blur_window(ColorF* window, int w, int h, int radius);

// 同上，水平 pass 的結果寫進呼叫端給的 scratch（至少 w * h 個），不配置記憶體
void box_blur_window(ColorF* window, ColorF* scratch, int w, int h, int radius);

} // namespace pr
