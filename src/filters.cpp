#include "pixresize/filters.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace pr {

static inline std::size_t idx(int y, int x, int W) {
    return static_cast<std::size_t>(y) * W + x;
}

static inline void accumulate(ColorF& acc, const ColorF& c) {
    acc.r += c.r;
    acc.g += c.g;
    acc.b += c.b;
    acc.a += c.a;
}

static inline ColorF divide(const ColorF& c, float n) {
    return ColorF{c.r / n, c.g / n, c.b / n, c.a / n};
}

// ============================================================
// 水平 pass：window → tmp
// ============================================================
static void box_blur_horizontal(const ColorF* in, ColorF* out,
                                int W, int H, int radius) {
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const int from = std::max(0, x - radius);
            const int to   = std::min(W, x + radius + 1);

            ColorF sum;
            for (int xx = from; xx < to; ++xx) {
                accumulate(sum, in[idx(y, xx, W)]);
            }
            out[idx(y, x, W)] = divide(sum, static_cast<float>(to - from));
        }
    }
}

// ============================================================
// 垂直 pass：tmp → window
// ============================================================
static void box_blur_vertical(const ColorF* in, ColorF* out,
                              int W, int H, int radius) {
    for (int y = 0; y < H; ++y) {
        const int from = std::max(0, y - radius);
        const int to   = std::min(H, y + radius + 1);

        for (int x = 0; x < W; ++x) {
            ColorF sum;
            for (int yy = from; yy < to; ++yy) {
                accumulate(sum, in[idx(yy, x, W)]);
            }
            out[idx(y, x, W)] = divide(sum, static_cast<float>(to - from));
        }
    }
}

static void check_window(const ColorF* window, int w, int h, int radius) {
    if (!window) throw std::invalid_argument("box_blur_window: null window");
    if (w <= 0 || h <= 0) throw std::invalid_argument("box_blur_window: invalid size");
    if (radius < 0) throw std::invalid_argument("box_blur_window: radius must be >= 0");
}

void box_blur_window(ColorF* window, ColorF* scratch, int w, int h, int radius) {
    check_window(window, w, h, radius);
    if (!scratch) throw std::invalid_argument("box_blur_window: null scratch");
    if (radius == 0) return;

    box_blur_horizontal(window, scratch, w, h, radius);
    box_blur_vertical(scratch, window, w, h, radius);
}

void box_blur_window(ColorF* window, int w, int h, int radius) {
    check_window(window, w, h, radius);
    if (radius == 0) return;

    std::vector<ColorF> tmp(static_cast<std::size_t>(w) * h);
    box_blur_window(window, tmp.data(), w, h, radius);
}

} // namespace pr
