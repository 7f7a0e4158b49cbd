#include "pixresize/resampler.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

#include "pixresize/color.hpp"
#include "pixresize/interpolation.hpp"
#include "log.hpp"
#include "parallel.hpp"

namespace pr {

namespace {

// destination rect 與畫布的對應關係，所有 kernel 共用
struct Mapping {
    int start_x, start_y;      // rect 左上角
    int begin_x, end_x;        // rect ∩ [0, width)
    int begin_y, end_y;        // rect ∩ [0, height)
    double width_factor;       // source / rect，dest → source
    double height_factor;
    int max_x, max_y;          // source 寬高 - 1
};

// double 累加器，最後才 clamp
struct Accumulator {
    double r = 0, g = 0, b = 0, a = 0;

    void add(double weight, const ColorF& c) {
        r += weight * c.r;
        g += weight * c.g;
        b += weight * c.b;
        a += weight * c.a;
    }

    ColorF value() const {
        return ColorF{static_cast<float>(r), static_cast<float>(g),
                      static_cast<float>(b), static_cast<float>(a)};
    }
};

inline ColorF sample(const ConstPixelView& src, int x, int y, bool fix_gamma) {
    const Color c = src.get(x, y);
    return fix_gamma ? linearize(c) : to_float(c);
}

inline Color finish(const Accumulator& acc, bool fix_gamma) {
    if (fix_gamma) return delinearize(acc.value());
    return Color{clamp_to_byte(acc.r), clamp_to_byte(acc.g),
                 clamp_to_byte(acc.b), clamp_to_byte(acc.a)};
}

inline int clamp_index(int i, int max) {
    return std::clamp(i, 0, max);
}

void check_args(const char* fn, const ImageRGBA8& src,
                int width, int height, const Rect& destination) {
    if (src.empty()) {
        throw std::invalid_argument(std::string(fn) + ": empty image");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(std::string(fn) + ": invalid new size");
    }
    if (destination.width <= 0 || destination.height <= 0) {
        throw std::invalid_argument(std::string(fn) + ": empty destination rectangle");
    }
    // right() / bottom() 必須放得進 int
    constexpr long long kIntMax = std::numeric_limits<int>::max();
    if (static_cast<long long>(destination.x) + destination.width > kIntMax ||
        static_cast<long long>(destination.y) + destination.height > kIntMax) {
        throw std::invalid_argument(std::string(fn) + ": destination rectangle out of range");
    }
}

Mapping make_mapping(const ImageRGBA8& src, int width, int height, const Rect& destination) {
    Mapping m;
    m.start_x = destination.x;
    m.start_y = destination.y;
    m.begin_x = std::max(0, destination.x);
    m.end_x   = std::min(width, destination.right());
    m.begin_y = std::max(0, destination.y);
    m.end_y   = std::min(height, destination.bottom());
    m.width_factor  = src.w() / static_cast<double>(destination.width);
    m.height_factor = src.h() / static_cast<double>(destination.height);
    m.max_x = src.w() - 1;
    m.max_y = src.h() - 1;
    return m;
}

// 配置輸出（全透明）並對每個 frame 的每個 row 呼叫 row_fn(src_view, m, row)
template <typename RowFn>
ImageRGBA8 run_rows(const char* fn, const ImageRGBA8& src,
                    int width, int height, const Rect& destination,
                    Backend backend, RowFn&& row_fn) {
    check_args(fn, src, width, height, destination);

    const Mapping m = make_mapping(src, width, height, destination);

    PR_LOG_TRACE("{}: {}x{} -> {}x{}, rect ({}, {}, {}, {}), frames {}",
                 fn, src.w(), src.h(), width, height,
                 destination.x, destination.y, destination.width, destination.height,
                 src.frames());

    ImageRGBA8 dst(height, width, src.frames());
    dst.set_resolution(src.dpi_x(), src.dpi_y());

    for (int f = 0; f < src.frames(); ++f) {
        const ConstPixelView in = src.view(f);
        detail::for_each_row(dst.view(f), m.begin_y, m.end_y, backend,
                             [&](detail::RowWriter& row) { row_fn(in, m, row); });
    }
    return dst;
}

// ======================
//  Nearest neighbor
// ======================
void nearest_row(const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
    const int oy = std::min(static_cast<int>((row.y() - m.start_y) * m.height_factor), m.max_y);

    for (int x = m.begin_x; x < m.end_x; ++x) {
        const int ox = std::min(static_cast<int>((x - m.start_x) * m.width_factor), m.max_x);
        row.set(x, in.get(ox, oy));
    }
}

// ======================
//  Bilinear
// ======================
inline double bilinear(double dx1, double dx2, double dy1, double dy2,
                       float p1, float p2, float p3, float p4) {
    return dy2 * (dx2 * p1 + dx1 * p2) + dy1 * (dx2 * p3 + dx1 * p4);
}

void bilinear_row(const ConstPixelView& in, const Mapping& m, bool fix_gamma,
                  detail::RowWriter& row) {
    const double origin_y = (row.y() - m.start_y) * m.height_factor;
    const int    y1  = std::min(static_cast<int>(origin_y), m.max_y);
    const int    y2  = std::min(y1 + 1, m.max_y);
    const double dy1 = origin_y - y1;
    const double dy2 = 1.0 - dy1;

    for (int x = m.begin_x; x < m.end_x; ++x) {
        const double origin_x = (x - m.start_x) * m.width_factor;
        const int    x1  = std::min(static_cast<int>(origin_x), m.max_x);
        const int    x2  = std::min(x1 + 1, m.max_x);
        const double dx1 = origin_x - x1;
        const double dx2 = 1.0 - dx1;

        const ColorF c1 = sample(in, x1, y1, fix_gamma);
        const ColorF c2 = sample(in, x2, y1, fix_gamma);
        const ColorF c3 = sample(in, x1, y2, fix_gamma);
        const ColorF c4 = sample(in, x2, y2, fix_gamma);

        ColorF v;
        v.r = static_cast<float>(bilinear(dx1, dx2, dy1, dy2, c1.r, c2.r, c3.r, c4.r));
        v.g = static_cast<float>(bilinear(dx1, dx2, dy1, dy2, c1.g, c2.g, c3.g, c4.g));
        v.b = static_cast<float>(bilinear(dx1, dx2, dy1, dy2, c1.b, c2.b, c3.b, c4.b));
        v.a = static_cast<float>(bilinear(dx1, dx2, dy1, dy2, c1.a, c2.a, c3.a, c4.a));

        if (fix_gamma) {
            row.set(x, delinearize(v));
        } else {
            // 非 gamma 路徑直接截斷小數
            row.set(x, Color{clamp_to_byte(static_cast<int>(v.r)),
                             clamp_to_byte(static_cast<int>(v.g)),
                             clamp_to_byte(static_cast<int>(v.b)),
                             clamp_to_byte(static_cast<int>(v.a))});
        }
    }
}

// ======================
//  Bicubic
// ======================
void bicubic_row(const ConstPixelView& in, const Mapping& m, bool fix_gamma,
                 detail::RowWriter& row) {
    const double origin_y = (row.y() - m.start_y) * m.height_factor - 0.5;
    const int    oy1 = static_cast<int>(origin_y);
    const double dy  = origin_y - oy1;

    for (int x = m.begin_x; x < m.end_x; ++x) {
        const double origin_x = (x - m.start_x) * m.width_factor - 0.5;
        const int    ox1 = static_cast<int>(origin_x);
        const double dx  = origin_x - ox1;

        Accumulator acc;
        for (int yy = -1; yy < 3; ++yy) {
            const double k1  = bicubic_kernel(dy - yy);
            const int    oy2 = clamp_index(oy1 + yy, m.max_y);

            for (int xx = -1; xx < 3; ++xx) {
                const double k2  = k1 * bicubic_kernel(xx - dx);
                const int    ox2 = clamp_index(ox1 + xx, m.max_x);
                acc.add(k2, sample(in, ox2, oy2, fix_gamma));
            }
        }
        row.set(x, finish(acc, fix_gamma));
    }
}

// ======================
//  Bicubic high quality（B-spline + pre-blur）
// ======================
constexpr int kWindow = 4;

void bicubic_hq_row(const ConstPixelView& in, const Mapping& m, bool fix_gamma,
                    int radius, detail::RowWriter& row) {
    const double origin_y = (row.y() - m.start_y) * m.height_factor - 0.5;
    const int    oy1 = static_cast<int>(origin_y);
    const double dy  = origin_y - oy1;

    std::array<ColorF, kWindow * kWindow> window;
    std::array<ColorF, kWindow * kWindow> scratch;

    for (int x = m.begin_x; x < m.end_x; ++x) {
        const double origin_x = (x - m.start_x) * m.width_factor - 0.5;
        const int    ox1 = static_cast<int>(origin_x);
        const double dx  = origin_x - ox1;

        // 先取 4x4 鄰域（需要時轉 linear）
        for (int yy = -1; yy < 3; ++yy) {
            const int oy2 = clamp_index(oy1 + yy, m.max_y);
            for (int xx = -1; xx < 3; ++xx) {
                const int ox2 = clamp_index(ox1 + xx, m.max_x);
                window[(yy + 1) * kWindow + (xx + 1)] = sample(in, ox2, oy2, fix_gamma);
            }
        }

        if (radius > 0) {
            box_blur_window(window.data(), scratch.data(), kWindow, kWindow, radius);
        }

        Accumulator acc;
        for (int yy = -1; yy < 3; ++yy) {
            const double k1 = bicubic_bspline_kernel(dy - yy);
            for (int xx = -1; xx < 3; ++xx) {
                const double k2 = k1 * bicubic_bspline_kernel(xx - dx);
                acc.add(k2, window[(yy + 1) * kWindow + (xx + 1)]);
            }
        }
        row.set(x, finish(acc, fix_gamma));
    }
}

// ======================
//  Lanczos 3
// ======================
void lanczos_row(const ConstPixelView& in, const Mapping& m, bool fix_gamma,
                 detail::RowWriter& row) {
    const double origin_y = (row.y() - m.start_y) * m.height_factor - 0.5;
    const int    oy1 = static_cast<int>(origin_y);
    const double dy  = origin_y - oy1;

    for (int x = m.begin_x; x < m.end_x; ++x) {
        const double origin_x = (x - m.start_x) * m.width_factor - 0.5;
        const int    ox1 = static_cast<int>(origin_x);
        const double dx  = origin_x - ox1;

        Accumulator acc;
        for (int n = -3; n < 6; ++n) {
            const double k1  = lanczos_kernel3(dy - n);
            const int    oy2 = clamp_index(oy1 + n, m.max_y);

            for (int k = -3; k < 6; ++k) {
                const double k2  = k1 * lanczos_kernel3(k - dx);
                const int    ox2 = clamp_index(ox1 + k, m.max_x);
                acc.add(k2, sample(in, ox2, oy2, fix_gamma));
            }
        }
        row.set(x, finish(acc, fix_gamma));
    }
}

} // namespace

// ======================
//  Public APIs with Backend
// ======================

ImageRGBA8 resize_nearest_neighbor(const ImageRGBA8& src,
                                   int width,
                                   int height,
                                   const Rect& destination,
                                   Backend backend) {
    return run_rows("resize_nearest_neighbor", src, width, height, destination, backend,
                    [](const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
                        nearest_row(in, m, row);
                    });
}

ImageRGBA8 resize_bilinear(const ImageRGBA8& src,
                           int width,
                           int height,
                           const Rect& destination,
                           bool fix_gamma,
                           Backend backend) {
    return run_rows("resize_bilinear", src, width, height, destination, backend,
                    [fix_gamma](const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
                        bilinear_row(in, m, fix_gamma, row);
                    });
}

ImageRGBA8 resize_bicubic(const ImageRGBA8& src,
                          int width,
                          int height,
                          const Rect& destination,
                          bool fix_gamma,
                          Backend backend) {
    return run_rows("resize_bicubic", src, width, height, destination, backend,
                    [fix_gamma](const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
                        bicubic_row(in, m, fix_gamma, row);
                    });
}

ImageRGBA8 resize_bicubic_high_quality(const ImageRGBA8& src,
                                       int width,
                                       int height,
                                       const Rect& destination,
                                       bool fix_gamma,
                                       Backend backend) {
    // 只對很小的輸出做 pre-blur
    const int radius = (width <= kPreBlurMaxDimension && height <= kPreBlurMaxDimension)
                           ? kPreBlurRadius
                           : 0;

    return run_rows("resize_bicubic_high_quality", src, width, height, destination, backend,
                    [fix_gamma, radius](const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
                        bicubic_hq_row(in, m, fix_gamma, radius, row);
                    });
}

ImageRGBA8 resize_lanczos(const ImageRGBA8& src,
                          int width,
                          int height,
                          const Rect& destination,
                          bool fix_gamma,
                          Backend backend) {
    return run_rows("resize_lanczos", src, width, height, destination, backend,
                    [fix_gamma](const ConstPixelView& in, const Mapping& m, detail::RowWriter& row) {
                        lanczos_row(in, m, fix_gamma, row);
                    });
}

ImageRGBA8 resample(const ImageRGBA8& src,
                    Resampler algorithm,
                    int width,
                    int height,
                    const Rect& destination,
                    bool fix_gamma,
                    Backend backend) {
    switch (algorithm) {
    case Resampler::NearestNeighbor:
        return resize_nearest_neighbor(src, width, height, destination, backend);
    case Resampler::Bilinear:
        return resize_bilinear(src, width, height, destination, fix_gamma, backend);
    case Resampler::Bicubic:
        return resize_bicubic(src, width, height, destination, fix_gamma, backend);
    case Resampler::Lanczos:
        return resize_lanczos(src, width, height, destination, fix_gamma, backend);
    case Resampler::BicubicHighQuality:
    default:
        return resize_bicubic_high_quality(src, width, height, destination, fix_gamma, backend);
    }
}

} // namespace pr
