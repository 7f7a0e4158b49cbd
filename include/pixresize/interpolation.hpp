#pragma once

#include <cmath>

namespace pr {

// ------------------------------------------------------------
// 重取樣 kernel（全部為 header inline，給像素迴圈用）
// ------------------------------------------------------------

// Bicubic convolution kernel，a = -0.5
inline double bicubic_kernel(double x) {
    constexpr double a = -0.5;

    if (x < 0) x = -x;

    if (x <= 1) {
        return ((1.5 * x - 2.5) * x * x) + 1;
    }
    if (x < 2) {
        return (((a * x + 2.5) * x - 4) * x) + 2;
    }
    return 0;
}

// Cubic B-spline kernel
inline double bicubic_bspline_kernel(double x) {
    const double xplus2  = x + 2;
    const double xplus1  = x + 1;
    const double xminus1 = x - 1;
    double r = 0;

    if (xplus2 > 0)  r += xplus2 * xplus2 * xplus2;
    if (xplus1 > 0)  r -= 4 * xplus1 * xplus1 * xplus1;
    if (x > 0)       r += 6 * x * x * x;
    if (xminus1 > 0) r -= 4 * xminus1 * xminus1 * xminus1;

    return r / 6.0;
}

namespace detail {

constexpr double kKernelEpsilon = 0.0001;
constexpr double kPi = 3.14159265358979323846;

// 接近 0 的結果直接歸零，避免浮點雜訊
inline double snap_to_zero(double x) {
    return std::abs(x) < kKernelEpsilon ? 0.0 : x;
}

} // namespace detail

inline double sinc(double x) {
    if (std::abs(x) > detail::kKernelEpsilon) {
        x *= detail::kPi;
        return detail::snap_to_zero(std::sin(x) / x);
    }
    return 1.0;
}

// Lanczos kernel，radius = 3
inline double lanczos_kernel3(double x) {
    if (x < 0) x = -x;

    if (x < 3) {
        return sinc(x) * sinc(x / 3.0);
    }
    return 0;
}

} // namespace pr
