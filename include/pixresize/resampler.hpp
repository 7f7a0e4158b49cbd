#pragma once

#include "pixresize/filters.hpp"  // 為了拿到 pr::Backend 定義
#include "pixresize/geometry.hpp"
#include "pixresize/image.hpp"

namespace pr {

enum class Resampler {
    NearestNeighbor,
    Bilinear,
    Bicubic,
    BicubicHighQuality,
    Lanczos,
};

// Bicubic high quality：輸出兩邊都 <= 150 時先做 pre-blur，減少 moiré
constexpr int kPreBlurMaxDimension = 150;
constexpr int kPreBlurRadius = 4;

// ------------------------------------------------------------
// 共通參數：
//   width / height : 輸出畫布尺寸
//   destination    : 內容在畫布上的位置，畫布以外的部分不取樣
//   fix_gamma      : 在 linear 色彩空間內插
// 畫布上 destination 以外的像素保持透明（全 0）
// ------------------------------------------------------------

ImageRGBA8 resize_nearest_neighbor(const ImageRGBA8& src,
                                   int width,
                                   int height,
                                   const Rect& destination,
                                   Backend backend = Backend::Auto);

ImageRGBA8 resize_bilinear(const ImageRGBA8& src,
                           int width,
                           int height,
                           const Rect& destination,
                           bool fix_gamma,
                           Backend backend = Backend::Auto);

// 4x4 鄰域，bicubic convolution（a = -0.5）
ImageRGBA8 resize_bicubic(const ImageRGBA8& src,
                          int width,
                          int height,
                          const Rect& destination,
                          bool fix_gamma,
                          Backend backend = Backend::Auto);

// 4x4 鄰域，cubic B-spline，小圖先 box blur
ImageRGBA8 resize_bicubic_high_quality(const ImageRGBA8& src,
                                       int width,
                                       int height,
                                       const Rect& destination,
                                       bool fix_gamma,
                                       Backend backend = Backend::Auto);

// Lanczos radius 3
ImageRGBA8 resize_lanczos(const ImageRGBA8& src,
                          int width,
                          int height,
                          const Rect& destination,
                          bool fix_gamma = true,
                          Backend backend = Backend::Auto);

// 依 algorithm 分派；NearestNeighbor 會忽略 fix_gamma
ImageRGBA8 resample(const ImageRGBA8& src,
                    Resampler algorithm,
                    int width,
                    int height,
                    const Rect& destination,
                    bool fix_gamma,
                    Backend backend = Backend::Auto);

} // namespace pr
