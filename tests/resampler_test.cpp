#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include "pixresize/color.hpp"
#include "pixresize/filters.hpp"
#include "pixresize/resampler.hpp"

namespace {

using pr::Backend;
using pr::Color;
using pr::ImageRGBA8;
using pr::Rect;
using pr::Resampler;

ImageRGBA8 solid(int w, int h, Color c, int frames = 1) {
    ImageRGBA8 img(h, w, frames);
    for (int f = 0; f < frames; ++f) {
        pr::PixelView v = img.view(f);
        for (int y = 0; y < h; ++y)
            for (int x = 0; x < w; ++x) v.set(x, y, c);
    }
    return img;
}

ImageRGBA8 gradient(int w, int h) {
    ImageRGBA8 img(h, w);
    pr::PixelView v = img.view();
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            v.set(x, y, Color{static_cast<uint8_t>((x * 255) / std::max(1, w - 1)),
                              static_cast<uint8_t>((y * 255) / std::max(1, h - 1)),
                              static_cast<uint8_t>((x * y) % 256),
                              255});
        }
    }
    return img;
}

bool same_bytes(const ImageRGBA8& a, const ImageRGBA8& b) {
    return a.byte_size() == b.byte_size() &&
           std::equal(a.data(), a.data() + a.byte_size(), b.data());
}

constexpr Resampler kAll[] = {
    Resampler::NearestNeighbor, Resampler::Bilinear, Resampler::Bicubic,
    Resampler::BicubicHighQuality, Resampler::Lanczos,
};

// ======================
//  Nearest neighbor
// ======================

TEST(NearestNeighbor, CheckerboardUpscaleRepeatsBlocks)
{
    const Color black{0, 0, 0, 255};
    const Color white{255, 255, 255, 255};

    ImageRGBA8 src(2, 2);
    src.view().set(0, 0, black);
    src.view().set(1, 0, white);
    src.view().set(0, 1, white);
    src.view().set(1, 1, black);

    const ImageRGBA8 dst = pr::resize_nearest_neighbor(src, 4, 4, Rect{0, 0, 4, 4});
    ASSERT_EQ(dst.w(), 4);
    ASSERT_EQ(dst.h(), 4);

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            EXPECT_EQ(dst.view().get(x, y), src.view().get(x / 2, y / 2)) << x << "," << y;
        }
    }
}

TEST(NearestNeighbor, PaddingStaysTransparent)
{
    const Color red{255, 0, 0, 255};
    const ImageRGBA8 src = solid(2, 2, red);

    const ImageRGBA8 dst = pr::resize_nearest_neighbor(src, 4, 4, Rect{1, 1, 2, 2});
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            const bool inside = x >= 1 && x < 3 && y >= 1 && y < 3;
            EXPECT_EQ(dst.view().get(x, y), inside ? red : Color{}) << x << "," << y;
        }
    }
}

// ======================
//  共通行為
// ======================

TEST(Resample, SolidColorPreserved)
{
    const Color c{200, 100, 50, 255};
    const ImageRGBA8 src = solid(8, 6, c);

    for (Resampler r : {Resampler::NearestNeighbor, Resampler::Bilinear}) {
        for (bool fix_gamma : {false, true}) {
            const ImageRGBA8 dst = pr::resample(src, r, 13, 9, Rect{0, 0, 13, 9}, fix_gamma);
            for (int y = 0; y < 9; ++y)
                for (int x = 0; x < 13; ++x)
                    ASSERT_EQ(dst.view().get(x, y), c) << static_cast<int>(r) << " @" << x << "," << y;
        }
    }
}

TEST(Resample, SolidColorPreservedAwayFromOrigin)
{
    // 第 0 行 / 列的 back-mapped 座標為 -0.5，不在此檢查
    const Color c{200, 100, 50, 255};
    const ImageRGBA8 src = solid(4, 4, c);

    for (Resampler r : {Resampler::Bicubic, Resampler::BicubicHighQuality}) {
        const ImageRGBA8 dst = pr::resample(src, r, 8, 8, Rect{0, 0, 8, 8}, false);
        for (int y = 1; y < 8; ++y)
            for (int x = 1; x < 8; ++x)
                ASSERT_EQ(dst.view().get(x, y), c) << static_cast<int>(r) << " @" << x << "," << y;
    }

    // Lanczos 權重不做正規化
    const ImageRGBA8 dst = pr::resize_lanczos(src, 8, 8, Rect{0, 0, 8, 8}, false);
    for (int y = 1; y < 8; ++y) {
        for (int x = 1; x < 8; ++x) {
            const Color got = dst.view().get(x, y);
            EXPECT_NEAR(got.r, c.r, 3);
            EXPECT_NEAR(got.g, c.g, 3);
            EXPECT_NEAR(got.b, c.b, 3);
        }
    }
}

TEST(Resample, BilinearGammaCorrectMidpoint)
{
    ImageRGBA8 src(1, 2);
    src.view().set(0, 0, Color{0, 0, 0, 255});
    src.view().set(1, 0, Color{255, 255, 255, 255});

    const ImageRGBA8 plain = pr::resize_bilinear(src, 4, 1, Rect{0, 0, 4, 1}, false);
    const ImageRGBA8 linear = pr::resize_bilinear(src, 4, 1, Rect{0, 0, 4, 1}, true);

    // x = 1 落在兩個像素正中間
    EXPECT_EQ(plain.view().get(1, 0).r, 127);
    EXPECT_NEAR(linear.view().get(1, 0).r, 188, 1);
    EXPECT_EQ(linear.view().get(1, 0).a, 255);
}

TEST(Resample, OutputHasRequestedShapeAndResolution)
{
    ImageRGBA8 src = gradient(16, 12);
    src.set_resolution(300.f, 200.f);

    for (Resampler r : kAll) {
        const ImageRGBA8 dst = pr::resample(src, r, 7, 5, Rect{0, 0, 7, 5}, true);
        EXPECT_EQ(dst.w(), 7);
        EXPECT_EQ(dst.h(), 5);
        EXPECT_EQ(dst.frames(), 1);
        EXPECT_FLOAT_EQ(dst.dpi_x(), 300.f);
        EXPECT_FLOAT_EQ(dst.dpi_y(), 200.f);
    }
}

TEST(Resample, RectangleBeyondCanvasIsClipped)
{
    const ImageRGBA8 src = gradient(10, 10);

    for (Resampler r : kAll) {
        const ImageRGBA8 dst = pr::resample(src, r, 4, 4, Rect{-3, -2, 12, 9}, false);
        EXPECT_EQ(dst.w(), 4);
        EXPECT_EQ(dst.h(), 4);
        // 整個畫布都在 rect 內，alpha 全部寫入
        for (int y = 0; y < 4; ++y)
            for (int x = 0; x < 4; ++x)
                EXPECT_GT(dst.view().get(x, y).a, 0);
    }
}

TEST(Resample, DeterministicAcrossBackends)
{
    const ImageRGBA8 src = gradient(37, 23);

    for (Resampler r : kAll) {
        for (bool fix_gamma : {false, true}) {
            const ImageRGBA8 single = pr::resample(src, r, 61, 41, Rect{3, 2, 55, 37}, fix_gamma, Backend::Single);
            const ImageRGBA8 parallel = pr::resample(src, r, 61, 41, Rect{3, 2, 55, 37}, fix_gamma, Backend::OpenMP);
            const ImageRGBA8 again = pr::resample(src, r, 61, 41, Rect{3, 2, 55, 37}, fix_gamma, Backend::Auto);
            EXPECT_TRUE(same_bytes(single, parallel)) << static_cast<int>(r);
            EXPECT_TRUE(same_bytes(single, again)) << static_cast<int>(r);
        }
    }
}

TEST(Resample, EveryFrameIsResampled)
{
    const Color first{10, 20, 30, 255};
    const Color second{200, 150, 100, 255};

    ImageRGBA8 src = solid(4, 4, first, 2);
    pr::PixelView v = src.view(1);
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 4; ++x) v.set(x, y, second);

    const ImageRGBA8 dst = pr::resize_nearest_neighbor(src, 2, 2, Rect{0, 0, 2, 2});
    ASSERT_EQ(dst.frames(), 2);
    EXPECT_EQ(dst.view(0).get(1, 1), first);
    EXPECT_EQ(dst.view(1).get(1, 1), second);
}

TEST(Resample, InvalidArgumentsThrow)
{
    const ImageRGBA8 src = gradient(4, 4);
    const ImageRGBA8 empty;

    for (Resampler r : kAll) {
        EXPECT_THROW(pr::resample(empty, r, 4, 4, Rect{0, 0, 4, 4}, false), std::invalid_argument);
        EXPECT_THROW(pr::resample(src, r, 0, 4, Rect{0, 0, 4, 4}, false), std::invalid_argument);
        EXPECT_THROW(pr::resample(src, r, 4, -1, Rect{0, 0, 4, 4}, false), std::invalid_argument);
        EXPECT_THROW(pr::resample(src, r, 4, 4, Rect{0, 0, 0, 4}, false), std::invalid_argument);
        EXPECT_THROW(pr::resample(src, r, 4, 4, Rect{2147483000, 0, 1000, 4}, false), std::invalid_argument);
        EXPECT_THROW(pr::resample(src, r, 4, 4, Rect{0, 2147483000, 4, 1000}, false), std::invalid_argument);
    }
}

TEST(Resample, HighQualityBlursSmallOutputsOnly)
{
    // 黑白直條紋：小輸出會被 pre-blur 抹平，大輸出保留對比
    ImageRGBA8 src(8, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x)
            src.view().set(x, y, (x % 2) ? Color{255, 255, 255, 255} : Color{0, 0, 0, 255});

    const ImageRGBA8 small = pr::resize_bicubic_high_quality(src, 16, 16, Rect{0, 0, 16, 16}, false);
    const ImageRGBA8 large = pr::resize_bicubic_high_quality(src, 160, 16, Rect{0, 0, 160, 16}, false);

    int small_min = 255, small_max = 0, large_min = 255, large_max = 0;
    for (int x = 4; x < 12; ++x) {
        const int v = small.view().get(x, 8).r;
        small_min = std::min(small_min, v);
        small_max = std::max(small_max, v);
    }
    for (int x = 40; x < 120; ++x) {
        const int v = large.view().get(x, 8).r;
        large_min = std::min(large_min, v);
        large_max = std::max(large_max, v);
    }
    EXPECT_LT(small_max - small_min, large_max - large_min);
}

// ======================
//  Box blur
// ======================

TEST(BoxBlur, RadiusZeroIsNoop)
{
    std::array<pr::ColorF, 4> w = {pr::ColorF{1, 2, 3, 4}, pr::ColorF{5, 6, 7, 8},
                                   pr::ColorF{9, 10, 11, 12}, pr::ColorF{13, 14, 15, 16}};
    pr::box_blur_window(w.data(), 2, 2, 0);
    EXPECT_FLOAT_EQ(w[3].r, 13.f);
}

TEST(BoxBlur, LargeRadiusAveragesWholeWindow)
{
    std::array<pr::ColorF, 16> w{};
    for (int i = 0; i < 16; ++i) w[i] = pr::ColorF{static_cast<float>(i), 0.f, 0.f, 255.f};

    pr::box_blur_window(w.data(), 4, 4, 4);
    for (const pr::ColorF& c : w) {
        EXPECT_NEAR(c.r, 7.5f, 1e-4);
        EXPECT_NEAR(c.a, 255.f, 1e-4);
    }
}

TEST(BoxBlur, ScratchOverloadMatchesAllocating)
{
    std::array<pr::ColorF, 16> a{};
    for (int i = 0; i < 16; ++i) a[i] = pr::ColorF{static_cast<float>(i * i), static_cast<float>(i), 0.f, 255.f};
    std::array<pr::ColorF, 16> b = a;
    std::array<pr::ColorF, 16> scratch{};

    pr::box_blur_window(a.data(), 4, 4, 1);
    pr::box_blur_window(b.data(), scratch.data(), 4, 4, 1);
    for (int i = 0; i < 16; ++i) {
        EXPECT_FLOAT_EQ(a[i].r, b[i].r) << i;
        EXPECT_FLOAT_EQ(a[i].g, b[i].g) << i;
    }
}

TEST(BoxBlur, InvalidArgumentsThrow)
{
    std::array<pr::ColorF, 4> w{};
    EXPECT_THROW(pr::box_blur_window(w.data(), nullptr, 2, 2, 1), std::invalid_argument);
    EXPECT_THROW(pr::box_blur_window(nullptr, 2, 2, 1), std::invalid_argument);
    EXPECT_THROW(pr::box_blur_window(w.data(), 0, 2, 1), std::invalid_argument);
    EXPECT_THROW(pr::box_blur_window(w.data(), 2, 2, -1), std::invalid_argument);
}

} // namespace
