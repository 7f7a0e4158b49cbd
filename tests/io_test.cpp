#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "pixresize/image.hpp"
#include "pixresize/io.hpp"

namespace {

using pr::Color;
using pr::ImageRGBA8;

std::string temp_path(const std::string& name)
{
    return (std::filesystem::temp_directory_path() / name).string();
}

TEST(Io, PngKeepsPixelsAndAlpha)
{
    ImageRGBA8 img(3, 5);
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 5; ++x)
            img.view().set(x, y, Color{static_cast<uint8_t>(x * 40), static_cast<uint8_t>(y * 80),
                                       static_cast<uint8_t>(x + y), static_cast<uint8_t>(255 - x * 50)});

    const std::string path = temp_path("pixresize_io_test.png");
    pr::save_image_rgba8(path, img);
    const ImageRGBA8 loaded = pr::load_image_rgba8(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.w(), 5);
    ASSERT_EQ(loaded.h(), 3);
    EXPECT_EQ(loaded.frames(), 1);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            const Color a = img.view().get(x, y);
            const Color b = loaded.view().get(x, y);
            EXPECT_EQ(a.r, b.r) << x << "," << y;
            EXPECT_EQ(a.g, b.g) << x << "," << y;
            EXPECT_EQ(a.b, b.b) << x << "," << y;
            EXPECT_EQ(a.a, b.a) << x << "," << y;
        }
    }
}

TEST(Io, UnsupportedExtensionThrows)
{
    ImageRGBA8 img(2, 2);
    EXPECT_THROW(pr::save_image_rgba8(temp_path("pixresize_io_test.bmp"), img), std::runtime_error);
}

TEST(Io, EmptyImageThrows)
{
    EXPECT_THROW(pr::save_image_rgba8(temp_path("pixresize_io_empty.png"), ImageRGBA8{}),
                 std::invalid_argument);
}

TEST(Io, MissingFileThrows)
{
    EXPECT_THROW(pr::load_image_rgba8(temp_path("pixresize_io_missing.png")), std::runtime_error);
}

} // namespace
