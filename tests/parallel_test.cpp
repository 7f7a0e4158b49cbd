#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <vector>

#include "parallel.hpp"

namespace {

using pr::Backend;
using pr::Color;
using pr::ImageRGBA8;

constexpr Backend kBackends[] = {Backend::Single, Backend::OpenMP, Backend::Auto};

TEST(ForEachRow, VisitsEveryRowOnce)
{
    for (Backend backend : kBackends) {
        ImageRGBA8 img(64, 3);
        std::vector<std::atomic<int>> hits(64);

        pr::detail::for_each_row(img.view(), 0, 64, backend, [&](pr::detail::RowWriter& row) {
            hits[row.y()].fetch_add(1);
            for (int x = 0; x < row.w(); ++x) row.set(x, Color{static_cast<uint8_t>(row.y()), 0, 0, 255});
        });

        for (int y = 0; y < 64; ++y) {
            EXPECT_EQ(hits[y].load(), 1) << y;
            EXPECT_EQ(img.view().get(2, y).r, y);
        }
    }
}

TEST(ForEachRow, RespectsRowRange)
{
    ImageRGBA8 img(8, 2);
    pr::detail::for_each_row(img.view(), 2, 5, Backend::Single, [](pr::detail::RowWriter& row) {
        row.set(0, Color{1, 1, 1, 1});
    });

    for (int y = 0; y < 8; ++y) {
        EXPECT_EQ(img.view().get(0, y).a, (y >= 2 && y < 5) ? 1 : 0) << y;
    }

    // 空範圍不呼叫 callback
    bool called = false;
    pr::detail::for_each_row(img.view(), 5, 5, Backend::OpenMP, [&](pr::detail::RowWriter&) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ForEachRow, RowExceptionReachesCaller)
{
    for (Backend backend : kBackends) {
        ImageRGBA8 img(100, 4);
        bool caught = false;
        try {
            pr::detail::for_each_row(img.view(), 0, 100, backend, [](pr::detail::RowWriter& row) {
                if (row.y() == 37) throw std::runtime_error("row 37 failed");
                row.set(0, Color{1, 2, 3, 4});
            });
        } catch (const std::runtime_error& ex) {
            caught = true;
            EXPECT_STREQ(ex.what(), "row 37 failed");
        }
        EXPECT_TRUE(caught) << static_cast<int>(backend);
    }
}

TEST(ForEachRow, FirstOfSeveralExceptionsIsRethrown)
{
    ImageRGBA8 img(50, 1);
    EXPECT_THROW(pr::detail::for_each_row(img.view(), 0, 50, Backend::OpenMP, [](pr::detail::RowWriter& row) {
                     if (row.y() % 2 == 0) throw std::logic_error("even row");
                 }),
                 std::logic_error);
}

} // namespace
