#pragma once

#include <atomic>
#include <exception>

#include "pixresize/filters.hpp"
#include "pixresize/image.hpp"

namespace pr {
namespace detail {

// 只能寫入單一 row 的 writer；for_each_row 每個 y 只會建立一個，
// 所以平行時不同 task 不會寫到同一個像素
class RowWriter {
public:
    int y() const { return y_; }
    int w() const { return view_.w(); }

    void set(int x, Color c) { view_.set(x, y_, c); }

private:
    template <typename RowFn>
    friend void for_each_row(PixelView dst, int begin, int end, Backend backend, RowFn&& fn);

    RowWriter(PixelView view, int y) : view_(view), y_(y) {}

    PixelView view_;
    int y_;
};

// 對 [begin, end) 的每個 row 呼叫 fn(RowWriter&)
// OpenMP 區塊內的例外不能直接丟出去：先記下第一個，join 後在呼叫端重丟
template <typename RowFn>
void for_each_row(PixelView dst, int begin, int end, Backend backend, RowFn&& fn) {
    if (begin >= end) return;

    if (resolve_backend(backend) != Backend::OpenMP) {
        for (int y = begin; y < end; ++y) {
            RowWriter row(dst, y);
            fn(row);
        }
        return;
    }

    std::exception_ptr error;
    std::atomic<bool> failed{false};

#ifdef PR_HAS_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (int y = begin; y < end; ++y) {
        if (failed.load(std::memory_order_relaxed)) continue;
        try {
            RowWriter row(dst, y);
            fn(row);
        } catch (...) {
#ifdef PR_HAS_OPENMP
#pragma omp critical(pr_for_each_row_error)
#endif
            {
                if (!error) error = std::current_exception();
            }
            failed.store(true, std::memory_order_relaxed);
        }
    }

    if (error) std::rethrow_exception(error);
}

} // namespace detail
} // namespace pr
