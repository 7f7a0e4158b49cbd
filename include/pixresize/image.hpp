#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace pr {

using std::uint8_t;

// ------------------------------------------------------------
// RGBA8 像素（straight alpha）
// ------------------------------------------------------------
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;
};

inline bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

inline bool operator!=(const Color& lhs, const Color& rhs) {
    return !(lhs == rhs);
}

// 動畫影像的 frame 處理模式
enum class AnimationProcessMode {
    All,    // 保留並處理所有 frame
    First,  // 只處理第一個 frame
};

// ------------------------------------------------------------
// 快速像素存取：直接用指標算位址，不經過 virtual
// ------------------------------------------------------------
class ConstPixelView {
public:
    ConstPixelView(const uint8_t* base, int h, int w)
        : base_(base), h_(h), w_(w) {}

    int h() const { return h_; }
    int w() const { return w_; }

    Color get(int x, int y) const {
        const uint8_t* p = base_ + (static_cast<std::size_t>(y) * w_ + x) * 4;
        return Color{p[0], p[1], p[2], p[3]};
    }

private:
    const uint8_t* base_;
    int h_;
    int w_;
};

class PixelView {
public:
    PixelView(uint8_t* base, int h, int w)
        : base_(base), h_(h), w_(w) {}

    int h() const { return h_; }
    int w() const { return w_; }

    Color get(int x, int y) const {
        const uint8_t* p = address(x, y);
        return Color{p[0], p[1], p[2], p[3]};
    }

    void set(int x, int y, Color c) {
        uint8_t* p = address(x, y);
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = c.a;
    }

    operator ConstPixelView() const { return ConstPixelView(base_, h_, w_); }

private:
    uint8_t* address(int x, int y) const {
        return base_ + (static_cast<std::size_t>(y) * w_ + x) * 4;
    }

    uint8_t* base_;
    int h_;
    int w_;
};

// ------------------------------------------------------------
// ImageRGBA8：H x W x 4，frames 個 frame 連續排列
// ------------------------------------------------------------
class ImageRGBA8 {
public:
    static constexpr int kChannels = 4;
    static constexpr float kDefaultDpi = 96.0f;

    ImageRGBA8() = default;

    // 擁有新配置（自有）的影像，像素全為 0（透明）
    ImageRGBA8(int h, int w, int frames = 1)
        : h_(h), w_(w), frames_(frames)
    {
        if (h <= 0 || w <= 0 || frames <= 0)
            throw std::invalid_argument("ImageRGBA8: invalid shape");
        data_ = std::shared_ptr<uint8_t[]>(new uint8_t[byte_size()](), std::default_delete<uint8_t[]>());
    }

    // 共享外部緩衝區（零拷貝）
    ImageRGBA8(int h, int w, int frames, std::shared_ptr<uint8_t[]> external)
        : h_(h), w_(w), frames_(frames), data_(std::move(external))
    {
        if (!data_) throw std::invalid_argument("ImageRGBA8: null external buffer");
        if (h <= 0 || w <= 0 || frames <= 0)
            throw std::invalid_argument("ImageRGBA8: invalid shape");
    }

    // 不允許複製（避免意外深拷），要複製請用 copy()
    ImageRGBA8(const ImageRGBA8&)            = delete;
    ImageRGBA8& operator=(const ImageRGBA8&) = delete;

    // 允許移動
    ImageRGBA8(ImageRGBA8&&)            = default;
    ImageRGBA8& operator=(ImageRGBA8&&) = default;

    int  h() const { return h_; }
    int  w() const { return w_; }
    int  frames() const { return frames_; }
    bool empty() const { return !data_; }

    std::size_t stride() const { return static_cast<std::size_t>(w_) * kChannels; }
    std::size_t frame_size() const { return static_cast<std::size_t>(h_) * stride(); }
    std::size_t byte_size() const { return frame_size() * frames_; }

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    uint8_t*       frame_data(int frame);
    const uint8_t* frame_data(int frame) const;

    PixelView      view(int frame = 0) { return PixelView(frame_data(frame), h_, w_); }
    ConstPixelView view(int frame = 0) const { return ConstPixelView(frame_data(frame), h_, w_); }

    float dpi_x() const { return dpi_x_; }
    float dpi_y() const { return dpi_y_; }
    void  set_resolution(float dpi_x, float dpi_y);

    // 深拷貝；First 模式只保留第一個 frame
    ImageRGBA8 copy(AnimationProcessMode mode = AnimationProcessMode::All) const;

    // 暴露 shared_ptr 以便 pybind11 綁定時延長生命週期
    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

private:
    int h_ = 0, w_ = 0, frames_ = 0;
    float dpi_x_ = kDefaultDpi;
    float dpi_y_ = kDefaultDpi;
    std::shared_ptr<uint8_t[]> data_;
};

} // namespace pr
