#include "pixresize/image.hpp"

#include <algorithm>
#include <stdexcept>

namespace pr {

uint8_t* ImageRGBA8::frame_data(int frame) {
    if (empty()) throw std::logic_error("ImageRGBA8: empty image");
    if (frame < 0 || frame >= frames_)
        throw std::out_of_range("ImageRGBA8: frame index out of range");
    return data_.get() + frame_size() * frame;
}

const uint8_t* ImageRGBA8::frame_data(int frame) const {
    if (empty()) throw std::logic_error("ImageRGBA8: empty image");
    if (frame < 0 || frame >= frames_)
        throw std::out_of_range("ImageRGBA8: frame index out of range");
    return data_.get() + frame_size() * frame;
}

void ImageRGBA8::set_resolution(float dpi_x, float dpi_y) {
    if (!(dpi_x > 0.f) || !(dpi_y > 0.f))
        throw std::invalid_argument("ImageRGBA8: resolution must be > 0");
    dpi_x_ = dpi_x;
    dpi_y_ = dpi_y;
}

ImageRGBA8 ImageRGBA8::copy(AnimationProcessMode mode) const {
    if (empty()) throw std::invalid_argument("ImageRGBA8::copy: empty image");

    const int n = (mode == AnimationProcessMode::First) ? 1 : frames_;
    ImageRGBA8 dst(h_, w_, n);
    std::copy(data_.get(), data_.get() + frame_size() * n, dst.data());
    dst.set_resolution(dpi_x_, dpi_y_);
    return dst;
}

} // namespace pr
