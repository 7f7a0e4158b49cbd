#include "pixresize/color.hpp"

#include <array>
#include <cmath>

namespace pr {

// sRGB 轉換公式
// http://entropymine.com/imageworsener/srgbformula/
float srgb_to_linear(float signal) {
    constexpr float a = 0.055f;

    if (signal <= 0.04045f) {
        return signal / 12.92f;
    }
    return std::pow((signal + a) / (1.0f + a), 2.4f);
}

float linear_to_srgb(float signal) {
    constexpr float a = 0.055f;

    if (signal <= 0.0031308f) {
        return signal * 12.92f;
    }
    return (1.0f + a) * std::pow(signal, 1.0f / 2.4f) - a;
}

// 256 個 sRGB 值對應的 linear 值（0..255 float），只建一次
static const std::array<float, 256>& linear_table() {
    static const std::array<float, 256> table = [] {
        std::array<float, 256> t{};
        for (int v = 0; v < 256; ++v) {
            t[v] = 255.0f * srgb_to_linear(static_cast<float>(v) / 255.0f);
        }
        return t;
    }();
    return table;
}

static inline uint8_t encode_channel(float linear) {
    const float v = std::clamp(linear, 0.0f, 255.0f) / 255.0f;
    return clamp_to_byte(255.0f * linear_to_srgb(v));
}

ColorF linearize(Color composite) {
    const auto& t = linear_table();
    return ColorF{t[composite.r], t[composite.g], t[composite.b],
                  static_cast<float>(composite.a)};
}

Color delinearize(const ColorF& linear) {
    return Color{encode_channel(linear.r),
                 encode_channel(linear.g),
                 encode_channel(linear.b),
                 clamp_to_byte(linear.a)};
}

} // namespace pr
