#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include "pixresize/image.hpp"

namespace pr {

// 浮點累加用的顏色，channel 範圍仍是 0..255
struct ColorF {
    float r = 0.f;
    float g = 0.f;
    float b = 0.f;
    float a = 0.f;
};

inline ColorF to_float(Color c) {
    return ColorF{static_cast<float>(c.r), static_cast<float>(c.g),
                  static_cast<float>(c.b), static_cast<float>(c.a)};
}

// clamp 到 [0, 255] 後四捨五入到偶數（banker's rounding）
inline uint8_t clamp_to_byte(double v) {
    v = std::clamp(v, 0.0, 255.0);
    return static_cast<uint8_t>(std::nearbyint(v));
}

inline Color to_color(const ColorF& c) {
    return Color{clamp_to_byte(c.r), clamp_to_byte(c.g),
                 clamp_to_byte(c.b), clamp_to_byte(c.a)};
}

// 單一 channel 的 sRGB <-> linear 轉換，輸入輸出都在 [0, 1]
float srgb_to_linear(float signal);
float linear_to_srgb(float signal);

// sRGB -> linear（查表，alpha 不變）
ColorF linearize(Color composite);

// linear -> sRGB，結果 clamp 並量化成 8-bit（alpha 只做 clamp）
Color delinearize(const ColorF& linear);

} // namespace pr
