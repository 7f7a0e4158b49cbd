#include "pixresize/options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pr {

static std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (ch == '-' || ch == '_' || ch == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

ResizeMode parse_resize_mode(const std::string& s) {
    const std::string v = normalize(s);
    if (v == "pad")     return ResizeMode::Pad;
    if (v == "stretch") return ResizeMode::Stretch;
    if (v == "crop")    return ResizeMode::Crop;
    if (v == "max")     return ResizeMode::Max;
    if (v == "min")     return ResizeMode::Min;
    if (v == "boxpad")  return ResizeMode::BoxPad;
    throw std::invalid_argument("mode must be one of: pad, stretch, crop, max, min, boxpad");
}

AnchorPosition parse_anchor_position(const std::string& s) {
    const std::string v = normalize(s);
    if (v == "center")      return AnchorPosition::Center;
    if (v == "top")         return AnchorPosition::Top;
    if (v == "bottom")      return AnchorPosition::Bottom;
    if (v == "left")        return AnchorPosition::Left;
    if (v == "right")       return AnchorPosition::Right;
    if (v == "topleft")     return AnchorPosition::TopLeft;
    if (v == "topright")    return AnchorPosition::TopRight;
    if (v == "bottomleft")  return AnchorPosition::BottomLeft;
    if (v == "bottomright") return AnchorPosition::BottomRight;
    throw std::invalid_argument(
        "anchor must be one of: center, top, bottom, left, right, "
        "topleft, topright, bottomleft, bottomright");
}

Resampler parse_resampler(const std::string& s) {
    const std::string v = normalize(s);
    if (v == "nearest" || v == "nearestneighbor") return Resampler::NearestNeighbor;
    if (v == "bilinear")                          return Resampler::Bilinear;
    if (v == "bicubic")                           return Resampler::Bicubic;
    if (v == "bicubichq" || v == "bicubichighquality") return Resampler::BicubicHighQuality;
    if (v == "lanczos" || v == "lanczos3")        return Resampler::Lanczos;
    throw std::invalid_argument("resampler must be one of: nearest, bilinear, bicubic, bicubic_hq, lanczos");
}

Backend parse_backend(const std::string& s) {
    const std::string v = normalize(s);
    if (v == "auto")                  return Backend::Auto;
    if (v == "single")                return Backend::Single;
    if (v == "openmp" || v == "omp")  return normalize_backend(Backend::OpenMP);
    throw std::invalid_argument("backend must be one of: auto, single, openmp");
}

AnimationProcessMode parse_animation_process_mode(const std::string& s) {
    const std::string v = normalize(s);
    if (v == "all")   return AnimationProcessMode::All;
    if (v == "first") return AnimationProcessMode::First;
    throw std::invalid_argument("animation mode must be one of: all, first");
}

const char* to_string(ResizeMode mode) {
    switch (mode) {
    case ResizeMode::Pad:     return "pad";
    case ResizeMode::Stretch: return "stretch";
    case ResizeMode::Crop:    return "crop";
    case ResizeMode::Max:     return "max";
    case ResizeMode::Min:     return "min";
    case ResizeMode::BoxPad:  return "boxpad";
    }
    return "unknown";
}

const char* to_string(AnchorPosition anchor) {
    switch (anchor) {
    case AnchorPosition::Center:      return "center";
    case AnchorPosition::Top:         return "top";
    case AnchorPosition::Bottom:      return "bottom";
    case AnchorPosition::Left:        return "left";
    case AnchorPosition::Right:       return "right";
    case AnchorPosition::TopLeft:     return "topleft";
    case AnchorPosition::TopRight:    return "topright";
    case AnchorPosition::BottomLeft:  return "bottomleft";
    case AnchorPosition::BottomRight: return "bottomright";
    }
    return "unknown";
}

const char* to_string(Resampler algorithm) {
    switch (algorithm) {
    case Resampler::NearestNeighbor:    return "nearest";
    case Resampler::Bilinear:           return "bilinear";
    case Resampler::Bicubic:            return "bicubic";
    case Resampler::BicubicHighQuality: return "bicubic_hq";
    case Resampler::Lanczos:            return "lanczos";
    }
    return "unknown";
}

} // namespace pr
