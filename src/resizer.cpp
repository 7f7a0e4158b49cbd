#include "pixresize/resizer.hpp"

#include <climits>
#include <exception>
#include <string>

#include "pixresize/errors.hpp"
#include "pixresize/options.hpp"
#include "log.hpp"

namespace pr {

namespace {

// restricted_sizes 非空時，輸出尺寸必須命中其中之一；
// 某一邊為 0 的項目只比對另一邊
bool is_restricted(const std::vector<Size>& restricted, int width, int height) {
    if (restricted.empty()) return false;

    for (const Size& r : restricted) {
        if (r.width == 0 || r.height == 0) {
            if (r.width == width || r.height == height) return false;
        } else if (r.width == width && r.height == height) {
            return false;
        }
    }
    return true;
}

} // namespace

Resizer::Resizer(Size size)
    : layer_(size) {}

Resizer::Resizer(ResizeLayer layer)
    : layer_(std::move(layer)) {}

ResizeResult Resizer::resize_image(ImageRGBA8 source, bool linear) const {
    try {
        if (source.empty()) {
            throw std::invalid_argument("resize_image: empty image");
        }

        const Size source_size{source.w(), source.h()};
        const TargetBounds bounds = calculate_target_location_and_bounds(
            source_size, layer_, layer_.size.width, layer_.size.height);

        const int width = bounds.size.width;
        const int height = bounds.size.height;

        int max_width = layer_.max_size ? layer_.max_size->width : INT_MAX;
        int max_height = layer_.max_size ? layer_.max_size->height : INT_MAX;
        bool upscale = layer_.upscale;

        if (layer_.mode == ResizeMode::Min) {
            // Min 不能放大
            max_width = source_size.width;
            max_height = source_size.height;
            upscale = false;
        } else if (layer_.mode == ResizeMode::BoxPad) {
            upscale = true;
        }

        max_width = max_width > 0 ? max_width : INT_MAX;
        max_height = max_height > 0 ? max_height : INT_MAX;

        if (is_restricted(layer_.restricted_sizes, width, height)) {
            PR_LOG_DEBUG("resize rejected: {}x{} not in restricted sizes", width, height);
            return ResizeResult{std::move(source), false};
        }

        if (width <= 0 || height <= 0 || width > max_width || height > max_height) {
            PR_LOG_DEBUG("resize rejected: {}x{} exceeds max {}x{}", width, height, max_width, max_height);
            return ResizeResult{std::move(source), false};
        }

        if ((width > source_size.width || height > source_size.height) &&
            !upscale && layer_.mode != ResizeMode::Stretch) {
            PR_LOG_DEBUG("resize rejected: upscaling {}x{} -> {}x{} not allowed",
                         source_size.width, source_size.height, width, height);
            return ResizeResult{std::move(source), false};
        }

        PR_LOG_DEBUG("resize {}x{} -> {}x{} ({}, {}, {})",
                     source_size.width, source_size.height, width, height,
                     to_string(layer_.mode), to_string(resampler_),
                     linear ? "linear" : "composite");

        ImageRGBA8 resized = linear ? resize_linear(source, width, height, bounds.rect)
                                    : resize_composite(source, width, height, bounds.rect);

        // source 在這裡離開 scope 被釋放
        return ResizeResult{std::move(resized), true};
    } catch (const std::exception& ex) {
        const std::string name = operation_name();
        PR_LOG_ERROR("Error processing image with {}: {}", name, ex.what());
        std::throw_with_nested(ImageProcessingException(
            "Error processing image with " + name + ": " + ex.what(), name));
    }
}

ImageRGBA8 Resizer::resize_composite(const ImageRGBA8& source,
                                     int width,
                                     int height,
                                     const Rect& destination) const {
    return resample(source, resampler_, width, height, destination, false, backend_);
}

ImageRGBA8 Resizer::resize_linear(const ImageRGBA8& source,
                                  int width,
                                  int height,
                                  const Rect& destination) const {
    const ImageRGBA8 frames = source.copy(animation_process_mode_);
    return resample(frames, resampler_, width, height, destination, true, backend_);
}

} // namespace pr
