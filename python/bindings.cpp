#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "pixresize/image.hpp"
#include "pixresize/geometry.hpp"
#include "pixresize/logging.hpp"
#include "pixresize/options.hpp"
#include "pixresize/resampler.hpp"
#include "pixresize/resizer.hpp"
#ifdef PR_HAS_STB
#include "pixresize/io.hpp"
#endif
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace py = pybind11;

namespace prpy {

using pr::ImageRGBA8;
using pr::Backend;
using pr::Rect;
using pr::Size;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxWx4)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
};

static ShapeInfo check_uint8_hw4(const py::buffer_info& info) {
    if (info.ndim != 3) {
        throw std::runtime_error("expected HxWx4 uint8 array");
    }
    if (info.itemsize != 1) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);
    const int c = static_cast<int>(info.shape[2]);

    if (c != ImageRGBA8::kChannels) {
        throw std::runtime_error("expected 4 channels (RGBA)");
    }

    // H x W x 4: strides = [W*4, 4, 1]
    if (!(info.strides[0] == static_cast<ssize_t>(w * c) &&
          info.strides[1] == static_cast<ssize_t>(c) &&
          info.strides[2] == 1)) {
        throw std::runtime_error("expected C-contiguous array (HxWx4)");
    }

    return {h, w};
}

// ------------------------------------------------------------
// numpy.ndarray -> ImageRGBA8（零拷貝）
// ------------------------------------------------------------
static ImageRGBA8 numpy_to_image_zero_copy(const py::array& array) {
    py::buffer_info info = array.request();
    auto shape = check_uint8_hw4(info);

    auto* ptr = static_cast<uint8_t*>(info.ptr);

    // 持有原始 numpy 陣列，確保其生命週期 >= ImageRGBA8
    py::object owner = array;

    // shared_ptr 不負責釋放 ptr，僅透過捕獲 owner 延長生命週期
    std::shared_ptr<uint8_t[]> sp(ptr, [owner](uint8_t*) mutable {
        // numpy 擁有這塊記憶體；deleter 可能在沒有 GIL 的地方被呼叫
        py::gil_scoped_acquire gil;
        owner = py::object();
    });

    return ImageRGBA8(shape.h, shape.w, 1, std::move(sp));
}

// ------------------------------------------------------------
// ImageRGBA8 -> numpy.ndarray（零拷貝，只輸出第一個 frame）
// ------------------------------------------------------------
static py::array image_to_numpy(const ImageRGBA8& img) {
    if (img.empty()) {
        throw std::runtime_error("Image is empty");
    }

    const int h = img.h();
    const int w = img.w();
    const int c = ImageRGBA8::kChannels;

    std::vector<ssize_t> shape   = {h, w, c};
    std::vector<ssize_t> strides = {static_cast<ssize_t>(w * c),
                                    static_cast<ssize_t>(c),
                                    1};

    // 建立 shared_ptr 副本放進 capsule，讓 numpy 管理一份 ref 計數
    auto* sp_copy = new std::shared_ptr<uint8_t[]>(img.shared());
    py::capsule base(sp_copy, [](void* p) {
        delete reinterpret_cast<std::shared_ptr<uint8_t[]>*>(p);
    });

    return py::array(
        py::dtype::of<uint8_t>(),
        shape,
        strides,
        img.shared().get(),  // data pointer（frame 0 在最前面）
        base                 // base object to keep memory alive
    );
}

static Size to_size(const std::tuple<int, int>& t) {
    return Size{std::get<0>(t), std::get<1>(t)};
}

static py::tuple bounds_to_tuple(const pr::TargetBounds& b) {
    return py::make_tuple(
        py::make_tuple(b.size.width, b.size.height),
        py::make_tuple(b.rect.x, b.rect.y, b.rect.width, b.rect.height));
}

// ------------------------------------------------------------
// Python 參數 → ResizeLayer
// ------------------------------------------------------------
static pr::ResizeLayer make_layer(int width,
                                  int height,
                                  const std::string& mode,
                                  const std::string& anchor,
                                  bool upscale,
                                  const std::optional<std::tuple<float, float>>& center,
                                  const std::optional<std::tuple<int, int>>& anchor_point,
                                  const std::optional<std::tuple<int, int>>& max_size,
                                  const std::vector<std::tuple<int, int>>& restricted_sizes) {
    pr::ResizeLayer layer(Size{width, height},
                          pr::parse_resize_mode(mode),
                          pr::parse_anchor_position(anchor),
                          upscale);
    if (center) {
        layer.center = pr::PointF{std::get<0>(*center), std::get<1>(*center)};
    }
    if (anchor_point) {
        layer.anchor_point = pr::Point{std::get<0>(*anchor_point), std::get<1>(*anchor_point)};
    }
    if (max_size) {
        layer.max_size = to_size(*max_size);
    }
    for (const auto& s : restricted_sizes) {
        layer.restricted_sizes.push_back(to_size(s));
    }
    return layer;
}

static pr::LogLevel parse_log_level(const std::string& s) {
    if (s == "trace")   return pr::LogLevel::Trace;
    if (s == "debug")   return pr::LogLevel::Debug;
    if (s == "info")    return pr::LogLevel::Info;
    if (s == "warning" || s == "warn") return pr::LogLevel::Warning;
    if (s == "error")   return pr::LogLevel::Error;
    if (s == "off")     return pr::LogLevel::Off;
    throw std::runtime_error("level must be one of: trace, debug, info, warning, error, off");
}

} // namespace prpy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace prpy;

    m.doc() = "pixresize core (resize policies + resampling kernels, zero-copy numpy interop)";

#ifdef PR_HAS_STB
    // Image IO
    m.def("load_image",
          [](const std::string& path) {
              return image_to_numpy(pr::load_image_rgba8(path));
          },
          py::arg("path"),
          "Load image as numpy.ndarray (uint8, HxWx4) with zero-copy.");

    m.def("save_image",
          [](const std::string& path, const py::array& array) {
              ImageRGBA8 img = numpy_to_image_zero_copy(array);
              pr::save_image_rgba8(path, img);
          },
          py::arg("path"), py::arg("img"),
          "Save numpy.ndarray (uint8, HxWx4) to file (.png/.jpg).");
#endif

    m.def("set_log_level",
          [](const std::string& level) { pr::set_log_level(parse_log_level(level)); },
          py::arg("level"),
          "Set the log level (trace, debug, info, warning, error, off).");

    // ------------------------------------------------------------
    // Geometry
    // ------------------------------------------------------------
    m.def(
        "calculate_bounds",
        [](std::tuple<int, int> source,
           int width,
           int height,
           const std::string& mode,
           const std::string& anchor,
           std::optional<std::tuple<float, float>> center,
           std::optional<std::tuple<int, int>> anchor_point) {
            pr::ResizeLayer layer = make_layer(width, height, mode, anchor, true,
                                               center, anchor_point, std::nullopt, {});
            return bounds_to_tuple(pr::calculate_target_location_and_bounds(
                to_size(source), layer, width, height));
        },
        py::arg("source"),
        py::arg("width"),
        py::arg("height"),
        py::arg("mode") = "pad",
        py::arg("anchor") = "center",
        py::arg("center") = py::none(),
        py::arg("anchor_point") = py::none(),
        "Return ((width, height), (x, y, w, h)) for the given resize policy."
    );

    // ------------------------------------------------------------
    // Resizer
    // ------------------------------------------------------------
    m.def(
        "resize",
        [](const py::array& src,
           int width,
           int height,
           const std::string& mode,
           const std::string& anchor,
           bool upscale,
           std::optional<std::tuple<float, float>> center,
           std::optional<std::tuple<int, int>> anchor_point,
           std::optional<std::tuple<int, int>> max_size,
           std::vector<std::tuple<int, int>> restricted_sizes,
           const std::string& resampler,
           bool linear,
           const std::string& backend) {
            pr::Resizer resizer(make_layer(width, height, mode, anchor, upscale,
                                           center, anchor_point, max_size, restricted_sizes));
            resizer.set_resampler(pr::parse_resampler(resampler));
            resizer.set_backend(pr::parse_backend(backend));

            ImageRGBA8 in = numpy_to_image_zero_copy(src);  // 這裡是零拷貝
            pr::ResizeResult out;
            {
                py::gil_scoped_release release;
                out = resizer.resize_image(std::move(in), linear);
            }
            return py::make_tuple(image_to_numpy(out.image), out.resized);
        },
        py::arg("img"),
        py::arg("width"),
        py::arg("height"),
        py::arg("mode") = "pad",
        py::arg("anchor") = "center",
        py::arg("upscale") = true,
        py::arg("center") = py::none(),
        py::arg("anchor_point") = py::none(),
        py::arg("max_size") = py::none(),
        py::arg("restricted_sizes") = std::vector<std::tuple<int, int>>{},
        py::arg("resampler") = "bicubic_hq",
        py::arg("linear") = false,
        py::arg("backend") = "auto",
        "Resize an RGBA image under a resize policy. Returns (image, resized)."
    );

    // ------------------------------------------------------------
    // 低階 resampler
    // ------------------------------------------------------------
    m.def(
        "resample",
        [](const py::array& src,
           int width,
           int height,
           std::tuple<int, int, int, int> rect,
           const std::string& resampler,
           bool fix_gamma,
           const std::string& backend) {
            ImageRGBA8 in = numpy_to_image_zero_copy(src);
            const Rect dest{std::get<0>(rect), std::get<1>(rect),
                            std::get<2>(rect), std::get<3>(rect)};
            const pr::Resampler algorithm = pr::parse_resampler(resampler);
            const Backend be = pr::parse_backend(backend);
            ImageRGBA8 out;
            {
                py::gil_scoped_release release;
                out = pr::resample(in, algorithm, width, height, dest, fix_gamma, be);
            }
            return image_to_numpy(out);
        },
        py::arg("img"),
        py::arg("width"),
        py::arg("height"),
        py::arg("rect"),
        py::arg("resampler") = "bicubic",
        py::arg("fix_gamma") = false,
        py::arg("backend") = "auto",
        "Resample into a (height, width) canvas, drawing into rect = (x, y, w, h)."
    );
}
