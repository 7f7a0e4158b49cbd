#pragma once

#include <string>
#include <utility>

#include "pixresize/filters.hpp"
#include "pixresize/geometry.hpp"
#include "pixresize/image.hpp"
#include "pixresize/resampler.hpp"

namespace pr {

// resized == false 代表被設定擋下，image 就是原本傳進來的那張
struct ResizeResult {
    ImageRGBA8 image;
    bool resized = false;
};

// ------------------------------------------------------------
// Resizer：依 ResizeLayer 計算幾何，再交給 resampler
// 本身只存設定，可重複使用、可多執行緒共用（const 呼叫）
// ------------------------------------------------------------
class Resizer {
public:
    explicit Resizer(Size size);
    explicit Resizer(ResizeLayer layer);
    virtual ~Resizer() = default;

    const ResizeLayer& layer() const { return layer_; }
    void set_layer(ResizeLayer layer) { layer_ = std::move(layer); }

    Resampler resampler() const { return resampler_; }
    void set_resampler(Resampler resampler) { resampler_ = resampler; }

    Backend backend() const { return backend_; }
    void set_backend(Backend backend) { backend_ = backend; }

    AnimationProcessMode animation_process_mode() const { return animation_process_mode_; }
    void set_animation_process_mode(AnimationProcessMode mode) { animation_process_mode_ = mode; }

    // 取得 source 的所有權；成功時 source 被釋放，回傳新影像
    // 失敗時丟 ImageProcessingException（nested 原本的例外）
    ResizeResult resize_image(ImageRGBA8 source, bool linear) const;

protected:
    // 錯誤訊息與 ImageProcessingException::operation() 用的名稱，子類別覆寫成自己的名字
    virtual std::string operation_name() const { return "Resizer"; }

    // 不做 gamma 修正
    virtual ImageRGBA8 resize_composite(const ImageRGBA8& source,
                                        int width,
                                        int height,
                                        const Rect& destination) const;

    // 在 linear 色彩空間內插，先依 animation mode 複製 frame
    virtual ImageRGBA8 resize_linear(const ImageRGBA8& source,
                                     int width,
                                     int height,
                                     const Rect& destination) const;

private:
    ResizeLayer layer_;
    Resampler resampler_ = Resampler::BicubicHighQuality;
    Backend backend_ = Backend::Auto;
    AnimationProcessMode animation_process_mode_ = AnimationProcessMode::All;
};

} // namespace pr
