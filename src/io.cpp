#include "pixresize/io.hpp"
#include <memory>
#include <string>
#include <stdexcept>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace pr {

// 零拷貝：直接共享 stb 配置的像素，一律要求 4 channel
ImageRGBA8 load_image_rgba8(const std::string& path)
{
    int w = 0, h = 0, ch_in = 0;

    stbi_uc* raw = stbi_load(path.c_str(), &w, &h, &ch_in, ImageRGBA8::kChannels);
    if (!raw) throw std::runtime_error("stb_image: failed to load " + path);

    // 將 raw 交給 shared_ptr 管理，deleter 使用 stbi_image_free
    std::shared_ptr<uint8_t[]> sp(
        reinterpret_cast<uint8_t*>(raw),
        [](uint8_t* p){ stbi_image_free(p); }
    );

    return ImageRGBA8(h, w, 1, std::move(sp));
}


// 只寫第一個 frame
void save_image_rgba8(const std::string& path, const ImageRGBA8& image)
{
    if (image.empty())
        throw std::invalid_argument("save_image: empty image");

    const auto ends_with = [](const std::string& s, const char* suf){
        const size_t n = std::char_traits<char>::length(suf);
        return s.size() >= n && s.compare(s.size()-n, n, suf) == 0;
    };

    const int w = image.w();
    const int h = image.h();
    const uint8_t* data = image.frame_data(0);

    if (ends_with(path, ".png") || ends_with(path, ".PNG"))
    {
        const int stride = static_cast<int>(image.stride()); // bytes per row
        if (!stbi_write_png(path.c_str(), w, h, ImageRGBA8::kChannels, data, stride))
            throw std::runtime_error("stb_image_write: failed to write png " + path);
    }
    else if (ends_with(path, ".jpg") || ends_with(path, ".jpeg")
          || ends_with(path, ".JPG") || ends_with(path, ".JPEG"))
    {
        // jpg 沒有 alpha，stb 會忽略第 4 個 channel
        int quality = 95;
        if (!stbi_write_jpg(path.c_str(), w, h, ImageRGBA8::kChannels, data, quality))
            throw std::runtime_error("stb_image_write: failed to write jpg " + path);
    }
    else {
        throw std::runtime_error("save_image: unsupported extension (use .png/.jpg): " + path);
    }
}

} // namespace pr
