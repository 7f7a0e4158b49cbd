#pragma once

#include <string>
#include "pixresize/image.hpp"

namespace pr {

// stb_image：任何格式都轉成 RGBA，單一 frame
ImageRGBA8 load_image_rgba8(const std::string& path);

// 只寫第一個 frame，支援 .png / .jpg
void save_image_rgba8(const std::string& path, const ImageRGBA8& image);

} // namespace pr
