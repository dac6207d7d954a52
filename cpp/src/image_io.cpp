#include "image_io.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

bool LoadRgbImage(const std::string& path, RgbImage& out) {
    out = RgbImage{};
    int w = 0, h = 0, ch = 0;
    unsigned char* rgb = stbi_load(path.c_str(), &w, &h, &ch, 3);
    if (!rgb || w <= 0 || h <= 0) {
        if (rgb) stbi_image_free(rgb);
        return false;
    }
    out.w = w;
    out.h = h;
    out.rgb.assign(rgb, rgb + static_cast<size_t>(w) * static_cast<size_t>(h) * 3u);
    stbi_image_free(rgb);
    return true;
}
