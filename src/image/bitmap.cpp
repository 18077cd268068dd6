#include <quartermaster/image/bitmap.hpp>
#include <algorithm>
#include <cmath>

namespace quartermaster::image {

bitmap make_bitmap(const uint32_t width,
                   const uint32_t height,
                   const uint8_t fill) {
  return bitmap{.width = width,
                .height = height,
                .pixels = std::vector<uint8_t>(
                    static_cast<size_t>(width) * height, fill)};
}

uint8_t pixel_at(const bitmap& image, const uint32_t x, const uint32_t y) {
  return image.pixels[static_cast<size_t>(y) * image.width + x];
}

void fill_rect(bitmap& image,
               const int64_t x,
               const int64_t y,
               const int64_t width,
               const int64_t height,
               const uint8_t value) {
  const auto left = std::clamp<int64_t>(x, 0, image.width);
  const auto top = std::clamp<int64_t>(y, 0, image.height);
  const auto right = std::clamp<int64_t>(x + width, 0, image.width);
  const auto bottom = std::clamp<int64_t>(y + height, 0, image.height);
  for (auto row = top; row < bottom; ++row) {
    auto* line = image.pixels.data() + row * image.width;
    std::fill(line + left, line + right, value);
  }
}

void fill_disc(bitmap& image,
               const double cx,
               const double cy,
               const double radius,
               const uint8_t value) {
  const auto left = std::max<int64_t>(0, std::floor(cx - radius));
  const auto top = std::max<int64_t>(0, std::floor(cy - radius));
  const auto right =
      std::min<int64_t>(image.width, std::ceil(cx + radius) + 1);
  const auto bottom =
      std::min<int64_t>(image.height, std::ceil(cy + radius) + 1);
  const auto limit = radius * radius;
  for (auto y = top; y < bottom; ++y) {
    for (auto x = left; x < right; ++x) {
      const auto dx = (static_cast<double>(x) + 0.5) - cx;
      const auto dy = (static_cast<double>(y) + 0.5) - cy;
      if ((dx * dx + dy * dy) <= limit) {
        image.pixels[static_cast<size_t>(y) * image.width + x] = value;
      }
    }
  }
}

size_t count_pixels(const bitmap& image, const uint8_t value) {
  return static_cast<size_t>(
      std::count(std::begin(image.pixels), std::end(image.pixels), value));
}

}  // namespace quartermaster::image
