#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace quartermaster::image {

inline constexpr uint8_t kBlack = 0x00;
inline constexpr uint8_t kWhite = 0xFF;

/// 8-bit grayscale raster, row-major, no padding.
struct bitmap final {
  uint32_t width{};
  uint32_t height{};
  std::vector<uint8_t> pixels;
};

bitmap make_bitmap(uint32_t width, uint32_t height, uint8_t fill = kWhite);

uint8_t pixel_at(const bitmap& image, uint32_t x, uint32_t y);

/// Clipped to the bitmap bounds.
void fill_rect(bitmap& image,
               int64_t x,
               int64_t y,
               int64_t width,
               int64_t height,
               uint8_t value);

/// Paint every pixel whose centre lies within `radius` of (cx, cy).
void fill_disc(bitmap& image, double cx, double cy, double radius,
               uint8_t value);

/// Count of pixels equal to `value`.
size_t count_pixels(const bitmap& image, uint8_t value);

}  // namespace quartermaster::image
