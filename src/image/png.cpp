#include <png.h>
#include <spdlog/spdlog.h>
#include <quartermaster/image/png.hpp>
#include <csetjmp>
#include <cstring>
#include <iterator>

namespace quartermaster::image {

namespace {

struct read_cursor final {
  const uint8_t* data{};
  size_t size{};
  size_t offset{};
};

void on_error(png_structp png, png_const_charp message) {
  auto* error = static_cast<std::string*>(png_get_error_ptr(png));
  *error = message != nullptr ? message : "libpng error";
  png_longjmp(png, 1);
}

void on_warning(png_structp, png_const_charp message) {
  spdlog::debug("libpng: {}", message != nullptr ? message : "");
}

void write_bytes(png_structp png, png_bytep data, png_size_t length) {
  auto* out = static_cast<schema::bytes_t*>(png_get_io_ptr(png));
  out->insert(std::end(*out), data, data + length);
}

void flush_bytes(png_structp) {}

void read_bytes(png_structp png, png_bytep data, png_size_t length) {
  auto* cursor = static_cast<read_cursor*>(png_get_io_ptr(png));
  if ((cursor->size - cursor->offset) < length) {
    png_error(png, "unexpected end of PNG data");
  }
  std::memcpy(data, cursor->data + cursor->offset, length);
  cursor->offset += length;
}

}  // namespace

std::optional<schema::bytes_t> encode_png(const bitmap& image,
                                          std::string& error) {
  if (image.width == 0 || image.height == 0 ||
      image.pixels.size() != static_cast<size_t>(image.width) * image.height) {
    error = "bitmap dimensions do not match its pixel buffer";
    return std::nullopt;
  }

  auto out = schema::bytes_t{};
  auto rows = std::vector<png_bytep>(image.height);
  for (uint32_t y = 0; y < image.height; ++y) {
    rows[y] = const_cast<png_bytep>(image.pixels.data() +
                                    static_cast<size_t>(y) * image.width);
  }

  auto* png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &error, on_error,
                                      on_warning);
  if (png == nullptr) {
    error = "failed to create PNG write struct";
    return std::nullopt;
  }
  auto* info = png_create_info_struct(png);
  if (info == nullptr) {
    png_destroy_write_struct(&png, nullptr);
    error = "failed to create PNG info struct";
    return std::nullopt;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    return std::nullopt;
  }

  png_set_write_fn(png, &out, write_bytes, flush_bytes);
  png_set_IHDR(png, info, image.width, image.height, 8, PNG_COLOR_TYPE_GRAY,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_write_image(png, rows.data());
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return out;
}

std::optional<bitmap> decode_png(const schema::bytes_view_t& bytes,
                                 std::string& error) {
  if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0) {
    error = "not a PNG stream";
    return std::nullopt;
  }

  auto cursor = read_cursor{.data = bytes.data(), .size = bytes.size()};
  auto image = bitmap{};
  auto rows = std::vector<png_bytep>{};

  auto* png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &error, on_error,
                                     on_warning);
  if (png == nullptr) {
    error = "failed to create PNG read struct";
    return std::nullopt;
  }
  auto* info = png_create_info_struct(png);
  if (info == nullptr) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    error = "failed to create PNG info struct";
    return std::nullopt;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    return std::nullopt;
  }

  png_set_read_fn(png, &cursor, read_bytes);
  png_read_info(png, info);

  const auto color_type = png_get_color_type(png, info);
  const auto bit_depth = png_get_bit_depth(png, info);
  if (color_type == PNG_COLOR_TYPE_PALETTE) {
    png_set_palette_to_rgb(png);
  }
  if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
    png_set_expand_gray_1_2_4_to_8(png);
  }
  if (bit_depth == 16) {
    png_set_strip_16(png);
  }
  if ((color_type & PNG_COLOR_MASK_ALPHA) != 0 ||
      png_get_valid(png, info, PNG_INFO_tRNS) != 0) {
    png_set_strip_alpha(png);
  }
  if ((color_type & PNG_COLOR_MASK_COLOR) != 0) {
    png_set_rgb_to_gray_fixed(png, 1, -1, -1);
  }
  png_read_update_info(png, info);

  image.width = png_get_image_width(png, info);
  image.height = png_get_image_height(png, info);
  image.pixels.resize(static_cast<size_t>(image.width) * image.height);
  rows.resize(image.height);
  for (uint32_t y = 0; y < image.height; ++y) {
    rows[y] = image.pixels.data() + static_cast<size_t>(y) * image.width;
  }
  png_read_image(png, rows.data());
  png_read_end(png, nullptr);
  png_destroy_read_struct(&png, &info, nullptr);
  return image;
}

}  // namespace quartermaster::image
