#include <qrencode.h>
#include <quartermaster/image/png.hpp>
#include <quartermaster/qr/code.hpp>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>

namespace quartermaster::qr {

namespace {

struct qrcode_deleter final {
  void operator()(QRcode* code) const { QRcode_free(code); }
};

using qrcode_ptr_t = std::unique_ptr<QRcode, qrcode_deleter>;

QRecLevel to_level(const error_correction_t ecc) {
  switch (ecc) {
    case error_correction_t::low:
      return QR_ECLEVEL_L;
    case error_correction_t::medium:
      return QR_ECLEVEL_M;
    case error_correction_t::quartile:
      return QR_ECLEVEL_Q;
    case error_correction_t::high:
      return QR_ECLEVEL_H;
  }
  return QR_ECLEVEL_M;
}

}  // namespace

std::optional<error_correction_t> parse_error_correction(
    const std::string_view value) {
  if (value.size() != 1) {
    return std::nullopt;
  }
  switch (value.front()) {
    case 'L':
    case 'l':
      return error_correction_t::low;
    case 'M':
    case 'm':
      return error_correction_t::medium;
    case 'Q':
    case 'q':
      return error_correction_t::quartile;
    case 'H':
    case 'h':
      return error_correction_t::high;
    default:
      return std::nullopt;
  }
}

std::string_view to_string(const error_correction_t value) {
  switch (value) {
    case error_correction_t::low:
      return "L";
    case error_correction_t::medium:
      return "M";
    case error_correction_t::quartile:
      return "Q";
    case error_correction_t::high:
      return "H";
  }
  return "unknown";
}

bool symbol::dark(const uint32_t x, const uint32_t y) const {
  return modules[static_cast<size_t>(y) * size + x] != 0;
}

std::optional<symbol> encode_text(const std::string_view payload,
                                  const error_correction_t ecc,
                                  std::string& error) {
  if (payload.empty()) {
    error = "QR payload is empty";
    return std::nullopt;
  }
  errno = 0;
  auto code = qrcode_ptr_t{QRcode_encodeData(
      static_cast<int>(payload.size()),
      reinterpret_cast<const unsigned char*>(payload.data()), 0,
      to_level(ecc))};
  if (!code) {
    if (errno == ERANGE) {
      error = "payload of " + std::to_string(payload.size()) +
              " bytes does not fit in a QR symbol";
    } else {
      error = std::string{"QR encoding failed: "} + std::strerror(errno);
    }
    return std::nullopt;
  }

  auto result = symbol{};
  result.version = static_cast<uint32_t>(code->version);
  result.size = static_cast<uint32_t>(code->width);
  result.ecc = ecc;
  const auto count = static_cast<size_t>(result.size) * result.size;
  result.modules.resize(count);
  for (size_t i = 0; i < count; ++i) {
    result.modules[i] = static_cast<uint8_t>(code->data[i] & 0x01u);
  }
  return result;
}

image::bitmap render(const symbol& code, const render_options& options) {
  const auto modules_across = code.size + options.margin * 2;
  auto scale = 4.0;
  if (options.width >= modules_across) {
    scale = static_cast<double>(options.width) / modules_across;
  }
  const auto edge =
      static_cast<uint32_t>(std::floor(modules_across * scale));
  const auto margin_pixels = options.margin * scale;

  auto canvas = image::make_bitmap(edge, edge, image::kWhite);
  for (uint32_t py = 0; py < edge; ++py) {
    const auto my = std::floor((py - margin_pixels) / scale);
    if (my < 0 || my >= code.size) {
      continue;
    }
    for (uint32_t px = 0; px < edge; ++px) {
      const auto mx = std::floor((px - margin_pixels) / scale);
      if (mx < 0 || mx >= code.size) {
        continue;
      }
      if (code.dark(static_cast<uint32_t>(mx), static_cast<uint32_t>(my))) {
        canvas.pixels[static_cast<size_t>(py) * edge + px] = image::kBlack;
      }
    }
  }
  return canvas;
}

std::optional<schema::bytes_t> render_png(const std::string_view payload,
                                          const error_correction_t ecc,
                                          const render_options& options,
                                          std::string& error) {
  auto code = encode_text(payload, ecc, error);
  if (!code) {
    return std::nullopt;
  }
  return image::encode_png(render(*code, options), error);
}

}  // namespace quartermaster::qr
