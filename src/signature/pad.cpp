#include <quartermaster/image/png.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/signature/pad.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace quartermaster::signature {

namespace {

void draw_segment(image::bitmap& canvas, const point& from, const point& to) {
  const auto radius = kPenWidth / 2.0;
  const auto dx = to.x - from.x;
  const auto dy = to.y - from.y;
  const auto length = std::sqrt(dx * dx + dy * dy);
  const auto steps = std::max<int64_t>(1, std::ceil(length * 2.0));
  for (int64_t i = 0; i <= steps; ++i) {
    const auto t = static_cast<double>(i) / static_cast<double>(steps);
    image::fill_disc(canvas, from.x + dx * t, from.y + dy * t, radius,
                     image::kBlack);
  }
}

std::optional<double> parse_number(std::string_view text) {
  auto value = double{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

pad::pad(const uint32_t width) : width_{width == 0 ? kDefaultWidth : width} {}

uint32_t pad::width() const {
  return width_;
}

uint32_t pad::height() const {
  return kHeight;
}

point pad::clamp(const point position) const {
  return point{.x = std::clamp(position.x, 0.0, static_cast<double>(width_)),
               .y = std::clamp(position.y, 0.0, static_cast<double>(kHeight))};
}

void pad::begin_stroke(const point position) {
  strokes_.push_back(stroke_t{clamp(position)});
  drawing_ = true;
}

void pad::move_to(const point position) {
  if (!drawing_) {
    return;
  }
  strokes_.back().push_back(clamp(position));
  has_signature_ = true;
}

void pad::end_stroke() {
  drawing_ = false;
}

void pad::clear() {
  strokes_.clear();
  drawing_ = false;
  has_signature_ = false;
}

bool pad::drawing() const {
  return drawing_;
}

bool pad::has_signature() const {
  return has_signature_;
}

const std::vector<stroke_t>& pad::strokes() const {
  return strokes_;
}

image::bitmap pad::render() const {
  auto canvas = image::make_bitmap(width_, kHeight, image::kWhite);
  for (const auto& stroke : strokes_) {
    for (size_t i = 1; i < stroke.size(); ++i) {
      draw_segment(canvas, stroke[i - 1], stroke[i]);
    }
  }
  return canvas;
}

std::optional<std::string> pad::save(std::string& error) const {
  if (!has_signature_) {
    error = "no signature has been drawn";
    return std::nullopt;
  }
  auto encoded = image::encode_png(render(), error);
  if (!encoded) {
    return std::nullopt;
  }
  return schema::make_data_uri(image::kPngMimeType,
                               schema::make_bytes_view(*encoded));
}

std::optional<std::vector<stroke_t>> parse_strokes(const std::string_view text,
                                                   std::string& error) {
  auto strokes = std::vector<stroke_t>{};
  auto input = std::istringstream{std::string{text}};
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    auto samples = std::istringstream{line};
    auto sample = std::string{};
    auto stroke = stroke_t{};
    while (samples >> sample) {
      const auto comma = sample.find(',');
      if (comma == std::string::npos) {
        error = "line " + std::to_string(line_number) + ": expected x,y";
        return std::nullopt;
      }
      auto sample_view = std::string_view{sample};
      auto x = parse_number(sample_view.substr(0, comma));
      auto y = parse_number(sample_view.substr(comma + 1));
      if (!x || !y) {
        error = "line " + std::to_string(line_number) + ": invalid sample '" +
                sample + "'";
        return std::nullopt;
      }
      stroke.push_back(point{.x = *x, .y = *y});
    }
    if (!stroke.empty()) {
      strokes.push_back(std::move(stroke));
    }
  }
  return strokes;
}

void replay(pad& surface, const std::vector<stroke_t>& strokes) {
  for (const auto& stroke : strokes) {
    if (stroke.empty()) {
      continue;
    }
    surface.begin_stroke(stroke.front());
    for (size_t i = 1; i < stroke.size(); ++i) {
      surface.move_to(stroke[i]);
    }
    surface.end_stroke();
  }
}

}  // namespace quartermaster::signature
