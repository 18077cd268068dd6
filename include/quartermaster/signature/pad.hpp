#pragma once
#include <quartermaster/image/bitmap.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::signature {

inline constexpr uint32_t kDefaultWidth = 300;
inline constexpr uint32_t kHeight = 200;
inline constexpr double kPenWidth = 2.0;

struct point final {
  double x{};
  double y{};
};

using stroke_t = std::vector<point>;

/// Freehand signature surface.
///
/// Samples are grouped into strokes; positions outside the surface are
/// clamped to its edges. A signature exists once at least one segment has
/// been drawn. Nothing is persisted.
class pad final {
 public:
  /// `width` is the container width at mount time; zero selects the default.
  explicit pad(uint32_t width = kDefaultWidth);

  uint32_t width() const;
  uint32_t height() const;

  /// Pointer down. An unfinished stroke is closed first.
  void begin_stroke(point position);

  /// Pointer move. Ignored unless a stroke is in progress.
  void move_to(point position);

  /// Pointer up or pointer leaving the surface.
  void end_stroke();

  /// Discard all strokes and return to the initial empty state.
  void clear();

  bool drawing() const;
  bool has_signature() const;
  const std::vector<stroke_t>& strokes() const;

  /// Black strokes on white with a round pen.
  image::bitmap render() const;

  /// PNG data URI of the drawing. std::nullopt, with `error` set, when nothing
  /// has been drawn or encoding fails.
  std::optional<std::string> save(std::string& error) const;

 private:
  point clamp(point position) const;

  uint32_t width_;
  std::vector<stroke_t> strokes_;
  bool drawing_{false};
  bool has_signature_{false};
};

/// Parse a stroke script: one stroke per line, `x,y` samples separated by
/// whitespace. Blank lines are ignored.
std::optional<std::vector<stroke_t>> parse_strokes(std::string_view text,
                                                   std::string& error);

/// Feed parsed strokes through the pad as pointer events.
void replay(pad& surface, const std::vector<stroke_t>& strokes);

}  // namespace quartermaster::signature
