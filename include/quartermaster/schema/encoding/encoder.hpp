#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <optional>
#include <span>

namespace quartermaster::schema::encoding {

/// Encoding backend selected at build time by tag.
template <typename Library>
struct encoder {
  template <typename T>
  quartermaster::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quartermaster::schema::bytes_t& out);

  template <typename T>
  T decode(const quartermaster::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quartermaster::schema::bytes_view_t& bytes);
};

}  // namespace quartermaster::schema::encoding
