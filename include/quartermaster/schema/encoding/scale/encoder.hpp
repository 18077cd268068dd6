#pragma once
#include <quartermaster/common/critical.hpp>
#include <quartermaster/schema/encoding/encoder.hpp>
#include <quartermaster/schema/encoding/scale/asset.hpp>
#include <quartermaster/schema/encoding/scale/asset_status.hpp>
#include <quartermaster/schema/encoding/scale/reservation.hpp>
#include <quartermaster/schema/encoding/scale/reservation_status.hpp>
#include <quartermaster/schema/encoding/scale/session_state.hpp>
#include <quartermaster/schema/encoding/scale/transaction.hpp>
#include <quartermaster/schema/encoding/scale/transaction_type.hpp>
#include <quartermaster/schema/encoding/scale/user.hpp>
#include <quartermaster/schema/encoding/scale/user_role.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  quartermaster::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quartermaster::schema::bytes_t& out);

  template <typename T>
  T decode(const quartermaster::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quartermaster::schema::bytes_view_t& bytes);
};

template <typename T>
quartermaster::schema::bytes_t encoder<scale_encoder_tag>::encode(
    const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    quartermaster::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        quartermaster::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const quartermaster::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    quartermaster::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const quartermaster::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace quartermaster::schema::encoding
