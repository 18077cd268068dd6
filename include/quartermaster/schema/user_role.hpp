#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quartermaster::schema {

enum class user_role_t : uint8_t {
  admin = 0,
  staff = 1,
  viewer = 2,
  operator_ = 3
};

inline constexpr auto kUserRoleMappings =
    std::array{std::pair<std::string_view, user_role_t>{"Admin",
                                                        user_role_t::admin},
               std::pair<std::string_view, user_role_t>{"Staff",
                                                        user_role_t::staff},
               std::pair<std::string_view, user_role_t>{"Viewer",
                                                        user_role_t::viewer},
               std::pair<std::string_view, user_role_t>{
                   "Operator", user_role_t::operator_}};

template <>
inline std::optional<user_role_t> try_from_string<user_role_t>(
    const std::string_view value) {
  return from_string(value, kUserRoleMappings);
}

inline constexpr std::string_view to_string(const user_role_t value) {
  return to_string(value, kUserRoleMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
