#pragma once
#include <quartermaster/schema/primitives.hpp>
#include <quartermaster/schema/user_role.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::schema {

template <uint16_t Version>
struct user;

template <>
struct user<1> final {
  uint16_t version{1};
  std::string user_id;
  std::string name;
  user_role_t role{user_role_t::staff};
  std::string email;
  std::optional<std::string> department;
  std::optional<std::string> password;
};

using user_t = user<1>;

// Ledger user id for borrowers that are not registered users.
inline constexpr auto kWalkInUserId = std::string_view{"walk-in"};

}  // namespace quartermaster::schema
