#pragma once

#include "plugin_source.h"

#include <sol/sol.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace pakt {

using sol_state_ptr = std::unique_ptr<sol::state>;
sol_state_ptr sol_util_make_lua_state();  // with std libs

namespace detail {

template <typename T>
constexpr std::string_view type_name_for_error() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_same_v<T, sol::protected_function> ||
                       std::is_same_v<T, sol::function>) {
    return "function";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

}  // namespace detail

template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (!obj || !obj->valid() || obj->get_type() == sol::type::lua_nil) {
    return std::nullopt;
  }

  if (!obj->is<T>()) {
    throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                             " must be a " +
                             std::string(detail::type_name_for_error<T>()));
  }

  return obj->as<T>();
}

// A string or an array of strings, as accepted by `event` and `fallback_branches`.
// Throws std::runtime_error for anything else.
std::vector<std::string> sol_util_string_list(sol::object const &obj,
                                              std::string_view context);

// Scalar Lua value as a passthrough option. nullopt for tables, functions, userdata.
std::optional<option_value> sol_util_to_option_value(sol::object const &obj);

// True for tables whose keys are exactly 1..n.
bool sol_util_is_array(sol::table const &table);

}  // namespace pakt
