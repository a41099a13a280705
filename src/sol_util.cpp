#include "sol_util.h"

#include <stdexcept>

namespace pakt {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::coroutine,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug,
                      sol::lib::io);

  // error() carries a traceback
  lua->script(R"lua(
do
  local orig_error = error
  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end
end
)lua");

  return lua;
}

std::vector<std::string> sol_util_string_list(sol::object const &obj,
                                              std::string_view context) {
  if (obj.is<std::string>()) { return { obj.as<std::string>() }; }

  if (obj.get_type() != sol::type::table) {
    throw std::runtime_error(std::string(context) +
                             " must be a string or an array of strings");
  }

  std::vector<std::string> out;
  sol::table const table{ obj.as<sol::table>() };
  for (std::size_t i{ 1 }, n{ table.size() }; i <= n; ++i) {
    sol::object const item = table[i];
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string(context) + "[" + std::to_string(i) +
                               "] must be a string");
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::optional<option_value> sol_util_to_option_value(sol::object const &obj) {
  switch (obj.get_type()) {
    case sol::type::boolean: return option_value{ obj.as<bool>() };
    case sol::type::string: return option_value{ obj.as<std::string>() };
    case sol::type::number: {
      auto const d{ obj.as<double>() };
      auto const i{ static_cast<std::int64_t>(d) };
      if (static_cast<double>(i) == d) { return option_value{ i }; }
      return option_value{ d };
    }
    default: return std::nullopt;
  }
}

bool sol_util_is_array(sol::table const &table) {
  std::size_t count{ 0 };
  for (auto const &[key, value] : table) {
    (void)value;
    ++count;
    if (key.get_type() != sol::type::number) { return false; }
  }
  return count == table.size();
}

}  // namespace pakt
