#include "plugin_source.h"

#include "util.h"

#include <sstream>

namespace pakt {

std::string option_value_to_string(option_value const &value) {
  return std::visit(match{
                        [](bool b) -> std::string { return b ? "true" : "false"; },
                        [](std::int64_t i) { return std::to_string(i); },
                        [](double d) {
                          std::ostringstream oss;
                          oss << d;
                          return oss.str();
                        },
                        [](std::string const &s) { return "\"" + s + "\""; },
                    },
                    value);
}

}  // namespace pakt
