#include "input.hpp"

namespace tactile::input {
std::string_view getInputCodeName(InputCode code) {
  auto name = magic_enum::enum_name(code);
  if (name.empty())
    return "Unknown";
  return name;
}

std::optional<InputCode> parseInputCode(std::string_view name) {
  return magic_enum::enum_cast<InputCode>(name, magic_enum::case_insensitive);
}
} // namespace tactile::input
