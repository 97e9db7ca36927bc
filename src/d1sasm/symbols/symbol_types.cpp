#include "symbol_types.hpp"

namespace d1::symbols {

std::string_view to_string(symbol_type value) noexcept {
  switch (value) {
  case symbol_type::function:
    return "function";
  case symbol_type::static_data:
    return "static";
  }
  return "function";
}

std::string_view to_string(symbol_source value) noexcept {
  switch (value) {
  case symbol_source::object:
    return "object";
  case symbol_source::dwarf:
    return "DWARF";
  case symbol_source::pdb:
    return "PDB";
  }
  return "object";
}

std::string_view to_string(symbol_lang value) noexcept {
  switch (value) {
  case symbol_lang::rust:
    return "Rust";
  case symbol_lang::cpp:
    return "C++";
  case symbol_lang::c:
    return "C";
  case symbol_lang::unknown:
    return "unknown";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, symbol_type value) { return os << to_string(value); }

std::ostream& operator<<(std::ostream& os, symbol_source value) { return os << to_string(value); }

std::ostream& operator<<(std::ostream& os, symbol_lang value) { return os << to_string(value); }

} // namespace d1::symbols
