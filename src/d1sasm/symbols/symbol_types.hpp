#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace d1::symbols {

enum class symbol_type : uint8_t {
  function,
  static_data // static variable
};

enum class symbol_source : uint8_t {
  object, // stored in the object file structure (elf, mach-o, archive, pe, ...)
  dwarf,  // stored in DWARF debug data
  pdb     // found in a PDB
};

enum class symbol_lang : uint8_t { rust, cpp, c, unknown };

/**
 * @brief promote a language tag only while it is still unknown
 * @param current language recorded so far
 * @param incoming language suggested by classification
 * @return incoming if current is unknown, otherwise current
 */
constexpr symbol_lang update_lang(symbol_lang current, symbol_lang incoming) noexcept {
  return current == symbol_lang::unknown ? incoming : current;
}

std::string_view to_string(symbol_type value) noexcept;
std::string_view to_string(symbol_source value) noexcept;
std::string_view to_string(symbol_lang value) noexcept;

std::ostream& operator<<(std::ostream& os, symbol_type value);
std::ostream& operator<<(std::ostream& os, symbol_source value);
std::ostream& operator<<(std::ostream& os, symbol_lang value);

} // namespace d1::symbols
