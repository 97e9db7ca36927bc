#pragma once

#include <string>
#include <string_view>

#include "d1sasm/result.hpp"
#include "symbol_types.hpp"

namespace d1::symbols {

/**
 * @brief abstract interface for a single-scheme name demangler
 *
 * implementations must be pure functions of their input and safe to call concurrently.
 * a failed result is a recoverable "not this scheme" signal: error_code::not_mangled when
 * the input is not in the scheme at all, any other code for a malformed or unsupported encoding.
 */
class demangler {
public:
  virtual ~demangler() = default;

  /**
   * @brief demangle a linker-visible name
   * @param name raw symbol name bytes
   * @return rendered name on success
   */
  virtual result<std::string> demangle(std::string_view name) const = 0;

  // language implied by a successful demangle
  virtual symbol_lang language() const = 0;

  // backend identifier for logs (e.g. "llvm_rust", "llvm_itanium")
  virtual std::string get_name() const = 0;
};

} // namespace d1::symbols
