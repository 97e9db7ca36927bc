#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

#include "symbol_demangler.hpp"
#include "symbol_name.hpp"
#include "symbol_types.hpp"

namespace d1::symbols {

/**
 * @brief named code or data entity found in a binary
 *
 * the name is normalized at construction: rust demangling is tried first, then itanium c++,
 * otherwise the name is kept as given. a successful demangle only fills in the language when
 * the caller passed symbol_lang::unknown. symbols are immutable once built.
 *
 * a symbol built from a borrowed name that was kept verbatim still points into the caller's
 * buffer; call owned() before that buffer goes away.
 */
class symbol {
public:
  /**
   * @brief build a symbol with the standard demangle chain
   * @param name raw name, borrowed (string_view / const char*) or owned (std::string)
   * @param addr virtual address in the loaded image
   * @param bpos byte offset of the symbol in its binary
   * @param blen byte length of the symbol in its binary
   * @param type function or static data
   * @param source where the record came from
   * @param lang caller-known language, or unknown to let demangling classify it
   * @throws std::out_of_range if bpos + blen does not fit in size_t
   */
  symbol(
      symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type, symbol_source source,
      symbol_lang lang
  );

  // same, with an explicit demangle chain
  symbol(
      symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type, symbol_source source,
      symbol_lang lang, const symbol_demangler& chain
  );

  uint64_t address() const noexcept { return addr_; }
  size_t offset() const noexcept { return bpos_; }
  size_t end() const noexcept { return bpos_ + blen_; }
  size_t size() const noexcept { return blen_; }
  std::string_view name() const noexcept { return name_.view(); }
  symbol_lang lang() const noexcept { return lang_; }
  symbol_source source() const noexcept { return source_; }
  symbol_type type() const noexcept { return type_; }

  // true while the name still views caller-owned bytes
  bool is_borrowed() const noexcept { return name_.is_borrowed(); }

  // copy of this symbol whose name no longer depends on any upstream buffer
  symbol owned() const&;
  symbol owned() &&;

  friend bool operator==(const symbol& lhs, const symbol& rhs) noexcept;
  friend bool operator!=(const symbol& lhs, const symbol& rhs) noexcept { return !(lhs == rhs); }

private:
  struct normalized_tag {};

  // stores already-normalized fields without running the pipeline
  symbol(normalized_tag, symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type,
         symbol_source source, symbol_lang lang) noexcept;

  symbol_name name_;
  uint64_t addr_ = 0;
  size_t bpos_ = 0;
  size_t blen_ = 0;
  symbol_lang lang_ = symbol_lang::unknown;
  symbol_source source_ = symbol_source::object;
  symbol_type type_ = symbol_type::function;
};

std::ostream& operator<<(std::ostream& os, const symbol& sym);

} // namespace d1::symbols
